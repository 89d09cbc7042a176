#include <cxxopts.hpp>
#include <iostream>
#include <fstream>
#include <sstream>
#include "stackport/Config.hpp"
#include "stackport/EnvCodec.hpp"
#include "stackport/Errors.hpp"
#include "stackport/Factory.hpp"
#include "stackport/Logging.hpp"
#include "stackport/Util.hpp"

using namespace stackport;

namespace {

std::string read_stack_file(const std::string& path) {
    if (path == "-") {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        return ss.str();
    }
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) throw std::runtime_error("cannot read stack file: " + path);
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

int parse_id(const std::string& raw) {
    size_t pos = 0;
    int id = 0;
    try {
        id = std::stoi(raw, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid id parameter: " + raw);
    }
    if (pos != raw.size()) throw std::invalid_argument("invalid id parameter: " + raw);
    return id;
}

} // namespace

int main(int argc, char** argv) {
    try {
        init_logger();

        cxxopts::Options options("stackport-cli", "List, inspect, create and update regular and edge stacks");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("c,config", "Path to JSON/TOML config", cxxopts::value<std::string>())
            ("p,prefix", "Env-var prefix for config", cxxopts::value<std::string>()->default_value("STACKPORT"))
            ("overrides", "Comma-separated dot.key:JSON_value pairs", cxxopts::value<std::string>()->default_value(""))
            ("mandatory", "Comma-separated list of mandatory dot-keys", cxxopts::value<std::string>()->default_value(""))
            ("env-json", "Env overrides for update as a JSON array of {name, value}", cxxopts::value<std::string>())
            ("to", "Output format for `config`: json or toml", cxxopts::value<std::string>()->default_value("json"))
            ("v,verbose", "Debug logging")
            ("h,help", "Show help");

        auto result = options.parse(argc, argv);

        // Command + arguments are the unmatched positionals, kept verbatim
        // (GROUPS and NAME=VALUE may contain commas)
        const std::vector<std::string> cmdv = result.unmatched();
        if (result.count("help") || cmdv.empty()) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: list | file ID | env-names ID | create NAME FILE GROUPS | "
                         "update ID FILE GROUPS [NAME=VALUE ...] | config [--to json|toml]\n"
                         "GROUPS is a comma-separated list of environment group IDs; FILE may be '-' for stdin\n";
            return 0;
        }

        // Prepare LoadOptions
        LoadOptions load;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        load.prefix = result["prefix"].as<std::string>();
        load.overrides = parse_overrides(result["overrides"].as<std::string>());
        load.mandatory = split(result["mandatory"].as<std::string>(), ',');

        Config cfg = Config::load(load);
        ClientSettings settings = settings_from_config(cfg);

        set_log_level(result.count("verbose") ? spdlog::level::debug : parse_log_level(settings.log_level));

        const std::string cmd = cmdv[0];

        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                throw std::invalid_argument("insufficient arguments for command '" + cmd + "'");
            }
        };

        // CONFIG (no server access)
        if (cmd == "config") {
            Config shown(redact_secrets(cfg.data()));
            const std::string to = result["to"].as<std::string>();
            if (to == "toml") std::cout << shown.to_toml_string() << "\n";
            else if (to == "json") std::cout << shown.to_json_string(2) << "\n";
            else { std::cerr << "Error: unknown format '" << to << "'\n"; return 1; }
            return 0;
        }

        StackClient client = make_stack_client(settings);

        // LIST
        if (cmd == "list") {
            Value out = client.get_stacks();
            std::cout << out.dump(2) << "\n";
            return 0;
        }

        // FILE
        if (cmd == "file") {
            expect_args(2);
            std::cout << client.get_stack_file(parse_id(cmdv[1])) << "\n";
            return 0;
        }

        // ENV NAMES
        if (cmd == "env-names") {
            expect_args(2);
            Value out = client.get_stack_env_names(parse_id(cmdv[1]));
            std::cout << out.dump(2) << "\n";
            return 0;
        }

        // CREATE
        if (cmd == "create") {
            expect_args(4);
            int id = client.create_stack(cmdv[1], read_stack_file(cmdv[2]), parse_int_list(cmdv[3]));
            std::cout << "Stack created successfully with ID: " << id << "\n";
            return 0;
        }

        // UPDATE
        if (cmd == "update") {
            expect_args(4);
            std::vector<StackEnvVar> overrides;
            if (result.count("env-json")) {
                overrides = parse_env_overrides(Value::parse(result["env-json"].as<std::string>()));
            }
            for (size_t i = 4; i < cmdv.size(); ++i) {
                overrides.push_back(parse_env_assignment(cmdv[i]));
            }
            client.update_stack(parse_id(cmdv[1]), read_stack_file(cmdv[2]),
                                parse_int_list(cmdv[3]), overrides);
            std::cout << "Stack updated successfully\n";
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const MissingMandatoryConfig& mmc) {
        std::cerr << "Error: " << mmc.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
