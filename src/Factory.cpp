#include "stackport/Factory.hpp"
#include "stackport/EdgeStackApi.hpp"
#include "stackport/RegularStackApi.hpp"

#include <spdlog/spdlog.h>

namespace stackport {

TransportOptions regular_transport_options(const ClientSettings& settings) {
    TransportOptions opts;
    opts.base_url = settings.server_url;
    opts.api_key = settings.token;
    opts.skip_tls_verify = settings.skip_tls_verify;
    opts.timeout_seconds = settings.timeout_seconds;
    return opts;
}

TransportOptions edge_transport_options(const ClientSettings& settings) {
    TransportOptions opts = regular_transport_options(settings);
    opts.base_url = settings.edge_url;
    opts.api_key = settings.edge_token;
    return opts;
}

StackClient make_stack_client(const ClientSettings& settings) {
    if (settings.edge_url.empty()) {
        throw ConfigError("no server url configured (set server.url or edge.url)");
    }

    std::unique_ptr<RegularStackApi> regular;
    if (settings.has_regular_api()) {
        regular = std::make_unique<RegularStackApi>(
            std::make_shared<CurlTransport>(regular_transport_options(settings)));
    } else {
        spdlog::debug("server url or token missing, regular stack api disabled");
    }

    auto edge = std::make_shared<HttpEdgeStackApi>(
        std::make_shared<CurlTransport>(edge_transport_options(settings)));

    StackClientOptions options;
    options.fallback = settings.fallback;
    options.read_only = settings.read_only;

    return StackClient(std::move(regular), std::move(edge), std::move(options));
}

} // namespace stackport
