/**
 * @file EdgeStackApi.hpp
 * @brief The four edge-stack primitives
 *
 * StackClient consumes edge stacks only through this interface and treats
 * its behavior as opaque: any std::exception thrown here is reported as an
 * edge-path failure.
 */

#ifndef STACKPORT_EDGESTACKAPI_HPP
#define STACKPORT_EDGESTACKAPI_HPP

#include "stackport/Models.hpp"
#include "stackport/Transport.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace stackport {

class EdgeStackApi {
public:
    virtual ~EdgeStackApi() = default;

    virtual std::vector<EdgeStack> list_edge_stacks() = 0;
    virtual std::string get_edge_stack_file(int64_t id) = 0;
    virtual int64_t create_edge_stack(const std::string& name, const std::string& file,
                                      const std::vector<int64_t>& group_ids) = 0;
    virtual void update_edge_stack(int64_t id, const std::string& file,
                                   const std::vector<int64_t>& group_ids) = 0;
};

/**
 * @brief Edge primitives over the server's /api/edge_stacks endpoints
 *
 * - list:   GET  /api/edge_stacks
 * - file:   GET  /api/edge_stacks/{id}/file
 * - create: POST /api/edge_stacks/create/string
 * - update: PUT  /api/edge_stacks/{id}
 *
 * Stacks are created and updated as compose deployments.
 */
class HttpEdgeStackApi : public EdgeStackApi {
public:
    explicit HttpEdgeStackApi(std::shared_ptr<HttpTransport> transport)
        : rest_(std::move(transport)) {}

    std::vector<EdgeStack> list_edge_stacks() override;
    std::string get_edge_stack_file(int64_t id) override;
    int64_t create_edge_stack(const std::string& name, const std::string& file,
                              const std::vector<int64_t>& group_ids) override;
    void update_edge_stack(int64_t id, const std::string& file,
                           const std::vector<int64_t>& group_ids) override;

private:
    RestClient rest_;
};

} // namespace stackport

#endif // STACKPORT_EDGESTACKAPI_HPP
