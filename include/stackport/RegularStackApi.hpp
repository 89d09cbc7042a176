/**
 * @file RegularStackApi.hpp
 * @brief Calls against the general REST stack surface
 *
 * Endpoints:
 * - GET /api/stacks                          -> [RegularStack]
 * - GET /api/stacks/{id}/file                -> {StackFileContent}
 * - GET /api/stacks/{id}                     -> {EndpointId, Env, ...}
 * - PUT /api/stacks/{id}?endpointId={eid}    <- {StackFileContent, Prune, PullImage, Env}
 */

#ifndef STACKPORT_REGULARSTACKAPI_HPP
#define STACKPORT_REGULARSTACKAPI_HPP

#include "stackport/Models.hpp"
#include "stackport/Transport.hpp"
#include <memory>
#include <string>
#include <vector>

namespace stackport {

class RegularStackApi {
public:
    explicit RegularStackApi(std::shared_ptr<HttpTransport> transport)
        : rest_(std::move(transport)) {}

    /**
     * @throws TransportError, StatusError, ParseError
     */
    std::vector<RegularStack> list();

    /**
     * @return StackFileContent (may be empty)
     * @throws TransportError, StatusError, ParseError
     */
    std::string file(int id);

    /**
     * @brief Endpoint ID and decoded env of one stack
     * @throws TransportError, StatusError, ParseError
     */
    RegularStackDetails details(int id);

    /**
     * @brief Replace the stack file and env
     *
     * Prune and PullImage are always sent as false.
     *
     * @throws TransportError, StatusError
     */
    void update(int id, int endpoint_id, const std::string& file,
                const std::vector<StackEnvVar>& env);

private:
    RestClient rest_;
};

} // namespace stackport

#endif // STACKPORT_REGULARSTACKAPI_HPP
