#ifndef STACKPORT_FACTORY_HPP
#define STACKPORT_FACTORY_HPP

#include "stackport/Config.hpp"
#include "stackport/StackClient.hpp"
#include "stackport/Transport.hpp"

namespace stackport {

// Transport options for the REST path and the edge path
TransportOptions regular_transport_options(const ClientSettings& settings);
TransportOptions edge_transport_options(const ClientSettings& settings);

/**
 * @brief Wire a StackClient over libcurl from settings
 *
 * The REST path is only wired when both server URL and token are set.
 *
 * @throws ConfigError when no edge URL is available either
 */
StackClient make_stack_client(const ClientSettings& settings);

} // namespace stackport

#endif // STACKPORT_FACTORY_HPP
