#pragma once
/**
 * @file node_server.hpp
 * @brief Serve one coordinator connection with a NodeSession.
 */

#include <string>

#include "fedsim/node_session.hpp"
#include "fedsim/transport/transport_socket.hpp"
#include "socket_io.hpp"

namespace fedsim {

/// Per-reply write deadline on the node side.
static constexpr int NODE_SEND_TIMEOUT_MS = 30000;

/**
 * @brief Run the protocol over an already-connected transport until SHUTDOWN,
 *        a fault, or the coordinator going away.
 *
 * On a fault the connection is closed without a reply.
 *
 * @return true only for a clean SHUTDOWN.
 */
bool serve_connection(transport::SocketTransport& conn, NodeSession& session, std::string& err);

/**
 * @brief Listen on `ep`, accept exactly one coordinator, serve it, clean up.
 *
 * @param accept_timeout_ms  how long to wait for the coordinator; negative waits forever.
 */
bool run_node_server(const Endpoint& ep, NodeSession& session, int accept_timeout_ms, std::string& err);

} // namespace fedsim
