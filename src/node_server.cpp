// -----------------------------------------------------------------------------
// node_server.cpp: one-connection protocol loop for fedsim-node
// -----------------------------------------------------------------------------
#include "fedsim/node_server.hpp"

#include "fedsim/log.hpp"

namespace fedsim {

using transport::IoResult;

bool serve_connection(transport::SocketTransport& conn, NodeSession& session, std::string& err) {
  std::string line;
  std::vector<std::string> replies;

  while (true) {
    const IoResult r = conn.recv_line_blocking(line);
    if (r != IoResult::Ok) {
      err = std::string("recv_") + transport::io_result_name(r);
      if (r == IoResult::Error) err += " " + conn.last_error();
      conn.close();
      return false;                              // coordinator vanished without SHUTDOWN
    }

    replies.clear();
    if (!session.handle_line(line, replies)) {
      err = std::string(error_kind_name(session.error_kind())) + " " + session.last_error();
      conn.close();                              // no reply on a fault
      return false;
    }

    for (const auto& reply : replies) {
      const IoResult w = conn.send_line(reply, transport::deadline_in_ms(NODE_SEND_TIMEOUT_MS));
      if (w != IoResult::Ok) {
        err = std::string("send_") + transport::io_result_name(w);
        conn.close();
        return false;
      }
    }

    if (session.closed()) {
      conn.close();                              // closing is the SHUTDOWN acknowledgement
      return true;
    }
  }
}

bool run_node_server(const Endpoint& ep, NodeSession& session, int accept_timeout_ms, std::string& err) {
  const int lfd = listen_endpoint(ep, err);
  if (lfd < 0) return false;
  FEDSIM_INFO("node", "event=listening endpoint=%s", ep.str().c_str());

  const int cfd = accept_client(lfd, accept_timeout_ms, err);
  close_socket(lfd);                             // one coordinator per process
  if (cfd < 0) {
    unlink_endpoint(ep);
    return false;
  }
  FEDSIM_INFO("node", "event=connected endpoint=%s", ep.str().c_str());

  transport::SocketTransport conn(cfd, ep.str());
  const bool ok = serve_connection(conn, session, err);
  unlink_endpoint(ep);
  return ok;
}

} // namespace fedsim
