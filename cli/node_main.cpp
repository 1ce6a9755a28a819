/**
 * @file node_main.cpp
 * @brief fedsim-node: serve one coordinator session with a reference node model.
 *
 * Listens on --listen, accepts exactly one coordinator, answers INIT / ADVANCE /
 * SHUTDOWN with the chosen model, then exits.
 *
 * Exit status: 0 after a clean SHUTDOWN, 1 on a fault or a lost coordinator,
 * 2 on bad arguments.
 */

#include <iostream>
#include <string>

#include "CLI/CLI11.hpp"

#include "fedsim/log.hpp"
#include "fedsim/models.hpp"
#include "fedsim/node_server.hpp"
#include "fedsim/node_session.hpp"
#include "socket_io.hpp"

using namespace fedsim;

int main(int argc, char** argv) {
  CLI::App app{"fedsim node: reference model behind the lockstep protocol"};

  std::string listen;
  std::string model_name = "sensor";
  std::string log_level  = "info";
  int accept_timeout_ms  = -1;

  app.add_option("--listen", listen, "Endpoint to listen on (host:port or unix:<path>)")->required();
  app.add_option("--model", model_name, "Node model")->check(CLI::IsMember({"sensor", "gateway"}));
  app.add_option("--accept-timeout-ms", accept_timeout_ms, "Give up waiting for the coordinator (-1 = never)");
  app.add_option("--log-level", log_level, "error|warn|info|debug|trace|off");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    const int rc = app.exit(e);
    return rc == 0 ? 0 : 2;
  }

  LogLevel lvl;
  if (!parse_log_level(log_level, lvl)) {
    std::cerr << "status=error reason=bad_log_level value=" << log_level << "\n";
    return 2;
  }
  Logger::instance().set_level(lvl);

  Endpoint ep;
  std::string err;
  if (!parse_endpoint(listen, ep, err)) {
    std::cerr << "status=error reason=bad_endpoint detail=\"" << err << "\"\n";
    return 2;
  }

  auto model = make_model(model_name);
  if (!model) {
    std::cerr << "status=error reason=unknown_model value=" << model_name << "\n";
    return 2;
  }

  NodeSession session(std::move(model));

  if (!run_node_server(ep, session, accept_timeout_ms, err)) {
    FEDSIM_ERROR("node", "status=error reason=session_ended detail=\"%s\"", err.c_str());
    return 1;
  }

  if (session.core().late_deliveries() > 0) {
    FEDSIM_INFO("node", "event=late_deliveries node=%s count=%llu", session.core().node_id().c_str(),
                static_cast<unsigned long long>(session.core().late_deliveries()));
  }
  return 0;
}
