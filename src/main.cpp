#include "config.hpp"
#include "server.hpp"
#include "util.hpp"
#include "v8_util.hpp"

#include <csignal>

int main(int argc, char* argv[]) {
  Config config;
  try {
    config = parse_config(argc, argv);
  } catch (const ConfigError& e) {
    std::cerr << "sessiond: " << e.what() << std::endl;
    return 1;
  }
  if (config.help) {
    std::cout << config.help_text << std::endl;
    return 0;
  }
  // a peer hanging up mid response must not kill the server.
  std::signal(SIGPIPE, SIG_IGN);
  try {
    set_audit_log(config.audit_log);
  } catch (const std::runtime_error& e) {
    std::cerr << "sessiond: " << e.what() << std::endl;
    return 1;
  }
  V8RAII v8(argv[0]);
  Server server(config, v8.platform.get());
  try {
    server.listen();
  } catch (const libsocket::socket_exception& e) {
    std::cerr << "sessiond: cannot listen on " << config.host << ":" << config.port << ": " << e.mesg << std::endl;
    return 1;
  }
  server.run();
  return 0;
}
