#pragma once

#include <atomic>
#include <condition_variable>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <libsocket/inetserverstream.hpp>
#include <libsocket/exception.hpp>

#include "config.hpp"
#include "executor.hpp"
#include "protocol.hpp"
#include "session.hpp"
#include "stats.hpp"
#include "workspace.hpp"

// write all of msg, or return false once the peer is gone.
bool send_string(libsocket::inet_stream& s, const std::string& msg);

// listen on a tcp port, and serve every connection on its own thread.
// a connection send "session_id|code<|EOM|>" messages and get one response per message.
struct Server {
  Config config;
  WorkspaceManager workspace;
  SessionRegistry sessions;
  Executor executor;
  Stats stats;
  Server(const Config& config, v8::Platform* platform);
  Server(const Server&) = delete;
  ~Server();
  // resolve the session, hold its lock, make sure its workspace exist, and run the code.
  ExecutionResult execute(const Request& request);
  // one framed message in, one response body out.
  std::string handle(const std::string& message, const std::string& peer = "local");
  // bind the listening socket. throw libsocket::socket_exception when it cannot.
  void listen();
  // the bound port, useful when listening on port 0.
  int port() const;
  // accept connections until stop() is called.
  void run();
  void stop();
private:
  std::unique_ptr<libsocket::inet_stream_server> listener;
  std::atomic<bool> stopping {false};
  std::mutex m;
  // fd of every open connection, so stop() can shut them down.
  std::set<int> connections;
  std::list<std::future<void>> workers;
  std::thread reaper;
  std::condition_variable reaper_cv;
  size_t next_connection = 0;
  void serve(std::unique_ptr<libsocket::inet_stream> conn, size_t id);
  void reap();
};
