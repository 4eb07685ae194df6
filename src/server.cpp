#include "server.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <vector>
#include <libsocket/libinetsocket.h>

bool send_string(libsocket::inet_stream& s, const std::string& msg) {
  size_t sent = 0;
  while (sent < msg.size()) {
    ssize_t n = s.snd(msg.data() + sent, msg.size() - sent, MSG_NOSIGNAL);
    if (n <= 0) {
      return false;
    }
    sent += n;
  }
  return true;
}

Server::Server(const Config& config, v8::Platform* platform) :
  config(config),
  workspace(config.workspace_root),
  executor(platform, config.limits, config.echo_result) { }

Server::~Server() {
  stop();
}

ExecutionResult Server::execute(const Request& request) {
  Session session = sessions.get_or_create(request.session_id);
  SessionNode::Lock l = session->lock();
  std::filesystem::path workdir;
  try {
    workdir = workspace.ensure_dir(request.session_id);
  } catch (const std::exception& e) {
    return ExecutionResult::failure(FaultKind::InternalError, format_error("InternalError", e.what()));
  }
  return executor.run(*session, l, workdir, request.code);
}

std::string Server::handle(const std::string& message, const std::string& peer) {
  Decoded decoded = decode_request(message);
  if (!decoded.request) {
    log_line(peer + ": " + decoded.error);
    ExecutionResult r = ExecutionResult::failure(FaultKind::ProtocolError, decoded.error);
    stats.record(r);
    json j = r.to_json();
    j["peer"] = peer;
    log_json(j, "result");
    return render(r, config.response_format);
  }
  const Request& request = *decoded.request;
  log_line("=== Session " + request.session_id + " === code from " + peer + ":\n" + number_lines(request.code));
  {
    json j;
    j["session"] = request.session_id;
    j["peer"] = peer;
    j["code"] = request.code;
    log_json(j, "submit");
  }
  ExecutionResult r = execute(request);
  stats.record(r);
  log_line("=== Session " + request.session_id + " === " + to_string(r.kind) + " after " + std::to_string(r.duration.count()) + "ms:\n" + r.text());
  {
    json j = r.to_json();
    j["session"] = request.session_id;
    j["peer"] = peer;
    log_json(j, "result");
  }
  return render(r, config.response_format);
}

void Server::listen() {
  listener = std::make_unique<libsocket::inet_stream_server>(config.host, std::to_string(config.port), LIBSOCKET_IPv4);
}

int Server::port() const {
  if (!listener) {
    return config.port;
  }
  sockaddr_in addr;
  socklen_t len = sizeof addr;
  if (getsockname(listener->getfd(), reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    return config.port;
  }
  return ntohs(addr.sin_port);
}

void Server::run() {
  if (!listener) {
    listen();
  }
  if (config.session_idle_ttl.count() > 0) {
    reaper = std::thread([this]() { reap(); });
  }
  log_line("listening on " + config.host + ":" + std::to_string(port()) + ", workspaces in " + workspace.root.string());
  log_json(config.to_json(), "start");
  while (!stopping) {
    std::unique_ptr<libsocket::inet_stream> conn;
    try {
      conn = listener->accept2(LIBSOCKET_NUMERIC);
    } catch (const libsocket::socket_exception& e) {
      if (stopping) {
        break;
      }
      log_error("accept: " + e.mesg);
      // e.g. out of file descriptors. do not spin.
      std::this_thread::sleep_for(milliseconds(10));
      continue;
    }
    std::lock_guard<std::mutex> guard(m);
    workers.remove_if([](const std::future<void>& f) {
                        return f.wait_for(milliseconds(0)) == std::future_status::ready;
                      });
    if (stopping) {
      break;
    }
    connections.insert(conn->getfd());
    workers.push_back(std::async(std::launch::async, &Server::serve, this, std::move(conn), next_connection++));
  }
}

void Server::stop() {
  stopping = true;
  {
    std::lock_guard<std::mutex> guard(m);
    if (listener) {
      // wake up the blocking accept.
      ::shutdown(listener->getfd(), SHUT_RDWR);
    }
    for (int fd : connections) {
      ::shutdown(fd, SHUT_RDWR);
    }
  }
  reaper_cv.notify_all();
  if (reaper.joinable() && reaper.get_id() != std::this_thread::get_id()) {
    reaper.join();
  }
  std::list<std::future<void>> pending;
  {
    std::lock_guard<std::mutex> guard(m);
    pending.swap(workers);
  }
  for (auto& f : pending) {
    f.wait();
  }
}

void Server::serve(std::unique_ptr<libsocket::inet_stream> conn, size_t id) {
  std::string peer = conn->gethost() + ":" + conn->getport();
  int fd = conn->getfd();
  log_line("connection " + std::to_string(id) + " from " + peer);
  {
    json j;
    j["connection"] = id;
    j["peer"] = peer;
    log_json(j, "connection");
  }
  FrameBuffer buffer;
  std::vector<char> buf(65536);
  size_t messages = 0;
  // a peer that sent eom_token once is framing its messages, so a pause is not the end of one.
  bool framed = false;
  try {
    bool open = true;
    while (open) {
      // a peer that never send eom_token is done once it go quiet.
      bool waiting_legacy = config.legacy_idle.count() > 0 && !framed && !buffer.empty();
      pollfd pfd {fd, POLLIN, 0};
      int n = ::poll(&pfd, 1, waiting_legacy ? static_cast<int>(config.legacy_idle.count()) : -1);
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        throw std::runtime_error(std::string("poll: ") + strerror(errno));
      }
      if (n == 0) {
        ++messages;
        open = send_string(*conn, encode_response(handle(buffer.take(), peer)));
        continue;
      }
      ssize_t received = conn->rcv(buf.data(), buf.size());
      if (received <= 0) {
        break;
      }
      buffer.accept(buf.data(), received);
      while (open) {
        std::optional<std::string> message = buffer.next();
        if (!message) {
          break;
        }
        framed = true;
        ++messages;
        open = send_string(*conn, encode_response(handle(*message, peer)));
      }
      if (open && buffer.size() > config.max_request_bytes) {
        std::string error = format_error("ProtocolError", "message exceeds " + std::to_string(config.max_request_bytes) + " bytes");
        log_line(peer + ": " + error);
        ExecutionResult r = ExecutionResult::failure(FaultKind::ProtocolError, error);
        stats.record(r);
        send_string(*conn, encode_response(render(r, config.response_format)));
        open = false;
      }
    }
  } catch (const libsocket::socket_exception& e) {
    log_error("connection " + std::to_string(id) + ": " + e.mesg);
  } catch (const std::exception& e) {
    log_error("connection " + std::to_string(id) + ": " + e.what());
  }
  {
    std::lock_guard<std::mutex> guard(m);
    connections.erase(fd);
  }
  if (!buffer.empty()) {
    log_line("connection " + std::to_string(id) + " dropped " + std::to_string(buffer.size()) + " unterminated bytes");
  }
  log_line("connection " + std::to_string(id) + " closed after " + std::to_string(messages) + " messages");
  {
    json j;
    j["connection"] = id;
    j["peer"] = peer;
    j["messages"] = messages;
    log_json(j, "close");
    log_json(stats.report(), "stats");
  }
}

void Server::reap() {
  std::unique_lock<std::mutex> l(m);
  while (!stopping) {
    reaper_cv.wait_for(l, std::min<steady_clock::duration>(config.session_idle_ttl, seconds(1)));
    if (stopping) {
      break;
    }
    l.unlock();
    sessions.evict_idle(config.session_idle_ttl);
    l.lock();
  }
}
