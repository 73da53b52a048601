#include "server.hpp"

#include "blocking.hpp"
#include "command.hpp"
#include "datastore.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "protocol.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace emberkv {

namespace {

std::atomic<bool> g_shutdown{false};

constexpr int kMaxPollMs = 100;

bool set_nonblocking(int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

bool set_tcp_nodelay(int fd) {
  int yes = 1;
  return setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes)) == 0;
}

std::string errno_text() { return std::string(std::strerror(errno)); }

// Offset-tracked write buffer to avoid O(n) erase on partial writes
struct WriteBuf {
  std::string data;
  std::size_t offset = 0;

  bool empty() const { return offset >= data.size(); }
  std::size_t remaining() const { return data.size() - offset; }
  const char* ptr() const { return data.data() + offset; }
  void append(const std::string& s) { data.append(s); }
  void advance(std::size_t n) { offset += n; }
  void compact() {
    data.erase(0, offset);
    offset = 0;
  }
};

struct Connection {
  SessionState session;
  WriteBuf out;
};

int open_listener(const ServerConfig& config) {
  const int listen_fd = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd < 0) {
    log(LogLevel::Error, "socket() failed: " + errno_text());
    return -1;
  }

  int one = 1;
  if (setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) != 0) {
    log(LogLevel::Warn, "setsockopt(SO_REUSEADDR) failed: " + errno_text());
  }
  if (!set_nonblocking(listen_fd)) {
    log(LogLevel::Error, "cannot make listener non-blocking: " + errno_text());
    close(listen_fd);
    return -1;
  }

  sockaddr_in addr {};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(config.port));
  if (inet_pton(AF_INET, config.bind.c_str(), &addr.sin_addr) != 1) {
    log(LogLevel::Error, "invalid bind address: " + config.bind);
    close(listen_fd);
    return -1;
  }

  if (bind(listen_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    log(LogLevel::Error, "bind() failed on port " + std::to_string(config.port) + ": " + errno_text());
    close(listen_fd);
    return -1;
  }

  if (listen(listen_fd, 511) != 0) {
    log(LogLevel::Error, "listen() failed: " + errno_text());
    close(listen_fd);
    return -1;
  }
  return listen_fd;
}

// Owns every piece of cross-connection state. All of it is touched from the
// loop thread only, so commands never overlap.
class EventLoop {
 public:
  EventLoop(int listen_fd, int epoll_fd, int max_clients)
      : listen_fd_(listen_fd), epoll_fd_(epoll_fd), max_clients_(max_clients) {}

  ~EventLoop() {
    for (auto& entry : connections_) ::close(entry.first);
  }

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  void run() {
    std::vector<epoll_event> ep_events(1024);
    while (!shutdown_requested()) {
      const int nready = epoll_wait(epoll_fd_, ep_events.data(), static_cast<int>(ep_events.size()), poll_timeout());
      if (nready < 0) {
        if (errno == EINTR) continue;
        log(LogLevel::Error, "epoll_wait() failed: " + errno_text());
        break;
      }

      // Deadlines that passed while we slept fire before any new input is read.
      blocking_.expire(monotonic_ms());
      deliver_wakeups();

      for (int i = 0; i < nready && !shutdown_requested(); ++i) {
        const int fd = ep_events[i].data.fd;
        const uint32_t revents = ep_events[i].events;

        if (fd == listen_fd_) {
          accept_clients();
          continue;
        }
        if (connections_.find(fd) == connections_.end()) continue;

        if (revents & (EPOLLERR | EPOLLHUP)) {
          close_client(fd);
          continue;
        }
        if ((revents & EPOLLOUT) && !flush_output(fd)) {
          close_client(fd);
          continue;
        }
        if (revents & EPOLLIN) read_client(fd);
      }
    }
  }

 private:
  int poll_timeout() const {
    if (blocking_.has_ready()) return 0;
    const auto deadline = blocking_.next_deadline();
    if (!deadline.has_value()) return kMaxPollMs;
    const std::int64_t wait = *deadline - monotonic_ms();
    if (wait <= 0) return 0;
    return static_cast<int>(std::min<std::int64_t>(wait, kMaxPollMs));
  }

  void accept_clients() {
    while (true) {
      sockaddr_in client_addr {};
      socklen_t len = sizeof(client_addr);
      const int client_fd = accept4(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr), &len,
                                    SOCK_NONBLOCK | SOCK_CLOEXEC);
      if (client_fd < 0) {
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
          log(LogLevel::Warn, "accept4() failed: " + errno_text());
        }
        return;
      }

      if (static_cast<int>(connections_.size()) >= max_clients_) {
        static constexpr const char kErrMaxClients[] = "-ERR max number of clients reached\r\n";
        const ssize_t wn = ::write(client_fd, kErrMaxClients, sizeof(kErrMaxClients) - 1);
        if (wn < 0) log(LogLevel::Debug, "could not send maxclients error: " + errno_text());
        ::close(client_fd);
        continue;
      }

      set_tcp_nodelay(client_fd);

      epoll_event cev{};
      cev.events = EPOLLIN;
      cev.data.fd = client_fd;
      if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &cev) != 0) {
        log(LogLevel::Warn, "epoll_ctl(ADD) failed for client fd=" + std::to_string(client_fd) + ": " +
                                errno_text());
        ::close(client_fd);
        continue;
      }

      Connection conn;
      conn.session.client_id = ++last_client_id_;
      fd_by_client_[conn.session.client_id] = client_fd;
      connections_.emplace(client_fd, std::move(conn));
      log(LogLevel::Debug, "accepted client " + std::to_string(last_client_id_) + " fd=" + std::to_string(client_fd));
    }
  }

  void read_client(int fd) {
    char buf[16 * 1024];
    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return;
      close_client(fd);
      return;
    }

    auto& session = connections_.at(fd).session;
    if (n == 0) {
      try {
        session.decoder.finish();
      } catch (const ProtocolError& e) {
        log(LogLevel::Debug, "client " + std::to_string(session.client_id) + " closed mid-request: " + e.what());
      }
      close_client(fd);
      return;
    }

    session.decoder.feed(std::string_view(buf, static_cast<std::size_t>(n)));
    process_input(fd);
    deliver_wakeups();
  }

  // Runs every complete buffered request, in order, until the client blocks
  // or asks to close. Returns false if the connection was closed.
  bool process_input(int fd) {
    auto it = connections_.find(fd);
    if (it == connections_.end()) return false;
    auto& session = it->second.session;

    std::string batch_reply;
    bool protocol_failure = false;
    while (!session.blocked.active && !session.should_close) {
      std::optional<std::vector<std::string>> request;
      try {
        request = session.decoder.next();
      } catch (const ProtocolError& e) {
        log(LogLevel::Debug, "protocol error from client " + std::to_string(session.client_id) + ": " + e.what());
        encode_reply(Reply::error("ERR", std::string("Protocol error: ") + e.what()), batch_reply);
        protocol_failure = true;
        break;
      }
      if (!request.has_value()) break;

      CommandContext ctx{store_, blocking_, session};
      encode_reply(handle_command(*request, ctx), batch_reply);
    }

    if (!batch_reply.empty() && !enqueue_output(fd, batch_reply)) {
      close_client(fd);
      return false;
    }
    if (protocol_failure || session.should_close) {
      close_client(fd);
      return false;
    }
    return true;
  }

  // Sends replies owed to woken clients, then lets each of them resume its
  // pipelined input. Resuming may wake further clients; loop until quiet.
  void deliver_wakeups() {
    std::deque<Wakeup> pending;
    for (auto& w : blocking_.take_ready()) pending.push_back(std::move(w));

    while (!pending.empty()) {
      Wakeup w = std::move(pending.front());
      pending.pop_front();

      const auto fit = fd_by_client_.find(w.client_id);
      if (fit == fd_by_client_.end()) continue;
      const int fd = fit->second;
      auto& session = connections_.at(fd).session;
      session.blocked = BlockedState{};

      if (!enqueue_output(fd, encode_reply(w.reply))) {
        close_client(fd);
        continue;
      }
      // Pushes made by the resumed input wake others even if the client then closed.
      process_input(fd);
      for (auto& next : blocking_.take_ready()) pending.push_back(std::move(next));
    }
  }

  // Queue output for a client and attempt an immediate non-blocking flush.
  bool enqueue_output(int fd, const std::string& data) {
    if (data.empty()) return true;
    auto& wbuf = connections_.at(fd).out;
    const bool was_empty = wbuf.empty();
    wbuf.append(data);
    if (!write_pending(fd, wbuf)) return false;
    if (!wbuf.empty() && was_empty) {
      epoll_event ev{};
      ev.events = EPOLLIN | EPOLLOUT;
      ev.data.fd = fd;
      epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev);
    }
    return true;
  }

  bool flush_output(int fd) {
    auto& wbuf = connections_.at(fd).out;
    if (wbuf.empty()) return true;
    if (!write_pending(fd, wbuf)) return false;
    // Remove EPOLLOUT interest once the write buffer is fully drained.
    if (wbuf.empty()) {
      epoll_event ev{};
      ev.events = EPOLLIN;
      ev.data.fd = fd;
      epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev);
    }
    return true;
  }

  static bool write_pending(int fd, WriteBuf& wbuf) {
    while (!wbuf.empty()) {
      const ssize_t n = ::write(fd, wbuf.ptr(), wbuf.remaining());
      if (n < 0) {
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) break;
        return false;
      }
      if (n == 0) break;
      wbuf.advance(static_cast<std::size_t>(n));
    }
    if (wbuf.empty()) {
      wbuf.data.clear();
      wbuf.offset = 0;
    } else if (wbuf.offset > 65536) {
      wbuf.compact();
    }
    return true;
  }

  void close_client(int fd) {
    auto it = connections_.find(fd);
    if (it == connections_.end()) return;
    const std::uint64_t client_id = it->second.session.client_id;
    // Best effort: push out whatever is still queued, e.g. a QUIT reply.
    if (!it->second.out.empty() && !write_pending(fd, it->second.out)) {
      log(LogLevel::Debug, "dropping unsent output for client " + std::to_string(client_id) + ": " + errno_text());
    }
    blocking_.cancel(client_id);
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    ::close(fd);
    fd_by_client_.erase(client_id);
    connections_.erase(it);
    log(LogLevel::Debug, "closed client " + std::to_string(client_id));
  }

  int listen_fd_;
  int epoll_fd_;
  int max_clients_;
  std::uint64_t last_client_id_ = 0;
  DataStore store_;
  BlockingCoordinator blocking_;
  std::unordered_map<int, Connection> connections_;
  std::unordered_map<std::uint64_t, int> fd_by_client_;
};

} // namespace

void request_shutdown() { g_shutdown.store(true); }

bool shutdown_requested() { return g_shutdown.load(); }

void reset_shutdown_request() { g_shutdown.store(false); }

int run_server(const ServerConfig& config) {
  const int listen_fd = open_listener(config);
  if (listen_fd < 0) return 1;

  const int epoll_fd = epoll_create1(EPOLL_CLOEXEC);
  if (epoll_fd < 0) {
    log(LogLevel::Error, "epoll_create1() failed: " + errno_text());
    close(listen_fd);
    return 1;
  }

  epoll_event ev{};
  ev.events = EPOLLIN;
  ev.data.fd = listen_fd;
  if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, listen_fd, &ev) != 0) {
    log(LogLevel::Error, "epoll_ctl(ADD) failed for listener: " + errno_text());
    close(epoll_fd);
    close(listen_fd);
    return 1;
  }

  log(LogLevel::Info, "emberkv-server listening on " + config.bind + ":" + std::to_string(config.port));

  {
    EventLoop loop(listen_fd, epoll_fd, config.maxclients);
    loop.run();
  }

  close(listen_fd);
  close(epoll_fd);
  log(LogLevel::Info, "emberkv-server stopped");
  return 0;
}

}  // namespace emberkv
