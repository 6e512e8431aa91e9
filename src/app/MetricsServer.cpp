#ifdef IDEGUARD_HAVE_URING

#include "app/MetricsServer.hpp"
#include <liburing.h>
#include <cerrno>
#include <sys/socket.h>
#include <sys/eventfd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <unistd.h>
#include <cstdio>
#include <cstring>
#include <charconv>
#include <string_view>
#include <sys/time.h>
#include <sys/uio.h>

namespace ideguard::app {

// Tags for distinguishing CQE sources
enum class UringTag : uint64_t { ListenPoll = 1, StopPoll = 2 };

MetricsServer::MetricsServer(const StatsBuffers& buffers, uint16_t port)
    : buffers_(buffers), port_(port) {}

MetricsServer::~MetricsServer() { stop(); }

bool MetricsServer::available() { return true; }

static int open_listener(uint16_t port) {
  int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
  if (fd < 0) {
    std::fprintf(stderr, "ideguard: metrics server: socket() failed: %s\n", std::strerror(errno));
    return -1;
  }
  int optval = 1;
  (void)::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

  // Loopback only: the counters describe the local user's editor session
  struct sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

  const char* step = nullptr;
  if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) step = "bind";
  else if (::listen(fd, 4) < 0) step = "listen";
  if (step) {
    std::fprintf(stderr, "ideguard: metrics server: %s(127.0.0.1:%d) failed: %s\n", step, port, std::strerror(errno));
    ::close(fd);
    return -1;
  }
  return fd;
}

void MetricsServer::start() {
  if (thread_.joinable()) return;
  // Created before the thread so stop() can always signal it
  stop_eventfd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (stop_eventfd_ < 0) {
    std::fprintf(stderr, "ideguard: metrics server: eventfd() failed: %s\n", std::strerror(errno));
    return;
  }
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void MetricsServer::stop() {
  if (thread_.joinable()) {
    uint64_t val = 1;
    (void)::write(stop_eventfd_, &val, sizeof(val));
    thread_.request_stop();
    thread_.join();
  }
  if (stop_eventfd_ >= 0) { ::close(stop_eventfd_); stop_eventfd_ = -1; }
}

void MetricsServer::run(std::stop_token st) {
  listen_fd_ = open_listener(port_);
  if (listen_fd_ < 0) return;

  struct io_uring ring{};
  if (int rc = io_uring_queue_init(16, &ring, 0); rc < 0) {
    std::fprintf(stderr, "ideguard: metrics server: io_uring_queue_init() failed: %s\n", std::strerror(-rc));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return;
  }

  auto submit_poll = [&](int fd, UringTag tag) {
    struct io_uring_sqe* sqe = io_uring_get_sqe(&ring);
    io_uring_prep_poll_add(sqe, fd, POLLIN);
    io_uring_sqe_set_data64(sqe, static_cast<uint64_t>(tag));
  };

  submit_poll(listen_fd_, UringTag::ListenPoll);
  submit_poll(stop_eventfd_, UringTag::StopPoll);
  io_uring_submit(&ring);

  std::fprintf(stderr, "ideguard: metrics server listening on 127.0.0.1:%d\n", port_);

  while (!st.stop_requested()) {
    struct io_uring_cqe* cqe = nullptr;
    int ret = io_uring_wait_cqe(&ring, &cqe);
    if (ret < 0) {
      if (ret == -EINTR) continue;
      break;
    }

    auto tag = static_cast<UringTag>(io_uring_cqe_get_data64(cqe));
    int res = cqe->res;
    io_uring_cqe_seen(&ring, cqe);

    if (tag == UringTag::StopPoll || st.stop_requested()) {
      break;
    }

    if (tag == UringTag::ListenPoll && res >= 0) {
      int client_fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
      if (client_fd >= 0) {
        handle_client(client_fd);
        ::close(client_fd);
      }
      submit_poll(listen_fd_, UringTag::ListenPoll);
      io_uring_submit(&ring);
    }
  }

  io_uring_queue_exit(&ring);
  if (listen_fd_ >= 0) { ::close(listen_fd_); listen_fd_ = -1; }
}

static std::string response_head(std::string_view status, std::string_view content_type, size_t body_len) {
  std::string h = "HTTP/1.1 ";
  h += status;
  h += "\r\nContent-Type: ";
  h += content_type;
  h += "\r\nConnection: close\r\nContent-Length: ";
  char len_buf[24];
  auto [ptr, ec] = std::to_chars(len_buf, len_buf + sizeof(len_buf), body_len);
  h.append(len_buf, ptr);
  h += "\r\n\r\n";
  return h;
}

void MetricsServer::handle_client(int fd) {
  // A stalled scraper must not hold up shutdown for long
  struct timeval tv{.tv_sec = 2, .tv_usec = 0};
  (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  (void)::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  int one = 1;
  (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

  char reqbuf[2048];
  ssize_t nr = ::recv(fd, reqbuf, sizeof(reqbuf), 0);
  if (nr <= 0) return;
  std::string_view req(reqbuf, static_cast<size_t>(nr));
  std::string_view request_line = req.substr(0, req.find_first_of("\r\n"));

  const bool head_only = request_line.starts_with("HEAD ");
  std::string_view target;
  if (auto sp = request_line.find(' '); sp != std::string_view::npos) {
    target = request_line.substr(sp + 1);
    target = target.substr(0, target.find(' '));
  }

  std::string body;
  std::string headers;
  if (!request_line.starts_with("GET ") && !head_only) {
    body = "405 Method Not Allowed\n";
    headers = response_head("405 Method Not Allowed", "text/plain", body.size());
  } else if (target == "/metrics") {
    body = stats_to_prometheus(buffers_.read());
    headers = response_head("200 OK", "text/plain; version=0.0.4; charset=utf-8", body.size());
  } else if (target == "/") {
    body = "ideguard: use /metrics\n";
    headers = response_head("200 OK", "text/plain", body.size());
  } else {
    body = "404 Not Found\n";
    headers = response_head("404 Not Found", "text/plain", body.size());
  }
  if (head_only) body.clear();

  struct iovec iov[2] = {
    {.iov_base = headers.data(), .iov_len = headers.size()},
    {.iov_base = body.data(), .iov_len = body.size()}
  };
  struct msghdr msg{};
  msg.msg_iov = iov;
  msg.msg_iovlen = body.empty() ? 1 : 2;
  (void)::sendmsg(fd, &msg, MSG_NOSIGNAL);
}

} // namespace ideguard::app

#endif // IDEGUARD_HAVE_URING
