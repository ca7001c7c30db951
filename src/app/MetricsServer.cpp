#ifdef PROCSIGHT_HAVE_URING

#include "app/MetricsServer.hpp"
#include <liburing.h>
#include <sys/socket.h>
#include <sys/eventfd.h>
#include <sys/uio.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace procsight::app {

namespace {

enum class UringTag : uint64_t { ListenPoll = 1, StopPoll = 2 };

int open_listener(uint16_t port) {
  int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
  if (fd < 0) {
    std::fprintf(stderr, "procsight: MetricsServer: socket() failed: %s\n", std::strerror(errno));
    return -1;
  }
  int optval = 1;
  (void)::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

  struct sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = INADDR_ANY;
  if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::fprintf(stderr, "procsight: MetricsServer: bind(:%d) failed: %s\n", port, std::strerror(errno));
    ::close(fd);
    return -1;
  }
  if (::listen(fd, 8) < 0) {
    std::fprintf(stderr, "procsight: MetricsServer: listen() failed: %s\n", std::strerror(errno));
    ::close(fd);
    return -1;
  }
  return fd;
}

void arm_poll(struct io_uring& ring, int fd, UringTag tag) {
  struct io_uring_sqe* sqe = io_uring_get_sqe(&ring);
  if (!sqe) return;
  io_uring_prep_poll_add(sqe, fd, POLLIN);
  io_uring_sqe_set_data64(sqe, static_cast<uint64_t>(tag));
}

} // namespace

MetricsServer::MetricsServer(const SnapshotBuffers& buffers, uint16_t port)
    : buffers_(buffers), port_(port) {}

MetricsServer::~MetricsServer() { stop(); }

void MetricsServer::start() {
  if (thread_.joinable()) return;
  // Created before the thread so stop() always has something to signal.
  stop_eventfd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (stop_eventfd_ < 0) {
    std::fprintf(stderr, "procsight: MetricsServer: eventfd() failed: %s\n", std::strerror(errno));
    return;
  }
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void MetricsServer::stop() {
  if (!thread_.joinable()) return;
  uint64_t val = 1;
  (void)::write(stop_eventfd_, &val, sizeof(val));
  thread_.request_stop();
  thread_.join();
  ::close(stop_eventfd_);
  stop_eventfd_ = -1;
}

void MetricsServer::run(std::stop_token st) {
  listen_fd_ = open_listener(port_);
  if (listen_fd_ < 0) return;

  struct io_uring ring{};
  int rc = io_uring_queue_init(16, &ring, 0);
  if (rc < 0) {
    std::fprintf(stderr, "procsight: MetricsServer: io_uring_queue_init() failed: %s\n", std::strerror(-rc));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return;
  }

  arm_poll(ring, listen_fd_, UringTag::ListenPoll);
  arm_poll(ring, stop_eventfd_, UringTag::StopPoll);
  io_uring_submit(&ring);

  std::fprintf(stderr, "procsight: MetricsServer: listening on :%d\n", port_);

  while (!st.stop_requested()) {
    struct io_uring_cqe* cqe = nullptr;
    int ret = io_uring_wait_cqe(&ring, &cqe);
    if (ret == -EINTR) continue;
    if (ret < 0) {
      std::fprintf(stderr, "procsight: MetricsServer: io_uring_wait_cqe() failed: %s\n", std::strerror(-ret));
      break;
    }

    auto tag = static_cast<UringTag>(io_uring_cqe_get_data64(cqe));
    int res = cqe->res;
    io_uring_cqe_seen(&ring, cqe);
    if (tag == UringTag::StopPoll) break;

    if (res >= 0) {
      int client_fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
      if (client_fd >= 0) {
        handle_client(client_fd);
        ::close(client_fd);
      }
    }
    arm_poll(ring, listen_fd_, UringTag::ListenPoll);
    io_uring_submit(&ring);
  }

  io_uring_queue_exit(&ring);
  ::close(listen_fd_);
  listen_fd_ = -1;
}

void MetricsServer::handle_client(int fd) {
  // Slow clients must not stall the accept loop
  struct timeval tv{.tv_sec = 5, .tv_usec = 0};
  (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  (void)::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  int one = 1;
  (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

  char reqbuf[4096];
  ssize_t nr = ::recv(fd, reqbuf, sizeof(reqbuf) - 1, 0);
  if (nr <= 0) return;

  std::string_view req(reqbuf, static_cast<size_t>(nr));
  auto line_end = req.find_first_of("\r\n");
  HttpResponse resp = route_request(req.substr(0, line_end), buffers_);
  std::string headers = response_headers(resp);

  // headers + body without concatenating them
  struct iovec iov[2] = {
    {.iov_base = headers.data(), .iov_len = headers.size()},
    {.iov_base = resp.body.data(), .iov_len = resp.body.size()}
  };
  struct msghdr msg{};
  msg.msg_iov = iov;
  msg.msg_iovlen = 2;
  if (::sendmsg(fd, &msg, MSG_NOSIGNAL) < 0) {
    std::fprintf(stderr, "procsight: MetricsServer: sendmsg() failed: %s\n", std::strerror(errno));
  }
}

} // namespace procsight::app

#endif // PROCSIGHT_HAVE_URING
