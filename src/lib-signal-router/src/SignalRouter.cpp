#include "webctl/SignalRouter.hpp"

#include <pthread.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>
#include <system_error>

namespace webctl {

namespace {

void validateSignal(int signum) {
  if (signum <= 0 || signum >= NSIG || signum == SIGKILL || signum == SIGSTOP) {
    throw std::invalid_argument("SignalRouter: Invalid signal number: " +
                                std::to_string(signum));
  }
}

}  // namespace

SignalRouter::SignalRouter() {
  sigemptyset(&blocked_mask_);
  if (pthread_sigmask(SIG_SETMASK, nullptr, &original_mask_) != 0) {
    throw std::system_error(errno, std::system_category(),
                            "SignalRouter: pthread_sigmask(GET) failed");
  }
  signal_fd_ = signalfd(-1, &blocked_mask_, SFD_NONBLOCK | SFD_CLOEXEC);
  if (signal_fd_ == -1) {
    throw std::system_error(errno, std::system_category(),
                            "SignalRouter: signalfd create failed");
  }
}

void SignalRouter::registerHandler(int signum, Handler handler) {
  validateSignal(signum);

  std::lock_guard<std::mutex> lock(handlers_mutex_);

  sigaddset(&blocked_mask_, signum);
  if (int rc = pthread_sigmask(SIG_BLOCK, &blocked_mask_, nullptr); rc != 0) {
    throw std::system_error(rc, std::system_category(),
                            "SignalRouter: pthread_sigmask(BLOCK) failed");
  }

  // Обновляем signalfd
  if (signalfd(signal_fd_, &blocked_mask_, 0) == -1) {
    throw std::system_error(errno, std::system_category(),
                            "SignalRouter: signalfd configure failed");
  }

  handlers_[signum].push_back(std::move(handler));
}

void SignalRouter::unregisterHandler(int signum) {
  validateSignal(signum);

  std::lock_guard<std::mutex> lock(handlers_mutex_);
  handlers_.erase(signum);

  if (!sigismember(&blocked_mask_, signum)) return;
  sigdelset(&blocked_mask_, signum);
  if (signalfd(signal_fd_, &blocked_mask_, 0) == -1) {
    throw std::system_error(errno, std::system_category(),
                            "SignalRouter: signalfd configure failed");
  }

  if (!sigismember(&original_mask_, signum)) {
    sigset_t single_mask;
    sigemptyset(&single_mask);
    sigaddset(&single_mask, signum);
    pthread_sigmask(SIG_UNBLOCK, &single_mask, nullptr);
  }
}

void SignalRouter::start() {
  if (running_.exchange(true)) return;

  int epoll_fd = epoll_create1(EPOLL_CLOEXEC);
  if (epoll_fd == -1) {
    running_ = false;
    throw std::system_error(errno, std::system_category(),
                            "SignalRouter: epoll_create1 failed");
  }

  struct epoll_event ev {};
  ev.events = EPOLLIN;
  ev.data.fd = signal_fd_;
  if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, signal_fd_, &ev) == -1) {
    int err = errno;
    close(epoll_fd);
    running_ = false;
    throw std::system_error(err, std::system_category(),
                            "SignalRouter: epoll_ctl failed");
  }

  worker_thread_ = std::thread([this, epoll_fd] { processSignals(epoll_fd); });
}

void SignalRouter::processSignals(int epoll_fd) {
  constexpr int MAX_EVENTS = 10;
  struct epoll_event events[MAX_EVENTS];

  while (running_) {
    int nfds = epoll_wait(epoll_fd, events, MAX_EVENTS, 100);
    if (nfds == -1) {
      if (errno == EINTR) continue;
      break;
    }

    for (int i = 0; i < nfds; ++i) {
      if (events[i].data.fd != signal_fd_) continue;

      struct signalfd_siginfo fdsi;
      while (read(signal_fd_, &fdsi, sizeof(fdsi)) == sizeof(fdsi)) {
        dispatch(static_cast<int>(fdsi.ssi_signo));
      }
    }
  }

  close(epoll_fd);
}

void SignalRouter::dispatch(int signum) {
  std::vector<Handler> handlers;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    if (auto it = handlers_.find(signum); it != handlers_.end()) {
      handlers = it->second;
    }
  }
  for (auto& handler : handlers) {
    handler(signum);
  }
}

void SignalRouter::stop() noexcept {
  running_ = false;
  if (worker_thread_.joinable()) {
    worker_thread_.join();
  }
}

SignalRouter::~SignalRouter() {
  stop();
  close(signal_fd_);
  pthread_sigmask(SIG_SETMASK, &original_mask_, nullptr);
}

}  // namespace webctl
