#include "tunnelshare/tunnel/supervisor.hpp"

#include "tunnelshare/observability/global.hpp"

#include <array>
#include <cstring>
#include <system_error>
#include <vector>

#ifndef _WIN32
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace tunnelshare::tunnel {

namespace {

constexpr int kReaderPollMs = 200;

#ifndef _WIN32
bool make_pipe(int fds[2]) {
#ifdef __linux__
  return pipe2(fds, O_CLOEXEC) == 0;
#else
  if (pipe(fds) != 0) {
    return false;
  }
  fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  fcntl(fds[1], F_SETFD, FD_CLOEXEC);
  return true;
#endif
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

std::string describe_exit(const int status) {
  if (WIFEXITED(status)) {
    return "exit code " + std::to_string(WEXITSTATUS(status));
  }
  if (WIFSIGNALED(status)) {
    return "signal " + std::to_string(WTERMSIG(status));
  }
  return "exited";
}
#endif

} // namespace

std::string_view tunnel_status_name(const TunnelStatus status) {
  switch (status) {
  case TunnelStatus::Spawning:
    return "spawning";
  case TunnelStatus::Connecting:
    return "connecting";
  case TunnelStatus::Connected:
    return "connected";
  case TunnelStatus::Disconnected:
    return "disconnected";
  case TunnelStatus::Error:
    return "error";
  }
  return "unknown";
}

bool UrlSlot::offer(std::string url) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (url_.has_value()) {
      return false;
    }
    url_ = std::move(url);
  }
  cv_.notify_all();
  return true;
}

std::optional<std::string> UrlSlot::wait_for(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this]() { return url_.has_value(); });
  return url_;
}

std::optional<std::string> UrlSlot::peek() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return url_;
}

TunnelHandle::TunnelHandle(std::shared_ptr<ITunnelAgent> agent, std::string share_id,
                           TunnelListener listener)
    : agent_(std::move(agent)), share_id_(std::move(share_id)), listener_(std::move(listener)) {}

TunnelHandle::~TunnelHandle() { terminate(); }

common::Result<std::unique_ptr<TunnelHandle>>
TunnelHandle::spawn(std::shared_ptr<ITunnelAgent> agent, const std::uint16_t local_port,
                    std::string share_id, TunnelListener listener) {
  using HandleResult = common::Result<std::unique_ptr<TunnelHandle>>;
#ifdef _WIN32
  (void)agent;
  (void)local_port;
  (void)share_id;
  (void)listener;
  return HandleResult::failure(common::ErrorKind::TunnelSpawnFailure,
                               "tunnel agents are not implemented on Windows");
#else
  std::unique_ptr<TunnelHandle> handle(
      new TunnelHandle(std::move(agent), std::move(share_id), std::move(listener)));
  handle->emit(TunnelStatus::Spawning);

  const std::string command = handle->agent_->command_path();
  const std::vector<std::string> args = handle->agent_->build_args(local_port);
  std::vector<char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char *>(command.c_str()));
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  if (!make_pipe(out_pipe) || !make_pipe(err_pipe) || !make_pipe(exec_pipe)) {
    const std::string msg = std::strerror(errno);
    for (int *fds : {out_pipe, err_pipe, exec_pipe}) {
      close_fd(fds[0]);
      close_fd(fds[1]);
    }
    return HandleResult::failure(common::ErrorKind::TunnelSpawnFailure,
                                 "failed to create pipes: " + msg);
  }

  const pid_t pid = fork();
  if (pid < 0) {
    const std::string msg = std::strerror(errno);
    for (int *fds : {out_pipe, err_pipe, exec_pipe}) {
      close_fd(fds[0]);
      close_fd(fds[1]);
    }
    return HandleResult::failure(common::ErrorKind::TunnelSpawnFailure,
                                 "failed to fork tunnel agent: " + msg);
  }

  if (pid == 0) {
    setpgid(0, 0);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
    }
    execvp(command.c_str(), argv.data());
    const int err = errno;
    const ssize_t written = write(exec_pipe[1], &err, sizeof(err));
    (void)written;
    _exit(127);
  }

  setpgid(pid, pid);
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(exec_pipe[1]);

  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close_fd(exec_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    int status = 0;
    (void)waitpid(pid, &status, 0);
    return HandleResult::failure(common::ErrorKind::TunnelSpawnFailure,
                                 "failed to execute " + command + ": " +
                                     std::strerror(child_errno));
  }

  handle->process_.pid = pid;
  try {
    handle->exit_thread_ = std::thread([raw = handle.get()]() { raw->wait_exit(); });
  } catch (const std::system_error &e) {
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    handle->process_.signal_kill();
    int status = 0;
    (void)waitpid(pid, &status, 0);
    handle->exited_ = true;
    return HandleResult::failure(common::ErrorKind::TunnelSpawnFailure,
                                 std::string("failed to start exit waiter: ") + e.what());
  }

  handle->emit(TunnelStatus::Connecting);

  try {
    handle->stdout_thread_ =
        std::thread([raw = handle.get(), fd = out_pipe[0]]() { raw->read_stream(fd, "stdout"); });
    out_pipe[0] = -1;
    handle->stderr_thread_ =
        std::thread([raw = handle.get(), fd = err_pipe[0]]() { raw->read_stream(fd, "stderr"); });
    err_pipe[0] = -1;
  } catch (const std::system_error &e) {
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    handle->terminate();
    return HandleResult::failure(common::ErrorKind::TunnelSpawnFailure,
                                 std::string("failed to start output readers: ") + e.what());
  }

  return HandleResult::success(std::move(handle));
#endif
}

std::optional<std::string> TunnelHandle::wait_for_url(const std::chrono::milliseconds timeout) {
  return url_slot_.wait_for(timeout);
}

std::optional<std::string> TunnelHandle::public_url() const { return url_slot_.peek(); }

TunnelStatus TunnelHandle::status() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return status_;
}

bool TunnelHandle::has_exited() const {
  std::lock_guard<std::mutex> lock(exit_mutex_);
  return exited_;
}

void TunnelHandle::terminate(const std::chrono::milliseconds grace) {
  {
    std::unique_lock<std::mutex> lock(exit_mutex_);
    if (!terminated_) {
      terminated_ = true;
      if (!exited_ && exit_thread_.joinable()) {
        process_.signal_terminate();
        if (!exit_cv_.wait_for(lock, grace, [this]() { return exited_; })) {
          process_.signal_kill();
        }
      }
    }
  }

  {
    std::lock_guard<std::mutex> lock(readers_mutex_);
    stop_readers_ = true;
  }
  readers_cv_.notify_all();
  for (std::thread *thread : {&stdout_thread_, &stderr_thread_, &exit_thread_}) {
    if (thread->joinable() && thread->get_id() != std::this_thread::get_id()) {
      thread->join();
    }
  }
}

void TunnelHandle::read_stream(const int fd, const char *stream_name) {
#ifndef _WIN32
  std::string pending;
  std::array<char, 4096> buffer{};
  while (!stop_readers_) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    const int ready = poll(&pfd, 1, kReaderPollMs);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (ready == 0) {
      continue;
    }

    const ssize_t n = read(fd, buffer.data(), buffer.size());
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      break;
    }
    if (n == 0) {
      break;
    }
    pending.append(buffer.data(), static_cast<std::size_t>(n));

    std::size_t newline = 0;
    while ((newline = pending.find('\n')) != std::string::npos) {
      std::string line = pending.substr(0, newline);
      pending.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      handle_line(stream_name, line);
    }
  }

  if (!pending.empty()) {
    handle_line(stream_name, pending);
  }
  close(fd);
  {
    std::lock_guard<std::mutex> lock(readers_mutex_);
    --readers_open_;
  }
  readers_cv_.notify_all();
#else
  (void)fd;
  (void)stream_name;
#endif
}

void TunnelHandle::handle_line(const char *stream_name, const std::string &line) {
  if (line.empty()) {
    return;
  }
  observability::record_tunnel_output(share_id_, stream_name, line);

  if (auto url = agent_->extract_url(line); url.has_value()) {
    if (url_slot_.offer(*url)) {
      emit(TunnelStatus::Connected, std::move(url));
    } else {
      emit(TunnelStatus::Connected);
    }
    return;
  }
  if (line_reports_error(line)) {
    emit(TunnelStatus::Error, std::nullopt, line);
  }
}

void TunnelHandle::wait_exit() {
#ifndef _WIN32
  // Wait without reaping so the pid cannot be reused while terminate() may
  // still signal it; reap under the lock.
  siginfo_t info{};
  int rc = 0;
  do {
    rc = waitid(P_PID, static_cast<id_t>(process_.pid), &info, WEXITED | WNOWAIT);
  } while (rc != 0 && errno == EINTR);

  int status = 0;
  {
    std::lock_guard<std::mutex> lock(exit_mutex_);
    pid_t reaped = 0;
    do {
      reaped = waitpid(process_.pid, &status, 0);
    } while (reaped < 0 && errno == EINTR);
    exited_ = true;
  }
  exit_cv_.notify_all();

  // A grandchild may keep the pipes open, so the drain is bounded.
  {
    std::unique_lock<std::mutex> lock(readers_mutex_);
    readers_cv_.wait_for(lock, kReaderDrainTimeout,
                         [this]() { return readers_open_ <= 0 || stop_readers_; });
  }
  emit(TunnelStatus::Disconnected, std::nullopt, describe_exit(status));
#endif
}

void TunnelHandle::emit(const TunnelStatus status, std::optional<std::string> url,
                        std::optional<std::string> detail) {
  std::lock_guard<std::mutex> emit_lock(emit_mutex_);
  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    if (status_ == TunnelStatus::Disconnected) {
      return;
    }
    status_ = status;
  }
  observability::record_tunnel_status(share_id_, std::string(tunnel_status_name(status)),
                                      detail.value_or(""));
  if (listener_) {
    listener_(TunnelUpdate{
        .status = status, .public_url = std::move(url), .detail = std::move(detail)});
  }
}

} // namespace tunnelshare::tunnel
