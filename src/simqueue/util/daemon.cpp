#include "simqueue/util/daemon.hpp"

#include "simqueue/util/conv.hpp"

#include <boost/filesystem.hpp>
#include <boost/interprocess/exceptions.hpp>

#include <csignal>
#include <fstream>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>
#include <utility>

namespace simqueue {

std::atomic<bool> g_shutdown_requested{false};

namespace {

namespace fs = boost::filesystem;
namespace ipc = boost::interprocess;

constexpr auto kExitPollInterval = std::chrono::milliseconds(100);

auto from_boost(const boost::system::error_code &ec) -> std::error_code {
  return {ec.value(), std::system_category()};
}

// Creates the file (and its directory) without truncating it: a running
// server's lock lives on that inode.
auto touch_pid_file(const fs::path &path) -> Result<void> {
  boost::system::error_code ec;
  if (const auto dir = path.parent_path(); !dir.empty()) {
    fs::create_directories(dir, ec);
    if (ec) {
      return fail(from_boost(ec));
    }
  }
  std::ofstream touch(path.string(), std::ios::app);
  if (!touch.is_open()) {
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

auto write_own_pid(const std::string &path) -> Result<void> {
  std::ofstream out(path, std::ios::in | std::ios::out);
  if (!out.is_open()) {
    return fail(Error::FileOpenFailed);
  }
  out << ::getpid() << '\n';
  out.flush();
  if (!out.good()) {
    return fail(Error::FileOpenFailed);
  }
  // Drop whatever a longer stale pid left past our newline.
  const auto length = static_cast<off_t>(static_cast<std::streamoff>(out.tellp()));
  return sys_check(::truncate(path.c_str(), length)).transform([](int) {});
}

auto fork_and_exit_parent() -> Result<void> {
  return sys_check(::fork()).transform([](pid_t pid) {
    if (pid > 0) {
      ::_Exit(0);
    }
  });
}

void on_shutdown_signal(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
  g_shutdown_requested.notify_one();
}

} // namespace

PidFileGuard::PidFileGuard(std::string path, ipc::file_lock lock) noexcept
    : path_(std::move(path)), lock_(std::move(lock)) {}

PidFileGuard::~PidFileGuard() { release(); }

PidFileGuard::PidFileGuard(PidFileGuard &&other) noexcept
    : path_(std::move(other.path_)), lock_(std::exchange(other.lock_, {})) {}

auto PidFileGuard::operator=(PidFileGuard &&other) noexcept -> PidFileGuard & {
  if (this != &other) {
    release();
    path_ = std::move(other.path_);
    lock_ = std::exchange(other.lock_, {});
  }
  return *this;
}

auto PidFileGuard::acquire(std::string_view path) -> Result<PidFileGuard> {
  if (path.empty()) {
    return fail(Error::InvalidArgument);
  }
  std::string file(path);
  if (auto r = touch_pid_file(fs::path(file)); !r) {
    return fail(r.error());
  }

  ipc::file_lock lock;
  try {
    lock = ipc::file_lock(file.c_str());
    if (!lock.try_lock()) {
      return fail(Error::Conflict);
    }
  } catch (const ipc::interprocess_exception &e) {
    return fail(std::error_code(e.get_native_error(), std::system_category()));
  }

  if (auto r = write_own_pid(file); !r) {
    return fail(r.error());
  }
  return ok(PidFileGuard(std::move(file), std::move(lock)));
}

auto PidFileGuard::release() noexcept -> void {
  if (!lock_) {
    return;
  }
  // Unlink before unlocking so `serve start` in another process never sees a
  // stale pid under a free lock.
  boost::system::error_code ec;
  fs::remove(fs::path(path_), ec);
  try {
    lock_->unlock();
  } catch (const ipc::interprocess_exception &) {
    // Closing the descriptor below drops the lock regardless.
  }
  lock_.reset();
}

auto daemonize() -> Result<void> {
  return fork_and_exit_parent()
      .and_then([] { return sys_check(::setsid()); })
      .and_then([](pid_t) { return fork_and_exit_parent(); })
      .transform([] {
        ::umask(0);
        for (int fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
          (void)::close(fd);
        }
      });
}

auto read_pid_file(std::string_view path) -> Result<std::int64_t> {
  std::ifstream in{std::string(path)};
  if (!in.is_open()) {
    return fail(Error::FileNotFound);
  }
  std::string line;
  std::getline(in, line);
  if (auto pid = util::parse_int<std::int64_t>(line); pid && *pid > 0) {
    return *pid;
  }
  return fail(Error::ParseError);
}

auto remove_pid_file(std::string_view path) -> Result<void> {
  boost::system::error_code ec;
  fs::remove(fs::path(std::string(path)), ec);
  if (ec) {
    return fail(from_boost(ec));
  }
  return ok();
}

auto is_process_alive(std::int64_t pid) -> bool {
  if (pid <= 0) {
    return false;
  }
  return ::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM;
}

auto send_signal(std::int64_t pid, int signal_no) -> Result<void> {
  if (pid <= 0) {
    return fail(Error::InvalidArgument);
  }
  return sys_check(::kill(static_cast<pid_t>(pid), signal_no))
      .transform([](int) {});
}

auto wait_for_process_exit(std::int64_t pid, std::chrono::milliseconds timeout)
    -> bool {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (is_process_alive(pid)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(kExitPollInterval);
  }
  return true;
}

void setup_signal_handlers() {
  std::signal(SIGINT, on_shutdown_signal);
  std::signal(SIGTERM, on_shutdown_signal);
  std::signal(SIGPIPE, SIG_IGN);
}

void wait_for_shutdown() {
  g_shutdown_requested.wait(false, std::memory_order_acquire);
}

} // namespace simqueue
