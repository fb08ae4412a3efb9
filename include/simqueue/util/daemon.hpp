#pragma once

#include "simqueue/core/error.hpp"

#include <boost/interprocess/sync/file_lock.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace simqueue {

/// Set by SIGINT/SIGTERM; `simqueue serve` blocks on it in the foreground.
extern std::atomic<bool> g_shutdown_requested;

/// Exclusive ownership of the server pid file. The file holds the owner's pid
/// and an advisory lock for as long as the guard lives; destruction removes
/// it. Acquiring a file locked by a live server fails with Error::Conflict, a
/// file left behind by a dead one is taken over.
class PidFileGuard {
public:
  PidFileGuard() = default;
  ~PidFileGuard();

  PidFileGuard(const PidFileGuard &) = delete;
  auto operator=(const PidFileGuard &) -> PidFileGuard & = delete;
  PidFileGuard(PidFileGuard &&other) noexcept;
  auto operator=(PidFileGuard &&other) noexcept -> PidFileGuard &;

  [[nodiscard]] static auto acquire(std::string_view path)
      -> Result<PidFileGuard>;

private:
  PidFileGuard(std::string path, boost::interprocess::file_lock lock) noexcept;
  auto release() noexcept -> void;

  std::string path_;
  std::optional<boost::interprocess::file_lock> lock_;
};

/// Detach from the terminal (double fork). Only the grandchild returns.
[[nodiscard]] auto daemonize() -> Result<void>;

[[nodiscard]] auto read_pid_file(std::string_view path) -> Result<std::int64_t>;
[[nodiscard]] auto remove_pid_file(std::string_view path) -> Result<void>;

[[nodiscard]] auto is_process_alive(std::int64_t pid) -> bool;
[[nodiscard]] auto send_signal(std::int64_t pid, int signal_no) -> Result<void>;
/// Polls until `pid` is gone; false if it outlived `timeout`.
[[nodiscard]] auto wait_for_process_exit(std::int64_t pid,
                                         std::chrono::milliseconds timeout)
    -> bool;

void setup_signal_handlers();
void wait_for_shutdown();

} // namespace simqueue
