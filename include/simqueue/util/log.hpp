#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <unistd.h>
#include <utility>
#include <variant>
#include <vector>

namespace simqueue::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", "\o{33}[36m", "\o{33}[32m", "\o{33}[33m", "\o{33}[31m"};

inline constexpr std::string_view kColorReset = "\o{33}[0m";

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name) noexcept
    -> Level {
  const auto *it = std::ranges::find(level_names, name);
  return it != level_names.end()
             ? static_cast<Level>(std::distance(level_names.begin(), it))
             : Level::Info;
}

/// One formatted log line waiting for the writer thread.
struct Record {
  Level level{Level::Info};
  std::chrono::system_clock::time_point time;
  std::size_t thread{0};
  std::string text;
};

/// Switches the sink. An empty path means stdout.
struct Redirect {
  std::string path;
};

using Entry = std::variant<Record, Redirect>;

class Logger {
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kBatchSize = 64;
  using Channel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, Entry)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<FILE *> sink_{stdout};
  std::atomic<std::uint64_t> dropped_{0};
  FILE *owned_file_{nullptr};
  boost::asio::io_context channel_ctx_{1};
  std::atomic<std::shared_ptr<Channel>> channel_;
  std::jthread writer_;

  static auto this_thread_tag() -> std::size_t {
    return std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
  }

  static auto render(const Record &rec, bool color) -> std::string {
    auto secs = std::chrono::floor<std::chrono::seconds>(rec.time);
    if (color) {
      return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", secs,
                         level_colors.at(std::to_underlying(rec.level)),
                         level_name(rec.level), kColorReset, rec.thread,
                         rec.text);
    }
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", secs,
                       level_name(rec.level), rec.thread, rec.text);
  }

  static auto is_terminal(FILE *out) noexcept -> bool {
    if (out == nullptr) {
      return false;
    }
    const int fd = ::fileno(out);
    return fd >= 0 && ::isatty(fd) != 0;
  }

  auto current_sink() const noexcept -> FILE * {
    auto *out = sink_.load(std::memory_order_acquire);
    return out != nullptr ? out : stdout;
  }

  auto write_now(const Record &rec) -> void {
    auto *out = current_sink();
    auto line = render(rec, is_terminal(out));
    std::fwrite(line.data(), 1, line.size(), out);
    std::fflush(out);
  }

  auto open_sink(const std::string &path) -> bool {
    if (path.empty()) {
      sink_.store(stdout, std::memory_order_release);
      if (owned_file_ != nullptr) {
        std::fclose(owned_file_);
        owned_file_ = nullptr;
      }
      return true;
    }
    FILE *f = std::fopen(path.c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    sink_.store(f, std::memory_order_release);
    if (owned_file_ != nullptr) {
      std::fclose(owned_file_);
    }
    owned_file_ = f;
    return true;
  }

  auto apply(Entry &entry) -> void {
    std::visit(
        [this](auto &e) {
          using E = std::decay_t<decltype(e)>;
          if constexpr (std::is_same_v<E, Redirect>) {
            (void)open_sink(e.path);
          } else {
            auto *out = current_sink();
            auto line = render(e, is_terminal(out));
            std::fwrite(line.data(), 1, line.size(), out);
          }
        },
        entry);
  }

  auto drain(Channel &channel, std::vector<Entry> &batch) -> void {
    while (batch.size() < kBatchSize) {
      bool got = channel.try_receive(
          [&](const boost::system::error_code &ec, Entry e) {
            if (!ec) {
              batch.push_back(std::move(e));
            }
          });
      if (!got) {
        break;
      }
    }
  }

  auto writer_loop(std::shared_ptr<Channel> channel) -> void {
    std::vector<Entry> batch;
    batch.reserve(kBatchSize);

    while (running_.load(std::memory_order_acquire)) {
      boost::system::error_code recv_ec;
      batch.clear();
      channel->async_receive(
          [&](const boost::system::error_code &ec, Entry e) {
            recv_ec = ec;
            if (!ec) {
              batch.push_back(std::move(e));
            }
          });
      channel_ctx_.restart();
      (void)channel_ctx_.run_one();
      if (recv_ec) {
        break;
      }
      drain(*channel, batch);
      for (auto &e : batch) {
        apply(e);
      }
      std::fflush(current_sink());
    }

    for (;;) {
      batch.clear();
      drain(*channel, batch);
      if (batch.empty()) {
        break;
      }
      for (auto &e : batch) {
        apply(e);
      }
    }
    std::fflush(current_sink());
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (owned_file_ != nullptr) {
      std::fclose(owned_file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel))
      return;
    channel_ctx_.restart();
    auto channel =
        std::make_shared<Channel>(channel_ctx_.get_executor(), kQueueCapacity);
    channel_.store(channel, std::memory_order_release);
    writer_ = std::jthread([this, channel] { writer_loop(channel); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel))
      return;
    if (auto channel = channel_.exchange(nullptr, std::memory_order_acq_rel)) {
      channel->close();
    }
    channel_ctx_.stop();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() noexcept -> void {
    sink_.store(stderr, std::memory_order_release);
  }

  /// Before start() the file is opened immediately; afterwards the switch
  /// is queued behind pending records.
  auto set_output_file(std::string_view path) -> bool {
    if (auto channel = channel_.load(std::memory_order_acquire)) {
      return channel->try_send(boost::system::error_code{},
                               Entry{Redirect{std::string(path)}});
    }
    return open_sink(std::string(path));
  }

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    Record rec{level, std::chrono::system_clock::now(), this_thread_tag(),
               std::format(fmt, std::forward<Args>(args)...)};

    auto channel = channel_.load(std::memory_order_acquire);
    if (!channel) {
      write_now(rec);
      return;
    }
    if (channel->try_send(boost::system::error_code{}, Entry{rec})) {
      return;
    }
    // Queue full: never block a caller when nobody is watching the output.
    if (!is_terminal(current_sink())) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
      return;
    }
    write_now(rec);
  }
};

inline auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() noexcept -> void {
  logger().set_output_stderr();
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace simqueue::log
