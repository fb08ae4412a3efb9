#pragma once

#include "simqueue/queue/job.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

namespace simqueue::cli::fmt {

namespace ansi {

inline auto is_tty() noexcept -> bool {
  static const bool tty = ::isatty(::fileno(stdout));
  return tty;
}

inline constexpr std::string_view kReset = "\033[0m";
inline constexpr std::string_view kBold = "\033[1m";
inline constexpr std::string_view kDim = "\033[2m";
inline constexpr std::string_view kGreen = "\033[32m";
inline constexpr std::string_view kRed = "\033[31m";
inline constexpr std::string_view kYellow = "\033[33m";
inline constexpr std::string_view kBlue = "\033[34m";

inline auto colorize(std::string_view text, std::string_view color)
    -> std::string {
  if (!is_tty()) {
    return std::string(text);
  }
  return std::format("{}{}{}", color, text, kReset);
}

inline auto bold(std::string_view text) -> std::string {
  return colorize(text, kBold);
}

inline auto dim(std::string_view text) -> std::string {
  return colorize(text, kDim);
}

inline auto ansi_visible_width(std::string_view s) -> std::size_t {
  std::size_t width = 0;
  bool in_escape = false;
  for (char c : s) {
    if (in_escape) {
      if (c == 'm')
        in_escape = false;
    } else if (c == '\033') {
      in_escape = true;
    } else {
      ++width;
    }
  }
  return width;
}

} // namespace ansi

inline auto colorize_status(JobStatus status) -> std::string {
  const auto text = to_string_view(status);
  switch (status) {
  case JobStatus::Pending:
    return ansi::colorize(text, ansi::kDim);
  case JobStatus::Running:
    return ansi::colorize(text, ansi::kBlue);
  case JobStatus::Completed:
    return ansi::colorize(text, ansi::kGreen);
  case JobStatus::Failed:
    return ansi::colorize(text, ansi::kRed);
  case JobStatus::Cancelled:
    return ansi::colorize(text, ansi::kYellow);
  }
  return std::string(text);
}

/// Fixed-width text table for `simqueue jobs`. Cells may carry ANSI colour;
/// padding is computed on the visible width.
class Table {
public:
  struct Column {
    std::string header;
    std::size_t width;
    bool right_align{false};
  };

  explicit Table(std::vector<Column> columns) : columns_(std::move(columns)) {}

  auto print_header() const -> void {
    std::vector<std::string> headers;
    std::size_t rule = 0;
    for (const auto &col : columns_) {
      headers.push_back(col.header);
      rule += col.width + (rule == 0 ? 0 : 1);
    }
    print_row(headers);
    std::println("{}", std::string(rule, '-'));
  }

  auto print_row(const std::vector<std::string> &cells) const -> void {
    std::string line;
    const auto n = std::min(columns_.size(), cells.size());
    for (std::size_t i = 0; i < n; ++i) {
      const auto visible = ansi::ansi_visible_width(cells[i]);
      const std::string pad(
          visible < columns_[i].width ? columns_[i].width - visible : 0, ' ');
      if (i > 0) {
        line += ' ';
      }
      line += columns_[i].right_align ? pad + cells[i] : cells[i] + pad;
    }
    std::println("{}", line);
  }

private:
  std::vector<Column> columns_;
};

/// Truncates to `width` visible characters, marking the cut with "...".
inline auto ellipsize(std::string_view text, std::size_t width)
    -> std::string {
  if (text.size() <= width) {
    return std::string(text);
  }
  if (width <= 3) {
    return std::string(text.substr(0, width));
  }
  return std::format("{}...", text.substr(0, width - 3));
}

inline auto format_duration(const std::optional<Timestamp> &start,
                            const std::optional<Timestamp> &end)
    -> std::string {
  if (!start || !end) {
    return "-";
  }
  auto dur =
      std::chrono::duration_cast<std::chrono::seconds>(*end - *start).count();
  if (dur < 60)
    return std::format("{}s", dur);
  if (dur < 3600)
    return std::format("{}m {}s", dur / 60, dur % 60);
  return std::format("{}h {}m", dur / 3600, (dur % 3600) / 60);
}

} // namespace simqueue::cli::fmt
