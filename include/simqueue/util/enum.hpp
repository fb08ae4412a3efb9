#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>

#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace simqueue {

/// Strict text-to-enum conversion; specialised per enum by
/// SIMQUEUE_DEFINE_ENUM_SERDE. Unknown input yields std::nullopt.
template <typename T>
[[nodiscard]] auto parse(std::string_view s) noexcept -> std::optional<T>;

namespace util {

[[nodiscard]] inline auto enum_name_to_snake_case(std::string_view name)
    -> std::string {
  std::string out;
  out.reserve(name.size() * 2);
  for (std::size_t i = 0; i < name.size(); ++i) {
    const auto uch = static_cast<unsigned char>(name[i]);
    if (std::isupper(uch) != 0 && i > 0 &&
        std::islower(static_cast<unsigned char>(name[i - 1])) != 0) {
      out.push_back('_');
    }
    out.push_back(static_cast<char>(std::tolower(uch)));
  }
  return out;
}

template <typename E>
  requires std::is_enum_v<E>
[[nodiscard]] inline auto enum_to_snake_case_view(E value) noexcept
    -> std::string_view {
  using descriptors = boost::describe::describe_enumerators<E>;
  constexpr std::size_t kCount = boost::mp11::mp_size<descriptors>::value;

  static const auto table = [] {
    std::array<std::pair<E, std::string>, kCount> out{};
    std::size_t i = 0;
    boost::mp11::mp_for_each<descriptors>([&](auto descriptor) {
      out[i++] = {descriptor.value, enum_name_to_snake_case(descriptor.name)};
    });
    return out;
  }();

  for (const auto &[enum_value, text] : table) {
    if (enum_value == value) {
      return text;
    }
  }
  return "unknown";
}

/// Matches the snake_case spelling exactly, the form used on the wire and
/// in the database.
template <typename E>
  requires std::is_enum_v<E>
[[nodiscard]] inline auto parse_enum(std::string_view input) noexcept
    -> std::optional<E> {
  std::optional<E> out;
  boost::mp11::mp_for_each<boost::describe::describe_enumerators<E>>(
      [&](auto descriptor) {
        if (!out && input == enum_to_snake_case_view(descriptor.value)) {
          out = descriptor.value;
        }
      });
  return out;
}

template <typename E, typename F>
  requires std::is_enum_v<E>
auto for_each_enumerator(F &&fn) -> void {
  boost::mp11::mp_for_each<boost::describe::describe_enumerators<E>>(
      [&](auto descriptor) { fn(descriptor.value); });
}

} // namespace util

#define SIMQUEUE_DEFINE_ENUM_SERDE(EnumType)                                   \
  [[nodiscard]] inline auto to_string_view(EnumType value) noexcept            \
      -> std::string_view {                                                    \
    return ::simqueue::util::enum_to_snake_case_view(value);                   \
  }                                                                            \
  template <>                                                                  \
  [[nodiscard]] inline auto parse<EnumType>(std::string_view s) noexcept       \
      -> std::optional<EnumType> {                                             \
    return ::simqueue::util::parse_enum<EnumType>(s);                          \
  }

} // namespace simqueue
