// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include <concepts>
#include <cstddef>
#include <optional>
#include <ostream>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace weave::detail {

template <class T>
concept string_like = std::is_convertible_v<const T&, std::string_view>;

template <class T>
concept has_to_string = requires(const T& x) {
  { to_string(x) } -> std::convertible_to<std::string>;
};

template <class T>
concept has_ostream_operator = requires(std::ostream& out, const T& x) {
  out << x;
};

template <class T>
concept tuple_like = requires { std::tuple_size<T>::value; };

template <class T>
struct is_optional : std::false_type {};

template <class T>
struct is_optional<std::optional<T>> : std::true_type {};

template <class T>
struct is_variant : std::false_type {};

template <class... Ts>
struct is_variant<std::variant<Ts...>> : std::true_type {};

/// Checks whether `deep_to_string` can render values of type `T`. Nested types
/// (elements of containers and tuples) are checked when rendering.
template <class T>
concept renderable
  = std::is_arithmetic_v<T> || string_like<T> || has_to_string<T>
    || is_optional<T>::value || is_variant<T>::value || tuple_like<T>
    || std::ranges::input_range<const T> || has_ostream_operator<T>
    || std::is_same_v<T, std::monostate>;

inline void append_quoted(std::string& out, std::string_view str) {
  out += '"';
  for (auto c : str) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out += c;
    }
  }
  out += '"';
}

template <class T>
void stringify(std::string& out, const T& x);

template <class Tuple, size_t... Is>
void stringify_tuple(std::string& out, const Tuple& xs,
                     std::index_sequence<Is...>) {
  out += '(';
  auto sep = std::string_view{};
  ((out += sep, stringify(out, std::get<Is>(xs)), sep = ", "), ...);
  out += ')';
}

template <class T>
void stringify(std::string& out, const T& x) {
  if constexpr (std::is_same_v<T, bool>) {
    out += x ? "true" : "false";
  } else if constexpr (std::is_same_v<T, char>) {
    out += '\'';
    out += x;
    out += '\'';
  } else if constexpr (std::is_arithmetic_v<T>) {
    if constexpr (std::is_floating_point_v<T>) {
      std::ostringstream buf;
      buf << x;
      out += buf.str();
    } else {
      out += std::to_string(x);
    }
  } else if constexpr (string_like<T>) {
    append_quoted(out, std::string_view{x});
  } else if constexpr (has_to_string<T>) {
    out += to_string(x);
  } else if constexpr (std::is_same_v<T, std::monostate>) {
    out += "none";
  } else if constexpr (is_optional<T>::value) {
    if (x)
      stringify(out, *x);
    else
      out += "null";
  } else if constexpr (is_variant<T>::value) {
    std::visit([&out](const auto& val) { stringify(out, val); }, x);
  } else if constexpr (tuple_like<T>) {
    stringify_tuple(out, x, std::make_index_sequence<std::tuple_size_v<T>>{});
  } else if constexpr (std::ranges::input_range<const T>) {
    out += '[';
    auto sep = std::string_view{};
    for (const auto& item : x) {
      out += sep;
      stringify(out, item);
      sep = ", ";
    }
    out += ']';
  } else if constexpr (has_ostream_operator<T>) {
    std::ostringstream buf;
    buf << x;
    out += buf.str();
  } else {
    static_assert(renderable<T>, "deep_to_string: unable to render type");
  }
}

} // namespace weave::detail

namespace weave {

/// Unrolls collections, tuples and optional values to render their content.
/// Strings are quoted.
template <class... Ts>
std::string deep_to_string(const Ts&... xs) {
  std::string result;
  auto sep = std::string_view{};
  ((result += sep, detail::stringify(result, xs), sep = ", "), ...);
  return result;
}

} // namespace weave
