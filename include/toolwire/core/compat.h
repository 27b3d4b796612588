#ifndef TOOLWIRE_CORE_COMPAT_H
#define TOOLWIRE_CORE_COMPAT_H

// Vocabulary types used throughout toolwire. The project is built as C++17,
// so these resolve to the std:: versions.

#include <cstddef>
#include <optional>
#include <utility>
#include <variant>

namespace toolwire {

template <typename T>
using optional = std::optional<T>;

using nullopt_t = std::nullopt_t;
inline constexpr auto nullopt = std::nullopt;

using bad_optional_access = std::bad_optional_access;

template <typename T>
constexpr optional<typename std::decay<T>::type> make_optional(T&& value) {
  return std::make_optional(std::forward<T>(value));
}

template <typename... Types>
using variant = std::variant<Types...>;

using bad_variant_access = std::bad_variant_access;
using std::get;
using std::get_if;
using std::holds_alternative;
using std::visit;

}  // namespace toolwire

#endif  // TOOLWIRE_CORE_COMPAT_H
