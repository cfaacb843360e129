#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace gpk::codec {

template <typename T, typename... Ts>
inline constexpr bool in_v = (std::is_same_v<T, Ts> || ...);

template <typename T>
concept CharType = in_v<std::remove_cv_t<T>, char, wchar_t, char8_t, char16_t, char32_t>;

template <typename T>
concept BooleanType = std::is_same_v<std::remove_cv_t<T>, bool>;

template <typename T>
concept IntegerType = std::is_integral_v<T> && !BooleanType<T> && !CharType<T>;

template <typename T>
concept FloatType = std::is_floating_point_v<T>;

template <typename T>
concept ByteType = in_v<std::remove_cv_t<T>, std::byte, unsigned char, signed char>;

// Character sequences. view() is only called on a non-null value.
template <typename T>
struct string_traits : std::false_type {};

template <CharType C, typename A>
struct string_traits<std::basic_string<C, std::char_traits<C>, A>> : std::true_type {
  using char_type = C;
  static bool null(const std::basic_string<C, std::char_traits<C>, A> &) { return false; }
  static std::basic_string_view<C> view(const std::basic_string<C, std::char_traits<C>, A> &s) { return s; }
};

template <CharType C>
struct string_traits<std::basic_string_view<C>> : std::true_type {
  using char_type = C;
  static bool null(std::basic_string_view<C>) { return false; }
  static std::basic_string_view<C> view(std::basic_string_view<C> s) { return s; }
};

template <CharType C>
struct string_traits<C *> : std::true_type {
  using char_type = std::remove_cv_t<C>;
  static bool null(const C *s) { return s == nullptr; }
  static std::basic_string_view<char_type> view(const C *s) { return s; }
};

// a character array holds at most N characters, up to the first NUL
template <CharType C, size_t N>
struct string_traits<C[N]> : std::true_type {
  using char_type = std::remove_cv_t<C>;
  static bool null(const C (&)[N]) { return false; }
  static std::basic_string_view<char_type> view(const C (&s)[N]) {
    size_t n = 0;
    while (n < N && s[n] != char_type{}) {
      ++n;
    }
    return {s, n};
  }
};

template <typename T>
concept StringType = string_traits<std::remove_cv_t<T>>::value;

// Transparent holders: get() returns the target or nullptr.
template <typename T>
struct optional_traits : std::false_type {};

template <typename T>
struct optional_traits<std::optional<T>> : std::true_type {
  using target_type = T;
  static const T *get(const std::optional<T> &o) { return o.has_value() ? std::addressof(*o) : nullptr; }
};

template <typename T>
  requires(!CharType<T> && !std::is_void_v<T> && !std::is_function_v<T>)
struct optional_traits<T *> : std::true_type {
  using target_type = std::remove_cv_t<T>;
  static const target_type *get(T *p) { return p; }
};

template <typename T>
struct optional_traits<std::shared_ptr<T>> : std::true_type {
  using target_type = std::remove_cv_t<T>;
  static const target_type *get(const std::shared_ptr<T> &p) { return p.get(); }
};

template <typename T, typename D>
struct optional_traits<std::unique_ptr<T, D>> : std::true_type {
  using target_type = std::remove_cv_t<T>;
  static const target_type *get(const std::unique_ptr<T, D> &p) { return p.get(); }
};

template <typename T>
struct optional_traits<std::reference_wrapper<T>> : std::true_type {
  using target_type = std::remove_cv_t<T>;
  static const target_type *get(const std::reference_wrapper<T> &r) { return std::addressof(r.get()); }
};

template <typename T>
concept OptionalType = optional_traits<std::remove_cv_t<T>>::value;

template <typename T>
struct is_std_array : std::false_type {};
template <typename T, size_t N>
struct is_std_array<std::array<T, N>> : std::true_type {};

template <typename T>
struct is_span : std::false_type {};
template <typename T, size_t E>
struct is_span<std::span<T, E>> : std::true_type {};

template <typename T>
concept MapType = std::ranges::input_range<const T> && requires {
  typename T::key_type;
  typename T::mapped_type;
};

template <typename T>
concept ByteArrayType = std::ranges::contiguous_range<const T> && std::ranges::sized_range<const T> &&
                        ByteType<std::ranges::range_value_t<const T>>;

// fixed-extent sequences
template <typename T>
concept ArrayType = std::ranges::input_range<const T> &&
                    (std::is_bounded_array_v<T> || is_std_array<T>::value || is_span<T>::value);

template <typename T>
concept CollectionType = std::ranges::input_range<const T> && !MapType<T> && !ArrayType<T>;

template <typename T>
concept ReaderType = std::derived_from<T, std::basic_istream<wchar_t>>;

template <typename T>
concept InputStreamType = std::derived_from<T, std::basic_istream<char>>;

template <typename T>
concept Formattable = std::is_default_constructible_v<std::formatter<T, char>> &&
                      requires(std::formatter<T, char> f, const T &t, std::format_context &ctx) { f.format(t, ctx); };

template <typename T>
concept Streamable = requires(std::ostream &out, const T &t) { out << t; };

}  // namespace gpk::codec
