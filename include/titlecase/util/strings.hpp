#ifndef TITLECASE_STRINGS_HPP
#define TITLECASE_STRINGS_HPP

#include <charconv>
#include <cstddef>
#include <string>
#include <span>
#include <string_view>

#include "titlecase/util/chars.hpp"

namespace titlecase {

// see is_ascii_lower_alpha
inline constexpr std::u8string_view all_ascii_lower_alpha8 = u8"abcdefghijklmnopqrstuvwxyz";

// see is_ascii_upper_alpha
inline constexpr std::u8string_view all_ascii_upper_alpha8 = u8"ABCDEFGHIJKLMNOPQRSTUVWXYZ";

// see is_ascii_blank
inline constexpr std::u8string_view all_ascii_blank8 = u8"\t\n\f\r\v ";

[[nodiscard]]
inline std::string_view as_string_view(std::u8string_view str)
{
    return { reinterpret_cast<const char*>(str.data()), str.size() };
}

[[nodiscard]]
constexpr std::u8string_view as_u8string_view(std::span<const char8_t> text)
{
    return { text.data(), text.size() };
}

[[nodiscard]]
inline std::u8string_view as_u8string_view(std::string_view text)
{
    return { reinterpret_cast<const char8_t*>(text.data()), text.size() };
}

/// @brief Returns the decimal representation of `value`.
[[nodiscard]]
inline std::u8string decimal_string(std::size_t value)
{
    char buffer[24];
    const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    return std::u8string { as_u8string_view(std::string_view { buffer, result.ptr }) };
}

/// @brief Returns true if `c` is a blank character.
/// This matches the C locale definition,
/// and includes vertical tabs.
[[nodiscard]]
constexpr bool is_ascii_blank(char8_t c)
{
    return all_ascii_blank8.find(c) != std::u8string_view::npos;
}

[[nodiscard]]
constexpr std::size_t length_blank_left(std::u8string_view str)
{
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (!is_ascii_blank(str[i])) {
            return i;
        }
    }
    return str.length();
}

[[nodiscard]]
constexpr std::size_t length_blank_right(std::u8string_view str)
{
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (!is_ascii_blank(str[str.length() - i - 1])) {
            return i;
        }
    }
    return str.length();
}

[[nodiscard]]
constexpr std::u8string_view trim_ascii_blank_left(std::u8string_view str)
{
    return str.substr(length_blank_left(str));
}

[[nodiscard]]
constexpr std::u8string_view trim_ascii_blank_right(std::u8string_view str)
{
    return str.substr(0, str.length() - length_blank_right(str));
}

/// @brief Equivalent to `trim_ascii_blank_right(trim_ascii_blank_left(str))`.
[[nodiscard]]
constexpr std::u8string_view trim_ascii_blank(std::u8string_view str)
{
    return trim_ascii_blank_right(trim_ascii_blank_left(str));
}

} // namespace titlecase

#endif
