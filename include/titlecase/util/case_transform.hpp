#ifndef TITLECASE_CASE_TRANSFORM_HPP
#define TITLECASE_CASE_TRANSFORM_HPP

#include <string>
#include <string_view>

namespace titlecase {

/// @brief Returns the value of the `Simple_Uppercase_Mapping` property of `c`
/// if `c` is an ASCII or Latin-1 Supplement letter,
/// or `c` itself otherwise.
/// U+00DF LATIN SMALL LETTER SHARP S has no simple uppercase mapping and is returned as is.
[[nodiscard]]
char32_t simple_to_upper(char32_t c) noexcept;

/// @brief Returns the value of the `Simple_Lowercase_Mapping` property of `c`
/// if `c` is an ASCII or Latin-1 Supplement letter (or U+0178, the uppercase form of U+00FF),
/// or `c` itself otherwise.
[[nodiscard]]
char32_t simple_to_lower(char32_t c) noexcept;

/// @brief Appends `str` to `out`, with every code point mapped using `simple_to_upper`.
/// Malformed code units are appended unchanged.
void to_upper(std::u8string& out, std::u8string_view str);

/// @brief Appends `str` to `out`, with every code point mapped using `simple_to_lower`.
/// Malformed code units are appended unchanged.
void to_lower(std::u8string& out, std::u8string_view str);

[[nodiscard]]
std::u8string to_upper(std::u8string_view str);

[[nodiscard]]
std::u8string to_lower(std::u8string_view str);

} // namespace titlecase

#endif
