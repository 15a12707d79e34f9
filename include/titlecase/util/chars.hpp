#ifndef TITLECASE_CHARS_HPP
#define TITLECASE_CHARS_HPP

#include "ulight/impl/ascii_chars.hpp"
#include "ulight/impl/unicode_chars.hpp"

namespace titlecase {

using ulight::code_point_max;
using ulight::is_ascii;
using ulight::is_ascii_alpha;
using ulight::is_ascii_alphanumeric;
using ulight::is_ascii_digit;
using ulight::is_ascii_lower_alpha;
using ulight::is_ascii_upper_alpha;
using ulight::to_ascii_lower;
using ulight::to_ascii_upper;

/// @brief U+02BC MODIFIER LETTER APOSTROPHE, as in "toys ʼnʼ games".
inline constexpr char32_t modifier_letter_apostrophe = U'ʼ';
/// @brief U+2019 RIGHT SINGLE QUOTATION MARK, the typographic apostrophe.
inline constexpr char32_t right_single_quotation_mark = U'’';

/// @brief Returns `true` if `c` is a letter in the Latin-1 Supplement block,
/// i.e. in the range U+00C0 to U+00FF, except for U+00D7 MULTIPLICATION SIGN
/// and U+00F7 DIVISION SIGN.
[[nodiscard]]
constexpr bool is_latin1_supplement_alpha(char32_t c) noexcept
{
    return c >= U'À' && c <= U'ÿ' && c != U'×' && c != U'÷';
}

[[nodiscard]]
constexpr bool is_latin1_supplement_upper_alpha(char32_t c) noexcept
{
    return c >= U'À' && c <= U'Þ' && c != U'×';
}

[[nodiscard]]
constexpr bool is_latin1_supplement_lower_alpha(char32_t c) noexcept
{
    return c >= U'ß' && c <= U'ÿ' && c != U'÷';
}

/// @brief U+0178 LATIN CAPITAL LETTER Y WITH DIAERESIS, the uppercase form of U+00FF.
inline constexpr char32_t latin_capital_y_with_diaeresis = U'Ÿ';

/// @brief Returns `true` if `c` is an ASCII letter or a Latin-1 Supplement letter,
/// or U+0178, so that uppercasing a letter never turns it into a non-letter.
/// These are the only letters whose case is ever changed.
[[nodiscard]]
constexpr bool is_title_alpha(char32_t c) noexcept
{
    return is_ascii_alpha(c) || is_latin1_supplement_alpha(c)
        || c == latin_capital_y_with_diaeresis;
}

[[nodiscard]]
constexpr bool is_title_alphanumeric(char32_t c) noexcept
{
    return is_title_alpha(c) || is_ascii_digit(c);
}

/// @brief Returns `true` if `c` is one of the three apostrophes which can be part of a word,
/// as in "tramp's", "o'er", or "rock ’n’ roll".
[[nodiscard]]
constexpr bool is_apostrophe(char32_t c) noexcept
{
    return c == U'\'' || c == modifier_letter_apostrophe || c == right_single_quotation_mark;
}

/// @brief Returns `true` if `c` can be part of a word-like token.
/// This includes letters, digits, apostrophes, and the period,
/// so that contractions and period-delimited acronyms such as "S.O.S." form a single token.
[[nodiscard]]
constexpr bool is_word_constituent(char32_t c) noexcept
{
    return is_title_alphanumeric(c) || is_apostrophe(c) || c == U'.';
}

} // namespace titlecase

#endif
