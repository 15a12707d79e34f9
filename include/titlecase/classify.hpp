#ifndef TITLECASE_CLASSIFY_HPP
#define TITLECASE_CLASSIFY_HPP

#include <span>
#include <string>
#include <string_view>

#include "titlecase/fwd.hpp"

namespace titlecase {

/// @brief The category of a token, which determines how its case is changed.
enum struct Token_Category : Default_Underlying {
    /// @brief A period-delimited acronym like "S.O.S.", which is uppercased.
    acronym,
    /// @brief A numeral followed by letters, like "1st" or "'90s", which is left unchanged.
    ordinal,
    /// @brief A short article, conjunction, or preposition, which is lowercased.
    function_word,
    /// @brief A word consisting of letters and apostrophes, which is capitalized.
    ordinary_word,
    /// @brief Anything else, which is left unchanged.
    other,
};

[[nodiscard]]
constexpr std::u8string_view token_category_name(Token_Category category)
{
    using enum Token_Category;
    switch (category) {
        TITLECASE_ENUM_STRING_CASE8(acronym);
        TITLECASE_ENUM_STRING_CASE8(ordinal);
        TITLECASE_ENUM_STRING_CASE8(function_word);
        TITLECASE_ENUM_STRING_CASE8(ordinary_word);
        TITLECASE_ENUM_STRING_CASE8(other);
    }
    return u8"";
}

/// @brief A single rule of token classification.
/// If `applies` returns `true` for a token, the token belongs to `category`.
struct Classification_Rule {
    Token_Category category;
    bool (*applies)(std::u8string_view token, const Lexicon& lexicon);
};

/// @brief Returns the classification rules in order of precedence.
/// The first rule which applies to a token determines its category.
/// Tokens to which no rule applies are `Token_Category::other`.
[[nodiscard]]
std::span<const Classification_Rule> classification_rules() noexcept;

/// @brief Returns `true` if `token` consists of two or more letters,
/// each followed by a period, such as "S.O.S." or "M.A.S.H.".
[[nodiscard]]
bool is_period_acronym(std::u8string_view token);

/// @brief Returns `true` if `token` consists of an optional run of characters
/// which are neither letters nor digits,
/// followed by one or more digits,
/// immediately followed by a letter.
/// This matches ordinals like "1st" or "22nd",
/// but also decades like "'90s", and other tokens such as "3D" or "2fast".
[[nodiscard]]
bool is_ordinal_like(std::u8string_view token);

/// @brief Returns `true` if `token` is non-empty and consists only of letters and apostrophes.
[[nodiscard]]
bool is_ordinary_word(std::u8string_view token);

/// @brief Returns the category of `token`, determined by `classification_rules()`.
/// The classification does not depend on the position of the token in the title.
[[nodiscard]]
Token_Category classify_token(std::u8string_view token, const Lexicon& lexicon);

/// @brief Appends `text` to `out`, with the first letter converted to uppercase,
/// unless that letter is immediately preceded by a digit.
/// Unlike a naive capitalization, leading punctuation (as in "...and") is skipped,
/// and "4.5x" remains unchanged.
void capitalize(std::u8string& out, std::u8string_view text);

[[nodiscard]]
std::u8string capitalize(std::u8string_view text);

/// @brief Appends `token` to `out`, with its case changed according to `category`.
void apply_category(std::u8string& out, std::u8string_view token, Token_Category category);

} // namespace titlecase

#endif
