#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include "titlecase/util/assert.hpp"
#include "titlecase/util/case_transform.hpp"
#include "titlecase/util/chars.hpp"
#include "titlecase/util/unicode.hpp"

#include "titlecase/classify.hpp"
#include "titlecase/lexicon.hpp"

namespace titlecase {

namespace {

[[nodiscard]]
bool applies_acronym(std::u8string_view token, const Lexicon&)
{
    return is_period_acronym(token);
}

[[nodiscard]]
bool applies_ordinal(std::u8string_view token, const Lexicon&)
{
    return is_ordinal_like(token);
}

[[nodiscard]]
bool applies_function_word(std::u8string_view token, const Lexicon& lexicon)
{
    return lexicon.is_function_word(token);
}

[[nodiscard]]
bool applies_ordinary_word(std::u8string_view token, const Lexicon&)
{
    return is_ordinary_word(token);
}

// The order is significant.
// For example, "A.D." would otherwise be left unchanged as neither an ordinary word nor a
// function word, and "1st" must not be capitalized as "1St".
constexpr Classification_Rule rules[] {
    { Token_Category::acronym, applies_acronym },
    { Token_Category::ordinal, applies_ordinal },
    { Token_Category::function_word, applies_function_word },
    { Token_Category::ordinary_word, applies_ordinary_word },
};

} // namespace

std::span<const Classification_Rule> classification_rules() noexcept
{
    return rules;
}

bool is_period_acronym(const std::u8string_view token)
{
    std::size_t segments = 0;
    bool expect_letter = true;
    for (const char32_t c : utf8::Code_Point_View { token }) {
        if (expect_letter) {
            if (!is_title_alpha(c)) {
                return false;
            }
        }
        else {
            if (c != U'.') {
                return false;
            }
            ++segments;
        }
        expect_letter = !expect_letter;
    }
    return expect_letter && segments >= 2;
}

bool is_ordinal_like(std::u8string_view token)
{
    while (!token.empty()) {
        const auto [code_point, length] = utf8::decode_and_length_or_replacement(token);
        if (is_title_alphanumeric(code_point)) {
            break;
        }
        token.remove_prefix(std::size_t(length));
    }

    std::size_t digits = 0;
    while (digits < token.size() && is_ascii_digit(token[digits])) {
        ++digits;
    }
    if (digits == 0 || digits == token.size()) {
        return false;
    }
    const auto [suffix_start, _] = utf8::decode_and_length_or_replacement(token.substr(digits));
    return is_title_alpha(suffix_start);
}

bool is_ordinary_word(const std::u8string_view token)
{
    if (token.empty()) {
        return false;
    }
    for (const char32_t c : utf8::Code_Point_View { token }) {
        if (!is_title_alpha(c) && !is_apostrophe(c)) {
            return false;
        }
    }
    return true;
}

Token_Category classify_token(const std::u8string_view token, const Lexicon& lexicon)
{
    for (const Classification_Rule& rule : rules) {
        if (rule.applies(token, lexicon)) {
            return rule.category;
        }
    }
    return Token_Category::other;
}

void capitalize(std::u8string& out, const std::u8string_view text)
{
    bool after_digit = false;
    for (std::size_t i = 0; i < text.size();) {
        const auto [code_point, length] = utf8::decode_and_length_or_replacement(text.substr(i));
        const auto units = std::size_t(length);
        if (is_title_alpha(code_point)) {
            if (after_digit) {
                break;
            }
            out.append(text.substr(0, i));
            to_upper(out, text.substr(i, units));
            out.append(text.substr(i + units));
            return;
        }
        after_digit = is_ascii_digit(code_point);
        i += units;
    }
    out.append(text);
}

std::u8string capitalize(const std::u8string_view text)
{
    std::u8string result;
    capitalize(result, text);
    return result;
}

void apply_category(std::u8string& out, const std::u8string_view token, const Token_Category category)
{
    switch (category) {
    case Token_Category::acronym: to_upper(out, token); return;
    case Token_Category::function_word: to_lower(out, token); return;
    case Token_Category::ordinary_word: capitalize(out, token); return;
    case Token_Category::ordinal:
    case Token_Category::other: out.append(token); return;
    }
    TITLECASE_ASSERT_UNREACHABLE();
}

} // namespace titlecase
