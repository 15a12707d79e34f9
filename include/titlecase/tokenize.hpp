#ifndef TITLECASE_TOKENIZE_HPP
#define TITLECASE_TOKENIZE_HPP

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "titlecase/util/function_ref.hpp"

#include "titlecase/fwd.hpp"

namespace titlecase {

enum struct Token_Kind : bool {
    /// @brief Whitespace, punctuation, symbols, and any other non-word characters.
    other,
    /// @brief Characters satisfying `is_word_constituent`.
    word,
};

/// @brief A maximal span of characters which all have the same `Token_Kind`.
struct Token {
    /// @brief The index of the first code unit in the tokenized text.
    std::size_t begin;
    /// @brief The length in code units.
    std::size_t length;
    Token_Kind kind;

    [[nodiscard]]
    constexpr std::size_t end() const noexcept
    {
        return begin + length;
    }

    [[nodiscard]]
    constexpr bool is_word() const noexcept
    {
        return kind == Token_Kind::word;
    }

    /// @brief Returns the text of this token within the text it was obtained from.
    [[nodiscard]]
    constexpr std::u8string_view text_in(std::u8string_view source) const
    {
        return source.substr(begin, length);
    }

    [[nodiscard]]
    friend constexpr bool operator==(const Token&, const Token&) = default;
};

/// @brief The indices of the first and last word tokens within a sequence of tokens.
/// These are not necessarily the first and last token,
/// such as in "...and it comes out here!".
struct Word_Token_Range {
    std::size_t first;
    std::size_t last;

    [[nodiscard]]
    friend constexpr bool operator==(const Word_Token_Range&, const Word_Token_Range&) = default;
};

/// @brief Splits `text` into tokens at every boundary between word-constituent
/// and non-word-constituent characters,
/// and invokes `out` for every token from left to right.
/// Concatenating the text of all tokens yields `text` exactly.
/// Malformed UTF-8 is treated as U+FFFD REPLACEMENT CHARACTER, which is not word-constituent.
/// If `text` is empty, `out` is not invoked.
void tokenize(Function_Ref<void(Token)> out, std::u8string_view text);

/// @brief Like `tokenize(Function_Ref, std::u8string_view)`,
/// but appends the tokens to `out`.
void tokenize(std::vector<Token>& out, std::u8string_view text);

[[nodiscard]]
std::vector<Token> tokenize(std::u8string_view text);

/// @brief Returns the range of word tokens in `tokens`,
/// or `std::nullopt` if `tokens` contains no word token.
[[nodiscard]]
std::optional<Word_Token_Range> find_word_tokens(std::span<const Token> tokens);

} // namespace titlecase

#endif
