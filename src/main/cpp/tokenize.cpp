#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "titlecase/util/chars.hpp"
#include "titlecase/util/function_ref.hpp"
#include "titlecase/util/unicode.hpp"

#include "titlecase/tokenize.hpp"

namespace titlecase {

void tokenize(const Function_Ref<void(Token)> out, const std::u8string_view text)
{
    if (text.empty()) {
        return;
    }

    std::size_t token_begin = 0;
    auto token_kind = Token_Kind::other;

    for (std::size_t i = 0; i < text.size();) {
        const auto [code_point, length] = utf8::decode_and_length_or_replacement(text.substr(i));
        const auto kind = is_word_constituent(code_point) ? Token_Kind::word : Token_Kind::other;
        if (i == 0) {
            token_kind = kind;
        }
        else if (kind != token_kind) {
            out(Token { .begin = token_begin, .length = i - token_begin, .kind = token_kind });
            token_begin = i;
            token_kind = kind;
        }
        i += std::size_t(length);
    }

    out(Token { .begin = token_begin, .length = text.size() - token_begin, .kind = token_kind });
}

void tokenize(std::vector<Token>& out, const std::u8string_view text)
{
    tokenize([&out](const Token token) { out.push_back(token); }, text);
}

std::vector<Token> tokenize(const std::u8string_view text)
{
    std::vector<Token> result;
    tokenize(result, text);
    return result;
}

std::optional<Word_Token_Range> find_word_tokens(const std::span<const Token> tokens)
{
    std::optional<Word_Token_Range> result;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (!tokens[i].is_word()) {
            continue;
        }
        if (!result) {
            result = Word_Token_Range { .first = i, .last = i };
        }
        else {
            result->last = i;
        }
    }
    return result;
}

} // namespace titlecase
