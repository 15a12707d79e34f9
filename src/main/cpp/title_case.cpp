#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "titlecase/util/assert.hpp"
#include "titlecase/util/case_transform.hpp"
#include "titlecase/util/severity.hpp"
#include "titlecase/util/strings.hpp"
#include "titlecase/util/unicode.hpp"

#include "titlecase/classify.hpp"
#include "titlecase/diagnostic.hpp"
#include "titlecase/lexicon.hpp"
#include "titlecase/regexp.hpp"
#include "titlecase/services.hpp"
#include "titlecase/title_case.hpp"
#include "titlecase/tokenize.hpp"

namespace titlecase {

void lowercase_phrases(std::u8string& text, const Lexicon& lexicon)
{
    std::vector<Reg_Exp_Match> matches;
    std::u8string lowered;

    for (const Phrase& phrase : lexicon.get_phrases()) {
        matches.clear();
        phrase.pattern.for_each_match(text, [&matches](const Reg_Exp_Match match) {
            matches.push_back(match);
        });
        for (const Reg_Exp_Match& match : matches) {
            lowered.clear();
            to_lower(lowered, std::u8string_view { text }.substr(match.index, match.length));
            TITLECASE_ASSERT(lowered.size() == match.length);
            text.replace(match.index, match.length, lowered);
        }
    }
}

void capitalize_boundary_words(std::u8string& text)
{
    const std::vector<Token> tokens = tokenize(text);
    const std::optional<Word_Token_Range> words = find_word_tokens(tokens);
    if (!words) {
        return;
    }

    std::u8string capitalized;
    const auto capitalize_token = [&](const Token& token) {
        const std::u8string_view word = token.text_in(text);
        if (is_ordinal_like(word)) {
            return;
        }
        capitalized.clear();
        capitalize(capitalized, word);
        TITLECASE_ASSERT(capitalized.size() == token.length);
        text.replace(token.begin, token.length, capitalized);
    };

    capitalize_token(tokens[words->first]);
    if (words->last != words->first) {
        capitalize_token(tokens[words->last]);
    }
}

void title_case(std::u8string& out, const std::u8string_view input, const Lexicon& lexicon)
{
    std::u8string result;
    result.reserve(input.size());

    tokenize(
        [&](const Token token) {
            const std::u8string_view text = token.text_in(input);
            apply_category(result, text, classify_token(text, lexicon));
        },
        input
    );
    TITLECASE_DEBUG_ASSERT(result.size() == input.size());

    lowercase_phrases(result, lexicon);
    capitalize_boundary_words(result);

    out += result;
}

std::u8string title_case(const std::u8string_view input, const Lexicon& lexicon)
{
    std::u8string result;
    title_case(result, input, lexicon);
    return result;
}

void title_case_line(
    std::u8string& out,
    std::u8string_view line,
    const std::size_t line_number,
    const Lexicon& lexicon,
    Logger& logger
)
{
    line = trim_ascii_blank(line);
    if (!utf8::is_valid(line) && logger.can_log(Severity::error)) {
        std::u8string message = u8"Line ";
        message += decimal_string(line_number);
        message += u8" is not valid UTF-8. Malformed code units are left unchanged.";
        logger(Diagnostic {
            .severity = Severity::error,
            .id = diagnostic::io_utf8,
            .message = message,
        });
    }

    if (!line.empty()) {
        title_case(out, line, lexicon);
    }
    out += u8'\n';
}

void title_case_lines(
    std::u8string& out,
    std::u8string_view text,
    const Lexicon& lexicon,
    Logger& logger
)
{
    std::size_t line_number = 0;
    while (!text.empty()) {
        const std::size_t terminator = text.find(u8'\n');
        if (terminator == std::u8string_view::npos) {
            title_case_line(out, text, ++line_number, lexicon, logger);
            return;
        }
        title_case_line(out, text.substr(0, terminator), ++line_number, lexicon, logger);
        text.remove_prefix(terminator + 1);
    }
}

} // namespace titlecase
