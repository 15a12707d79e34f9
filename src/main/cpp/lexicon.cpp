#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "titlecase/util/assert.hpp"
#include "titlecase/util/case_transform.hpp"
#include "titlecase/util/chars.hpp"
#include "titlecase/util/result.hpp"
#include "titlecase/util/strings.hpp"
#include "titlecase/util/unicode.hpp"

#include "titlecase/diagnostic.hpp"
#include "titlecase/lexicon.hpp"
#include "titlecase/regexp.hpp"
#include "titlecase/services.hpp"

namespace titlecase {

namespace {

// see is_word_constituent
// With ignore_case, Boost case-folds both ends of a range,
// so no range may span the uppercase and lowercase Latin-1 letters.
constexpr std::u8string_view word_constituent_class = u8"A-Za-z0-9.'"
                                                      u8"\\x{C0}-\\x{D6}\\x{D8}-\\x{DE}"
                                                      u8"\\x{DF}-\\x{F6}\\x{F8}-\\x{FF}"
                                                      u8"\\x{178}\\x{2BC}\\x{2019}";

[[nodiscard]]
bool is_single_word(const std::u8string_view word)
{
    for (const char32_t c : utf8::Code_Point_View { word }) {
        if (!is_word_constituent(c)) {
            return false;
        }
    }
    return true;
}

void log_dropped_function_word(Logger& logger, const std::u8string_view word)
{
    if (!logger.can_log(Severity::debug)) {
        return;
    }
    std::u8string message = u8"The function word \"";
    message += word;
    message += u8"\" has too many letters and is not lowercased in titles.";
    logger(Diagnostic {
        .severity = Severity::debug,
        .id = diagnostic::lexicon_threshold,
        .message = message,
    });
}

void log_duplicate(Logger& logger, const std::u8string_view entry)
{
    if (!logger.can_log(Severity::soft_warning)) {
        return;
    }
    std::u8string message = u8"The lexicon entry \"";
    message += entry;
    message += u8"\" is present more than once.";
    logger(Diagnostic {
        .severity = Severity::soft_warning,
        .id = diagnostic::lexicon_duplicate,
        .message = message,
    });
}

} // namespace

std::u8string whole_word_pattern(const std::u8string_view phrase)
{
    std::u8string result;
    result += u8"(?<![";
    result += word_constituent_class;
    result += u8"])";
    append_reg_exp_escaped(result, phrase);
    result += u8"(?![";
    result += word_constituent_class;
    result += u8"])";
    return result;
}

void normalize_function_word(std::u8string& out, std::u8string_view word)
{
    while (!word.empty()) {
        const auto [code_point, length] = utf8::decode_and_length_or_replacement(word);
        const auto units = std::size_t(length);
        if (is_apostrophe(code_point)) {
            out += u8'\'';
        }
        else {
            to_lower(out, word.substr(0, units));
        }
        word.remove_prefix(units);
    }
}

std::size_t count_letters(const std::u8string_view word)
{
    std::size_t result = 0;
    for (const char32_t c : utf8::Code_Point_View { word }) {
        result += is_title_alpha(c) ? 1 : 0;
    }
    return result;
}

Result<Lexicon, Lexicon_Error> Lexicon::make(const Lexicon_Options& options, Logger& logger)
{
    if (options.max_function_word_length == 0
        || options.max_function_word_length > max_max_function_word_length) {
        return Lexicon_Error { .code = Lexicon_Error_Code::bad_max_length, .entry = {} };
    }

    Word_Set function_words;
    for (const std::u8string_view word : options.function_words) {
        if (word.empty()) {
            return Lexicon_Error { .code = Lexicon_Error_Code::empty_entry, .entry = {} };
        }
        if (!is_single_word(word)) {
            return Lexicon_Error { .code = Lexicon_Error_Code::not_a_word,
                                   .entry = std::u8string { word } };
        }
        if (count_letters(word) > options.max_function_word_length) {
            log_dropped_function_word(logger, word);
            continue;
        }
        std::u8string normalized;
        normalize_function_word(normalized, word);
        if (!function_words.insert(std::move(normalized)).second) {
            log_duplicate(logger, word);
        }
    }

    std::vector<Phrase> phrases;
    phrases.reserve(options.phrases.size());
    for (const Phrase_Definition& definition : options.phrases) {
        if (definition.text.empty()) {
            return Lexicon_Error { .code = Lexicon_Error_Code::empty_entry, .entry = {} };
        }
        std::u8string text = to_lower(definition.text);
        const std::u8string pattern = definition.pattern.empty()
            ? whole_word_pattern(text)
            : std::u8string { definition.pattern };

        Result<Reg_Exp, Reg_Exp_Error_Code> reg_exp
            = Reg_Exp::make(pattern, Reg_Exp_Flags::ignore_case);
        if (!reg_exp) {
            return Lexicon_Error { .code = Lexicon_Error_Code::bad_phrase_pattern,
                                  .entry = std::u8string { definition.text } };
        }
        phrases.push_back(Phrase { .text = std::move(text), .pattern = std::move(*reg_exp) });
    }

    if (logger.can_log(Severity::debug)) {
        std::u8string message = u8"Lexicon ready with ";
        message += decimal_string(function_words.size());
        message += u8" function words and ";
        message += decimal_string(phrases.size());
        message += u8" phrases.";
        logger(Diagnostic {
            .severity = Severity::debug,
            .id = diagnostic::lexicon_ready,
            .message = message,
        });
    }

    return Lexicon { std::move(function_words), std::move(phrases),
                     options.max_function_word_length };
}

bool Lexicon::is_function_word(const std::u8string_view word) const
{
    std::u8string normalized;
    normalize_function_word(normalized, word);
    return m_function_words.contains(std::u8string_view { normalized });
}

const Lexicon& default_lexicon()
{
    static const Lexicon lexicon = [] {
        Result<Lexicon, Lexicon_Error> result = Lexicon::make();
        TITLECASE_ASSERT(result);
        return std::move(*result);
    }();
    return lexicon;
}

} // namespace titlecase
