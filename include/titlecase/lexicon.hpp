#ifndef TITLECASE_LEXICON_HPP
#define TITLECASE_LEXICON_HPP

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "titlecase/util/result.hpp"
#include "titlecase/util/transparent_comparison.hpp"

#include "titlecase/fwd.hpp"
#include "titlecase/regexp.hpp"
#include "titlecase/services.hpp"
#include "titlecase/settings.hpp"

namespace titlecase {

/// @brief The definition of a multi-word phrase which is written in lowercase within titles,
/// such as "as well as" or "out of".
struct Phrase_Definition {
    /// @brief The phrase in its canonical lowercase form.
    std::u8string_view text;
    /// @brief A regular expression which matches the phrase within a title.
    /// The expression is matched case-insensitively.
    /// If empty, the pattern is derived from `text`
    /// so that `text` is matched literally as a whole word.
    std::u8string_view pattern = {};
};

/// @brief The articles, conjunctions, and prepositions which are candidates for lowercasing.
/// Only those with at most `Lexicon_Options::max_function_word_length` letters are used.
/// Apostrophes may be written as U+0027 only;
/// U+02BC and U+2019 within titles are treated the same.
inline constexpr std::u8string_view default_function_words[] {
    u8"a",    u8"amid", u8"an",   u8"and",  u8"anti", u8"as",   u8"at",   u8"atop", u8"away",
    u8"but",  u8"by",   u8"c.",   u8"ca.",  u8"cum",  u8"down", u8"ere",  u8"for",  u8"from",
    u8"gone", u8"in",   u8"into", u8"less", u8"'n",   u8"n'",   u8"'n'",  u8"nor",  u8"o'er",
    u8"of",   u8"off",  u8"on",   u8"onto", u8"or",   u8"out",  u8"over", u8"past", u8"per",
    u8"pro",  u8"save", u8"so",   u8"than", u8"the",  u8"'til", u8"to",   u8"up",   u8"v.",
    u8"via",  u8"vs.",  u8"with", u8"yet",
};

/// @brief The multi-word prepositions and conjunctions which are lowercased as a whole.
inline constexpr Phrase_Definition default_phrases[] {
    { u8"according to" }, { u8"ahead of" },    { u8"apart from" }, { u8"as for" },
    { u8"as per" },       { u8"as well as" },  { u8"away from" },  { u8"because of" },
    { u8"but for" },      { u8"due to" },      { u8"far from" },   { u8"in case of" },
    { u8"in face of" },   { u8"in spite of" }, { u8"in view of" }, { u8"instead of" },
    { u8"near to" },      { u8"off of" },      { u8"out of" },     { u8"prior to" },
    { u8"rather than" },  { u8"vis-à-vis" },   { u8"w/o" },        { u8"à la" },
};

struct Lexicon_Options {
    /// @brief The maximum number of letters in a function word.
    /// Apostrophes and periods are not counted, so "o'er" and "vs." have three and two letters.
    std::size_t max_function_word_length = default_max_function_word_length;
    std::span<const std::u8string_view> function_words = default_function_words;
    std::span<const Phrase_Definition> phrases = default_phrases;
};

enum struct Lexicon_Error_Code : Default_Underlying {
    /// @brief A function word or phrase is empty.
    empty_entry,
    /// @brief A function word contains characters that cannot be part of a single word token,
    /// so it could never be matched.
    not_a_word,
    /// @brief The pattern of a phrase is not a valid regular expression.
    bad_phrase_pattern,
    /// @brief `max_function_word_length` is zero or exceeds `max_max_function_word_length`.
    bad_max_length,
};

[[nodiscard]]
constexpr std::u8string_view lexicon_error_code_name(Lexicon_Error_Code code)
{
    using enum Lexicon_Error_Code;
    switch (code) {
        TITLECASE_ENUM_STRING_CASE8(empty_entry);
        TITLECASE_ENUM_STRING_CASE8(not_a_word);
        TITLECASE_ENUM_STRING_CASE8(bad_phrase_pattern);
        TITLECASE_ENUM_STRING_CASE8(bad_max_length);
    }
    return u8"";
}

struct Lexicon_Error {
    Lexicon_Error_Code code;
    /// @brief The offending function word or phrase,
    /// or an empty string for `bad_max_length`.
    std::u8string entry;
};

/// @brief A multi-word phrase which is lowercased as a whole.
struct Phrase {
    std::u8string text;
    Reg_Exp pattern;
};

/// @brief The immutable word lists used for title casing.
/// A `Lexicon` is constructed once, typically at startup, and can then be shared between
/// any number of threads and calls to `title_case`.
struct Lexicon {
private:
    using Word_Set = std::unordered_set<
        std::u8string,
        Transparent_String_View_Hash8,
        Transparent_String_View_Equals8>;

    Word_Set m_function_words;
    std::vector<Phrase> m_phrases;
    std::size_t m_max_function_word_length;

    [[nodiscard]]
    Lexicon(Word_Set&& function_words, std::vector<Phrase>&& phrases, std::size_t max_length)
        : m_function_words { std::move(function_words) }
        , m_phrases { std::move(phrases) }
        , m_max_function_word_length { max_length }
    {
    }

public:
    /// @brief Validates `options` and builds a lexicon from them.
    /// Function words with too many letters are dropped and logged with `Severity::debug`.
    [[nodiscard]]
    static Result<Lexicon, Lexicon_Error>
    make(const Lexicon_Options& options = {}, Logger& logger = ignorant_logger);

    /// @brief Returns `true` if `word` is a function word.
    /// The comparison is case-insensitive, and all apostrophe variants are treated the same.
    [[nodiscard]]
    bool is_function_word(std::u8string_view word) const;

    [[nodiscard]]
    std::span<const Phrase> get_phrases() const noexcept
    {
        return m_phrases;
    }

    [[nodiscard]]
    std::size_t get_function_word_count() const noexcept
    {
        return m_function_words.size();
    }

    [[nodiscard]]
    std::size_t get_max_function_word_length() const noexcept
    {
        return m_max_function_word_length;
    }
};

/// @brief Returns a lexicon constructed from the default `Lexicon_Options`.
/// The lexicon is constructed upon the first call.
[[nodiscard]]
const Lexicon& default_lexicon();

/// @brief Returns a regular expression which matches `phrase` literally,
/// but only if it is neither preceded nor followed by a word-constituent character.
/// Otherwise, "as for" would match within "has forgotten".
/// The expression is meant to be compiled with `Reg_Exp_Flags::ignore_case`.
[[nodiscard]]
std::u8string whole_word_pattern(std::u8string_view phrase);

/// @brief Appends the lowercase form of `word` to `out`,
/// with every apostrophe variant replaced by U+0027 APOSTROPHE.
void normalize_function_word(std::u8string& out, std::u8string_view word);

/// @brief Returns the number of letters (`is_title_alpha`) in `word`.
[[nodiscard]]
std::size_t count_letters(std::u8string_view word);

} // namespace titlecase

#endif
