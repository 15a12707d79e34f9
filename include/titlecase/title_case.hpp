#ifndef TITLECASE_TITLE_CASE_HPP
#define TITLECASE_TITLE_CASE_HPP

#include <cstddef>
#include <string>
#include <string_view>

#include "titlecase/fwd.hpp"
#include "titlecase/lexicon.hpp"
#include "titlecase/services.hpp"

namespace titlecase {

/// @brief Lowercases every occurrence of every multi-word phrase in `lexicon` within `text`,
/// such as "Out Of" in "Out Of the Hurly-Burly".
/// Lowercasing never changes the length of `text`,
/// and phrases may overlap without the result depending on their order in `lexicon`.
void lowercase_phrases(std::u8string& text, const Lexicon& lexicon);

/// @brief Capitalizes the first and the last word of `text`,
/// where a word is a run of word-constituent characters (see `is_word_constituent`).
/// Leading and trailing punctuation, such as the "..." in "... and it comes out here" is skipped.
/// Words that are ordinal-like (see `is_ordinal_like`) are left unchanged.
void capitalize_boundary_words(std::u8string& text);

/// @brief Appends `input` to `out`, converted to title case.
///
/// Conversion takes place in two phases.
/// Firstly, `input` is tokenized, every token is classified and transformed independently,
/// and the transformed tokens are concatenated.
/// Secondly, the multi-word phrases of `lexicon` are lowercased,
/// and the first and last word are capitalized.
/// The second phase must happen in this order, so that a phrase at the very start or end of a
/// title only has its first or last word capitalized, as in "Out of the Hurly-Burly".
///
/// Only the case of letters is changed; no characters are inserted, removed, or reordered.
/// Conversion never fails.
void title_case(std::u8string& out, std::u8string_view input, const Lexicon& lexicon);

/// @brief Returns `input` converted to title case.
[[nodiscard]]
std::u8string title_case(std::u8string_view input, const Lexicon& lexicon = default_lexicon());

/// @brief Appends `line` to `out`, converted to title case and followed by a line terminator.
/// Surrounding ASCII blanks (including a trailing carriage return) are removed first,
/// and a line that is blank remains blank.
/// If `line` is not valid UTF-8, an error is logged with `line_number`,
/// and the line is converted nonetheless, with malformed code units left unchanged.
void title_case_line(
    std::u8string& out,
    std::u8string_view line,
    std::size_t line_number,
    const Lexicon& lexicon,
    Logger& logger
);

/// @brief Applies `title_case_line` to every line in `text`, numbering lines from one.
/// A line terminator at the end of `text` does not begin another line.
void title_case_lines(
    std::u8string& out,
    std::u8string_view text,
    const Lexicon& lexicon,
    Logger& logger
);

} // namespace titlecase

#endif
