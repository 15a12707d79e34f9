#ifndef TITLECASE_DIAGNOSTIC_HPP
#define TITLECASE_DIAGNOSTIC_HPP

#include <string_view>

#include "titlecase/util/severity.hpp"

#include "titlecase/fwd.hpp"

namespace titlecase {

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    std::u8string_view id;
    /// @brief The diagnostic message.
    std::u8string_view message;
};

namespace diagnostic {

/// @brief A function word was not added to the lexicon
/// because it has more letters than the configured maximum.
inline constexpr std::u8string_view lexicon_threshold = u8"lexicon.threshold";

/// @brief A lexicon entry is empty.
inline constexpr std::u8string_view lexicon_empty = u8"lexicon.empty";

/// @brief A lexicon entry is present more than once.
inline constexpr std::u8string_view lexicon_duplicate = u8"lexicon.duplicate";

/// @brief The regular expression for a multi-word phrase could not be compiled.
inline constexpr std::u8string_view lexicon_bad_pattern = u8"lexicon.bad-pattern";

/// @brief The lexicon has been constructed.
inline constexpr std::u8string_view lexicon_ready = u8"lexicon.ready";

/// @brief An input file could not be read.
inline constexpr std::u8string_view io_read = u8"io.read";

/// @brief An input line is not valid UTF-8.
inline constexpr std::u8string_view io_utf8 = u8"io.utf8";

/// @brief Command-line arguments are invalid.
inline constexpr std::u8string_view cli_args = u8"cli.args";

} // namespace diagnostic

} // namespace titlecase

#endif
