#ifndef TITLECASE_SETTINGS_HPP
#define TITLECASE_SETTINGS_HPP

#include <cstddef>
#include <string_view>

#ifndef NDEBUG // debug builds
#define TITLECASE_IF_DEBUG(...) __VA_ARGS__
#define TITLECASE_IF_NOT_DEBUG(...)
#else // release builds
#define TITLECASE_IF_DEBUG(...)
#define TITLECASE_IF_NOT_DEBUG(...) __VA_ARGS__
#endif

#ifndef TITLECASE_VERSION_MAJOR
#define TITLECASE_VERSION_MAJOR 1
#endif
#ifndef TITLECASE_VERSION_MINOR
#define TITLECASE_VERSION_MINOR 0
#endif
#ifndef TITLECASE_VERSION_PATCH
#define TITLECASE_VERSION_PATCH 0
#endif

#define TITLECASE_STRINGIFY_IMPL(...) #__VA_ARGS__
#define TITLECASE_STRINGIFY(...) TITLECASE_STRINGIFY_IMPL(__VA_ARGS__)

namespace titlecase {

/// @brief The version in `major.minor.patch` form, as printed by `titlecase --version`.
inline constexpr std::u8string_view version_string = u8"" //
    TITLECASE_STRINGIFY(TITLECASE_VERSION_MAJOR) "." //
    TITLECASE_STRINGIFY(TITLECASE_VERSION_MINOR) "." //
    TITLECASE_STRINGIFY(TITLECASE_VERSION_PATCH);

/// @brief The number of letters that a single-word function word may have at most
/// in order to be written in lowercase within a title.
/// Three letters match the usual newspaper rule ("a", "in", "the", but "With").
inline constexpr std::size_t default_max_function_word_length = 3;

/// @brief The upper bound for the configurable function word length.
inline constexpr std::size_t max_max_function_word_length = 16;

} // namespace titlecase

#endif
