#ifndef TITLECASE_REGEXP_HPP
#define TITLECASE_REGEXP_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "titlecase/util/function_ref.hpp"
#include "titlecase/util/result.hpp"

#include "titlecase/fwd.hpp"

namespace titlecase {

struct Reg_Exp_Match {
    std::size_t index;
    std::size_t length;
};

enum struct Reg_Exp_Error_Code : Default_Underlying {
    /// @brief The given pattern is not valid.
    bad_pattern,
};

enum struct Reg_Exp_Status : Default_Underlying {
    /// @brief Execution completed; no match was found.
    unmatched,
    /// @brief Execution completed; a match was found.
    matched,
};

enum struct Reg_Exp_Flags : Default_Underlying {
    /// @brief `i`.
    ignore_case = 1 << 0,
};

[[nodiscard]]
constexpr Reg_Exp_Flags operator|(const Reg_Exp_Flags x, const Reg_Exp_Flags y)
{
    return Reg_Exp_Flags(std::to_underlying(x) | std::to_underlying(y));
}

[[nodiscard]]
constexpr Reg_Exp_Flags operator&(const Reg_Exp_Flags x, const Reg_Exp_Flags y)
{
    return Reg_Exp_Flags(std::to_underlying(x) & std::to_underlying(y));
}

struct Reg_Exp_Search_Result {
    Reg_Exp_Status status;
    Reg_Exp_Match match;
};

struct In_Place_Tag { };

struct Reg_Exp;

struct Reg_Exp_Impl {
private:
    alignas(8) unsigned char m_storage[16];

public:
    Reg_Exp_Impl() noexcept;
    Reg_Exp_Impl(const Reg_Exp_Impl&) noexcept;
    Reg_Exp_Impl(Reg_Exp_Impl&&) noexcept;

    Reg_Exp_Impl& operator=(const Reg_Exp_Impl&) noexcept;
    Reg_Exp_Impl& operator=(Reg_Exp_Impl&&) noexcept;

    ~Reg_Exp_Impl();

private:
    template <typename T>
    Reg_Exp_Impl(In_Place_Tag, T&&) noexcept;

    [[nodiscard]]
    auto& get();
    [[nodiscard]]
    const auto& get() const;

    friend Reg_Exp;
};

/// @brief Represents a Perl/ECMAScript-flavored regular expression
/// which operates on UTF-8 text, code point by code point.
///
/// A `Reg_Exp` has shared ownership over the underlying compiled regular expression,
/// meaning that both copying and moving are relatively inexpensive.
/// All member functions are `const` and may be called concurrently.
struct Reg_Exp {
public:
    [[nodiscard]]
    static Result<Reg_Exp, Reg_Exp_Error_Code>
    make(std::u8string_view pattern, Reg_Exp_Flags flags = {});

private:
    Reg_Exp_Impl m_impl;
    Reg_Exp_Flags m_flags;

    [[nodiscard]]
    Reg_Exp(Reg_Exp_Impl&& impl, const Reg_Exp_Flags flags) noexcept
        : m_impl { std::move(impl) }
        , m_flags { flags }
    {
    }

public:
    /// @brief Returns `matched` if `string` matches this regex in its entirety.
    [[nodiscard]]
    Reg_Exp_Status match(std::u8string_view string) const;

    /// @brief Searches for the first occurrence of this regex in `string`.
    [[nodiscard]]
    Reg_Exp_Search_Result search(std::u8string_view string) const;

    /// @brief Invokes `consume` for every non-overlapping occurrence of this regex in `string`,
    /// from left to right.
    /// Assertions such as lookbehinds see the whole `string`,
    /// not just the remainder after the previous match.
    /// @returns `matched` if `consume` was invoked at least once, otherwise `unmatched`.
    Reg_Exp_Status for_each_match(
        std::u8string_view string,
        Function_Ref<void(Reg_Exp_Match)> consume
    ) const;

    [[nodiscard]]
    Reg_Exp_Flags get_flags() const
    {
        return m_flags;
    }

    [[nodiscard]]
    constexpr bool is_ignore_case() const
    {
        return (m_flags & Reg_Exp_Flags::ignore_case) != Reg_Exp_Flags {};
    }
};

/// @brief Appends `text` to `out` such that every character is matched literally
/// when `out` is used as a regex pattern.
void append_reg_exp_escaped(std::u8string& out, std::u8string_view text);

} // namespace titlecase

#endif
