#include <cstddef>
#include <new>
#include <string>
#include <string_view>
#include <utility>

#include "titlecase/util/assert.hpp"
#include "titlecase/util/function_ref.hpp"

#include "titlecase/regexp.hpp"

#include <boost/regex.hpp>
#include <boost/regex/icu.hpp>

namespace titlecase {

static_assert(sizeof(Reg_Exp_Impl) == sizeof(boost::u32regex));

template <typename T>
Reg_Exp_Impl::Reg_Exp_Impl(In_Place_Tag, T&& arg) noexcept
{
    new (m_storage) boost::u32regex(std::forward<T>(arg));
}

auto& Reg_Exp_Impl::get()
{
    return *std::launder(reinterpret_cast<boost::u32regex*>(m_storage));
}

const auto& Reg_Exp_Impl::get() const
{
    return *std::launder(reinterpret_cast<const boost::u32regex*>(m_storage));
}

Reg_Exp_Impl::Reg_Exp_Impl() noexcept
{
    new (m_storage) boost::u32regex;
}

Reg_Exp_Impl::Reg_Exp_Impl(const Reg_Exp_Impl& other) noexcept
    : Reg_Exp_Impl { In_Place_Tag {}, other.get() }
{
}

Reg_Exp_Impl::Reg_Exp_Impl(Reg_Exp_Impl&& other) noexcept
    : Reg_Exp_Impl { In_Place_Tag {}, std::move(other.get()) }
{
}

// We assume that boost::regex handles self-assignment in some reasonable way,
// which it should because it boils down to std::shared_ptr self-assignment.
// NOLINTNEXTLINE(bugprone-unhandled-self-assignment)
Reg_Exp_Impl& Reg_Exp_Impl::operator=(const Reg_Exp_Impl& other) noexcept
{
    get() = other.get();
    return *this;
}

Reg_Exp_Impl& Reg_Exp_Impl::operator=(Reg_Exp_Impl&& other) noexcept
{
    // boost::basic_regex has no move operations,
    // but maybe this will change in the future, so we try to std::move anyway.
    // See https://github.com/boostorg/regex/issues/270
    // NOLINTNEXTLINE(performance-move-const-arg)
    get() = std::move(other.get());
    return *this;
}

Reg_Exp_Impl::~Reg_Exp_Impl()
{
    get().~basic_regex();
}

[[nodiscard]]
Result<Reg_Exp, Reg_Exp_Error_Code>
Reg_Exp::make(const std::u8string_view pattern, const Reg_Exp_Flags flags)
{
    boost::regex_constants::syntax_option_type boost_flags
        = boost::regex_constants::ECMAScript | boost::regex_constants::no_except;
    if ((flags & Reg_Exp_Flags::ignore_case) != Reg_Exp_Flags {}) {
        boost_flags |= boost::regex_constants::icase;
    }

    // Code units are passed as char8_t, so Boost decodes the pattern as UTF-8.
    boost::u32regex result
        = boost::make_u32regex(pattern.data(), pattern.data() + pattern.size(), boost_flags);
    if (result.status() != 0) {
        return Reg_Exp_Error_Code::bad_pattern;
    }
    return Reg_Exp { Reg_Exp_Impl { In_Place_Tag {}, std::move(result) }, flags };
}

[[nodiscard]]
Reg_Exp_Status Reg_Exp::match(const std::u8string_view string) const
{
    const bool result
        = boost::u32regex_match(string.data(), string.data() + string.size(), m_impl.get());
    return result ? Reg_Exp_Status::matched : Reg_Exp_Status::unmatched;
}

[[nodiscard]]
Reg_Exp_Search_Result Reg_Exp::search(const std::u8string_view string) const
{
    boost::match_results<const char8_t*> match;
    const bool found
        = boost::u32regex_search(string.data(), string.data() + string.size(), match, m_impl.get());
    if (!found) {
        return { Reg_Exp_Status::unmatched, {} };
    }
    const auto& first = match[0];
    TITLECASE_ASSERT(first.matched);
    const Reg_Exp_Match result_match {
        .index = std::size_t(first.first - string.data()),
        .length = std::size_t(first.second - first.first),
    };
    return Reg_Exp_Search_Result { Reg_Exp_Status::matched, result_match };
}

Reg_Exp_Status Reg_Exp::for_each_match(
    const std::u8string_view string,
    const Function_Ref<void(Reg_Exp_Match)> consume
) const
{
    using Iterator = boost::u32regex_iterator<const char8_t*>;

    const char8_t* const begin = string.data();
    const char8_t* const end = begin + string.size();

    auto status = Reg_Exp_Status::unmatched;
    for (Iterator it { begin, end, m_impl.get() }; it != Iterator {}; ++it) {
        const auto& whole = (*it)[0];
        consume(Reg_Exp_Match {
            .index = std::size_t(whole.first - begin),
            .length = std::size_t(whole.second - whole.first),
        });
        status = Reg_Exp_Status::matched;
    }
    return status;
}

void append_reg_exp_escaped(std::u8string& out, const std::u8string_view text)
{
    // Only the syntax characters are escaped.
    // In Boost's Perl syntax, sequences like \' or \< are assertions, not literals.
    constexpr std::u8string_view syntax_characters = u8"\\^$.|?*+()[]{}";
    for (const char8_t c : text) {
        if (syntax_characters.contains(c)) {
            out += u8'\\';
        }
        out += c;
    }
}

} // namespace titlecase
