#include <cstddef>
#include <string>
#include <string_view>

#include "titlecase/util/case_transform.hpp"
#include "titlecase/util/chars.hpp"
#include "titlecase/util/unicode.hpp"

namespace titlecase {

namespace {

inline constexpr char32_t ascii_case_offset = U'a' - U'A';
inline constexpr char32_t latin1_case_offset = U'à' - U'À';

using Code_Point_Mapping = char32_t(char32_t) noexcept;

void transform_code_points(std::u8string& out, std::u8string_view str, Code_Point_Mapping* map)
{
    out.reserve(out.size() + str.size());
    while (!str.empty()) {
        const auto [code_point, length] = utf8::decode_and_length_or_replacement(str);
        const auto units = std::size_t(length);
        const char32_t mapped = map(code_point);
        // Malformed sequences decode as U+FFFD, which maps onto itself,
        // so their code units are copied unchanged.
        if (mapped == code_point) {
            out.append(str.substr(0, units));
        }
        else {
            out.append(utf8::encode8_unchecked(mapped).as_string());
        }
        str.remove_prefix(units);
    }
}

} // namespace

char32_t simple_to_upper(const char32_t c) noexcept
{
    if (is_ascii_lower_alpha(c)) {
        return c - ascii_case_offset;
    }
    if (c == U'ÿ') {
        return latin_capital_y_with_diaeresis;
    }
    if (c != U'ß' && is_latin1_supplement_lower_alpha(c)) {
        return c - latin1_case_offset;
    }
    return c;
}

char32_t simple_to_lower(const char32_t c) noexcept
{
    if (is_ascii_upper_alpha(c)) {
        return c + ascii_case_offset;
    }
    if (c == latin_capital_y_with_diaeresis) {
        return U'ÿ';
    }
    if (is_latin1_supplement_upper_alpha(c)) {
        return c + latin1_case_offset;
    }
    return c;
}

void to_upper(std::u8string& out, const std::u8string_view str)
{
    transform_code_points(out, str, simple_to_upper);
}

void to_lower(std::u8string& out, const std::u8string_view str)
{
    transform_code_points(out, str, simple_to_lower);
}

std::u8string to_upper(const std::u8string_view str)
{
    std::u8string result;
    to_upper(result, str);
    return result;
}

std::u8string to_lower(const std::u8string_view str)
{
    std::u8string result;
    to_lower(result, str);
    return result;
}

} // namespace titlecase
