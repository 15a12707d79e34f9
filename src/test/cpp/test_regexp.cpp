#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "titlecase/util/strings.hpp"

#include "titlecase/lexicon.hpp"
#include "titlecase/regexp.hpp"

namespace titlecase {
namespace {

TEST(Reg_Exp, make)
{
    EXPECT_TRUE(Reg_Exp::make(u8"awoo"));
    EXPECT_TRUE(Reg_Exp::make(u8"(?<![a-z])as for(?![a-z])"));

    const auto unclosed = Reg_Exp::make(u8"(");
    ASSERT_FALSE(unclosed);
    EXPECT_EQ(unclosed.error(), Reg_Exp_Error_Code::bad_pattern);
    EXPECT_FALSE(Reg_Exp::make(u8"[a-"));
}

TEST(Reg_Exp, flags)
{
    EXPECT_FALSE(Reg_Exp::make(u8"a")->is_ignore_case());
    EXPECT_TRUE(Reg_Exp::make(u8"a", Reg_Exp_Flags::ignore_case)->is_ignore_case());
}

TEST(Reg_Exp, match)
{
    EXPECT_EQ(Reg_Exp::make(u8"awoo")->match(u8"awoo"), Reg_Exp_Status::matched);
    EXPECT_EQ(Reg_Exp::make(u8".*")->match(u8"awoo"), Reg_Exp_Status::matched);
    EXPECT_EQ(Reg_Exp::make(u8"awoo")->match(u8"AWOO"), Reg_Exp_Status::unmatched);
    EXPECT_EQ(
        Reg_Exp::make(u8"awoo", Reg_Exp_Flags::ignore_case)->match(u8"AWOO"),
        Reg_Exp_Status::matched
    );
    EXPECT_EQ(
        Reg_Exp::make(u8"crème", Reg_Exp_Flags::ignore_case)->match(u8"CRÈME"),
        Reg_Exp_Status::matched
    );
}

TEST(Reg_Exp, search)
{
    EXPECT_EQ(Reg_Exp::make(u8"w")->search(u8"awoo").status, Reg_Exp_Status::matched);
    EXPECT_EQ(Reg_Exp::make(u8"z")->search(u8"awoo").status, Reg_Exp_Status::unmatched);

    const auto [status, match]
        = Reg_Exp::make(u8"à la", Reg_Exp_Flags::ignore_case)->search(u8"Crêpes À LA Mode");
    EXPECT_EQ(status, Reg_Exp_Status::matched);
    EXPECT_EQ(match.index, 8);
    EXPECT_EQ(match.length, 5);
}

TEST(Reg_Exp, for_each_match)
{
    std::vector<std::size_t> indices;
    const Reg_Exp_Status status = Reg_Exp::make(u8"a")->for_each_match(
        u8"banana", [&](const Reg_Exp_Match m) {
            EXPECT_EQ(m.length, 1);
            indices.push_back(m.index);
        }
    );
    EXPECT_EQ(status, Reg_Exp_Status::matched);
    EXPECT_EQ(indices, (std::vector<std::size_t> { 1, 3, 5 }));
}

TEST(Reg_Exp, for_each_match_sees_lookbehind_context)
{
    std::vector<Reg_Exp_Match> matches;
    const Reg_Exp_Status status = Reg_Exp::make(u8"(?<![a-z])as for")->for_each_match(
        u8"has for and as for", [&](const Reg_Exp_Match m) { matches.push_back(m); }
    );
    EXPECT_EQ(status, Reg_Exp_Status::matched);
    ASSERT_EQ(matches.size(), 1);
    EXPECT_EQ(matches[0].index, 12);
    EXPECT_EQ(matches[0].length, 6);
}

TEST(Reg_Exp, for_each_match_none)
{
    bool invoked = false;
    const Reg_Exp_Status status = Reg_Exp::make(u8"z")->for_each_match(
        u8"banana", [&](Reg_Exp_Match) { invoked = true; }
    );
    EXPECT_EQ(status, Reg_Exp_Status::unmatched);
    EXPECT_FALSE(invoked);
}

TEST(Reg_Exp, whole_word_pattern)
{
    const auto pattern = Reg_Exp::make(whole_word_pattern(u8"as for"), Reg_Exp_Flags::ignore_case);
    ASSERT_TRUE(pattern);
    EXPECT_EQ(pattern->search(u8"as for me").status, Reg_Exp_Status::matched);
    EXPECT_EQ(pattern->search(u8"As For Me").status, Reg_Exp_Status::matched);
    EXPECT_EQ(pattern->search(u8"(AS FOR)").status, Reg_Exp_Status::matched);
    EXPECT_EQ(pattern->search(u8"has for").status, Reg_Exp_Status::unmatched);
    EXPECT_EQ(pattern->search(u8"as forest").status, Reg_Exp_Status::unmatched);
    EXPECT_EQ(pattern->search(u8"éas for").status, Reg_Exp_Status::unmatched);
    EXPECT_EQ(pattern->search(u8"ÉAS FOR").status, Reg_Exp_Status::unmatched);
    EXPECT_EQ(pattern->search(u8"ÿas for").status, Reg_Exp_Status::unmatched);
    EXPECT_EQ(pattern->search(u8"ŸAS FOR").status, Reg_Exp_Status::unmatched);
    EXPECT_EQ(pattern->search(u8"as forêt").status, Reg_Exp_Status::unmatched);
    EXPECT_EQ(pattern->search(u8"as forß").status, Reg_Exp_Status::unmatched);
}

TEST(Reg_Exp, whole_word_pattern_default_phrases)
{
    for (const Phrase_Definition& phrase : default_phrases) {
        EXPECT_TRUE(Reg_Exp::make(whole_word_pattern(phrase.text), Reg_Exp_Flags::ignore_case))
            << "phrase: " << as_string_view(phrase.text);
    }
}

TEST(Reg_Exp, append_reg_exp_escaped)
{
    const auto escaped = [](std::u8string_view text) {
        std::u8string result;
        append_reg_exp_escaped(result, text);
        return result;
    };
    EXPECT_EQ(escaped(u8"as well as"), u8"as well as");
    EXPECT_EQ(escaped(u8"w/o"), u8"w/o");
    EXPECT_EQ(escaped(u8"o'er"), u8"o'er");
    EXPECT_EQ(escaped(u8"vis-à-vis"), u8"vis-à-vis");
    EXPECT_EQ(escaped(u8"c."), u8"c\\.");
    EXPECT_EQ(escaped(u8"(a|b)*"), u8"\\(a\\|b\\)\\*");

    const std::u8string pattern = escaped(u8"1+1 (c.)");
    EXPECT_EQ(Reg_Exp::make(pattern)->match(u8"1+1 (c.)"), Reg_Exp_Status::matched);
    EXPECT_EQ(Reg_Exp::make(pattern)->match(u8"11 cx"), Reg_Exp_Status::unmatched);
}

} // namespace
} // namespace titlecase
