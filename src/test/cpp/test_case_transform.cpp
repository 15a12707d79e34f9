#include <string_view>

#include <gtest/gtest.h>

#include "titlecase/util/case_transform.hpp"

namespace titlecase {
namespace {

TEST(Case_Transform, simple_to_upper)
{
    EXPECT_EQ(simple_to_upper(U'a'), U'A');
    EXPECT_EQ(simple_to_upper(U'z'), U'Z');
    EXPECT_EQ(simple_to_upper(U'A'), U'A');
    EXPECT_EQ(simple_to_upper(U'à'), U'À');
    EXPECT_EQ(simple_to_upper(U'é'), U'É');
    EXPECT_EQ(simple_to_upper(U'þ'), U'Þ');
    EXPECT_EQ(simple_to_upper(U'ÿ'), U'Ÿ');

    EXPECT_EQ(simple_to_upper(U'ß'), U'ß');
    EXPECT_EQ(simple_to_upper(U'÷'), U'÷');
    EXPECT_EQ(simple_to_upper(U'1'), U'1');
    EXPECT_EQ(simple_to_upper(U'.'), U'.');
    EXPECT_EQ(simple_to_upper(U'α'), U'α');
}

TEST(Case_Transform, simple_to_lower)
{
    EXPECT_EQ(simple_to_lower(U'A'), U'a');
    EXPECT_EQ(simple_to_lower(U'Z'), U'z');
    EXPECT_EQ(simple_to_lower(U'a'), U'a');
    EXPECT_EQ(simple_to_lower(U'À'), U'à');
    EXPECT_EQ(simple_to_lower(U'É'), U'é');
    EXPECT_EQ(simple_to_lower(U'Þ'), U'þ');
    EXPECT_EQ(simple_to_lower(U'Ÿ'), U'ÿ');

    EXPECT_EQ(simple_to_lower(U'×'), U'×');
    EXPECT_EQ(simple_to_lower(U'ß'), U'ß');
    EXPECT_EQ(simple_to_lower(U'Α'), U'Α');
}

TEST(Case_Transform, round_trip_latin1)
{
    for (char32_t c = U'À'; c <= U'Þ'; ++c) {
        EXPECT_EQ(simple_to_upper(simple_to_lower(c)), c);
    }
}

TEST(Case_Transform, to_upper)
{
    EXPECT_EQ(to_upper(u8""), u8"");
    EXPECT_EQ(to_upper(u8"s.o.s."), u8"S.O.S.");
    EXPECT_EQ(to_upper(u8"crème brûlée"), u8"CRÈME BRÛLÉE");
    EXPECT_EQ(to_upper(u8"straße"), u8"STRAßE");
    EXPECT_EQ(to_upper(u8"ÿes"), u8"ŸES");
}

TEST(Case_Transform, to_lower)
{
    EXPECT_EQ(to_lower(u8"THE"), u8"the");
    EXPECT_EQ(to_lower(u8"À LA"), u8"à la");
    EXPECT_EQ(to_lower(u8"VIS-À-VIS"), u8"vis-à-vis");
    EXPECT_EQ(to_lower(u8"ŸES"), u8"ÿes");
}

TEST(Case_Transform, malformed_code_units_are_preserved)
{
    const std::u8string_view malformed = u8"a\xFF" "b\xC3";
    const std::u8string upper = to_upper(malformed);
    ASSERT_EQ(upper.size(), malformed.size());
    EXPECT_EQ(upper, u8"A\xFF" "B\xC3");
}

TEST(Case_Transform, appends)
{
    std::u8string out = u8"Out ";
    to_lower(out, u8"OF");
    EXPECT_EQ(out, u8"Out of");
}

} // namespace
} // namespace titlecase
