#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "titlecase/util/io.hpp"
#include "titlecase/util/result.hpp"
#include "titlecase/util/severity.hpp"
#include "titlecase/util/strings.hpp"

#include "titlecase/diagnostic.hpp"

#include "titlecase/lexicon.hpp"
#include "titlecase/title_case.hpp"

#include "collecting_logger.hpp"

namespace titlecase {
namespace {

struct Title_Example {
    std::u8string input;
    std::u8string expected;
};

/// @brief Loads the tab-separated examples in `test/titles.tsv`.
[[nodiscard]]
std::vector<Title_Example> load_title_examples()
{
    std::vector<char8_t> text;
    const Result<void, IO_Error_Code> r = load_utf8_file(text, u8"test/titles.tsv");
    if (!r) {
        ADD_FAILURE() << "Failed to load test/titles.tsv";
        return {};
    }

    std::vector<Title_Example> result;
    std::u8string_view rest = as_u8string_view(text);
    while (!rest.empty()) {
        const std::size_t line_end = rest.find(u8'\n');
        const std::u8string_view line = rest.substr(0, line_end);
        rest = line_end == std::u8string_view::npos ? std::u8string_view {}
                                                    : rest.substr(line_end + 1);
        if (line.empty()) {
            continue;
        }
        const std::size_t tab = line.find(u8'\t');
        if (tab == std::u8string_view::npos) {
            ADD_FAILURE() << "Line without tab in test/titles.tsv";
            continue;
        }
        result.push_back({ std::u8string { line.substr(0, tab) },
                           std::u8string { line.substr(tab + 1) } });
    }
    return result;
}

TEST(Title_Case, scenarios)
{
    EXPECT_EQ(
        title_case(u8"a tramp's wallet stored by an english goldsmith during his wanderings in "
                   u8"germany and france"),
        u8"A Tramp's Wallet Stored by an English Goldsmith During His Wanderings in Germany and "
        u8"France"
    );
    EXPECT_EQ(title_case(u8"...and it comes out here"), u8"...And It Comes out Here");
    EXPECT_EQ(title_case(u8"s.o.s. aphrodite!"), u8"S.O.S. Aphrodite!");
    EXPECT_EQ(
        title_case(u8"out of the hurly-burly; or, life in an odd corner"),
        u8"Out of the Hurly-Burly; or, Life in an Odd Corner"
    );
    EXPECT_EQ(title_case(u8""), u8"");
    EXPECT_EQ(
        title_case(u8"entering the city with the horse i got off of"),
        u8"Entering the City With the Horse I Got off Of"
    );
}

TEST(Title_Case, examples_file)
{
    const std::vector<Title_Example> examples = load_title_examples();
    EXPECT_GE(examples.size(), 10);
    for (const Title_Example& example : examples) {
        EXPECT_EQ(title_case(example.input), example.expected)
            << "input: " << as_string_view(example.input);
    }
}

TEST(Title_Case, idempotent)
{
    for (const Title_Example& example : load_title_examples()) {
        EXPECT_EQ(title_case(example.expected), example.expected)
            << "input: " << as_string_view(example.expected);
    }
}

TEST(Title_Case, ordinals)
{
    EXPECT_EQ(title_case(u8"the 21st century"), u8"The 21st Century");
    EXPECT_EQ(title_case(u8"2fast 2furious"), u8"2fast 2furious");
    EXPECT_EQ(title_case(u8"'90s music of the '80s"), u8"'90s Music of the '80s");
}

TEST(Title_Case, numbers)
{
    EXPECT_EQ(title_case(u8"1984"), u8"1984");
    EXPECT_EQ(title_case(u8"catch-22"), u8"Catch-22");
}

TEST(Title_Case, latin1)
{
    EXPECT_EQ(
        title_case(u8"à la recherche du temps perdu"), u8"À la Recherche Du Temps Perdu"
    );
    EXPECT_EQ(title_case(u8"crème brûlée for two"), u8"Crème Brûlée for Two");
}

TEST(Title_Case, acronyms)
{
    EXPECT_EQ(title_case(u8"m.a.s.h. goes home"), u8"M.A.S.H. Goes Home");
}

TEST(Title_Case, only_punctuation)
{
    EXPECT_EQ(title_case(u8"—!?"), u8"—!?");
    EXPECT_EQ(title_case(u8"   "), u8"   ");
}

TEST(Title_Case, single_function_word)
{
    EXPECT_EQ(title_case(u8"the"), u8"The");
    EXPECT_EQ(title_case(u8"of"), u8"Of");
}

TEST(Title_Case, malformed_utf8)
{
    const std::u8string_view input = u8"caf\xC3 au lait";
    const std::u8string result = title_case(input);
    ASSERT_EQ(result.size(), input.size());
    EXPECT_EQ(result, u8"Caf\xC3 Au Lait");
}

TEST(Title_Case, appends)
{
    std::u8string out = u8"> ";
    title_case(out, u8"out of here", default_lexicon());
    EXPECT_EQ(out, u8"> Out of Here");
}

TEST(Title_Case, lowercase_phrases)
{
    std::u8string text = u8"Because Of You, As Well As Me";
    lowercase_phrases(text, default_lexicon());
    EXPECT_EQ(text, u8"because of You, as well as Me");

    std::u8string inside_word = u8"Has Forgotten";
    lowercase_phrases(inside_word, default_lexicon());
    EXPECT_EQ(inside_word, u8"Has Forgotten");
}

TEST(Title_Case, capitalize_boundary_words)
{
    std::u8string text = u8"...and it comes out here";
    capitalize_boundary_words(text);
    EXPECT_EQ(text, u8"...And it comes out Here");

    std::u8string ordinal = u8"'90s music";
    capitalize_boundary_words(ordinal);
    EXPECT_EQ(ordinal, u8"'90s Music");

    std::u8string punctuation = u8"—!?";
    capitalize_boundary_words(punctuation);
    EXPECT_EQ(punctuation, u8"—!?");
}

TEST(Title_Case, lowercase_phrases_respects_latin1_boundaries)
{
    static constexpr std::u8string_view unchanged[] {
        u8"ÉAS FOR ME", u8"ŸAS FOR ME", u8"As Forêt", u8"As Forß",
    };
    for (const std::u8string_view input : unchanged) {
        std::u8string text { input };
        lowercase_phrases(text, default_lexicon());
        EXPECT_TRUE(text == input) << "input: " << as_string_view(input);
    }

    std::u8string text = u8"Élan, As For Me";
    lowercase_phrases(text, default_lexicon());
    EXPECT_EQ(text, u8"Élan, as for Me");
}

TEST(Title_Case, separate_leading_punctuation)
{
    // The ellipsis forms its own word, so it is the first word, and "and" stays lowercase.
    EXPECT_EQ(title_case(u8"... and it comes out here"), u8"... and It Comes out Here");
    EXPECT_EQ(title_case(u8"...and it comes out here"), u8"...And It Comes out Here");
}

TEST(Title_Case, title_case_lines)
{
    Collecting_Logger logger;
    std::u8string out;
    title_case_lines(out, u8"a\n\n b \r\n", default_lexicon(), logger);
    EXPECT_EQ(out, u8"A\n\nB\n");
    EXPECT_TRUE(logger.nothing_logged());
}

TEST(Title_Case, title_case_lines_without_final_terminator)
{
    Collecting_Logger logger;
    std::u8string out;
    title_case_lines(out, u8"out of here\n\tthe end", default_lexicon(), logger);
    EXPECT_EQ(out, u8"Out of Here\nThe End\n");

    out.clear();
    title_case_lines(out, u8"", default_lexicon(), logger);
    EXPECT_EQ(out, u8"");
    EXPECT_TRUE(logger.nothing_logged());
}

TEST(Title_Case, title_case_lines_malformed_utf8)
{
    Collecting_Logger logger;
    std::u8string out;
    title_case_lines(out, u8"fine\nthe caf\xC3\nok", default_lexicon(), logger);
    EXPECT_EQ(out, u8"Fine\nThe Caf\xC3\nOk\n");

    ASSERT_EQ(logger.diagnostics.size(), 1);
    EXPECT_EQ(logger.diagnostics[0].severity, Severity::error);
    EXPECT_EQ(logger.diagnostics[0].id, diagnostic::io_utf8);
    EXPECT_NE(logger.diagnostics[0].message.find(u8"Line 2"), std::u8string::npos);
}

TEST(Title_Case, title_case_line_numbering)
{
    Collecting_Logger logger;
    std::u8string out;
    title_case_line(out, u8"\xFF", 7, default_lexicon(), logger);
    EXPECT_EQ(out, u8"\xFF\n");
    ASSERT_EQ(logger.diagnostics.size(), 1);
    EXPECT_NE(logger.diagnostics[0].message.find(u8"Line 7"), std::u8string::npos);
}

} // namespace
} // namespace titlecase
