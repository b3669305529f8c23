#include <gtest/gtest.h>
#include "docprint/errors.h"
#include "docprint/line_breaker.h"
#include <cmath>

using namespace docprint;

namespace {

// 0.5 em per character at 12pt
const float kCharMm = 0.5f * 12.0f * kPtToMm;

ResolvedRun run(const std::string& text, bool bold = false, float sizePt = 12.0f) {
    ResolvedRun r;
    r.text = text;
    r.style.bold = bold;
    r.style.sizePt = sizePt;
    return r;
}

std::string joined(const std::vector<VisualLine>& lines) {
    std::string result;
    for (const auto& line : lines) result += line.text();
    return result;
}

} // anonymous namespace

class LineBreakerTest : public ::testing::Test {
protected:
    FixedWidthMetrics metrics{0.5f};
    LineBreaker breaker{metrics, 1.15f};
};

TEST_F(LineBreakerTest, SingleLineFits) {
    auto lines = breaker.breakLines({run("Hello world")}, 100.0f);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].text(), "Hello world");
    EXPECT_FLOAT_EQ(lines[0].widthMm, 11 * kCharMm);
    EXPECT_FLOAT_EQ(lines[0].heightMm, 12.0f * 0.38f * 1.15f);
}

TEST_F(LineBreakerTest, WrapsAtWordBoundaries) {
    // Room for 10 characters
    auto lines = breaker.breakLines({run("aaa bbb ccc ddd")}, 10.5f * kCharMm);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].text(), "aaa bbb ");
    EXPECT_EQ(lines[1].text(), "ccc ddd");
    // Trailing space is not measured
    EXPECT_FLOAT_EQ(lines[0].widthMm, 7 * kCharMm);
}

TEST_F(LineBreakerTest, ConservesCharactersAcrossRuns) {
    std::vector<ResolvedRun> runs = {
        run("The quick "), run("brown", true), run(" fox jumps over the "),
        run("lazy", false, 16.0f), run(" dog and keeps on running around the yard"),
    };
    std::string expected;
    for (const auto& r : runs) expected += r.text;

    for (float chars : {6.0f, 11.0f, 17.0f, 40.0f, 200.0f}) {
        auto lines = breaker.breakLines(runs, chars * kCharMm);
        EXPECT_EQ(joined(lines), expected) << "width " << chars;
    }
}

TEST_F(LineBreakerTest, SplitRunsKeepTheirStyle) {
    std::vector<ResolvedRun> runs = {run("plain start "), run("bold words here", true)};
    auto lines = breaker.breakLines(runs, 17.5f * kCharMm);
    ASSERT_EQ(lines.size(), 2u);
    ASSERT_EQ(lines[0].slices.size(), 2u);
    EXPECT_EQ(lines[0].slices[1].run.text, "bold ");
    EXPECT_TRUE(lines[0].slices[1].run.style.bold);
    ASSERT_EQ(lines[1].slices.size(), 1u);
    EXPECT_EQ(lines[1].slices[0].run.text, "words here");
    EXPECT_TRUE(lines[1].slices[0].run.style.bold);
}

TEST_F(LineBreakerTest, OverwideWordStandsAlone) {
    auto lines = breaker.breakLines({run("a supercalifragilistic word")}, 8.0f * kCharMm);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].text(), "a ");
    EXPECT_EQ(lines[1].text(), "supercalifragilistic ");
    EXPECT_EQ(lines[2].text(), "word");
}

TEST_F(LineBreakerTest, WordSpanningTwoRunsIsNotSplit) {
    // "foo" bold and "bar" plain form one word at the wrap boundary
    std::vector<ResolvedRun> runs = {run("aaaa "), run("foo", true), run("bar")};
    auto lines = breaker.breakLines(runs, 10.0f * kCharMm);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].text(), "aaaa ");
    EXPECT_EQ(lines[1].text(), "foobar");
    ASSERT_EQ(lines[1].slices.size(), 2u);
    EXPECT_TRUE(lines[1].slices[0].run.style.bold);
    EXPECT_FALSE(lines[1].slices[1].run.style.bold);
}

TEST_F(LineBreakerTest, HardBreaks) {
    auto lines = breaker.breakLines({run("one\ntwo\nthree")}, 100.0f);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].text(), "one\n");
    EXPECT_EQ(lines[1].text(), "two\n");
    EXPECT_EQ(lines[2].text(), "three");
    EXPECT_FLOAT_EQ(lines[0].widthMm, 3 * kCharMm);
}

TEST_F(LineBreakerTest, NonBreakingSpaceHoldsWordsTogether) {
    std::string text = "ab\xc2\xa0" "cd ef";
    auto points = linebreak::findBreakPoints(text, 0, text.size());
    ASSERT_EQ(points.size(), 1u);
    EXPECT_EQ(points[0], 7u);

    auto lines = breaker.breakLines({run(text)}, 5.5f * kCharMm);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].text(), "ab\xc2\xa0" "cd ");
}

TEST_F(LineBreakerTest, UnicodeSpacesBreak) {
    std::string text = "ab\xe2\x80\x89" "cd";  // thin space
    auto points = linebreak::findBreakPoints(text, 0, text.size());
    ASSERT_EQ(points.size(), 1u);
    EXPECT_EQ(points[0], 5u);
    EXPECT_EQ(linebreak::trimTrailingSpace(text, 0, 5), 2u);
}

TEST_F(LineBreakerTest, LeadingSuperscriptKeepsFullMeasure) {
    ResolvedRun sup = run("1");
    sup.style.script = Script::Super;
    std::string words;
    for (int i = 0; i < 60; ++i) words += "word ";

    auto lines = breaker.breakLines({sup, run(words)}, 40.0f * kCharMm);
    ASSERT_GT(lines.size(), 1u);
    for (const auto& line : lines) {
        EXPECT_LE(line.widthMm, 40.0f * kCharMm + 1e-3f);
    }
}

TEST_F(LineBreakerTest, CarriageReturnIsBreakAndTrimmed) {
    std::string text = "ab\r\ncd";
    auto points = linebreak::findBreakPoints(text, 0, text.size());
    ASSERT_EQ(points.size(), 1u);
    EXPECT_EQ(points[0], 3u);
    EXPECT_EQ(linebreak::trimTrailingSpace(text, 0, 4), 2u);

    auto lines = breaker.breakLines({run("int a;\r\nint b;\r\n")}, 100.0f);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].text(), "int a;\r\n");
    EXPECT_FLOAT_EQ(lines[0].widthMm, 6 * kCharMm);
}

TEST_F(LineBreakerTest, PrefixOnFirstLineOnly) {
    auto lines = breaker.breakLines({run("aaa bbb ccc")}, 4.5f * kCharMm, "1. ");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].prefix, "1. ");
    EXPECT_TRUE(lines[1].prefix.empty());
    EXPECT_TRUE(lines[2].prefix.empty());
}

TEST_F(LineBreakerTest, LineHeightFollowsLargestFont) {
    std::vector<ResolvedRun> runs = {run("small "), run("BIG", false, 24.0f)};
    auto lines = breaker.breakLines(runs, 200.0f);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_FLOAT_EQ(lines[0].maxSizePt, 24.0f);
    EXPECT_FLOAT_EQ(lines[0].heightMm, 24.0f * 0.38f * 1.15f);
    EXPECT_FLOAT_EQ(lines[0].dominantStyle().sizePt, 24.0f);
}

TEST_F(LineBreakerTest, AlignIsCarried) {
    auto lines = breaker.breakLines({run("centered")}, 100.0f, "", TextAlign::Center);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].align, TextAlign::Center);
}

TEST_F(LineBreakerTest, EmptyInputGivesNoLines) {
    EXPECT_TRUE(breaker.breakLines({}, 100.0f).empty());
}

TEST_F(LineBreakerTest, NonPositiveWidthThrows) {
    EXPECT_THROW(breaker.breakLines({run("x")}, 0.0f), ConfigurationError);
    EXPECT_THROW(breaker.breakLines({run("x")}, -5.0f), ConfigurationError);
    EXPECT_THROW(breaker.breakLines({run("x")}, std::nanf("")), ConfigurationError);
}
