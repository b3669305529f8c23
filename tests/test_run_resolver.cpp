#include <gtest/gtest.h>
#include "docprint/run_resolver.h"

using namespace docprint;

// MARK: - Font sizes

TEST(FontSizeTest, PointsAndBareNumbers) {
    EXPECT_FLOAT_EQ(parseFontSize("14pt").value(), 14.0f);
    EXPECT_FLOAT_EQ(parseFontSize("12").value(), 12.0f);
    EXPECT_FLOAT_EQ(parseFontSize(" 10.5pt ").value(), 10.5f);
}

TEST(FontSizeTest, PixelsConvertAtThreeQuarters) {
    EXPECT_FLOAT_EQ(parseFontSize("16px").value(), 12.0f);
    EXPECT_FLOAT_EQ(parseFontSize("24PX").value(), 18.0f);
}

TEST(FontSizeTest, MalformedSizes) {
    EXPECT_FALSE(parseFontSize("").has_value());
    EXPECT_FALSE(parseFontSize("large").has_value());
    EXPECT_FALSE(parseFontSize("-3pt").has_value());
    EXPECT_FALSE(parseFontSize("0").has_value());
    EXPECT_FALSE(parseFontSize("2em").has_value());
}

TEST(FontSizeTest, ResolveKeepsInheritedOnMalformed) {
    EXPECT_FLOAT_EQ(resolveSize(12.0f, std::nullopt), 12.0f);
    EXPECT_FLOAT_EQ(resolveSize(12.0f, std::string("abc")), 12.0f);
    EXPECT_FLOAT_EQ(resolveSize(12.0f, std::string("20px")), 15.0f);
}

// MARK: - Font families

TEST(FontFamilyTest, LookupTable) {
    EXPECT_EQ(lookupFontFamily("Arial").value(), FontFamily::Helvetica);
    EXPECT_EQ(lookupFontFamily("Inter, sans-serif").value(), FontFamily::Helvetica);
    EXPECT_EQ(lookupFontFamily("Georgia").value(), FontFamily::Times);
    EXPECT_EQ(lookupFontFamily("'Times New Roman', serif").value(), FontFamily::Times);
    EXPECT_EQ(lookupFontFamily("\"Courier New\"").value(), FontFamily::Courier);
    EXPECT_EQ(lookupFontFamily("monospace").value(), FontFamily::Courier);
}

TEST(FontFamilyTest, OnlyFirstFamilyCounts) {
    EXPECT_FALSE(lookupFontFamily("Wingdings, serif").has_value());
    EXPECT_EQ(resolveFamily(FontFamily::Courier, std::string("Wingdings")), FontFamily::Courier);
}

// MARK: - Colors

TEST(ColorTest, HexForms) {
    EXPECT_EQ(parseColor("#f00").value(), (Rgb{255, 0, 0}));
    EXPECT_EQ(parseColor("#00FF80").value(), (Rgb{0, 255, 128}));
    EXPECT_FALSE(parseColor("#12").has_value());
    EXPECT_FALSE(parseColor("#ggg").has_value());
}

TEST(ColorTest, RgbFunctionAndNames) {
    EXPECT_EQ(parseColor("rgb(1, 2, 3)").value(), (Rgb{1, 2, 3}));
    EXPECT_EQ(parseColor("Blue").value(), (Rgb{0, 0, 255}));
    EXPECT_FALSE(parseColor("rgb(300, 0, 0)").has_value());
    EXPECT_FALSE(parseColor("rgb(1, 2)").has_value());
    EXPECT_FALSE(parseColor("chartreuse-ish").has_value());
}

TEST(ColorTest, ResolveKeepsInheritedOnMalformed) {
    Rgb inherited{10, 20, 30};
    EXPECT_EQ(resolveColor(inherited, std::string("nope")), inherited);
    EXPECT_EQ(resolveColor(inherited, std::string("#000")), (Rgb{0, 0, 0}));
}

// MARK: - Merge

TEST(MergeTest, BooleansAreOrCombined) {
    RunStyle inherited;
    inherited.bold = true;

    InlineRun run = InlineRun::italicized("x");
    run.underline = true;
    RunStyle style = merge(inherited, run);
    EXPECT_TRUE(style.bold);
    EXPECT_TRUE(style.italic);
    EXPECT_TRUE(style.underline);
    EXPECT_FALSE(style.strike);
}

TEST(MergeTest, SuperscriptWinsOverSubscript) {
    InlineRun run = InlineRun::plain("2");
    run.superscript = true;
    run.subscript = true;
    EXPECT_EQ(merge(RunStyle{}, run).script, Script::Super);

    run.superscript = false;
    EXPECT_EQ(merge(RunStyle{}, run).script, Script::Sub);
}

TEST(MergeTest, ScriptShrinksFont) {
    InlineRun run = InlineRun::plain("2");
    run.superscript = true;
    RunStyle style = merge(RunStyle{}, run);
    EXPECT_FLOAT_EQ(style.sizePt, 12.0f);
    EXPECT_FLOAT_EQ(style.font().sizePt, 12.0f * 0.7f);
}

TEST(MergeTest, AttributeMarks) {
    InlineRun run = InlineRun::plain("x");
    run.fontFamily = "Georgia";
    run.fontSize = "16px";
    run.color = "#336699";
    run.highlight = "yellow";
    RunStyle style = merge(RunStyle{}, run);
    EXPECT_EQ(style.family, FontFamily::Times);
    EXPECT_FLOAT_EQ(style.sizePt, 12.0f);
    EXPECT_EQ(style.color, (Rgb{0x33, 0x66, 0x99}));
    EXPECT_TRUE(style.highlighted);
    EXPECT_EQ(style.highlight, (Rgb{255, 255, 0}));
}

TEST(MergeTest, MalformedHighlightIgnored) {
    InlineRun run = InlineRun::plain("x");
    run.highlight = "not-a-color";
    EXPECT_FALSE(merge(RunStyle{}, run).highlighted);
}

// MARK: - Resolver

TEST(RunResolverTest, DropsEmptyRuns) {
    RunResolver resolver(BlockDefaults{});
    auto runs = resolver.resolve({InlineRun::plain(""), InlineRun::bolded("a"),
                                  InlineRun::plain("")});
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0].text, "a");
    EXPECT_TRUE(runs[0].style.bold);
}

TEST(RunResolverTest, MergesAdjacentIdenticalStyles) {
    RunResolver resolver(BlockDefaults{});
    InlineRun sized = InlineRun::plain("c");
    sized.fontSize = "12pt";  // Same as the default: style is identical
    auto runs = resolver.resolve({InlineRun::plain("a"), InlineRun::plain("b"), sized,
                                  InlineRun::bolded("d")});
    ASSERT_EQ(runs.size(), 2u);
    EXPECT_EQ(runs[0].text, "abc");
    EXPECT_EQ(runs[1].text, "d");
}

TEST(RunResolverTest, BlockDefaultsApply) {
    BlockDefaults defaults;
    defaults.family = FontFamily::Times;
    defaults.sizePt = 18.0f;
    defaults.forceBold = true;
    defaults.forceItalic = true;
    RunResolver resolver(defaults);

    auto runs = resolver.resolve({InlineRun::plain("Title")});
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0].style.family, FontFamily::Times);
    EXPECT_FLOAT_EQ(runs[0].style.sizePt, 18.0f);
    EXPECT_TRUE(runs[0].style.bold);
    EXPECT_TRUE(runs[0].style.italic);
}

TEST(RunResolverTest, MarkOverridesBlockDefault) {
    BlockDefaults defaults;
    defaults.sizePt = 18.0f;
    RunResolver resolver(defaults);

    InlineRun run = InlineRun::plain("small");
    run.fontSize = "9pt";
    auto runs = resolver.resolve({run});
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_FLOAT_EQ(runs[0].style.sizePt, 9.0f);
}

TEST(RunResolverTest, MonospaceIsForced) {
    BlockDefaults defaults;
    defaults.forceMonospace = true;
    RunResolver resolver(defaults);
    EXPECT_EQ(resolver.baseStyle().family, FontFamily::Courier);

    InlineRun run = InlineRun::plain("x = 1");
    run.fontFamily = "Georgia";
    auto runs = resolver.resolve({run});
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0].style.family, FontFamily::Courier);
}
