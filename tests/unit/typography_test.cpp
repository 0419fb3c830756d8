#include <page_analysis/element_analyzer.hpp>
#include <page_analysis/recognizer.hpp>
#include <page_analysis/typography.hpp>
#include <page_model/dom.hpp>

#include <gtest/gtest.h>

using namespace page_analysis;
using page_model::TextRole;

namespace {

TypographySample sample(double px, TextRole role = TextRole::Body, std::string family = "Inter") {
    TypographySample s;
    s.family = std::move(family);
    s.size_px = px;
    s.role = role;
    return s;
}

} // namespace

// ---------------------------------------------------------------------------
// Type scale
// ---------------------------------------------------------------------------
TEST(TypographyTest, SnapsSixteenTwentyTwentyFiveToMajorThird) {
    auto system = summarize_typography({ sample(16), sample(20, TextRole::H2), sample(25, TextRole::H1) });
    EXPECT_DOUBLE_EQ(system.scale.base_size, 16);
    EXPECT_DOUBLE_EQ(system.scale.ratio, 1.25);
}

TEST(TypographyTest, BaseDefaultsToSixteenOutsideBodyRange) {
    auto system = summarize_typography({ sample(12), sample(40, TextRole::H1) });
    EXPECT_DOUBLE_EQ(system.scale.base_size, 16);
}

TEST(TypographyTest, BaseTieGoesToSmallerSize) {
    auto system = summarize_typography({ sample(18), sample(14) });
    EXPECT_DOUBLE_EQ(system.scale.base_size, 14);
}

TEST(TypographyTest, RatioDefaultsWithoutLargerSizes) {
    auto system = summarize_typography({ sample(16) });
    EXPECT_DOUBLE_EQ(system.scale.ratio, 1.25);
}

TEST(TypographyTest, SnapRatioPicksNearest) {
    EXPECT_DOUBLE_EQ(snap_ratio(1.3), 1.333);
    EXPECT_DOUBLE_EQ(snap_ratio(1.1), 1.125);
    EXPECT_DOUBLE_EQ(snap_ratio(2.0), 1.618);
}

TEST(TypographyTest, ScaleNamesFollowRatioBuckets) {
    EXPECT_EQ(scale_name(12, 16), "xs");
    EXPECT_EQ(scale_name(16, 16), "base");
    EXPECT_EQ(scale_name(20, 16), "lg");
    EXPECT_EQ(scale_name(32, 16), "3xl");
    EXPECT_EQ(scale_name(80, 16), "6xl");
}

// ---------------------------------------------------------------------------
// Role styles take the first observed instance
// ---------------------------------------------------------------------------
TEST(TypographyTest, HeadingStyleIsFirstInstance) {
    auto system = summarize_typography({ sample(40, TextRole::H1), sample(16), sample(28, TextRole::H1) });
    const auto* h1 = system.style_for(TextRole::H1);
    ASSERT_NE(h1, nullptr);
    EXPECT_DOUBLE_EQ(h1->font_size, 40);
}

// ---------------------------------------------------------------------------
// Global settings and statistics
// ---------------------------------------------------------------------------
TEST(TypographyTest, GlobalFontsComeFromUsage) {
    auto system = summarize_typography({
        sample(16, TextRole::Body, "Inter"),
        sample(16, TextRole::Body, "Inter"),
        sample(32, TextRole::H1, "Playfair Display"),
    });
    EXPECT_EQ(system.global.base_font_family, "Inter");
    EXPECT_EQ(system.global.heading_font_family, "Playfair Display");
    EXPECT_EQ(system.global.heading_font_weight, "700");
    EXPECT_EQ(system.statistics.distinct_fonts, 2);
    EXPECT_EQ(system.statistics.quality, page_model::ScaleQuality::Excellent);
}

TEST(TypographyTest, ExtractsFromDocument) {
    page_model::DomDocument doc;
    auto h1 = page_model::make_element("h1", { { "style", "font-size: 2rem; font-family: 'Roboto', sans-serif" } },
        { page_model::make_text("Title") });
    auto p = page_model::make_element("p", { { "style", "font-size: 16px; font-family: Roboto" } },
        { page_model::make_text("Body") });
    doc.root = page_model::make_element("body", {}, { h1, p });

    auto analyzed = analyze_document(doc);
    auto components = recognize_document(analyzed, 60);
    auto system = extract_typography(analyzed, components);

    const auto* heading = system.style_for(TextRole::H1);
    ASSERT_NE(heading, nullptr);
    EXPECT_DOUBLE_EQ(heading->font_size, 32);
    EXPECT_EQ(heading->font_family, "Roboto");
    EXPECT_EQ(system.global.base_font_family, "Roboto");
}
