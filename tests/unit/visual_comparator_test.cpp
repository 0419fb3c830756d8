#include <page_validation/visual_comparator.hpp>

#include <gtest/gtest.h>

using namespace page_validation;
using page_model::DiscrepancySeverity;

namespace {

Screenshot solid(int width, int height, std::uint8_t value) {
    Screenshot shot;
    shot.width = width;
    shot.height = height;
    shot.rgba.assign(static_cast<size_t>(width) * height * 4, value);
    return shot;
}

void paint(Screenshot& shot, int x, int y, std::uint8_t value) {
    size_t offset = (static_cast<size_t>(y) * shot.width + x) * 4;
    shot.rgba[offset] = value;
}

} // namespace

// ---------------------------------------------------------------------------
// Pixels
// ---------------------------------------------------------------------------
TEST(VisualComparatorTest, IdenticalImagesMatch) {
    auto diff = diff_pixels(solid(10, 10, 128), solid(10, 10, 128), 0.1);
    EXPECT_EQ(diff.different, 0);
    EXPECT_EQ(diff.total, 100);
    EXPECT_TRUE(diff.dimensions_match);
}

TEST(VisualComparatorTest, ThresholdSkipsSmallChanges) {
    auto original = solid(10, 10, 100);
    auto converted = solid(10, 10, 100);
    paint(converted, 0, 0, 120);
    paint(converted, 1, 0, 200);
    // 0.1 * 255 rounds to 26: a change of 20 passes, 100 does not.
    EXPECT_EQ(diff_pixels(original, converted, 0.1).different, 1);
    EXPECT_EQ(diff_pixels(original, converted, 0.0).different, 2);
}

TEST(VisualComparatorTest, SizeMismatchComparesUnionCanvas) {
    auto diff = diff_pixels(solid(10, 10, 0), solid(10, 12, 0), 0.1);
    EXPECT_FALSE(diff.dimensions_match);
    EXPECT_EQ(diff.total, 120);
    EXPECT_EQ(diff.different, 20);
}

TEST(VisualComparatorTest, SeverityByProperty) {
    EXPECT_EQ(discrepancy_severity("display"), DiscrepancySeverity::Major);
    EXPECT_EQ(discrepancy_severity("height"), DiscrepancySeverity::Major);
    EXPECT_EQ(discrepancy_severity("color"), DiscrepancySeverity::Moderate);
    EXPECT_EQ(discrepancy_severity("font-size"), DiscrepancySeverity::Moderate);
    EXPECT_EQ(discrepancy_severity("letter-spacing"), DiscrepancySeverity::Minor);
}

// ---------------------------------------------------------------------------
// Snapshots
// ---------------------------------------------------------------------------
TEST(VisualComparatorTest, ComparesElementsAndStyles) {
    RenderSnapshot original;
    original.screenshot = solid(20, 10, 255);
    original.elements = {
        { "#hero", { { "display", "flex" }, { "color", "#000000" } } },
        { "#promo", { { "display", "block" } } },
    };

    RenderSnapshot converted;
    converted.screenshot = solid(20, 10, 255);
    for (int x = 0; x < 3; ++x) paint(converted.screenshot, x, 0, 0);
    converted.elements = {
        { "#hero", { { "display", "block" }, { "color", "#000000" }, { "margin-top", "8px" } } },
        { ".elementor-widget", {} },
    };

    page_model::Viewport viewport{ "desktop", 1920, 1080 };
    auto result = compare_snapshots(original, converted, viewport, 0.1);

    EXPECT_EQ(result.viewport.name, "desktop");
    EXPECT_EQ(result.pixel_difference, 3);
    EXPECT_EQ(result.total_pixels, 200);
    EXPECT_DOUBLE_EQ(result.diff_percentage, 1.5);
    EXPECT_DOUBLE_EQ(result.similarity_score, 98.5);
    EXPECT_EQ(result.missing_elements, (std::vector<std::string>{ "#promo" }));
    EXPECT_EQ(result.extra_elements, (std::vector<std::string>{ ".elementor-widget" }));

    ASSERT_EQ(result.style_discrepancies.size(), 2u);
    EXPECT_EQ(result.style_discrepancies[0].property, "display");
    EXPECT_EQ(result.style_discrepancies[0].original_value, "flex");
    EXPECT_EQ(result.style_discrepancies[0].converted_value, "block");
    EXPECT_EQ(result.style_discrepancies[0].severity, DiscrepancySeverity::Major);
    EXPECT_EQ(result.style_discrepancies[1].property, "margin-top");
    EXPECT_TRUE(result.style_discrepancies[1].original_value.empty());
    EXPECT_EQ(result.style_discrepancies[1].severity, DiscrepancySeverity::Minor);
}

TEST(VisualComparatorTest, EmptyCanvasIsFullySimilar) {
    auto result = compare_snapshots(RenderSnapshot{}, RenderSnapshot{}, { "mobile", 375, 667 }, 0.1);
    EXPECT_EQ(result.total_pixels, 0);
    EXPECT_DOUBLE_EQ(result.similarity_score, 100.0);
}
