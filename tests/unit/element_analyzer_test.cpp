#include <page_analysis/css_values.hpp>
#include <page_analysis/element_analyzer.hpp>
#include <page_model/dom.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

using namespace page_analysis;
using page_model::make_element;
using page_model::make_text;

// ---------------------------------------------------------------------------
// Malformed roots fail fast
// ---------------------------------------------------------------------------
TEST(ElementAnalyzerTest, NullRootThrows) {
    EXPECT_THROW(analyze_tree(nullptr), std::invalid_argument);
}

TEST(ElementAnalyzerTest, TextRootThrows) {
    auto text = make_text("loose text");
    EXPECT_THROW(analyze_tree(&text), std::invalid_argument);
}

TEST(ElementAnalyzerTest, EmptyTagThrows) {
    page_model::DomNode node;
    EXPECT_THROW(analyze_tree(&node), std::invalid_argument);
}

// ---------------------------------------------------------------------------
// Pre-order ids skip text runs
// ---------------------------------------------------------------------------
TEST(ElementAnalyzerTest, AssignsPreOrderIds) {
    page_model::DomDocument doc;
    doc.title = "Ids";
    doc.root = make_element("body", {}, {
        make_element("div", {}, {
            make_element("h1", {}, { make_text("Title") }),
            make_element("p", {}, { make_text("Body") }),
        }),
        make_element("footer", {}, { make_text("Bye") }),
    });

    auto analyzed = analyze_document(doc);
    EXPECT_EQ(analyzed.title, "Ids");
    EXPECT_EQ(analyzed.element_count, 5u);
    EXPECT_EQ(analyzed.root.id, "el-0");
    ASSERT_EQ(analyzed.root.children.size(), 2u);
    EXPECT_EQ(analyzed.root.children[0].id, "el-1");
    EXPECT_EQ(analyzed.root.children[0].children[0].id, "el-2");
    EXPECT_EQ(analyzed.root.children[0].children[1].id, "el-3");
    EXPECT_EQ(analyzed.root.children[1].id, "el-4");
}

TEST(ElementAnalyzerTest, CollectsWhitespaceCollapsedText) {
    auto root = make_element("div", {}, {
        make_text("  Hello \n"),
        make_element("strong", {}, { make_text("  big   world ") }),
    });
    auto analyzed = analyze_tree(&root);
    EXPECT_EQ(analyzed.text_content, "Hello big world");
}

TEST(ElementAnalyzerTest, ContextFlagsFollowAncestry) {
    auto root = make_element("body", {}, {
        make_element("div", { { "class", "hero-banner" } }, {
            make_element("form", {}, { make_element("input", { { "type", "email" } }) }),
        }),
    });
    auto analyzed = analyze_tree(&root);
    const auto& input = analyzed.children[0].children[0].children[0];
    EXPECT_TRUE(input.context.inside_hero);
    EXPECT_TRUE(input.context.inside_form);
    EXPECT_FALSE(input.context.inside_footer);
    EXPECT_EQ(input.context.depth, 3);
}

// ---------------------------------------------------------------------------
// Style normalization
// ---------------------------------------------------------------------------
TEST(ElementAnalyzerTest, ExpandsBoxShorthandWithLonghandOverride) {
    auto styles = extract_styles({ { "padding", "10px 20px" }, { "padding-left", "4px" } });
    ASSERT_TRUE(styles.padding.has_value());
    EXPECT_EQ(styles.padding->top, "10px");
    EXPECT_EQ(styles.padding->right, "20px");
    EXPECT_EQ(styles.padding->bottom, "10px");
    EXPECT_EQ(styles.padding->left, "4px");
    EXPECT_FALSE(styles.margin.has_value());
}

TEST(ElementAnalyzerTest, DropsZeroWidthAndNoneBorders) {
    EXPECT_FALSE(extract_styles({ { "border", "0px solid #000" } }).border.has_value());
    EXPECT_FALSE(extract_styles({ { "border", "1px none #000" } }).border.has_value());
    auto styles = extract_styles({ { "border", "2px solid rgb(255, 0, 0)" } });
    ASSERT_TRUE(styles.border.has_value());
    EXPECT_EQ(styles.border->width, "2px");
    EXPECT_EQ(styles.border->style, "solid");
    EXPECT_EQ(styles.border->color, "#ff0000");
}

TEST(ElementAnalyzerTest, NormalizesColorsAndWeights) {
    auto styles = extract_styles({
        { "color", "rgb(17, 34, 51)" },
        { "background-color", "transparent" },
        { "font-weight", "bold" },
        { "opacity", "1" },
        { "overflow", "visible" },
    });
    EXPECT_EQ(styles.color, "#112233");
    EXPECT_EQ(styles.background_color, "");
    EXPECT_EQ(styles.font_weight, "700");
    EXPECT_EQ(styles.opacity, "");
    EXPECT_EQ(styles.overflow, "");
}

TEST(ElementAnalyzerTest, InlineStyleFillsMissingComputedValues) {
    auto root = make_element("div", { { "style", "color: #abcdef; font-size: 18px" } });
    root.computed_style["font-size"] = "20px";
    auto analyzed = analyze_tree(&root);
    EXPECT_EQ(analyzed.styles.color, "#abcdef");
    EXPECT_EQ(analyzed.styles.font_size, "20px");
}

TEST(ElementAnalyzerTest, TakesFirstBackgroundUrl) {
    auto styles = extract_styles({ { "background-image", "url('/a.png'), url(/b.png)" } });
    EXPECT_EQ(styles.background_image, "/a.png");
}

// ---------------------------------------------------------------------------
// Odd author CSS never throws
// ---------------------------------------------------------------------------
TEST(ElementAnalyzerTest, NumbersParseWholeStringsOnly) {
    EXPECT_DOUBLE_EQ(*parse_number(".5"), 0.5);
    EXPECT_DOUBLE_EQ(*parse_number("-12.25"), -12.25);
    EXPECT_FALSE(parse_number(".").has_value());
    EXPECT_FALSE(parse_number("1.2.3").has_value());
    EXPECT_FALSE(parse_number("").has_value());
    EXPECT_EQ(parse_integer("600"), 600);
    EXPECT_FALSE(parse_integer("600abc").has_value());
    EXPECT_FALSE(parse_integer("99999999999").has_value());
}

TEST(ElementAnalyzerTest, UnreadableAlphaLeavesColorUnnormalized) {
    page_model::ExtractedStyles styles;
    EXPECT_NO_THROW(styles = extract_styles({ { "color", "rgba(0,0,0,.)" }, { "background-color", "rgba(0, 0, 0, 0)" } }));
    EXPECT_EQ(styles.color, "rgba(0,0,0,.)");
    EXPECT_EQ(styles.background_color, "");
}

TEST(ElementAnalyzerTest, OutOfRangeLengthsReadAsZero) {
    const std::string huge = "1" + std::string(400, '0') + "px";
    EXPECT_DOUBLE_EQ(parse_pixels(huge), 0.0);
    EXPECT_FALSE(font_size_to_px(huge).has_value());
}

TEST(ElementAnalyzerTest, MalformedInlineStyleStillAnalyzes) {
    auto root = make_element("body", {}, {
        make_element("p", { { "style", "color: rgba(0,0,0,.); font-weight: 9999999999" } }, { make_text("Odd") }),
    });
    page_model::AnalyzedElement analyzed;
    EXPECT_NO_THROW(analyzed = analyze_tree(&root));
    ASSERT_EQ(analyzed.children.size(), 1u);
    EXPECT_FALSE(looks_like_heading(analyzed.children[0].styles));
}
