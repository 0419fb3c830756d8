#include <page_analysis/element_analyzer.hpp>
#include <page_analysis/recognizer.hpp>
#include <page_model/dom.hpp>

#include <gtest/gtest.h>

#include <algorithm>

using namespace page_analysis;
using page_model::ComponentType;
using page_model::make_element;
using page_model::make_text;

namespace {

page_model::RecognitionResult recognize_node(const page_model::DomNode& node, int min_confidence = 60) {
    auto analyzed = analyze_tree(&node);
    return recognize(analyzed, analyzed.context, min_confidence);
}

} // namespace

// ---------------------------------------------------------------------------
// Unmatched elements
// ---------------------------------------------------------------------------
TEST(RecognizerTest, MarqueeIsUnknownWithZeroConfidence) {
    auto result = recognize_node(make_element("marquee", {}, { make_text("Sale!") }));
    EXPECT_EQ(result.component_type, ComponentType::Unknown);
    EXPECT_EQ(result.confidence, 0);
    EXPECT_TRUE(result.manual_review_needed);
    EXPECT_TRUE(result.matched_patterns.empty());
}

// ---------------------------------------------------------------------------
// Winning pattern
// ---------------------------------------------------------------------------
TEST(RecognizerTest, HeadingTagWins) {
    auto result = recognize_node(make_element("h2", {}, { make_text("About us") }));
    EXPECT_EQ(result.component_type, ComponentType::Heading);
    EXPECT_EQ(result.confidence, 95);
    EXPECT_FALSE(result.manual_review_needed);
    EXPECT_FALSE(result.fallback_type.has_value());
    ASSERT_FALSE(result.matched_patterns.empty());
    EXPECT_EQ(result.matched_patterns.front(), "heading.tag");
}

TEST(RecognizerTest, ButtonClassOnLinkBeatsPlainLink) {
    auto result = recognize_node(make_element("a", { { "class", "btn btn-primary" }, { "href", "/go" } },
        { make_text("Go") }));
    EXPECT_EQ(result.component_type, ComponentType::Button);
}

TEST(RecognizerTest, ConfidenceIsNotAccumulated) {
    // Several patterns match a table; only the winner's confidence is reported.
    auto result = recognize_node(make_element("table", {}, {
        make_element("tr", {}, { make_element("td", {}, { make_text("1") }) }),
    }));
    EXPECT_EQ(result.component_type, ComponentType::Table);
    EXPECT_EQ(result.confidence, 95);
}

TEST(RecognizerTest, BelowMinimumConfidenceSetsUnknownFallback) {
    auto result = recognize_node(make_element("p", {}, { make_text("Body") }), 95);
    EXPECT_EQ(result.component_type, ComponentType::Paragraph);
    EXPECT_EQ(result.confidence, 90);
    ASSERT_TRUE(result.fallback_type.has_value());
    EXPECT_EQ(*result.fallback_type, ComponentType::Unknown);
}

// ---------------------------------------------------------------------------
// Pattern table
// ---------------------------------------------------------------------------
TEST(RecognizerTest, PatternTableIsOrderedByPriority) {
    const auto& table = pattern_table();
    ASSERT_FALSE(table.empty());
    for (size_t i = 1; i < table.size(); ++i)
        EXPECT_GE(table[i - 1].priority, table[i].priority) << table[i].id;
}

TEST(RecognizerTest, PatternConfidencesStayInRange) {
    for (const auto& p : pattern_table()) {
        EXPECT_GE(p.confidence, 0) << p.id;
        EXPECT_LE(p.confidence, 100) << p.id;
        EXPECT_NE(p.type, ComponentType::Unknown) << p.id;
    }
}

// ---------------------------------------------------------------------------
// Whole documents
// ---------------------------------------------------------------------------
TEST(RecognizerTest, OneResultPerElementInPreOrder) {
    page_model::DomDocument doc;
    doc.root = make_element("body", {}, {
        make_element("h1", {}, { make_text("Title") }),
        make_element("p", {}, { make_text("Body") }),
        make_element("marquee", {}, { make_text("Old") }),
    });
    auto analyzed = analyze_document(doc);
    auto components = recognize_document(analyzed, 60);

    ASSERT_EQ(components.size(), analyzed.element_count);
    EXPECT_EQ(components[1].element_id, "el-1");
    EXPECT_EQ(components[1].component_type, ComponentType::Heading);
    EXPECT_EQ(components[2].component_type, ComponentType::Paragraph);
    EXPECT_EQ(components[3].component_type, ComponentType::Unknown);
    EXPECT_EQ(components[3].tag_name, "marquee");
}

TEST(RecognizerTest, RepeatedRunsAgree) {
    page_model::DomDocument doc;
    doc.root = make_element("body", {}, {
        make_element("section", {}, {
            make_element("h2", {}, { make_text("Plans") }),
            make_element("ul", {}, { make_element("li", {}, { make_text("One") }) }),
        }),
    });
    auto analyzed = analyze_document(doc);
    auto first = recognize_document(analyzed, 60);
    auto second = recognize_document(analyzed, 60);
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].component_type, second[i].component_type);
        EXPECT_EQ(first[i].recognition.confidence, second[i].recognition.confidence);
        EXPECT_EQ(first[i].recognition.matched_patterns, second[i].recognition.matched_patterns);
    }
}
