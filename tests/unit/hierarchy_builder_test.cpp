#include <page_analysis/element_analyzer.hpp>
#include <page_analysis/recognizer.hpp>
#include <page_layout/hierarchy_builder.hpp>
#include <page_loaders/debug_page.hpp>
#include <page_model/dom.hpp>

#include <gtest/gtest.h>

#include <map>
#include <string>

using namespace page_layout;
using page_model::ComponentType;
using page_model::NodeKind;
using page_model::make_element;
using page_model::make_text;

namespace {

page_model::ComponentHierarchy build(const page_model::DomNode& root) {
    page_model::DomDocument doc;
    doc.title = "Test";
    doc.root = root;
    auto analyzed = page_analysis::analyze_document(doc);
    auto components = page_analysis::recognize_document(analyzed, 60);
    return build_hierarchy(analyzed, components);
}

} // namespace

// ---------------------------------------------------------------------------
// Column inference
// ---------------------------------------------------------------------------
TEST(HierarchyBuilderTest, TwoColSixSiblingsFormHalfColumns) {
    auto hierarchy = build(make_element("body", {}, {
        make_element("div", { { "class", "col-6" } }, { make_text("Left") }),
        make_element("div", { { "class", "col-6" } }, { make_text("Right") }),
    }));

    ASSERT_EQ(hierarchy.sections.size(), 1u);
    const auto& section = hierarchy.sections[0];
    EXPECT_TRUE(section.implicit);
    ASSERT_EQ(section.children.size(), 1u);
    const auto& row = section.children[0];
    EXPECT_EQ(row.kind, NodeKind::Row);
    EXPECT_FALSE(row.layout_review_needed);
    ASSERT_EQ(row.children.size(), 2u);
    for (const auto& column : row.children) {
        EXPECT_EQ(column.kind, NodeKind::Column);
        EXPECT_DOUBLE_EQ(column.column_size, 50.0);
    }
}

TEST(HierarchyBuilderTest, OvershootingColumnsFallBackToSingleColumn) {
    auto hierarchy = build(make_element("body", {}, {
        make_element("div", { { "class", "col-8" } }, { make_text("A") }),
        make_element("div", { { "class", "col-8" } }, { make_text("B") }),
    }));

    const auto& row = hierarchy.sections.at(0).children.at(0);
    EXPECT_EQ(row.kind, NodeKind::Row);
    EXPECT_TRUE(row.layout_review_needed);
    ASSERT_EQ(row.children.size(), 1u);
    EXPECT_DOUBLE_EQ(row.children[0].column_size, 100.0);
    EXPECT_EQ(row.children[0].children.size(), 2u);
}

TEST(HierarchyBuilderTest, ResolvesUnknownSizesWithEqualShares) {
    auto sizes = resolve_column_sizes({ 50.0, std::nullopt, std::nullopt });
    ASSERT_TRUE(sizes.has_value());
    EXPECT_DOUBLE_EQ((*sizes)[0], 50.0);
    EXPECT_DOUBLE_EQ((*sizes)[1], 25.0);
    EXPECT_DOUBLE_EQ((*sizes)[2], 25.0);
}

TEST(HierarchyBuilderTest, RejectsSizesAboveTolerance) {
    EXPECT_FALSE(resolve_column_sizes({ 60.0, 45.0 }).has_value());
    EXPECT_TRUE(resolve_column_sizes({ 50.5, 50.0 }).has_value());
}

TEST(HierarchyBuilderTest, ColumnHintsFromWidthAndGrid) {
    auto root = make_element("div", {}, {
        make_element("div", { { "style", "width: 25%" } }, { make_text("Narrow") }),
        make_element("div", {}, { make_text("Plain") }),
    });
    auto parent = page_analysis::analyze_tree(&root);

    auto narrow = column_hint(parent.children[0], parent, false);
    EXPECT_TRUE(narrow.column_like);
    ASSERT_TRUE(narrow.size.has_value());
    EXPECT_DOUBLE_EQ(*narrow.size, 25.0);
    EXPECT_FALSE(column_hint(parent.children[1], parent, false).column_like);
    EXPECT_TRUE(column_hint(parent.children[1], parent, true).column_like);

    auto grid_root = make_element("div", { { "style", "display: grid; grid-template-columns: 1fr 1fr 1fr" } }, {
        make_element("div", {}, { make_text("Cell") }),
    });
    auto grid = page_analysis::analyze_tree(&grid_root);
    auto cell = column_hint(grid.children[0], grid, false);
    EXPECT_TRUE(cell.column_like);
    ASSERT_TRUE(cell.size.has_value());
    EXPECT_DOUBLE_EQ(*cell.size, 33.33);
}

TEST(HierarchyBuilderTest, OversizedGridRepeatDoesNotThrow) {
    auto hint_for = [](const std::string& columns) {
        auto root = make_element("div", { { "style", "display: grid; grid-template-columns: " + columns } }, {
            make_element("div", {}, { make_text("Cell") }),
        });
        auto grid = page_analysis::analyze_tree(&root);
        return column_hint(grid.children[0], grid, false);
    };

    ColumnHint unreadable;
    EXPECT_NO_THROW(unreadable = hint_for("repeat(99999999999, 1fr)"));
    EXPECT_FALSE(unreadable.column_like);

    auto capped = hint_for("repeat(200, 1fr)");
    ASSERT_TRUE(capped.size.has_value());
    EXPECT_DOUBLE_EQ(*capped.size, 4.17);

    auto mixed = hint_for("repeat(99999999999, 1fr) 1fr");
    ASSERT_TRUE(mixed.size.has_value());
    EXPECT_DOUBLE_EQ(*mixed.size, 50.0);

    EXPECT_NO_THROW(build(make_element("body", { { "style", "display: grid; grid-template-columns: repeat(99999999999, 1fr)" } }, {
        make_element("div", {}, { make_text("A") }),
        make_element("div", {}, { make_text("B") }),
    })));
}

// ---------------------------------------------------------------------------
// Sections and coverage
// ---------------------------------------------------------------------------
TEST(HierarchyBuilderTest, SectionTagsStartSections) {
    auto hierarchy = build(make_element("body", {}, {
        make_element("p", {}, { make_text("Intro") }),
        make_element("section", {}, { make_element("h2", {}, { make_text("Inside") }) }),
        make_element("p", {}, { make_text("Outro") }),
    }));
    ASSERT_EQ(hierarchy.sections.size(), 3u);
    EXPECT_TRUE(hierarchy.sections[0].implicit);
    EXPECT_FALSE(hierarchy.sections[1].implicit);
    EXPECT_EQ(hierarchy.sections[1].element_id, "el-2");
    EXPECT_TRUE(hierarchy.sections[2].implicit);
    EXPECT_EQ(hierarchy.root_element_id, "el-0");
}

TEST(HierarchyBuilderTest, HeadingLevelAndListItemsBecomeProps) {
    auto hierarchy = build(make_element("body", {}, {
        make_element("h3", {}, { make_text("Third") }),
        make_element("ol", {}, {
            make_element("li", {}, { make_text("One") }),
            make_element("li", {}, { make_text("Two") }),
        }),
    }));
    const auto& column = hierarchy.sections.at(0).children.at(0).children.at(0);
    ASSERT_EQ(column.children.size(), 2u);
    EXPECT_EQ(column.children[0].component_type, ComponentType::Heading);
    EXPECT_EQ(column.children[0].props.level, 3);
    const auto& list = column.children[1];
    EXPECT_EQ(list.component_type, ComponentType::List);
    EXPECT_TRUE(list.props.ordered);
    ASSERT_EQ(list.props.items.size(), 2u);
    EXPECT_EQ(list.props.items[1].title, "Two");
    // The list absorbs its items.
    EXPECT_EQ(list.covered_element_ids.size(), 3u);
}

TEST(HierarchyBuilderTest, DebugPageCoversEveryElementOnce) {
    page_model::DomDocument doc = page_loaders::generate_debug_page();
    auto analyzed = page_analysis::analyze_document(doc);
    auto components = page_analysis::recognize_document(analyzed, 60);
    auto hierarchy = build_hierarchy(analyzed, components);

    std::map<std::string, int> seen;
    page_model::for_each_node(hierarchy, [&](const page_model::HierarchyNode& node) {
        for (const auto& id : node.covered_element_ids) ++seen[id];
    });
    if (!hierarchy.root_element_id.empty()) ++seen[hierarchy.root_element_id];

    EXPECT_EQ(seen.size(), analyzed.element_count);
    for (const auto& [id, count] : seen)
        EXPECT_EQ(count, 1) << id;
}
