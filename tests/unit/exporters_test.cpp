#include <page_export/converter.hpp>
#include <page_export/markup.hpp>
#include <page_loaders/debug_page.hpp>
#include <page_model/dom.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>

using namespace page_export;
using page_model::TargetBuilder;
using page_model::make_element;
using page_model::make_text;

namespace {

page_model::DomDocument two_columns() {
    page_model::DomDocument doc;
    doc.title = "Columns";
    doc.root = make_element("body", {}, {
        make_element("div", { { "class", "col-6" } }, { make_element("h2", {}, { make_text("Left") }) }),
        make_element("div", { { "class", "col-6" } }, { make_element("p", {}, { make_text("Right") }) }),
    });
    return doc;
}

page_model::DomDocument euro_pricing() {
    page_model::DomDocument doc;
    doc.title = "Plans";
    doc.root = make_element("body", {}, {
        make_element("div", { { "class", "pricing" } }, {
            make_element("h3", {}, { make_text("Pro") }),
            make_element("p", {}, { make_text("€29 / month") }),
        }),
    });
    return doc;
}

ConversionResult run(const page_model::DomDocument& doc, TargetBuilder target) {
    page_model::ConversionOptions options;
    options.target = target;
    return convert_page(doc, options);
}

} // namespace

// ---------------------------------------------------------------------------
// Prices
// ---------------------------------------------------------------------------
TEST(PriceTest, FindsMultiByteCurrencies) {
    auto euro = find_price("Pro €29 / month");
    ASSERT_TRUE(euro.has_value());
    EXPECT_EQ(euro->currency, "€");
    EXPECT_EQ(euro->amount, "29");

    auto dollar = find_price("$ 9.99 billed yearly");
    ASSERT_TRUE(dollar.has_value());
    EXPECT_EQ(dollar->currency, "$");
    EXPECT_EQ(dollar->amount, "9.99");

    auto yen = find_price("¥1,200");
    ASSERT_TRUE(yen.has_value());
    EXPECT_EQ(yen->currency, "¥");
    EXPECT_EQ(yen->amount, "1,200");

    EXPECT_FALSE(find_price("Contact sales").has_value());
    EXPECT_FALSE(find_price("€").has_value());
}

TEST(PriceTest, EuroPricingExportsForEveryTarget) {
    const auto doc = euro_pricing();
    for (auto target : page_model::all_target_builders) {
        SCOPED_TRACE(page_model::to_string(target));
        std::string text;
        ASSERT_NO_THROW(text = export_text(run(doc, target).export_data));
        EXPECT_NE(text.find("€"), std::string::npos);
    }

    const std::string divi = export_text(run(doc, TargetBuilder::Divi).export_data);
    EXPECT_NE(divi.find("currency=\"€\""), std::string::npos);
    EXPECT_NE(divi.find("sum=\"29\""), std::string::npos);
}

// ---------------------------------------------------------------------------
// Gutenberg
// ---------------------------------------------------------------------------
TEST(GutenbergTest, BlockMarkersSurviveSerialization) {
    auto result = run(page_loaders::generate_debug_page(), TargetBuilder::Gutenberg);
    const auto& doc = std::get<GutenbergDocument>(result.export_data);

    auto expected = block_markers(doc);
    auto parsed = parse_block_markers(serialize_blocks(doc));
    ASSERT_EQ(parsed.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(parsed[i].name, expected[i].name) << i;
        EXPECT_EQ(parsed[i].attrs, expected[i].attrs) << expected[i].name;
    }
}

TEST(GutenbergTest, EmptyBlockIsSelfClosing) {
    GutenbergDocument doc;
    GutenbergBlock separator;
    separator.name = "core/spacer";
    separator.attrs = { { "height", "40px" } };
    doc.blocks.push_back(separator);
    EXPECT_EQ(serialize_blocks(doc), "<!-- wp:spacer {\"height\":\"40px\"} /-->\n");
}

TEST(GutenbergTest, DoubleHyphensAreEscapedInAttrs) {
    GutenbergDocument doc;
    GutenbergBlock block;
    block.name = "core/paragraph";
    block.attrs = { { "className", "a--b" } };
    block.inner_html = "<p>x</p>";
    doc.blocks.push_back(block);

    const std::string text = serialize_blocks(doc);
    EXPECT_EQ(text.find("a--b"), std::string::npos);
    auto parsed = parse_block_markers(text);
    ASSERT_EQ(parsed.size(), 1u);
    EXPECT_EQ(parsed[0].attrs.at("className"), "a--b");
}

TEST(GutenbergTest, ParserAddsCoreNamespace) {
    auto parsed = parse_block_markers("<!-- wp:paragraph -->\n<p>x</p>\n<!-- /wp:paragraph -->\n"
                                      "<!-- wp:acme/card {\"n\":1} /-->");
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed[0].name, "core/paragraph");
    EXPECT_EQ(parsed[1].name, "acme/card");
    EXPECT_EQ(parsed[1].attrs.at("n"), 1);
}

TEST(GutenbergTest, ColumnsCarryPercentWidths) {
    auto result = run(two_columns(), TargetBuilder::Gutenberg);
    const auto& doc = std::get<GutenbergDocument>(result.export_data);
    ASSERT_EQ(doc.blocks.size(), 1u);
    const auto& columns = doc.blocks[0];
    EXPECT_EQ(columns.name, "core/columns");
    ASSERT_EQ(columns.inner_blocks.size(), 2u);
    EXPECT_EQ(columns.inner_blocks[0].name, "core/column");
    EXPECT_EQ(columns.inner_blocks[0].attrs.at("width"), "50%");
}

// ---------------------------------------------------------------------------
// Divi
// ---------------------------------------------------------------------------
TEST(DiviTest, FractionsSnapToNearest) {
    EXPECT_EQ(divi_fraction(100), "4_4");
    EXPECT_EQ(divi_fraction(50), "1_2");
    EXPECT_EQ(divi_fraction(33.33), "1_3");
    EXPECT_EQ(divi_fraction(66.67), "2_3");
    EXPECT_EQ(divi_fraction(24), "1_4");
    EXPECT_EQ(divi_fraction(83.3), "5_6");
}

TEST(DiviTest, EscapesAttributeQuotesAndBrackets) {
    EXPECT_EQ(escape_shortcode_attr("say \"hi\" [x]"), "say %22hi%22 %91x%93");
}

TEST(DiviTest, TwoColumnsGiveHalfStructure) {
    auto result = run(two_columns(), TargetBuilder::Divi);
    const auto& layout = std::get<DiviLayout>(result.export_data);
    ASSERT_EQ(layout.sections.size(), 1u);
    ASSERT_FALSE(layout.sections[0].children.empty());
    const auto& row = layout.sections[0].children[0];
    EXPECT_EQ(row.tag, "et_pb_row");
    ASSERT_NE(row.attr("column_structure"), nullptr);
    EXPECT_EQ(*row.attr("column_structure"), "1_2,1_2");
    ASSERT_EQ(row.children.size(), 2u);
    EXPECT_EQ(*row.children[1].attr("type"), "1_2");

    auto tags = shortcode_tags(serialize_shortcodes(layout));
    ASSERT_FALSE(tags.empty());
    EXPECT_EQ(tags[0], "et_pb_section");
    EXPECT_TRUE(check_structure(layout).empty());
}

// ---------------------------------------------------------------------------
// Beaver Builder
// ---------------------------------------------------------------------------
TEST(BeaverTest, NodeTableAndOrderDescribeTwoColumns) {
    auto result = run(two_columns(), TargetBuilder::BeaverBuilder);
    const auto& layout = std::get<BeaverLayout>(result.export_data);

    const auto& rows = layout.children_of(beaver_root_id);
    ASSERT_EQ(rows.size(), 1u);
    const BeaverNode* row = layout.find(rows[0]);
    ASSERT_NE(row, nullptr);
    EXPECT_EQ(row->type, "row");
    EXPECT_EQ(row->node.size(), 13u);

    const auto& groups = layout.children_of(row->node);
    ASSERT_EQ(groups.size(), 1u);
    const auto& columns = layout.children_of(groups[0]);
    ASSERT_EQ(columns.size(), 2u);
    for (const auto& id : columns) {
        const BeaverNode* column = layout.find(id);
        ASSERT_NE(column, nullptr);
        EXPECT_EQ(column->type, "column");
        EXPECT_DOUBLE_EQ(column->settings.at("size").get<double>(), 50.0);
    }
    EXPECT_TRUE(check_structure(layout).empty());

    auto j = to_json(layout);
    EXPECT_TRUE(j.at("nodes").at(row->node).at("parent").is_null());
    EXPECT_EQ(j.at("nodeOrder").at(row->node).size(), 1u);
}

// ---------------------------------------------------------------------------
// Bricks
// ---------------------------------------------------------------------------
TEST(BricksTest, IdsAreSixBase36Digits) {
    EXPECT_EQ(bricks_id(1), "000001");
    EXPECT_EQ(bricks_id(36), "000010");
    EXPECT_EQ(bricks_id(35), "00000z");
}

TEST(BricksTest, ElementsLinkParentsAndChildren) {
    auto result = run(page_loaders::generate_debug_page(), TargetBuilder::Bricks);
    const auto& doc = std::get<BricksDocument>(result.export_data);
    ASSERT_FALSE(doc.elements.empty());

    std::set<std::string> ids;
    for (const auto& element : doc.elements) {
        EXPECT_TRUE(ids.insert(element.id).second) << element.id;
        if (element.parent == bricks_root_parent) {
            EXPECT_EQ(element.name, "section");
            continue;
        }
        const BricksElement* parent = doc.find(element.parent);
        ASSERT_NE(parent, nullptr) << element.id;
        EXPECT_NE(std::find(parent->children.begin(), parent->children.end(), element.id), parent->children.end());
    }
}

// ---------------------------------------------------------------------------
// Oxygen
// ---------------------------------------------------------------------------
TEST(OxygenTest, ComponentsNestUnderRootWithIncreasingIds) {
    auto result = run(two_columns(), TargetBuilder::Oxygen);
    const auto& doc = std::get<OxygenDocument>(result.export_data);
    EXPECT_EQ(doc.root.id, 0);
    EXPECT_EQ(doc.root.name, "root");
    ASSERT_EQ(doc.root.children.size(), 1u);
    const auto& section = doc.root.children[0];
    EXPECT_EQ(section.name, "ct_section");
    EXPECT_GE(section.id, 1);
    EXPECT_EQ(section.options.at("ct_parent"), 0);
    EXPECT_TRUE(check_structure(doc).empty());
}
