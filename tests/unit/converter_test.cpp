#include <page_export/converter.hpp>
#include <page_loaders/debug_page.hpp>
#include <page_model/dom.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>

using namespace page_export;
using page_model::FallbackKind;
using page_model::TargetBuilder;
using page_model::make_element;
using page_model::make_text;

namespace {

page_model::DomDocument heading_and_paragraph() {
    page_model::DomDocument doc;
    doc.title = "Hello";
    doc.root = make_element("body", {}, {
        make_element("div", {}, {
            make_element("h1", { { "style", "font-size:32px" } }, { make_text("Title") }),
            make_element("p", {}, { make_text("Body") }),
        }),
    });
    return doc;
}

page_model::DomDocument bare_marquee() {
    page_model::DomDocument doc;
    doc.title = "Marquee";
    doc.root = make_element("body", {}, { make_element("marquee", {}, { make_text("Scrolling") }) });
    return doc;
}

page_model::ConversionOptions options_for(TargetBuilder target) {
    page_model::ConversionOptions options;
    options.target = target;
    return options;
}

int html_fallbacks(const ConversionResult& result) {
    int n = 0;
    for (const auto& f : result.fallbacks)
        if (f.kind == FallbackKind::HtmlWidget) ++n;
    return n;
}

// Depth-first search over exported Elementor elements.
const nlohmann::json* find_element(const nlohmann::json& elements,
    const std::function<bool(const nlohmann::json&)>& match)
{
    for (const auto& el : elements) {
        if (match(el)) return &el;
        if (auto* found = find_element(el["elements"], match)) return found;
    }
    return nullptr;
}

const nlohmann::json* find_widget(const nlohmann::json& doc, const std::string& widget_type) {
    return find_element(doc["content"], [&](const nlohmann::json& el) {
        return el.value("widgetType", "") == widget_type;
    });
}

page_model::DomDocument responsive_columns() {
    auto left = make_element("div", { { "class", "col-6" } }, {
        make_element("h2", { { "style", "font-size:40px" } }, { make_text("Left") }),
    });
    left.responsive_styles["tablet"] = { { "width", "100%" }, { "padding", "12px" } };
    left.responsive_styles["mobile"] = { { "width", "100%" } };
    left.children[0].responsive_styles["tablet"] = { { "font-size", "32px" } };
    left.children[0].responsive_styles["mobile"] = { { "font-size", "24px" } };

    page_model::DomDocument doc;
    doc.title = "Responsive";
    doc.root = make_element("body", {}, {
        std::move(left),
        make_element("div", { { "class", "col-6" } }, { make_element("p", {}, { make_text("Right") }) }),
    });
    return doc;
}

} // namespace

// ---------------------------------------------------------------------------
// Heading and paragraph in a plain div
// ---------------------------------------------------------------------------
TEST(ConverterTest, HeadingAndParagraphBecomeCoreBlocks) {
    auto result = convert_page(heading_and_paragraph(), options_for(TargetBuilder::Gutenberg));

    const auto& doc = std::get<GutenbergDocument>(result.export_data);
    ASSERT_EQ(doc.blocks.size(), 2u);
    EXPECT_EQ(doc.blocks[0].name, "core/heading");
    EXPECT_EQ(doc.blocks[0].attrs.at("level"), 1);
    EXPECT_EQ(doc.blocks[1].name, "core/paragraph");
    EXPECT_TRUE(result.fallbacks.empty());
    EXPECT_FALSE(result.manual_review_needed);
    EXPECT_EQ(result.stats.html_fallbacks, 0);
    EXPECT_EQ(result.stats.native_widgets, 2);
    EXPECT_TRUE(result.validation.errors.empty());
}

TEST(ConverterTest, HeadingAndParagraphForElementor) {
    auto result = convert_page(heading_and_paragraph(), options_for(TargetBuilder::Elementor));
    const auto& doc = std::get<ElementorDocument>(result.export_data);
    EXPECT_EQ(doc.version, "3.16.0");
    ASSERT_FALSE(doc.content.empty());
    EXPECT_EQ(doc.content[0].el_type, "section");
    EXPECT_EQ(html_fallbacks(result), 0);
    EXPECT_TRUE(check_structure(result.export_data).empty());
}

// ---------------------------------------------------------------------------
// Unknown elements fall back to the target's HTML element
// ---------------------------------------------------------------------------
TEST(ConverterTest, MarqueeBecomesHtmlForEveryTarget) {
    const std::map<TargetBuilder, std::string> html_names = {
        { TargetBuilder::Elementor, "\"widgetType\": \"html\"" },
        { TargetBuilder::Gutenberg, "<!-- wp:html -->" },
        { TargetBuilder::BeaverBuilder, "\"type\": \"html\"" },
        { TargetBuilder::Divi, "[et_pb_code" },
        { TargetBuilder::Bricks, "\"name\": \"code\"" },
        { TargetBuilder::Oxygen, "\"name\": \"ct_code_block\"" },
    };
    for (auto target : page_model::all_target_builders) {
        auto result = convert_page(bare_marquee(), options_for(target));
        EXPECT_EQ(html_fallbacks(result), 1) << page_model::to_string(target);
        EXPECT_EQ(result.stats.html_fallbacks, 1) << page_model::to_string(target);
        ASSERT_EQ(result.components.size(), 2u);
        EXPECT_EQ(result.components[1].component_type, page_model::ComponentType::Unknown);
        EXPECT_EQ(result.components[1].recognition.confidence, 0);

        const std::string text = export_text(result.export_data);
        EXPECT_NE(text.find(html_names.at(target)), std::string::npos) << page_model::to_string(target) << "\n" << text;
        EXPECT_NE(text.find("marquee"), std::string::npos) << page_model::to_string(target);
    }
}

TEST(ConverterTest, NullRootFailsFast) {
    page_model::DomDocument doc;
    EXPECT_THROW(convert_page(doc, options_for(TargetBuilder::Gutenberg)), std::invalid_argument);
}

// ---------------------------------------------------------------------------
// Debug page across every target
// ---------------------------------------------------------------------------
TEST(ConverterTest, DebugPageExportsAreStructurallyValid) {
    const auto page = page_loaders::generate_debug_page();
    for (auto target : page_model::all_target_builders) {
        auto result = convert_page(page, options_for(target));
        auto problems = check_structure(result.export_data);
        EXPECT_TRUE(problems.empty()) << page_model::to_string(target) << ": " << (problems.empty() ? "" : problems[0]);
        EXPECT_TRUE(result.validation.errors.empty()) << page_model::to_string(target);
        EXPECT_EQ(result.stats.total_elements, static_cast<int>(result.components.size()));
    }
}

TEST(ConverterTest, EveryElementIsTracedExactlyOnce) {
    const auto page = page_loaders::generate_debug_page();
    for (auto target : page_model::all_target_builders) {
        auto result = convert_page(page, options_for(target));
        std::map<std::string, int> seen;
        for (const auto& trace : result.traces) ++seen[trace.element_id];
        EXPECT_EQ(seen.size(), result.components.size()) << page_model::to_string(target);
        for (const auto& [id, count] : seen)
            EXPECT_EQ(count, 1) << page_model::to_string(target) << " " << id;
    }
}

TEST(ConverterTest, RepeatedConversionsAreByteIdentical) {
    const auto page = page_loaders::generate_debug_page();
    for (auto target : page_model::all_target_builders) {
        auto first = convert_page(page, options_for(target));
        auto second = convert_page(page, options_for(target));
        EXPECT_EQ(export_text(first.export_data), export_text(second.export_data)) << page_model::to_string(target);
        EXPECT_EQ(first.fallbacks.size(), second.fallbacks.size());
    }
}

// ---------------------------------------------------------------------------
// Confidence threshold
// ---------------------------------------------------------------------------
TEST(ConverterTest, RaisingMinConfidenceNeverReducesHtmlFallbacks) {
    const auto page = page_loaders::generate_debug_page();
    int previous = -1;
    for (int min_confidence : { 0, 60, 75, 85, 90, 95, 100 }) {
        auto options = options_for(TargetBuilder::Elementor);
        options.min_confidence = min_confidence;
        int count = html_fallbacks(convert_page(page, options));
        EXPECT_GE(count, previous) << "min_confidence " << min_confidence;
        previous = count;
    }
}

TEST(ConverterTest, WithoutHtmlFallbackLowConfidenceGoesToManualReview) {
    auto options = options_for(TargetBuilder::Gutenberg);
    options.min_confidence = 100;
    options.fallback_to_html = false;
    auto result = convert_page(heading_and_paragraph(), options);

    EXPECT_EQ(html_fallbacks(result), 0);
    EXPECT_TRUE(result.manual_review_needed);
    const auto& doc = std::get<GutenbergDocument>(result.export_data);
    ASSERT_EQ(doc.blocks.size(), 2u);
    EXPECT_EQ(doc.blocks[0].name, "core/heading");
}

TEST(ConverterTest, ResultJsonCarriesStatsAndTarget) {
    auto result = convert_page(heading_and_paragraph(), options_for(TargetBuilder::Divi));
    auto j = to_json(result);
    EXPECT_EQ(j.at("targetBuilder"), "divi");
    EXPECT_TRUE(j.contains("exportData"));
    EXPECT_TRUE(j.contains("stats"));
    EXPECT_TRUE(j.contains("validation"));
}

// ---------------------------------------------------------------------------
// Elementor settings
// ---------------------------------------------------------------------------
TEST(ElementorSettingsTest, ResponsiveKeysOnlyWhenRequested) {
    auto options = options_for(TargetBuilder::Elementor);
    options.include_responsive = true;
    auto doc = to_json(std::get<ElementorDocument>(convert_page(responsive_columns(), options).export_data));

    auto* column = find_element(doc["content"], [](const nlohmann::json& el) {
        return el["elType"] == "column" && el["settings"].contains("_inline_size_tablet");
    });
    ASSERT_NE(column, nullptr);
    EXPECT_DOUBLE_EQ(column->at("settings").at("_inline_size_tablet").get<double>(), 100.0);
    EXPECT_DOUBLE_EQ(column->at("settings").at("_inline_size_mobile").get<double>(), 100.0);
    EXPECT_TRUE(column->at("settings").contains("padding_tablet"));

    auto* heading = find_widget(doc, "heading");
    ASSERT_NE(heading, nullptr);
    const auto& settings = heading->at("settings");
    EXPECT_DOUBLE_EQ(settings.at("typography_font_size").at("size").get<double>(), 40.0);
    EXPECT_DOUBLE_EQ(settings.at("typography_font_size_tablet").at("size").get<double>(), 32.0);
    EXPECT_DOUBLE_EQ(settings.at("typography_font_size_mobile").at("size").get<double>(), 24.0);

    auto flat = to_json(std::get<ElementorDocument>(
        convert_page(responsive_columns(), options_for(TargetBuilder::Elementor)).export_data));
    const std::string text = flat.dump();
    EXPECT_EQ(text.find("_tablet"), std::string::npos);
    EXPECT_EQ(text.find("_mobile"), std::string::npos);
}

TEST(ElementorSettingsTest, GlobalColorsAndFontsAreReferenced) {
    page_model::DomDocument page;
    page.title = "Globals";
    page.root = make_element("body", {}, {
        make_element("div", {}, {
            make_element("h1", { { "style", "color:#ff0000; font-family:Georgia, serif; font-size:40px" } },
                { make_text("Brand") }),
            make_element("p", { { "style", "color:#333333; font-family:Inter; font-size:16px" } }, { make_text("One") }),
            make_element("p", { { "style", "color:#333333; font-family:Inter; font-size:16px" } }, { make_text("Two") }),
        }),
    });
    auto result = convert_page(page, options_for(TargetBuilder::Elementor));
    auto doc = to_json(std::get<ElementorDocument>(result.export_data));

    auto* heading = find_widget(doc, "heading");
    ASSERT_NE(heading, nullptr);
    const auto& heading_globals = heading->at("settings").at("__globals__");
    EXPECT_EQ(heading_globals.value("title_color", std::string()), "globals/colors?id=primary");
    EXPECT_EQ(heading_globals.value("typography_typography", std::string()), "globals/typography?id=secondary");

    auto* paragraph = find_widget(doc, "text-editor");
    ASSERT_NE(paragraph, nullptr);
    const auto& text_globals = paragraph->at("settings").at("__globals__");
    EXPECT_EQ(text_globals.value("text_color", std::string()), "globals/colors?id=text");
    EXPECT_EQ(text_globals.value("typography_typography", std::string()), "globals/typography?id=primary");
}

TEST(ElementorSettingsTest, UnmappedTableBecomesTextEditorForReview) {
    page_model::DomDocument page;
    page.title = "Table";
    page.root = make_element("body", {}, {
        make_element("table", {}, {
            make_element("tr", {}, { make_element("td", {}, { make_text("Cell") }) }),
        }),
    });
    auto result = convert_page(page, options_for(TargetBuilder::Elementor));
    auto doc = to_json(std::get<ElementorDocument>(result.export_data));

    auto* editor = find_element(doc["content"], [](const nlohmann::json& el) {
        return el.value("widgetType", "") == "text-editor"
            && el["settings"].value("editor", std::string()).find("<table") != std::string::npos;
    });
    EXPECT_NE(editor, nullptr);

    auto gap = std::find_if(result.fallbacks.begin(), result.fallbacks.end(), [](const page_model::FallbackStrategy& f) {
        return f.alternative_type == page_model::ComponentType::Table;
    });
    ASSERT_NE(gap, result.fallbacks.end());
    EXPECT_EQ(gap->kind, FallbackKind::ManualReview);
    EXPECT_NE(gap->reason.find("no explicit mapping"), std::string::npos);
    EXPECT_TRUE(result.manual_review_needed);
}
