#include <page_analysis/element_analyzer.hpp>
#include <page_analysis/recognizer.hpp>
#include <page_analysis/template_parts.hpp>
#include <page_export/theme_template.hpp>
#include <page_model/dom.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace page_analysis;
using page_model::make_element;
using page_model::make_text;

namespace {

page_model::DomNode site_header(bool with_search = false) {
    auto header = make_element("header",
        { { "id", "masthead" }, { "class", "site-header" }, { "style", "position: sticky" } }, {
            make_element("nav", {}, { make_element("a", { { "href", "/" } }, { make_text("Home") }) }),
            make_element("span", { { "class", "tagline" } }, { make_text("Example") }),
        });
    if (with_search) header.children.push_back(make_element("input", { { "type", "search" } }));
    return header;
}

page_model::DomDocument site_page(const std::string& title, page_model::DomNode header) {
    page_model::DomDocument doc;
    doc.title = title;
    doc.root = make_element("body", {}, {
        std::move(header),
        make_element("main", {}, { make_element("h1", {}, { make_text(title) }) }),
        make_element("footer", { { "class", "site-footer" } }, {
            make_element("p", {}, { make_text("\xC2\xA9 2026 Example. All rights reserved.") }),
        }),
    });
    return doc;
}

// Keeps the analyzed pages alive for the TemplatePage views.
struct Site {
    std::vector<page_model::AnalyzedDocument> documents;
    std::vector<std::vector<page_model::RecognizedComponent>> components;
    std::vector<TemplatePage> pages;

    explicit Site(const std::vector<page_model::DomDocument>& docs) {
        documents.reserve(docs.size());
        components.reserve(docs.size());
        for (const auto& doc : docs) {
            documents.push_back(analyze_document(doc));
            components.push_back(recognize_document(documents.back(), 60));
        }
        for (std::size_t i = 0; i < docs.size(); ++i)
            pages.push_back({ "page-" + std::to_string(i + 1), &documents[i], &components[i] });
    }
};

} // namespace

// ---------------------------------------------------------------------------
// Detection across pages
// ---------------------------------------------------------------------------
TEST(TemplatePartsTest, SharedHeaderAndFooterRecur) {
    Site site({ site_page("Home", site_header()), site_page("About", site_header()), site_page("Blog", site_header()) });
    auto parts = detect_template_parts(site.pages);

    ASSERT_TRUE(parts.header.has_value());
    EXPECT_EQ(parts.header->kind, TemplatePartKind::Header);
    EXPECT_EQ(parts.header->html.rfind("<header", 0), 0u);
    EXPECT_EQ(parts.header->page_ids, (std::vector<std::string>{ "page-1", "page-2", "page-3" }));
    EXPECT_TRUE(parts.header->recurring);
    EXPECT_EQ(parts.header->confidence, 100);
    EXPECT_TRUE(parts.header->position.top);
    EXPECT_TRUE(parts.header->position.sticky);

    ASSERT_TRUE(parts.footer.has_value());
    EXPECT_EQ(parts.footer->html.rfind("<footer", 0), 0u);
    EXPECT_TRUE(parts.footer->recurring);
    EXPECT_TRUE(parts.footer->position.bottom);
    EXPECT_GE(parts.footer->confidence, template_part_min_confidence);

    EXPECT_FALSE(parts.sidebar.has_value());
    EXPECT_TRUE(parts.statistics.has_header);
    EXPECT_TRUE(parts.statistics.has_footer);
    EXPECT_FALSE(parts.statistics.has_sidebar);
    EXPECT_EQ(parts.statistics.header_pages, 3);
    EXPECT_EQ(parts.statistics.consistency, 67);
}

TEST(TemplatePartsTest, MostCommonVariantWins) {
    Site site({ site_page("Home", site_header(true)), site_page("About", site_header()), site_page("Blog", site_header()) });
    auto parts = detect_template_parts(site.pages);

    ASSERT_TRUE(parts.header.has_value());
    EXPECT_EQ(parts.header->page_ids, (std::vector<std::string>{ "page-2", "page-3" }));
    EXPECT_TRUE(parts.header->recurring);
    EXPECT_EQ(parts.statistics.header_pages, 2);
}

TEST(TemplatePartsTest, SignatureCoversTagIdClassesAndChildren) {
    auto page = site_page("Home", site_header());
    auto analyzed = analyze_tree(&page.root);
    EXPECT_EQ(template_part_signature(analyzed.children[0]), "header::masthead::site-header::2");
}

TEST(TemplatePartsTest, AsideIsSidebarOnItsPageOnly) {
    auto with_aside = site_page("Docs", site_header());
    with_aside.root.children.insert(with_aside.root.children.begin() + 1,
        make_element("aside", { { "class", "sidebar" } }, {
            make_element("div", { { "class", "widget" } }, { make_text("Recent posts") }),
        }));
    Site site({ with_aside, site_page("Home", site_header()), site_page("About", site_header()) });
    auto parts = detect_template_parts(site.pages);

    ASSERT_TRUE(parts.sidebar.has_value());
    EXPECT_EQ(parts.sidebar->page_ids, std::vector<std::string>{ "page-1" });
    EXPECT_FALSE(parts.sidebar->recurring);
    EXPECT_EQ(parts.sidebar->confidence, 90);
    EXPECT_TRUE(parts.statistics.has_sidebar);
    EXPECT_EQ(parts.statistics.consistency, 78);
}

TEST(TemplatePartsTest, NoPagesFindNothing) {
    auto parts = detect_template_parts({});
    EXPECT_FALSE(parts.header.has_value());
    EXPECT_EQ(parts.statistics.consistency, 0);
}

// ---------------------------------------------------------------------------
// Theme Builder export
// ---------------------------------------------------------------------------
TEST(TemplatePartsTest, HeaderTemplateAppliesToEntireSite) {
    Site site({ site_page("Home", site_header()) });
    auto parts = detect_template_parts(site.pages);
    ASSERT_TRUE(parts.header.has_value());

    auto tpl = page_export::theme_template_json(*parts.header);
    EXPECT_EQ(tpl["type"], "header");
    EXPECT_EQ(tpl["title"], "Site Header");
    ASSERT_EQ(tpl["conditions"].size(), 1u);
    EXPECT_EQ(tpl["conditions"][0]["sub_name"], "entire_site");
    const auto& section = tpl["content"][0];
    EXPECT_EQ(section["settings"]["layout"], "full_width");
    const auto& widget = section["elements"][0]["elements"][0];
    EXPECT_EQ(widget["widgetType"], "html");
    EXPECT_EQ(widget["settings"]["html"], parts.header->html);

    page_analysis::TemplatePart sidebar;
    sidebar.kind = TemplatePartKind::Sidebar;
    sidebar.name = "Sidebar";
    auto aside = page_export::theme_template_json(sidebar);
    EXPECT_TRUE(aside["conditions"].empty());
    EXPECT_EQ(aside["content"][0]["settings"]["layout"], "boxed");

    auto summary = page_export::to_json(parts);
    EXPECT_TRUE(summary["statistics"]["hasHeader"].get<bool>());
    EXPECT_EQ(summary["header"]["pageIds"].size(), 1u);
}
