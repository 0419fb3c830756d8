#include <page_loaders/json_loader.hpp>

#include <gtest/gtest.h>

#include <sstream>

using namespace page_loaders;

// ---------------------------------------------------------------------------
// Documents
// ---------------------------------------------------------------------------
TEST(JsonLoaderTest, LoadsWrappedDocument) {
    std::istringstream in(R"({
        "title": "Landing",
        "root": {
            "tag": "BODY",
            "attributes": { "ID": "top", "hidden": true, "tabindex": 2 },
            "styles": { "font-size": "16px", "opacity": 0.5 },
            "rect": { "x": 0, "y": 10, "width": 1200, "height": 800 },
            "children": [ "Hello", { "tag": "p", "text": "Body" } ]
        }
    })");
    auto doc = load_document_from_json(in);
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->title, "Landing");
    EXPECT_EQ(doc->root.tag_name, "body");
    EXPECT_EQ(doc->root.attributes.at("id"), "top");
    EXPECT_EQ(doc->root.attributes.at("hidden"), "");
    EXPECT_EQ(doc->root.attributes.at("tabindex"), "2");
    EXPECT_EQ(doc->root.computed_style.at("opacity"), "0.5");
    EXPECT_DOUBLE_EQ(doc->root.rect.width, 1200);
    ASSERT_EQ(doc->root.children.size(), 2u);
    EXPECT_TRUE(doc->root.children[0].is_text());
    EXPECT_EQ(doc->root.children[0].text, "Hello");
    EXPECT_EQ(doc->root.children[1].tag_name, "p");
}

TEST(JsonLoaderTest, BareNodeGetsDefaultTitle) {
    std::istringstream in(R"({ "tag": "div", "responsive": { "mobile": { "display": "none" } } })");
    auto doc = load_document_from_json(in);
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->title, "Converted Page");
    EXPECT_EQ(doc->root.responsive_styles.at("mobile").at("display"), "none");
}

TEST(JsonLoaderTest, RejectsMalformedInput) {
    std::istringstream broken("{ \"tag\": ");
    EXPECT_FALSE(load_document_from_json(broken).has_value());

    std::istringstream bad_children(R"({ "tag": "div", "children": { "tag": "p" } })");
    EXPECT_FALSE(load_document_from_json(bad_children).has_value());

    std::istringstream text_root(R"("just text")");
    EXPECT_FALSE(load_document_from_json(text_root).has_value());

    std::istringstream no_tag(R"({ "root": { "attributes": {} } })");
    EXPECT_FALSE(load_document_from_json(no_tag).has_value());
}

TEST(JsonLoaderTest, MissingFileGivesNothing) {
    EXPECT_FALSE(load_document_from_json_file("/nonexistent/page.json").has_value());
}

// ---------------------------------------------------------------------------
// Config
// ---------------------------------------------------------------------------
TEST(JsonLoaderTest, EmptyConfigKeepsDefaults) {
    std::istringstream in("{}");
    auto cfg = load_config_from_json(in);
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->conversion.target, page_model::TargetBuilder::Elementor);
    EXPECT_EQ(cfg->conversion.min_confidence, 60);
    EXPECT_TRUE(cfg->conversion.fallback_to_html);
    EXPECT_FALSE(cfg->validation.enabled);
    EXPECT_EQ(cfg->validation.timeout_ms, 5000);
    EXPECT_EQ(cfg->logging.level, "info");
}

TEST(JsonLoaderTest, ConfigOverridesAndClamps) {
    std::istringstream in(R"({
        "conversion": { "target": "beaver-builder", "min_confidence": 140, "fallback_to_html": false },
        "validation": { "enabled": true, "workers": 0, "viewports": ["mobile", 3, "desktop"],
                        "pixel_threshold": 2.0 },
        "logging": { "file": "convert.log", "level": "debug" }
    })");
    auto cfg = load_config_from_json(in);
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->conversion.target, page_model::TargetBuilder::BeaverBuilder);
    EXPECT_EQ(cfg->conversion.min_confidence, 100);
    EXPECT_FALSE(cfg->conversion.fallback_to_html);
    EXPECT_TRUE(cfg->validation.enabled);
    EXPECT_EQ(cfg->validation.workers, 1);
    EXPECT_EQ(cfg->validation.viewports, (std::vector<std::string>{ "mobile", "desktop" }));
    EXPECT_DOUBLE_EQ(cfg->validation.pixel_threshold, 1.0);
    EXPECT_EQ(cfg->logging.file, "convert.log");
    EXPECT_EQ(cfg->logging.level, "debug");
}

TEST(JsonLoaderTest, UnknownTargetKeepsDefault) {
    std::istringstream in(R"({ "conversion": { "target": "wix" } })");
    auto cfg = load_config_from_json(in);
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->conversion.target, page_model::TargetBuilder::Elementor);
}

TEST(JsonLoaderTest, NonObjectConfigIsRejected) {
    std::istringstream in("[1, 2]");
    EXPECT_FALSE(load_config_from_json(in).has_value());
}
