#include <page_validation/custom_code_detector.hpp>

#include <gtest/gtest.h>

#include <algorithm>

using namespace page_validation;
using page_model::Impact;
using page_model::WarningSeverity;
using page_model::make_element;
using page_model::make_text;

namespace {

CodeSources script(std::string code) {
    CodeSources sources;
    sources.inline_scripts.push_back(std::move(code));
    return sources;
}

bool has_feature(const page_model::CustomCodeDetection& d, const std::string& name) {
    return std::any_of(d.features.begin(), d.features.end(),
        [&](const page_model::DetectedFeature& f) { return f.feature == name; });
}

} // namespace

TEST(CustomCodeDetectorTest, NoCodeScoresFull) {
    auto d = detect_custom_code(CodeSources{});
    EXPECT_FALSE(d.has_custom_js);
    EXPECT_FALSE(d.has_custom_css);
    EXPECT_TRUE(d.can_be_converted);
    EXPECT_EQ(d.conversion_score, 100);
}

TEST(CustomCodeDetectorTest, JQueryIsSupported) {
    auto d = detect_custom_code(script("$('.menu').toggle();"));
    EXPECT_TRUE(d.has_custom_js);
    EXPECT_TRUE(has_feature(d, "jQuery"));
    EXPECT_TRUE(d.incompatibilities.empty());
    EXPECT_EQ(d.conversion_score, 90);
    EXPECT_TRUE(d.can_be_converted);
}

TEST(CustomCodeDetectorTest, ReactBlocksConversion) {
    auto d = detect_custom_code(script("ReactDOM.render(app, mount);"));
    ASSERT_EQ(d.incompatibilities.size(), 1u);
    EXPECT_EQ(d.incompatibilities[0].name, "React");
    EXPECT_EQ(d.incompatibilities[0].impact, Impact::Blocking);
    EXPECT_EQ(d.conversion_score, 60);
    EXPECT_FALSE(d.can_be_converted);
}

TEST(CustomCodeDetectorTest, FetchIsCritical) {
    auto d = detect_custom_code(script("fetch('/api/items').then(r => r.json());"));
    ASSERT_FALSE(d.warnings.empty());
    EXPECT_EQ(d.warnings[0].severity, WarningSeverity::Critical);
    EXPECT_EQ(d.warnings[0].message, "Asynchronous data fetching detected");
    EXPECT_TRUE(has_feature(d, "AJAX/Fetch"));
    EXPECT_EQ(d.conversion_score, 85);
    EXPECT_TRUE(d.can_be_converted);
}

TEST(CustomCodeDetectorTest, FrameworkFromScriptUrl) {
    CodeSources sources;
    sources.script_urls.push_back("https://cdn.example.com/VUE@3/dist/vue.global.js");
    auto d = detect_custom_code(sources);
    ASSERT_EQ(d.incompatibilities.size(), 1u);
    EXPECT_EQ(d.incompatibilities[0].name, "Vue");
    EXPECT_FALSE(d.can_be_converted);
}

TEST(CustomCodeDetectorTest, WebSocketDegrades) {
    auto d = detect_custom_code(script("const ws = new WebSocket(url);"));
    ASSERT_EQ(d.incompatibilities.size(), 1u);
    EXPECT_EQ(d.incompatibilities[0].impact, Impact::Degraded);
    EXPECT_EQ(d.conversion_score, 75);
    EXPECT_TRUE(d.can_be_converted);
}

TEST(CustomCodeDetectorTest, VendorPrefixesAreAutoFixable) {
    CodeSources sources;
    sources.styles.push_back(".card { -webkit-transition: opacity 1s; display: flex; }");
    auto d = detect_custom_code(sources);
    EXPECT_TRUE(d.has_custom_css);
    EXPECT_TRUE(has_feature(d, "Flexbox"));
    EXPECT_TRUE(has_feature(d, "Transforms & Transitions"));
    ASSERT_EQ(d.warnings.size(), 1u);
    EXPECT_TRUE(d.warnings[0].can_auto_fix);
    EXPECT_EQ(d.conversion_score, 95);
}

TEST(CustomCodeDetectorTest, ScoreIsClamped) {
    page_model::CustomCodeDetection d;
    d.has_custom_js = true;
    for (int i = 0; i < 5; ++i) d.incompatibilities.push_back({ "library", "X", "", Impact::Blocking, "" });
    EXPECT_EQ(conversion_score(d), 0);
}

TEST(CustomCodeDetectorTest, CollectsCodeFromDom) {
    auto root = make_element("body", {}, {
        make_element("script", { { "src", "/js/jquery.min.js" } }),
        make_element("div", {}, { make_element("script", {}, { make_text("console.log(1);") }) }),
        make_element("style", {}, { make_text("p { color: red; }") }),
    });
    auto sources = collect_code(root);
    EXPECT_EQ(sources.script_urls, (std::vector<std::string>{ "/js/jquery.min.js" }));
    EXPECT_EQ(sources.inline_scripts, (std::vector<std::string>{ "console.log(1);" }));
    EXPECT_EQ(sources.styles, (std::vector<std::string>{ "p { color: red; }" }));

    auto d = detect_custom_code(root);
    EXPECT_TRUE(has_feature(d, "jQuery"));
}
