#include <page_validation/asset_verifier.hpp>

#include <gtest/gtest.h>

#include <map>

using namespace page_validation;
using page_model::AssetType;
using page_model::make_element;
using page_model::make_text;

namespace {

class FakeProbe : public AssetProbe {
public:
    std::map<std::string, ProbeResponse> responses;
    std::vector<std::string> probed;

    ProbeResponse probe(const std::string& url) override {
        probed.push_back(url);
        auto it = responses.find(url);
        return it == responses.end() ? ProbeResponse{ 200, "" } : it->second;
    }
};

AssetReference image(std::string url) {
    return { AssetType::Image, std::move(url), { "img.hero" } };
}

} // namespace

// ---------------------------------------------------------------------------
// Collection
// ---------------------------------------------------------------------------
TEST(AssetVerifierTest, CollectsAssetsGroupedByType) {
    auto root = make_element("body", {}, {
        make_element("script", { { "src", "/js/app.js" } }),
        make_element("img", { { "id", "logo" }, { "src", "/img/logo.png" }, { "srcset", "/img/logo.png 1x, /img/logo@2x.png 2x" } }),
        make_element("link", { { "rel", "Stylesheet" }, { "href", "/css/site.css" } }),
        make_element("video", {}, { make_element("source", { { "src", "/media/intro.mp4" } }) }),
        make_element("iframe", { { "src", "https://www.youtube.com/embed/abc" } }),
        make_element("iframe", { { "src", "https://maps.example.com/embed" } }),
        make_element("style", {}, { make_text("@font-face { font-family: X; src: url('/fonts/x.woff2'); }") }),
        make_element("div", { { "class", "hero dark wide" }, { "style", "background: url(/img/bg.jpg) no-repeat" } }),
        make_element("img", { { "class", "thumb" }, { "data-src", "/img/logo.png" } }),
    });

    auto assets = collect_assets(root);
    ASSERT_EQ(assets.size(), 8u);

    EXPECT_EQ(assets[0].type, AssetType::Image);
    EXPECT_EQ(assets[0].url, "/img/logo.png");
    EXPECT_EQ(assets[0].used_in, (std::vector<std::string>{ "#logo", "#logo", "img.thumb" }));
    EXPECT_EQ(assets[1].url, "/img/logo@2x.png");
    EXPECT_EQ(assets[2].url, "/img/bg.jpg");
    EXPECT_EQ(assets[2].used_in, (std::vector<std::string>{ "div.hero.dark" }));

    EXPECT_EQ(assets[3].type, AssetType::Font);
    EXPECT_EQ(assets[3].used_in, (std::vector<std::string>{ "@font-face" }));
    EXPECT_EQ(assets[4].type, AssetType::Video);
    EXPECT_EQ(assets[4].url, "/media/intro.mp4");
    EXPECT_EQ(assets[4].used_in, (std::vector<std::string>{ "video" }));
    EXPECT_EQ(assets[5].url, "https://www.youtube.com/embed/abc");
    EXPECT_EQ(assets[6].type, AssetType::Stylesheet);
    EXPECT_EQ(assets[7].type, AssetType::Script);
}

TEST(AssetVerifierTest, ExternalUrls) {
    EXPECT_TRUE(is_external_url("https://cdn.example.com/a.js"));
    EXPECT_TRUE(is_external_url("HTTP://example.com"));
    EXPECT_FALSE(is_external_url("/local/a.js"));
    EXPECT_FALSE(is_external_url("data:image/png;base64,AAAA"));
    EXPECT_FALSE(is_external_url("//cdn.example.com/a.js"));
}

// ---------------------------------------------------------------------------
// Verification
// ---------------------------------------------------------------------------
TEST(AssetVerifierTest, ClassifiesProbeResponses) {
    FakeProbe probe;
    probe.responses["https://cdn.example.com/missing.png"] = { 404, "" };
    probe.responses["https://cdn.example.com/timeout.png"] = { std::nullopt, "connection refused" };

    std::vector<AssetReference> assets = {
        image("https://cdn.example.com/ok.png"),
        image("https://cdn.example.com/missing.png"),
        image("https://cdn.example.com/timeout.png"),
        image("/local.png"),
        { AssetType::Font, "https://fonts.example.com/404.woff", { "@font-face" } },
    };
    probe.responses["https://fonts.example.com/404.woff"] = { 410, "" };

    auto result = verify_assets(assets, probe, true);
    EXPECT_EQ(probe.probed.size(), 4u);
    EXPECT_EQ(result.total_assets, 5);
    EXPECT_EQ(result.verified_assets, 2);
    EXPECT_EQ(result.verification_score, 40);
    EXPECT_EQ(result.images.total, 4);
    EXPECT_EQ(result.images.missing, 1);
    EXPECT_EQ(result.images.broken, 1);

    ASSERT_EQ(result.missing_assets.size(), 2u);
    EXPECT_EQ(result.missing_assets[0].severity, page_model::WarningSeverity::Critical);
    EXPECT_EQ(result.missing_assets[1].severity, page_model::WarningSeverity::Warning);
    EXPECT_EQ(result.missing_assets[1].suggestion,
        "Asset not found. Check if the URL is correct: https://fonts.example.com/404.woff");

    ASSERT_EQ(result.broken_assets.size(), 1u);
    EXPECT_EQ(result.broken_assets[0].error, "connection refused");
}

TEST(AssetVerifierTest, ExternalChecksCanBeDisabled) {
    FakeProbe probe;
    probe.responses["https://cdn.example.com/missing.png"] = { 404, "" };
    auto result = verify_assets({ image("https://cdn.example.com/missing.png") }, probe, false);
    EXPECT_TRUE(probe.probed.empty());
    EXPECT_EQ(result.verification_score, 100);
    EXPECT_TRUE(result.missing_assets.empty());
}

TEST(AssetVerifierTest, EmptyPageScoresFull) {
    page_model::AssetVerificationResult result;
    finish_verification(result);
    EXPECT_EQ(result.total_assets, 0);
    EXPECT_EQ(result.verification_score, 100);
}

TEST(AssetVerifierTest, UnexpectedStatusIsBroken) {
    page_model::AssetVerificationResult result;
    record_asset(result, image("https://x.example.com/a.png"), ProbeResponse{ 101, "" });
    record_asset(result, image("https://x.example.com/b.png"), ProbeResponse{});
    finish_verification(result);
    ASSERT_EQ(result.broken_assets.size(), 2u);
    EXPECT_EQ(result.broken_assets[0].error, "unexpected status 101");
    EXPECT_EQ(result.broken_assets[1].error, "no response");
    EXPECT_EQ(result.verification_score, 0);
}

TEST(AssetVerifierTest, SuggestionsFollowAssetType) {
    EXPECT_EQ(missing_asset_suggestion("/a.png", AssetType::Image),
        "Consider using a placeholder image or removing the broken image reference.");
    EXPECT_EQ(missing_asset_suggestion("/a.js", AssetType::Script),
        "Verify the script URL or include the script inline if possible.");
}
