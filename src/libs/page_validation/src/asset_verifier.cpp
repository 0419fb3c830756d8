#include <page_validation/asset_verifier.hpp>
#include <page_analysis/css_values.hpp>
#include <page_model/logging.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <iterator>
#include <map>
#include <regex>
#include <sstream>

namespace page_validation {

namespace {

using page_model::AssetType;
using page_model::AssetVerificationResult;
using page_model::DomNode;

constexpr std::array<AssetType, 5> type_order = {
    AssetType::Image, AssetType::Font, AssetType::Video, AssetType::Stylesheet, AssetType::Script
};

class AssetCollector {
public:
    void add(AssetType type, std::string url, const std::string& selector) {
        url = trim(url);
        if (url.empty()) return;
        auto& bucket = buckets_[type];
        auto it = std::find_if(bucket.begin(), bucket.end(), [&](const AssetReference& a) { return a.url == url; });
        if (it == bucket.end()) {
            bucket.push_back({ type, url, { selector } });
        } else {
            it->used_in.push_back(selector);
        }
    }

    std::vector<AssetReference> take() {
        std::vector<AssetReference> out;
        for (auto type : type_order) {
            auto& bucket = buckets_[type];
            std::move(bucket.begin(), bucket.end(), std::back_inserter(out));
        }
        return out;
    }

private:
    static std::string trim(const std::string& s) {
        size_t b = s.find_first_not_of(" \t\r\n");
        if (b == std::string::npos) return {};
        size_t e = s.find_last_not_of(" \t\r\n");
        return s.substr(b, e - b + 1);
    }

    std::map<AssetType, std::vector<AssetReference>> buckets_;
};

std::string attr(const DomNode& node, const char* name) {
    auto it = node.attributes.find(name);
    return it == node.attributes.end() ? std::string() : it->second;
}

std::string selector_of(const DomNode& node) {
    std::string id = attr(node, "id");
    if (!id.empty()) return "#" + id;
    std::string selector = node.tag_name;
    auto classes = page_model::class_list(node);
    for (size_t i = 0; i < classes.size() && i < 2; ++i) selector += "." + classes[i];
    return selector;
}

// "a.png 1x, b.png 2x" -> first token of each candidate.
std::vector<std::string> srcset_urls(const std::string& srcset) {
    std::vector<std::string> out;
    std::stringstream ss(srcset);
    std::string entry;
    while (std::getline(ss, entry, ',')) {
        std::stringstream es(entry);
        std::string url;
        if (es >> url) out.push_back(url);
    }
    return out;
}

std::vector<std::string> css_urls(const std::string& css) {
    static const std::regex url_re(R"(url\(\s*['"]?([^'"()]+)['"]?\s*\))");
    std::vector<std::string> out;
    for (auto it = std::sregex_iterator(css.begin(), css.end(), url_re); it != std::sregex_iterator(); ++it)
        out.push_back((*it)[1].str());
    return out;
}

std::string raw_text(const DomNode& node) {
    std::string out;
    for (const auto& child : node.children) {
        if (child.is_text()) out += child.text;
    }
    return out;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void collect(const DomNode& node, const DomNode* parent, AssetCollector& out) {
    if (node.is_text()) return;
    const std::string selector = selector_of(node);
    const std::string& tag = node.tag_name;

    if (tag == "img") {
        std::string src = attr(node, "src");
        if (src.empty()) src = attr(node, "data-src");
        out.add(AssetType::Image, src, selector);
        std::string srcset = attr(node, "srcset");
        if (srcset.empty()) srcset = attr(node, "data-srcset");
        for (auto& url : srcset_urls(srcset)) out.add(AssetType::Image, url, selector);
    } else if (tag == "source" && parent) {
        const std::string owner = selector_of(*parent);
        if (parent->tag_name == "video" || parent->tag_name == "audio") {
            out.add(AssetType::Video, attr(node, "src"), owner);
        } else {
            out.add(AssetType::Image, attr(node, "src"), owner);
            for (auto& url : srcset_urls(attr(node, "srcset"))) out.add(AssetType::Image, url, owner);
        }
    } else if (tag == "video") {
        std::string src = attr(node, "src");
        if (src.empty()) src = attr(node, "data-src");
        out.add(AssetType::Video, src, selector);
    } else if (tag == "iframe") {
        static const std::regex video_host("youtube|vimeo|dailymotion|wistia", std::regex::icase);
        std::string src = attr(node, "src");
        if (std::regex_search(src, video_host)) out.add(AssetType::Video, src, selector);
    } else if (tag == "link") {
        if (lower(attr(node, "rel")).find("stylesheet") != std::string::npos)
            out.add(AssetType::Stylesheet, attr(node, "href"), selector);
    } else if (tag == "script") {
        out.add(AssetType::Script, attr(node, "src"), selector);
    } else if (tag == "style") {
        static const std::regex font_face(R"(@font-face\s*\{([^}]*)\})");
        const std::string css = raw_text(node);
        for (auto it = std::sregex_iterator(css.begin(), css.end(), font_face); it != std::sregex_iterator(); ++it) {
            for (auto& url : css_urls((*it)[1].str())) out.add(AssetType::Font, url, "@font-face");
        }
    }

    // Background images from the computed style and the inline style attribute.
    auto computed = node.computed_style.find("background-image");
    if (computed != node.computed_style.end()) {
        for (auto& url : css_urls(computed->second)) out.add(AssetType::Image, url, selector);
    }
    const std::string inline_style = attr(node, "style");
    if (!inline_style.empty()) {
        auto declared = page_analysis::parse_inline_style(inline_style);
        for (const char* key : { "background", "background-image" }) {
            auto it = declared.find(key);
            if (it == declared.end()) continue;
            for (auto& url : css_urls(it->second)) out.add(AssetType::Image, url, selector);
        }
    }

    for (const auto& child : node.children) collect(child, &node, out);
}

void record_missing(AssetVerificationResult& result, const AssetReference& asset) {
    status_for(result, asset.type).missing++;
    result.missing_assets.push_back({ asset.type, asset.url, asset.used_in,
        asset.type == AssetType::Image ? page_model::WarningSeverity::Critical
                                       : page_model::WarningSeverity::Warning,
        missing_asset_suggestion(asset.url, asset.type) });
}

void record_broken(AssetVerificationResult& result, const AssetReference& asset, std::string error,
    std::optional<int> status_code) {
    status_for(result, asset.type).broken++;
    result.broken_assets.push_back({ asset.type, asset.url, std::move(error), status_code, asset.used_in });
}

} // namespace

std::vector<AssetReference> collect_assets(const DomNode& root) {
    AssetCollector collector;
    collect(root, nullptr, collector);
    return collector.take();
}

bool is_external_url(std::string_view url) {
    std::string prefix = lower(std::string(url.substr(0, 8)));
    return prefix.rfind("http://", 0) == 0 || prefix.rfind("https://", 0) == 0;
}

std::string missing_asset_suggestion(const std::string& url, AssetType type) {
    if (url.find("404") != std::string::npos || url.find("not-found") != std::string::npos)
        return "Asset not found. Check if the URL is correct: " + url;
    switch (type) {
    case AssetType::Image: return "Consider using a placeholder image or removing the broken image reference.";
    case AssetType::Font: return "Use a fallback font or include the font file in your assets.";
    case AssetType::Video: return "Check if the video URL is correct or use an alternative video source.";
    case AssetType::Stylesheet: return "Ensure the stylesheet is properly linked or include styles inline.";
    case AssetType::Script: return "Verify the script URL or include the script inline if possible.";
    }
    return "Verify the asset URL and ensure it is accessible.";
}

page_model::AssetStatus& status_for(AssetVerificationResult& result, AssetType type) {
    switch (type) {
    case AssetType::Image: return result.images;
    case AssetType::Font: return result.fonts;
    case AssetType::Video: return result.videos;
    case AssetType::Stylesheet: return result.stylesheets;
    case AssetType::Script: return result.scripts;
    }
    return result.images;
}

void record_asset(AssetVerificationResult& result, const AssetReference& asset,
    const std::optional<ProbeResponse>& response) {
    auto& status = status_for(result, asset.type);
    status.total++;
    status.urls.push_back(asset.url);

    if (!response) {
        status.verified++;
        return;
    }
    if (!response->error.empty()) {
        record_broken(result, asset, response->error, response->status_code);
    } else if (!response->status_code) {
        record_broken(result, asset, "no response", std::nullopt);
    } else if (*response->status_code >= 200 && *response->status_code < 400) {
        status.verified++;
    } else if (*response->status_code >= 400) {
        record_missing(result, asset);
    } else {
        record_broken(result, asset, "unexpected status " + std::to_string(*response->status_code),
            response->status_code);
    }
}

void finish_verification(AssetVerificationResult& result) {
    result.total_assets = 0;
    result.verified_assets = 0;
    for (auto type : type_order) {
        const auto& status = status_for(result, type);
        result.total_assets += status.total;
        result.verified_assets += status.verified;
    }
    result.verification_score = result.total_assets > 0
        ? static_cast<int>(std::lround(100.0 * result.verified_assets / result.total_assets))
        : 100;
}

AssetVerificationResult verify_assets(const std::vector<AssetReference>& assets, AssetProbe& probe,
    bool check_external) {
    AssetVerificationResult result;
    for (const auto& asset : assets) {
        std::optional<ProbeResponse> response;
        if (check_external && is_external_url(asset.url)) response = probe.probe(asset.url);
        record_asset(result, asset, response);
    }
    finish_verification(result);
    page_model::conversion_logger()->info("Asset verification: {}/{} verified, {} missing, {} broken",
        result.verified_assets, result.total_assets, result.missing_assets.size(), result.broken_assets.size());
    return result;
}

} // namespace page_validation
