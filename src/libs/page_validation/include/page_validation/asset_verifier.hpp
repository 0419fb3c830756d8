#pragma once

#include <page_validation/capabilities.hpp>
#include <page_model/dom.hpp>
#include <page_model/validation.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace page_validation {

struct AssetReference {
    page_model::AssetType type = page_model::AssetType::Image;
    std::string url;
    // Selectors of the elements using the asset ("#id", "tag.class", "@font-face").
    std::vector<std::string> used_in;
};

// Grouped by type (images, fonts, videos, stylesheets, scripts), each in document order, one entry per URL.
std::vector<AssetReference> collect_assets(const page_model::DomNode& root);

// http:// or https://
bool is_external_url(std::string_view url);

std::string missing_asset_suggestion(const std::string& url, page_model::AssetType type);

page_model::AssetStatus& status_for(page_model::AssetVerificationResult& result, page_model::AssetType type);

// Classifies one asset. Without a response the asset counts as reachable.
void record_asset(page_model::AssetVerificationResult& result, const AssetReference& asset,
    const std::optional<ProbeResponse>& response);

// Totals and score from the per-type tallies.
void finish_verification(page_model::AssetVerificationResult& result);

// Sequential verification; external URLs are probed only when check_external is set.
page_model::AssetVerificationResult verify_assets(const std::vector<AssetReference>& assets, AssetProbe& probe,
    bool check_external);

} // namespace page_validation
