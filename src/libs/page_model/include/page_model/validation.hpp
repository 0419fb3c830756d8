#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace page_model {

enum class Severity { Critical, High, Medium, Low };
enum class DiscrepancySeverity { Minor, Moderate, Major };
enum class WarningSeverity { Critical, Warning, Info };
enum class Impact { Blocking, Degraded, Minimal };
enum class AssetType { Image, Font, Video, Stylesheet, Script };

std::string_view to_string(Severity severity);
std::string_view to_string(DiscrepancySeverity severity);
std::string_view to_string(WarningSeverity severity);
std::string_view to_string(Impact impact);
std::string_view to_string(AssetType type);

struct ValidationIssue {
    std::string type;
    std::string message;
    std::string component;
    Severity severity = Severity::Medium;
};

struct StyleDiscrepancy {
    std::string selector;
    std::string property;
    std::string original_value;
    std::string converted_value;
    DiscrepancySeverity severity = DiscrepancySeverity::Minor;
};

struct Viewport {
    std::string name;
    int width = 0;
    int height = 0;
};

struct VisualComparisonResult {
    Viewport viewport;
    double similarity_score = 0;
    long long pixel_difference = 0;
    long long total_pixels = 0;
    double diff_percentage = 0;
    bool dimensions_match = true;
    std::vector<std::string> missing_elements;
    std::vector<std::string> extra_elements;
    std::vector<StyleDiscrepancy> style_discrepancies;
};

struct AssetStatus {
    int total = 0;
    int verified = 0;
    int missing = 0;
    int broken = 0;
    std::vector<std::string> urls;
};

struct MissingAsset {
    AssetType type = AssetType::Image;
    std::string url;
    std::vector<std::string> used_in;
    WarningSeverity severity = WarningSeverity::Warning;
    std::string suggestion;
};

struct BrokenAsset {
    AssetType type = AssetType::Image;
    std::string url;
    std::string error;
    std::optional<int> status_code;
    std::vector<std::string> used_in;
};

struct AssetVerificationResult {
    int total_assets = 0;
    int verified_assets = 0;
    std::vector<MissingAsset> missing_assets;
    std::vector<BrokenAsset> broken_assets;
    AssetStatus images;
    AssetStatus fonts;
    AssetStatus videos;
    AssetStatus stylesheets;
    AssetStatus scripts;
    int verification_score = 100;
};

struct ConversionWarning {
    std::string type;
    WarningSeverity severity = WarningSeverity::Warning;
    std::string message;
    std::string suggestion;
    bool can_auto_fix = false;
};

struct DetectedFeature {
    std::string type;
    std::string feature;
    std::string description;
    bool is_supported = true;
    std::string alternative;
};

struct Incompatibility {
    std::string type;
    std::string name;
    std::string reason;
    Impact impact = Impact::Minimal;
    std::string workaround;
};

struct CustomCodeDetection {
    bool has_custom_js = false;
    bool has_custom_css = false;
    bool can_be_converted = true;
    std::vector<ConversionWarning> warnings;
    std::vector<DetectedFeature> features;
    std::vector<Incompatibility> incompatibilities;
    int conversion_score = 100;
};

struct ValidationResult {
    bool is_valid = true;
    std::vector<ValidationIssue> errors;
    std::vector<ValidationIssue> warnings;
    std::vector<std::string> suggestions;
    std::vector<VisualComparisonResult> visual_comparisons;
    std::optional<AssetVerificationResult> asset_verification;
    std::optional<CustomCodeDetection> custom_code;
    std::optional<int> overall_score;
    bool can_export = true;
    // A check timed out or could not reach its target.
    bool requires_override = false;
};

} // namespace page_model
