#pragma once

#include <page_model/component_type.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace page_model {

enum class TargetBuilder { Elementor, Gutenberg, BeaverBuilder, Divi, Bricks, Oxygen };

inline constexpr TargetBuilder all_target_builders[] = {
    TargetBuilder::Elementor, TargetBuilder::Gutenberg, TargetBuilder::BeaverBuilder,
    TargetBuilder::Divi, TargetBuilder::Bricks, TargetBuilder::Oxygen,
};

std::string_view to_string(TargetBuilder target);
// Accepts "beaver" and "beaver-builder".
std::optional<TargetBuilder> target_builder_from_string(std::string_view name);

struct ConversionOptions {
    TargetBuilder target = TargetBuilder::Elementor;
    bool preserve_custom_css = true;
    bool include_responsive = false;
    bool include_animations = false;
    bool optimize_assets = true;
    int min_confidence = 60;
    bool fallback_to_html = true;
};

enum class FallbackKind { HtmlWidget, CustomCss, ImageReplacement, ManualReview };

std::string_view to_string(FallbackKind kind);

struct FallbackStrategy {
    FallbackKind kind = FallbackKind::HtmlWidget;
    std::string element_id;
    std::string reason;
    std::string original_html;
    std::vector<std::string> suggestions;
    std::optional<ComponentType> alternative_type;
};

struct ConversionStats {
    int total_elements = 0;
    int recognized_components = 0;
    int native_widgets = 0;
    int html_fallbacks = 0;
    int manual_review = 0;
    int confidence_average = 0;
    double conversion_time_ms = 0;
};

// Where one source element ended up in a target document.
struct ElementTrace {
    std::string element_id;
    std::string target_node_id;
    bool fallback = false;
    // Wrapper with no node of its own in this target; target_node_id is the enclosing node.
    bool merged = false;
};

} // namespace page_model
