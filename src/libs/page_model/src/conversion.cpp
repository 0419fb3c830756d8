#include <page_model/conversion.hpp>

namespace page_model {

std::string_view to_string(TargetBuilder target) {
    switch (target) {
    case TargetBuilder::Elementor: return "elementor";
    case TargetBuilder::Gutenberg: return "gutenberg";
    case TargetBuilder::BeaverBuilder: return "beaver";
    case TargetBuilder::Divi: return "divi";
    case TargetBuilder::Bricks: return "bricks";
    case TargetBuilder::Oxygen: return "oxygen";
    }
    return "elementor";
}

std::optional<TargetBuilder> target_builder_from_string(std::string_view name) {
    if (name == "elementor") return TargetBuilder::Elementor;
    if (name == "gutenberg") return TargetBuilder::Gutenberg;
    if (name == "beaver" || name == "beaver-builder") return TargetBuilder::BeaverBuilder;
    if (name == "divi") return TargetBuilder::Divi;
    if (name == "bricks") return TargetBuilder::Bricks;
    if (name == "oxygen") return TargetBuilder::Oxygen;
    return std::nullopt;
}

std::string_view to_string(FallbackKind kind) {
    switch (kind) {
    case FallbackKind::HtmlWidget: return "html-widget";
    case FallbackKind::CustomCss: return "custom-css";
    case FallbackKind::ImageReplacement: return "image-replacement";
    case FallbackKind::ManualReview: return "manual-review";
    }
    return "html-widget";
}

} // namespace page_model
