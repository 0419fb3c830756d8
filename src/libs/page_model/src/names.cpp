#include <page_model/design_tokens.hpp>
#include <page_model/hierarchy.hpp>
#include <page_model/typography.hpp>

namespace page_model {

std::string_view to_string(TextRole role) {
    switch (role) {
    case TextRole::H1: return "h1";
    case TextRole::H2: return "h2";
    case TextRole::H3: return "h3";
    case TextRole::H4: return "h4";
    case TextRole::H5: return "h5";
    case TextRole::H6: return "h6";
    case TextRole::Body: return "body";
    case TextRole::Button: return "button";
    case TextRole::Caption: return "caption";
    case TextRole::Link: return "link";
    }
    return "body";
}

std::string_view to_string(ScaleQuality quality) {
    switch (quality) {
    case ScaleQuality::Excellent: return "excellent";
    case ScaleQuality::Good: return "good";
    case ScaleQuality::Fair: return "fair";
    case ScaleQuality::Poor: return "poor";
    }
    return "poor";
}

std::string_view to_string(ColorRole role) {
    switch (role) {
    case ColorRole::Primary: return "primary";
    case ColorRole::Secondary: return "secondary";
    case ColorRole::Accent: return "accent";
    case ColorRole::Neutral: return "neutral";
    }
    return "neutral";
}

std::string_view to_string(NodeKind kind) {
    switch (kind) {
    case NodeKind::Section: return "section";
    case NodeKind::Container: return "container";
    case NodeKind::Row: return "row";
    case NodeKind::Column: return "column";
    case NodeKind::Widget: return "widget";
    }
    return "widget";
}

const TextStyle* TypographySystem::style_for(TextRole role) const {
    auto it = role_styles.find(role);
    return it != role_styles.end() ? &it->second : nullptr;
}

std::optional<std::string> DesignTokens::global_color_id(const std::string& hex) const {
    for (const auto& c : elementor_colors)
        if (c.color == hex) return c.id;
    return std::nullopt;
}

} // namespace page_model
