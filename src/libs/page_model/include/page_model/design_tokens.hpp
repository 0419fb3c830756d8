#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace page_model {

enum class ColorRole { Primary, Secondary, Accent, Neutral };

std::string_view to_string(ColorRole role);

struct ColorToken {
    std::string hex;
    int usage = 0;
    // text / background / border
    std::set<std::string> contexts;
    ColorRole role = ColorRole::Neutral;
};

struct SpacingToken {
    std::string name;
    double px = 0;
};

struct ElementorGlobalColor {
    std::string id;
    std::string title;
    std::string color;
};

struct DesignTokens {
    // Sorted by usage, most used first.
    std::vector<ColorToken> colors;
    std::vector<SpacingToken> spacing;
    std::vector<ElementorGlobalColor> elementor_colors;

    // Global color id ("primary", "text", ...) registered for this hex, if any.
    std::optional<std::string> global_color_id(const std::string& hex) const;
};

} // namespace page_model
