#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace page_model {

enum class TextRole { H1, H2, H3, H4, H5, H6, Body, Button, Caption, Link };

std::string_view to_string(TextRole role);

struct FontUsage {
    std::string family;
    std::set<std::string> weights;
    int usage_count = 0;
    std::map<TextRole, int> role_counts;
};

struct TypeScaleEntry {
    std::string name;
    double px = 0;
    double rem = 0;
};

struct TypeScale {
    double base_size = 16;
    double ratio = 1.25;
    std::vector<TypeScaleEntry> sizes;
};

struct TextStyle {
    std::string font_family;
    double font_size = 0;
    std::string font_weight;
    std::string line_height;
    std::string letter_spacing;
    std::string text_transform;
    std::string color;
};

struct GlobalTypographySettings {
    std::string base_font_family;
    double base_font_size = 16;
    double base_line_height = 1.5;
    std::string base_color = "#000000";
    std::string heading_font_family;
    std::string heading_font_weight = "700";
    double heading_line_height = 1.2;
};

enum class ScaleQuality { Excellent, Good, Fair, Poor };

std::string_view to_string(ScaleQuality quality);

struct TypographyStatistics {
    int distinct_fonts = 0;
    int distinct_sizes = 0;
    ScaleQuality quality = ScaleQuality::Excellent;
};

struct ElementorGlobalFont {
    std::string id;
    std::string title;
    std::string font_family;
    std::string font_weight;
    double font_size = 0;
};

struct TypographySystem {
    // Sorted by usage, most used first.
    std::vector<FontUsage> fonts;
    TypeScale scale;
    // First observed instance per role; see extract_typography.
    std::map<TextRole, TextStyle> role_styles;
    GlobalTypographySettings global;
    TypographyStatistics statistics;
    std::vector<std::string> google_fonts;
    std::vector<ElementorGlobalFont> elementor_fonts;

    const TextStyle* style_for(TextRole role) const;
};

} // namespace page_model
