#pragma once

#include <optional>
#include <string>
#include <vector>

namespace page_model {

struct BoxSpacing {
    std::string top = "0";
    std::string right = "0";
    std::string bottom = "0";
    std::string left = "0";
};

struct BorderStyle {
    std::string width;
    std::string style;
    std::string color;
};

struct BorderRadius {
    std::string top_left = "0";
    std::string top_right = "0";
    std::string bottom_right = "0";
    std::string bottom_left = "0";
};

// Normalized style record. Empty string means "not set".
struct ExtractedStyles {
    // layout
    std::string display;
    std::string position;
    std::string flex_direction;
    std::string flex_wrap;
    std::string justify_content;
    std::string align_items;
    std::string grid_template_columns;
    std::string grid_template_rows;
    std::string grid_template_areas;
    std::string gap;

    // box model
    std::string width;
    std::string height;
    std::string min_width;
    std::string max_width;
    std::string min_height;
    std::string max_height;
    std::optional<BoxSpacing> margin;
    std::optional<BoxSpacing> padding;

    std::optional<BorderStyle> border;
    std::optional<BorderRadius> border_radius;

    // colors (hex when convertible)
    std::string background_color;
    std::string color;
    std::string border_color;

    // typography
    std::string font_family;
    std::string font_size;
    std::string font_weight;
    std::string font_style;
    std::string line_height;
    std::string letter_spacing;
    std::string text_align;
    std::string text_decoration;
    std::string text_transform;

    // effects
    std::string box_shadow;
    std::string text_shadow;
    std::string opacity;
    std::string transition;
    std::string transform;
    std::string filter;

    // background
    std::string background_image;
    std::string background_size;
    std::string background_position;
    std::string background_repeat;

    // advanced
    std::string z_index;
    std::string overflow;
    std::string cursor;
    std::string pointer_events;
    std::string object_fit;
};

struct CustomBreakpoint {
    std::optional<double> min_width;
    std::optional<double> max_width;
    ExtractedStyles styles;
};

// desktop 1920, laptop 1366, tablet 768, mobile 375
struct ResponsiveStyles {
    std::optional<ExtractedStyles> desktop;
    std::optional<ExtractedStyles> laptop;
    std::optional<ExtractedStyles> tablet;
    std::optional<ExtractedStyles> mobile;
    std::vector<CustomBreakpoint> custom;
};

struct InteractiveStates {
    ExtractedStyles normal;
    std::optional<ExtractedStyles> hover;
    std::optional<ExtractedStyles> focus;
    std::optional<ExtractedStyles> active;
    std::optional<ExtractedStyles> before;
    std::optional<ExtractedStyles> after;
};

} // namespace page_model
