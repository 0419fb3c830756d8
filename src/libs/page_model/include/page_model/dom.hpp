#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace page_model {

struct Rect {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;
};

// CSS property name (kebab-case) -> value.
using StyleMap = std::map<std::string, std::string>;

struct CustomBreakpointStyles {
    std::optional<double> min_width;
    std::optional<double> max_width;
    StyleMap styles;
};

// One node of the parsed, style-resolved page. Text runs are children tagged "#text".
struct DomNode {
    std::string tag_name;
    std::map<std::string, std::string> attributes;
    std::string text;
    StyleMap computed_style;
    // desktop / laptop / tablet / mobile
    std::map<std::string, StyleMap> responsive_styles;
    std::vector<CustomBreakpointStyles> custom_breakpoints;
    // hover / focus / active / before / after
    std::map<std::string, StyleMap> state_styles;
    Rect rect;
    std::vector<DomNode> children;

    bool is_text() const { return tag_name == "#text"; }
};

struct DomDocument {
    std::string title;
    DomNode root;
};

inline constexpr const char* text_tag = "#text";

// Descendant text, whitespace collapsed and trimmed.
std::string text_content(const DomNode& node);

std::string serialize_outer_html(const DomNode& node);
std::string serialize_inner_html(const DomNode& node);

std::vector<std::string> class_list(const DomNode& node);
std::string attribute_or(const DomNode& node, const std::string& name, const std::string& fallback = "");

// Builders used by the debug page generator and the tests.
DomNode make_element(std::string tag, std::map<std::string, std::string> attributes = {},
    std::vector<DomNode> children = {});
DomNode make_text(std::string text);

} // namespace page_model
