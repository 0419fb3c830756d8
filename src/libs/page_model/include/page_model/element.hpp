#pragma once

#include <page_model/dom.hpp>
#include <page_model/styles.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace page_model {

// Flags cover the element itself and its ancestors.
struct ElementContext {
    bool inside_hero = false;
    bool inside_form = false;
    bool inside_card = false;
    bool inside_nav = false;
    bool inside_header = false;
    bool inside_footer = false;
    bool inside_section = false;
    int depth = 0;
    std::string parent_tag;
    std::vector<std::string> sibling_tags;
};

struct AnalyzedElement {
    // Pre-order position in the document; id is "el-<index>".
    std::size_t index = 0;
    std::string id;
    std::string tag_name;
    std::string html_id;
    std::vector<std::string> classes;
    std::map<std::string, std::string> attributes;
    std::string text_content;
    // Text of the element's own #text children only.
    std::string own_text;
    std::string inner_html;
    std::string outer_html;
    ExtractedStyles styles;
    std::optional<ResponsiveStyles> responsive_styles;
    std::optional<InteractiveStates> interactive_states;
    ElementContext context;
    std::vector<AnalyzedElement> children;
    Rect rect;

    bool has_class_containing(const std::string& keyword) const;
    std::string attribute_or(const std::string& name, const std::string& fallback = "") const;
};

struct AnalyzedDocument {
    std::string title;
    AnalyzedElement root;
    std::size_t element_count = 0;
};

// Pre-order visit helpers.
template <typename Fn>
void for_each_element(const AnalyzedElement& element, Fn&& fn) {
    fn(element);
    for (const auto& child : element.children)
        for_each_element(child, fn);
}

std::size_t count_descendants(const AnalyzedElement& element);

} // namespace page_model
