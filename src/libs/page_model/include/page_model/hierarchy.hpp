#pragma once

#include <page_model/component_type.hpp>
#include <page_model/recognition.hpp>
#include <page_model/styles.hpp>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace page_model {

enum class NodeKind { Section, Container, Row, Column, Widget };

std::string_view to_string(NodeKind kind);

// Repeated content of composite widgets (list entries, tabs, accordion panels, menu links).
struct ComponentItem {
    std::string title;
    std::string content;
    std::string href;
};

struct ImageSource {
    std::string src;
    std::string alt;
};

struct ComponentProps {
    std::string text;
    std::string inner_html;

    std::string href;
    std::string target;

    std::string src;
    std::string alt;
    std::string poster;

    std::string input_type;
    std::string name;
    std::string placeholder;
    std::string value;
    bool required = false;

    std::string width;
    std::string height;

    std::string class_name;
    std::string html_id;

    // h1..h6 -> 1..6, 0 when not a heading
    int level = 0;
    bool ordered = false;
    std::vector<ComponentItem> items;
    std::vector<ImageSource> images;
    // table rows, cells as text
    std::vector<std::vector<std::string>> rows;

    std::map<std::string, std::string> data_attributes;
    std::map<std::string, std::string> aria_attributes;
};

struct HierarchyNode {
    NodeKind kind = NodeKind::Widget;
    ComponentType component_type = ComponentType::Unknown;
    // IR id, stable for a given input ("node-<n>").
    std::string id;
    ComponentProps props;
    ExtractedStyles styles;
    std::optional<ResponsiveStyles> responsive_styles;
    std::vector<HierarchyNode> children;

    // Source element; empty for implicit wrappers.
    std::string element_id;
    std::string tag_name;
    std::string original_html;
    // Every element this node stands for (its own plus any absorbed subtree).
    std::vector<std::string> covered_element_ids;
    std::optional<RecognitionResult> recognition;
    // Percentage of the row, columns only.
    double column_size = 100.0;
    bool implicit = false;
    // Set by the layout heuristics (structural ambiguity).
    bool layout_review_needed = false;

    int confidence() const { return recognition ? recognition->confidence : 100; }
};

struct ComponentHierarchy {
    std::string title;
    // The document element; it maps to the export document itself.
    std::string root_element_id;
    std::vector<HierarchyNode> sections;
};

template <typename Fn>
void for_each_node(const HierarchyNode& node, Fn&& fn) {
    fn(node);
    for (const auto& child : node.children)
        for_each_node(child, fn);
}

template <typename Fn>
void for_each_node(const ComponentHierarchy& hierarchy, Fn&& fn) {
    for (const auto& section : hierarchy.sections)
        for_each_node(section, fn);
}

} // namespace page_model
