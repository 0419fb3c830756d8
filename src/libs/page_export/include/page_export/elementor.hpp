#pragma once

#include <page_export/emit_context.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace page_export {

struct ElementorElement {
    // 7 hex digits
    std::string id;
    // section / column / widget
    std::string el_type;
    std::string widget_type;
    nlohmann::json settings = nlohmann::json::object();
    bool is_inner = false;
    std::vector<ElementorElement> elements;
};

struct ElementorDocument {
    std::string version = "3.16.0";
    std::string title;
    std::string type = "page";
    std::vector<ElementorElement> content;
    nlohmann::json page_settings = nlohmann::json::object();
};

ElementorDocument convert_elementor(const ExportInputs& inputs, EmitContext& ctx);

nlohmann::json to_json(const ElementorDocument& document);

// Version present, at least one section, sections hold columns.
std::vector<std::string> check_structure(const ElementorDocument& document);

} // namespace page_export
