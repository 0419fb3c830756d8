#pragma once

#include <page_export/emit_context.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace page_export {

struct OxygenComponent {
    int id = 0;
    std::string name;
    // ct_id / ct_parent / selector, plus "original" for styles and "media" for breakpoints.
    nlohmann::json options = nlohmann::json::object();
    std::vector<OxygenComponent> children;
};

struct OxygenDocument {
    std::string title;
    // id 0, name "root"
    OxygenComponent root;
};

OxygenDocument convert_oxygen(const ExportInputs& inputs, EmitContext& ctx);

// {"title", "ct_builder_json": root}
nlohmann::json to_json(const OxygenDocument& document);

std::vector<std::string> check_structure(const OxygenDocument& document);

} // namespace page_export
