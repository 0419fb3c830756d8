#pragma once

#include <page_export/emit_context.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace page_export {

// Parent of top-level elements.
inline constexpr const char* bricks_root_parent = "0";

struct BricksElement {
    // 6 base-36 digits
    std::string id;
    std::string name;
    std::string parent;
    std::vector<std::string> children;
    nlohmann::json settings = nlohmann::json::object();
};

struct BricksDocument {
    std::string title;
    // Flat, in emission order.
    std::vector<BricksElement> elements;

    const BricksElement* find(const std::string& id) const;
};

BricksDocument convert_bricks(const ExportInputs& inputs, EmitContext& ctx);

std::string bricks_id(int index);

// {"title", "content": [elements]}; root elements have a numeric parent 0.
nlohmann::json to_json(const BricksDocument& document);

std::vector<std::string> check_structure(const BricksDocument& document);

} // namespace page_export
