#pragma once

#include <page_export/emit_context.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace page_export {

// Parent id of top-level rows.
inline constexpr const char* beaver_root_id = "root";

struct BeaverNode {
    // 13 hex digits
    std::string node;
    // row / column-group / column / module
    std::string type;
    std::string parent;
    int position = 0;
    nlohmann::json settings = nlohmann::json::object();
};

// Flat node table; parent/child order lives in node_order only.
struct BeaverLayout {
    std::string title;
    std::vector<BeaverNode> nodes;
    std::map<std::string, std::vector<std::string>> node_order;

    const BeaverNode* find(const std::string& id) const;
    const std::vector<std::string>& children_of(const std::string& id) const;
};

BeaverLayout convert_beaver(const ExportInputs& inputs, EmitContext& ctx);

// {"title", "nodes": {id: node}, "nodeOrder": {parent: [ids]}}; root rows have a null parent.
nlohmann::json to_json(const BeaverLayout& layout);

// Parent types follow row > column-group > column > module, and column groups add up to 100%.
std::vector<std::string> check_structure(const BeaverLayout& layout);

} // namespace page_export
