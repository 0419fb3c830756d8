#pragma once

#include <page_export/emit_context.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace page_export {

struct GutenbergBlock {
    // Fully qualified, e.g. "core/heading".
    std::string name;
    nlohmann::json attrs = nlohmann::json::object();
    // Markup of a leaf block.
    std::string inner_html;
    // Markup around inner blocks.
    std::string wrapper_open;
    std::string wrapper_close;
    std::vector<GutenbergBlock> inner_blocks;
    // Trace id; not part of the serialized content.
    std::string client_id;
};

struct GutenbergDocument {
    std::string title;
    std::vector<GutenbergBlock> blocks;
};

struct BlockMarker {
    std::string name;
    nlohmann::json attrs = nlohmann::json::object();
};

GutenbergDocument convert_gutenberg(const ExportInputs& inputs, EmitContext& ctx);

// <!-- wp:name {attrs} -->...<!-- /wp:name -->, self-closing when a block has no content.
std::string serialize_blocks(const GutenbergDocument& document);

// Opening markers in document order; names without a namespace get "core/".
std::vector<BlockMarker> parse_block_markers(const std::string& content);

// Pre-order (name, attrs) of the block tree, comparable with parse_block_markers.
std::vector<BlockMarker> block_markers(const GutenbergDocument& document);

nlohmann::json to_json(const GutenbergDocument& document);

std::vector<std::string> check_structure(const GutenbergDocument& document);

} // namespace page_export
