#pragma once

#include <page_export/emit_context.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace page_export {

struct DiviShortcode {
    std::string tag;
    // In emission order.
    std::vector<std::pair<std::string, std::string>> attrs;
    // Enclosed markup of a leaf module.
    std::string content;
    std::vector<DiviShortcode> children;
    // Trace id; not serialized.
    std::string id;

    void set(const std::string& name, const std::string& value);
    const std::string* attr(const std::string& name) const;
};

struct DiviLayout {
    std::string title;
    std::vector<DiviShortcode> sections;
};

DiviLayout convert_divi(const ExportInputs& inputs, EmitContext& ctx);

// Nearest Divi column fraction for a percentage ("1_2", "1_3", ..., "4_4").
std::string divi_fraction(double percent);

// Attribute values use %22, %91 and %93 for quotes and brackets.
std::string escape_shortcode_attr(const std::string& value);

std::string serialize_shortcodes(const DiviLayout& layout);

// Opening tags in document order.
std::vector<std::string> shortcode_tags(const std::string& content);

nlohmann::json to_json(const DiviLayout& layout);

std::vector<std::string> check_structure(const DiviLayout& layout);

} // namespace page_export
