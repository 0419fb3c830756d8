#pragma once

#include <page_analysis/template_parts.hpp>
#include <nlohmann/json.hpp>

namespace page_export {

// Elementor Theme Builder template for a detected part: one section holding the part's markup in an
// html widget, with display conditions. Headers and footers apply to the entire site.
nlohmann::json theme_template_json(const page_analysis::TemplatePart& part);

nlohmann::json to_json(const page_analysis::TemplateParts& parts);

} // namespace page_export
