#pragma once

#include <page_model/design_tokens.hpp>
#include <page_model/element.hpp>
#include <optional>
#include <string>

namespace page_analysis {

// HSL saturation in percent for a "#rrggbb" color, nullopt for anything else.
std::optional<double> hsl_saturation(const std::string& hex);

page_model::DesignTokens extract_design_tokens(const page_model::AnalyzedDocument& document);

} // namespace page_analysis
