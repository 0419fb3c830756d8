#pragma once

#include <page_export/beaver.hpp>
#include <page_export/bricks.hpp>
#include <page_export/divi.hpp>
#include <page_export/elementor.hpp>
#include <page_export/gutenberg.hpp>
#include <page_export/oxygen.hpp>
#include <page_model/conversion.hpp>
#include <page_model/dom.hpp>
#include <page_model/element.hpp>
#include <page_model/recognition.hpp>
#include <page_model/validation.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

namespace page_export {

using ExportData = std::variant<ElementorDocument, GutenbergDocument, BeaverLayout, DiviLayout, BricksDocument,
    OxygenDocument>;

struct ConversionResult {
    page_model::TargetBuilder target = page_model::TargetBuilder::Elementor;
    ExportData export_data;
    std::vector<page_model::RecognizedComponent> components;
    page_model::ComponentHierarchy hierarchy;
    page_model::TypographySystem typography;
    page_model::DesignTokens tokens;
    std::vector<page_model::FallbackStrategy> fallbacks;
    // Export structure problems land in errors.
    page_model::ValidationResult validation;
    page_model::ConversionStats stats;
    std::vector<page_model::ElementTrace> traces;
    bool manual_review_needed = false;
};

// Runs the converter selected by inputs.options.target.
ExportData convert_target(const ExportInputs& inputs, EmitContext& ctx);

std::vector<std::string> check_structure(const ExportData& data);

// Converts an already built hierarchy. Component stats come from the hierarchy nodes.
ConversionResult convert(const page_model::ComponentHierarchy& hierarchy, const page_model::TypographySystem& typography,
    const page_model::DesignTokens& tokens, const page_model::ConversionOptions& options);

// Full pipeline: analyze, recognize, extract typography and tokens, build the hierarchy, convert.
// Throws std::invalid_argument for a malformed root.
ConversionResult convert_page(const page_model::DomDocument& document, const page_model::ConversionOptions& options);
ConversionResult convert_page(const page_model::AnalyzedDocument& document, const page_model::ConversionOptions& options);

nlohmann::json export_json(const ExportData& data);

// Block comments for Gutenberg, shortcodes for Divi, pretty JSON otherwise.
std::string export_text(const ExportData& data);

nlohmann::json to_json(const page_model::ValidationResult& validation);
nlohmann::json to_json(const ConversionResult& result);

} // namespace page_export
