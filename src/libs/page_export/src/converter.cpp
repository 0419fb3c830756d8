#include <page_export/converter.hpp>
#include <page_analysis/design_tokens.hpp>
#include <page_analysis/element_analyzer.hpp>
#include <page_analysis/recognizer.hpp>
#include <page_analysis/typography.hpp>
#include <page_layout/hierarchy_builder.hpp>
#include <page_model/logging.hpp>
#include <chrono>
#include <cmath>

namespace page_export {

namespace {

using json = nlohmann::json;

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

void count_components(page_model::ConversionStats& stats, const std::vector<const page_model::RecognitionResult*>& results) {
    stats.total_elements = static_cast<int>(results.size());
    stats.recognized_components = 0;
    stats.manual_review = 0;
    double confidence_sum = 0;
    for (const auto* r : results) {
        if (r->component_type != page_model::ComponentType::Unknown) ++stats.recognized_components;
        if (r->manual_review_needed) ++stats.manual_review;
        confidence_sum += r->confidence;
    }
    stats.confidence_average = results.empty() ? 0 : static_cast<int>(std::lround(confidence_sum / results.size()));
}

void finish(ConversionResult& result) {
    result.stats.html_fallbacks = 0;
    bool review_strategy = false;
    for (const auto& f : result.fallbacks) {
        if (f.kind == page_model::FallbackKind::HtmlWidget) ++result.stats.html_fallbacks;
        if (f.kind == page_model::FallbackKind::ManualReview) review_strategy = true;
    }
    result.manual_review_needed = review_strategy || result.stats.manual_review > 0;
}

json validation_issue_json(const page_model::ValidationIssue& issue) {
    json out = { { "type", issue.type }, { "message", issue.message },
        { "severity", std::string(page_model::to_string(issue.severity)) } };
    if (!issue.component.empty()) out["component"] = issue.component;
    return out;
}

json asset_status_json(const page_model::AssetStatus& s) {
    return { { "total", s.total }, { "verified", s.verified }, { "missing", s.missing }, { "broken", s.broken }, { "urls", s.urls } };
}

json hierarchy_node_json(const page_model::HierarchyNode& node) {
    json out = { { "id", node.id }, { "kind", std::string(page_model::to_string(node.kind)) },
        { "componentType", std::string(page_model::to_string(node.component_type)) } };
    if (!node.element_id.empty()) out["elementId"] = node.element_id;
    if (node.kind == page_model::NodeKind::Column) out["size"] = node.column_size;
    if (node.implicit) out["implicit"] = true;
    if (node.layout_review_needed) out["manualReviewNeeded"] = true;
    if (node.recognition) out["confidence"] = node.recognition->confidence;
    json children = json::array();
    for (const auto& child : node.children)
        children.push_back(hierarchy_node_json(child));
    if (!children.empty()) out["children"] = children;
    return out;
}

json typography_json(const page_model::TypographySystem& t) {
    json fonts = json::array();
    for (const auto& f : t.fonts)
        fonts.push_back({ { "family", f.family }, { "weights", f.weights }, { "usageCount", f.usage_count } });
    json sizes = json::array();
    for (const auto& s : t.scale.sizes)
        sizes.push_back({ { "name", s.name }, { "px", s.px }, { "rem", s.rem } });
    return { { "fonts", fonts },
        { "scale", { { "baseSize", t.scale.base_size }, { "ratio", t.scale.ratio }, { "sizes", sizes } } },
        { "global", { { "baseFontFamily", t.global.base_font_family }, { "baseFontSize", t.global.base_font_size },
                        { "headingFontFamily", t.global.heading_font_family } } },
        { "statistics", { { "distinctFonts", t.statistics.distinct_fonts }, { "distinctSizes", t.statistics.distinct_sizes },
                            { "quality", std::string(page_model::to_string(t.statistics.quality)) } } },
        { "googleFonts", t.google_fonts } };
}

json tokens_json(const page_model::DesignTokens& tokens) {
    json colors = json::array();
    for (const auto& c : tokens.colors)
        colors.push_back({ { "hex", c.hex }, { "usage", c.usage }, { "contexts", c.contexts },
            { "role", std::string(page_model::to_string(c.role)) } });
    json spacing = json::array();
    for (const auto& s : tokens.spacing)
        spacing.push_back({ { "name", s.name }, { "px", s.px } });
    return { { "colors", colors }, { "spacing", spacing } };
}

} // namespace

ExportData convert_target(const ExportInputs& inputs, EmitContext& ctx) {
    switch (inputs.options.target) {
    case page_model::TargetBuilder::Elementor: return convert_elementor(inputs, ctx);
    case page_model::TargetBuilder::Gutenberg: return convert_gutenberg(inputs, ctx);
    case page_model::TargetBuilder::BeaverBuilder: return convert_beaver(inputs, ctx);
    case page_model::TargetBuilder::Divi: return convert_divi(inputs, ctx);
    case page_model::TargetBuilder::Bricks: return convert_bricks(inputs, ctx);
    case page_model::TargetBuilder::Oxygen: return convert_oxygen(inputs, ctx);
    }
    return convert_elementor(inputs, ctx);
}

std::vector<std::string> check_structure(const ExportData& data) {
    return std::visit([](const auto& doc) { return check_structure(doc); }, data);
}

ConversionResult convert(const page_model::ComponentHierarchy& hierarchy, const page_model::TypographySystem& typography,
    const page_model::DesignTokens& tokens, const page_model::ConversionOptions& options)
{
    const auto started = std::chrono::steady_clock::now();
    auto logger = page_model::conversion_logger();
    logger->info("Converting '{}' for {}", hierarchy.title, page_model::to_string(options.target));

    ConversionResult result;
    result.target = options.target;
    result.hierarchy = hierarchy;
    result.typography = typography;
    result.tokens = tokens;

    EmitContext ctx(options);
    const ExportInputs inputs{ result.hierarchy, result.typography, result.tokens, options };
    result.export_data = convert_target(inputs, ctx);
    result.fallbacks = ctx.fallbacks();
    result.traces = ctx.traces();
    result.stats.native_widgets = ctx.native_widgets();

    for (const auto& problem : check_structure(result.export_data)) {
        logger->warn("Export structure: {}", problem);
        result.validation.errors.push_back({ "export-structure", problem, "", page_model::Severity::High });
    }
    result.validation.is_valid = result.validation.errors.empty();

    std::vector<const page_model::RecognitionResult*> recognitions;
    page_model::for_each_node(result.hierarchy, [&](const page_model::HierarchyNode& node) {
        if (node.recognition) recognitions.push_back(&*node.recognition);
    });
    count_components(result.stats, recognitions);
    finish(result);

    result.stats.conversion_time_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    logger->info("Converted {} nodes: {} native, {} html fallbacks, {} strategies", recognitions.size(),
        result.stats.native_widgets, result.stats.html_fallbacks, result.fallbacks.size());
    return result;
}

ConversionResult convert_page(const page_model::AnalyzedDocument& document, const page_model::ConversionOptions& options) {
    const auto started = std::chrono::steady_clock::now();
    auto components = page_analysis::recognize_document(document, options.min_confidence);
    auto typography = page_analysis::extract_typography(document, components);
    auto tokens = page_analysis::extract_design_tokens(document);
    auto hierarchy = page_layout::build_hierarchy(document, components);

    ConversionResult result = convert(hierarchy, typography, tokens, options);
    result.components = std::move(components);

    std::vector<const page_model::RecognitionResult*> recognitions;
    recognitions.reserve(result.components.size());
    for (const auto& c : result.components)
        recognitions.push_back(&c.recognition);
    count_components(result.stats, recognitions);
    finish(result);
    result.stats.conversion_time_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    return result;
}

ConversionResult convert_page(const page_model::DomDocument& document, const page_model::ConversionOptions& options) {
    const auto started = std::chrono::steady_clock::now();
    ConversionResult result = convert_page(page_analysis::analyze_document(document), options);
    result.stats.conversion_time_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    return result;
}

nlohmann::json export_json(const ExportData& data) {
    return std::visit([](const auto& doc) { return to_json(doc); }, data);
}

std::string export_text(const ExportData& data) {
    return std::visit(overloaded{
                          [](const GutenbergDocument& doc) { return serialize_blocks(doc); },
                          [](const DiviLayout& layout) { return serialize_shortcodes(layout); },
                          [](const auto& doc) { return to_json(doc).dump(2); },
                      },
        data);
}

nlohmann::json to_json(const page_model::ValidationResult& v) {
    json errors = json::array();
    for (const auto& e : v.errors)
        errors.push_back(validation_issue_json(e));
    json warnings = json::array();
    for (const auto& w : v.warnings)
        warnings.push_back(validation_issue_json(w));

    json out = { { "isValid", v.is_valid }, { "errors", errors }, { "warnings", warnings },
        { "suggestions", v.suggestions }, { "canExport", v.can_export }, { "requiresOverride", v.requires_override } };
    if (v.overall_score) out["overallScore"] = *v.overall_score;

    json visual = json::array();
    for (const auto& c : v.visual_comparisons) {
        json discrepancies = json::array();
        for (const auto& d : c.style_discrepancies)
            discrepancies.push_back({ { "selector", d.selector }, { "property", d.property },
                { "originalValue", d.original_value }, { "convertedValue", d.converted_value },
                { "severity", std::string(page_model::to_string(d.severity)) } });
        visual.push_back({ { "viewport", { { "name", c.viewport.name }, { "width", c.viewport.width }, { "height", c.viewport.height } } },
            { "similarityScore", c.similarity_score }, { "pixelDifference", c.pixel_difference },
            { "totalPixels", c.total_pixels }, { "diffPercentage", c.diff_percentage },
            { "dimensionsMatch", c.dimensions_match }, { "missingElements", c.missing_elements },
            { "extraElements", c.extra_elements }, { "styleDiscrepancies", discrepancies } });
    }
    if (!visual.empty()) out["visualComparisons"] = visual;

    if (v.asset_verification) {
        const auto& a = *v.asset_verification;
        json missing = json::array();
        for (const auto& m : a.missing_assets)
            missing.push_back({ { "type", std::string(page_model::to_string(m.type)) }, { "url", m.url }, { "usedIn", m.used_in },
                { "severity", std::string(page_model::to_string(m.severity)) }, { "suggestion", m.suggestion } });
        json broken = json::array();
        for (const auto& b : a.broken_assets) {
            json entry = { { "type", std::string(page_model::to_string(b.type)) }, { "url", b.url }, { "error", b.error },
                { "usedIn", b.used_in } };
            if (b.status_code) entry["statusCode"] = *b.status_code;
            broken.push_back(entry);
        }
        out["assetVerification"] = { { "totalAssets", a.total_assets }, { "verifiedAssets", a.verified_assets },
            { "missingAssets", missing }, { "brokenAssets", broken }, { "images", asset_status_json(a.images) },
            { "fonts", asset_status_json(a.fonts) }, { "videos", asset_status_json(a.videos) },
            { "stylesheets", asset_status_json(a.stylesheets) }, { "scripts", asset_status_json(a.scripts) },
            { "verificationScore", a.verification_score } };
    }

    if (v.custom_code) {
        const auto& c = *v.custom_code;
        json code_warnings = json::array();
        for (const auto& w : c.warnings)
            code_warnings.push_back({ { "type", w.type }, { "severity", std::string(page_model::to_string(w.severity)) },
                { "message", w.message }, { "suggestion", w.suggestion }, { "canAutoFix", w.can_auto_fix } });
        json features = json::array();
        for (const auto& f : c.features)
            features.push_back({ { "type", f.type }, { "feature", f.feature }, { "description", f.description },
                { "isSupported", f.is_supported }, { "alternative", f.alternative } });
        json incompatibilities = json::array();
        for (const auto& i : c.incompatibilities)
            incompatibilities.push_back({ { "type", i.type }, { "name", i.name }, { "reason", i.reason },
                { "impact", std::string(page_model::to_string(i.impact)) }, { "workaround", i.workaround } });
        out["customCode"] = { { "hasCustomJS", c.has_custom_js }, { "hasCustomCSS", c.has_custom_css },
            { "canBeConverted", c.can_be_converted }, { "warnings", code_warnings }, { "features", features },
            { "incompatibilities", incompatibilities }, { "conversionScore", c.conversion_score } };
    }
    return out;
}

nlohmann::json to_json(const ConversionResult& result) {
    json components = json::array();
    for (const auto& c : result.components) {
        json entry = { { "elementId", c.element_id }, { "tag", c.tag_name },
            { "componentType", std::string(page_model::to_string(c.component_type)) },
            { "confidence", c.recognition.confidence }, { "matchedPatterns", c.recognition.matched_patterns },
            { "manualReviewNeeded", c.recognition.manual_review_needed }, { "reason", c.recognition.reason } };
        if (c.recognition.fallback_type)
            entry["fallbackType"] = std::string(page_model::to_string(*c.recognition.fallback_type));
        components.push_back(entry);
    }

    json fallbacks = json::array();
    for (const auto& f : result.fallbacks) {
        json entry = { { "type", std::string(page_model::to_string(f.kind)) }, { "elementId", f.element_id },
            { "reason", f.reason }, { "originalHtml", f.original_html }, { "suggestions", f.suggestions } };
        if (f.alternative_type) entry["alternativeType"] = std::string(page_model::to_string(*f.alternative_type));
        fallbacks.push_back(entry);
    }

    json traces = json::array();
    for (const auto& t : result.traces)
        traces.push_back({ { "elementId", t.element_id }, { "targetNodeId", t.target_node_id }, { "fallback", t.fallback },
            { "merged", t.merged } });

    json sections = json::array();
    for (const auto& section : result.hierarchy.sections)
        sections.push_back(hierarchy_node_json(section));

    const auto& s = result.stats;
    return { { "targetBuilder", std::string(page_model::to_string(result.target)) },
        { "exportData", export_json(result.export_data) },
        { "components", components },
        { "hierarchy", { { "title", result.hierarchy.title }, { "sections", sections } } },
        { "typography", typography_json(result.typography) },
        { "designTokens", tokens_json(result.tokens) },
        { "fallbacks", fallbacks },
        { "validation", to_json(result.validation) },
        { "stats", { { "totalElements", s.total_elements }, { "recognizedComponents", s.recognized_components },
                       { "nativeWidgets", s.native_widgets }, { "htmlFallbacks", s.html_fallbacks },
                       { "manualReview", s.manual_review }, { "confidenceAverage", s.confidence_average },
                       { "conversionTimeMs", s.conversion_time_ms } } },
        { "traces", traces },
        { "manualReviewNeeded", result.manual_review_needed } };
}

} // namespace page_export
