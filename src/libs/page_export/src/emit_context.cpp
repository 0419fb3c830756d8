#include <page_export/emit_context.hpp>
#include <page_model/logging.hpp>

namespace page_export {

EmitContext::EmitContext(const page_model::ConversionOptions& options)
    : options_(options)
{
}

Route EmitContext::route_widget(const page_model::HierarchyNode& node) {
    const auto type_name = std::string(page_model::to_string(node.component_type));

    if (node.component_type == page_model::ComponentType::Unknown) {
        page_model::FallbackStrategy f;
        f.kind = page_model::FallbackKind::HtmlWidget;
        f.element_id = node.element_id;
        f.reason = "Unrecognized <" + node.tag_name + "> element";
        f.original_html = node.original_html;
        f.suggestions = { "Check the embedded HTML renders as expected",
            "Rebuild the element with native widgets if it needs editing" };
        page_model::conversion_logger()->warn("{} <{}>: unrecognized, kept as HTML", node.element_id, node.tag_name);
        fallbacks_.push_back(std::move(f));
        return Route::HtmlFallback;
    }

    if (node.confidence() < options_.min_confidence) {
        if (!options_.fallback_to_html) {
            manual_review(node, "Confidence " + std::to_string(node.confidence()) + " below minimum "
                + std::to_string(options_.min_confidence) + " for " + type_name);
            ++native_widgets_;
            return Route::Native;
        }
        page_model::FallbackStrategy f;
        f.kind = page_model::FallbackKind::HtmlWidget;
        f.element_id = node.element_id;
        f.reason = "Confidence " + std::to_string(node.confidence()) + " below minimum "
            + std::to_string(options_.min_confidence);
        f.original_html = node.original_html;
        f.suggestions = { "Replace with a native " + type_name + " widget after review" };
        f.alternative_type = node.component_type;
        page_model::conversion_logger()->warn("{} <{}>: {} confidence {} below {}, kept as HTML",
            node.element_id, node.tag_name, type_name, node.confidence(), options_.min_confidence);
        fallbacks_.push_back(std::move(f));
        return Route::HtmlFallback;
    }

    ++native_widgets_;
    return Route::Native;
}

void EmitContext::review_layout(const page_model::HierarchyNode& node) {
    if (node.layout_review_needed) {
        manual_review(node, "Column layout could not be inferred; using a single full-width column");
        return;
    }
    if (!node.element_id.empty() && node.confidence() < options_.min_confidence) {
        manual_review(node, "Layout " + std::string(page_model::to_string(node.component_type)) + " recognized with confidence "
            + std::to_string(node.confidence()));
    }
}

void EmitContext::mapping_gap(const page_model::HierarchyNode& node, std::string_view generic) {
    page_model::FallbackStrategy f;
    f.kind = page_model::FallbackKind::ManualReview;
    f.element_id = node.element_id;
    f.reason = "no explicit mapping for " + std::string(page_model::to_string(node.component_type))
        + " in " + std::string(page_model::to_string(options_.target));
    f.original_html = node.original_html;
    f.suggestions = { "Emitted as generic " + std::string(generic) + "; restyle manually" };
    f.alternative_type = node.component_type;
    page_model::conversion_logger()->debug("{}: {}", node.element_id, f.reason);
    fallbacks_.push_back(std::move(f));
}

void EmitContext::manual_review(const page_model::HierarchyNode& node, std::string reason) {
    page_model::FallbackStrategy f;
    f.kind = page_model::FallbackKind::ManualReview;
    f.element_id = node.element_id;
    f.reason = std::move(reason);
    f.original_html = node.original_html;
    f.suggestions = { "Review the converted node against the source page" };
    page_model::conversion_logger()->warn("{}: {}", node.element_id.empty() ? node.id : node.element_id, f.reason);
    fallbacks_.push_back(std::move(f));
}

void EmitContext::trace(const page_model::HierarchyNode& node, const std::string& target_id, bool fallback) {
    for (const auto& element_id : node.covered_element_ids)
        traces_.push_back({ element_id, target_id, fallback, false });
}

void EmitContext::trace_merged(const page_model::HierarchyNode& node, const std::string& enclosing_id) {
    for (const auto& element_id : node.covered_element_ids)
        traces_.push_back({ element_id, enclosing_id, false, true });
}

void EmitContext::trace_element(const std::string& element_id, const std::string& target_id, bool merged) {
    traces_.push_back({ element_id, target_id, false, merged });
}

} // namespace page_export
