#pragma once

#include <page_model/conversion.hpp>
#include <page_model/design_tokens.hpp>
#include <page_model/hierarchy.hpp>
#include <page_model/typography.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace page_export {

// Inputs shared by every target converter.
struct ExportInputs {
    const page_model::ComponentHierarchy& hierarchy;
    const page_model::TypographySystem& typography;
    const page_model::DesignTokens& tokens;
    const page_model::ConversionOptions& options;
};

enum class Route { Native, HtmlFallback };

// Per-conversion bookkeeping: id counter, fallback decisions and element traces.
class EmitContext {
public:
    explicit EmitContext(const page_model::ConversionOptions& options);

    const page_model::ConversionOptions& options() const { return options_; }

    // 1, 2, 3, ... in emission order.
    int next_index() { return ++counter_; }

    // Decides how a widget node is emitted and records the matching strategy.
    Route route_widget(const page_model::HierarchyNode& node);
    // Layout nodes are always native; low confidence and ambiguous columns are flagged for review.
    void review_layout(const page_model::HierarchyNode& node);
    // Known type without a dedicated target element; `generic` names what was emitted instead.
    void mapping_gap(const page_model::HierarchyNode& node, std::string_view generic);

    void trace(const page_model::HierarchyNode& node, const std::string& target_id, bool fallback = false);
    // Node folded into its enclosing target node.
    void trace_merged(const page_model::HierarchyNode& node, const std::string& enclosing_id);
    void trace_element(const std::string& element_id, const std::string& target_id, bool merged);

    int native_widgets() const { return native_widgets_; }
    const std::vector<page_model::FallbackStrategy>& fallbacks() const { return fallbacks_; }
    const std::vector<page_model::ElementTrace>& traces() const { return traces_; }

private:
    void manual_review(const page_model::HierarchyNode& node, std::string reason);

    const page_model::ConversionOptions& options_;
    int counter_ = 0;
    int native_widgets_ = 0;
    std::vector<page_model::FallbackStrategy> fallbacks_;
    std::vector<page_model::ElementTrace> traces_;
};

// Id the export document itself uses in traces.
inline constexpr const char* document_node_id = "document";

} // namespace page_export
