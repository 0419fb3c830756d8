#pragma once

#include <page_model/element.hpp>
#include <page_model/hierarchy.hpp>
#include <page_model/recognition.hpp>
#include <optional>
#include <vector>

namespace page_layout {

struct ColumnHint {
    bool column_like = false;
    // Percentage of the row when the element states one.
    std::optional<double> size;
};

// Column signals of `child` as a child of `parent`. `parent_is_row` is set when the parent
// was recognized as a row or grid.
ColumnHint column_hint(const page_model::AnalyzedElement& child, const page_model::AnalyzedElement& parent,
    bool parent_is_row);

// Fills unknown sizes with equal shares of the remaining width. Returns nullopt when the
// sizes cannot describe a single row (overshoot beyond tolerance, no width left).
std::optional<std::vector<double>> resolve_column_sizes(const std::vector<std::optional<double>>& sizes);

page_model::ComponentProps extract_props(const page_model::AnalyzedElement& element, page_model::ComponentType type);

// `components` is indexed by element index.
page_model::ComponentHierarchy build_hierarchy(const page_model::AnalyzedDocument& document,
    const std::vector<page_model::RecognizedComponent>& components);

} // namespace page_layout
