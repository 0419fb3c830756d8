#pragma once

#include <page_model/dom.hpp>
#include <page_model/element.hpp>
#include <page_model/styles.hpp>

namespace page_analysis {

// Throws std::invalid_argument for a null root, a text root, or an element without a tag name.
page_model::AnalyzedElement analyze_tree(const page_model::DomNode* root);
page_model::AnalyzedDocument analyze_document(const page_model::DomDocument& document);

page_model::ExtractedStyles extract_styles(const page_model::StyleMap& declarations);

} // namespace page_analysis
