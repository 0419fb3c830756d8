#pragma once

#include <page_model/component_type.hpp>
#include <optional>
#include <string>
#include <vector>

namespace page_model {

inline constexpr int manual_review_threshold = 70;

struct RecognitionResult {
    ComponentType component_type = ComponentType::Unknown;
    int confidence = 0;
    std::vector<std::string> matched_patterns;
    std::optional<ComponentType> fallback_type;
    bool manual_review_needed = true;
    std::string reason;
};

// One entry per analyzed element, indexed by AnalyzedElement::index.
struct RecognizedComponent {
    std::string element_id;
    std::string tag_name;
    ComponentType component_type = ComponentType::Unknown;
    RecognitionResult recognition;
};

} // namespace page_model
