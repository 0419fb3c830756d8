#pragma once

#include <page_model/element.hpp>
#include <page_model/recognition.hpp>
#include <regex>
#include <string>
#include <variant>
#include <vector>

namespace page_analysis {

// Bumped whenever a pattern is added, removed or re-weighted.
inline constexpr int pattern_table_version = 1;

struct TagIs {
    std::vector<std::string> tags;
};

// Case-insensitive substring match against any class.
struct ClassHas {
    std::vector<std::string> keywords;
};

struct StyleCheck {
    bool (*test)(const page_model::ExtractedStyles&);
};

// Searched in the element's text content.
struct ContentMatches {
    std::regex pattern;
};

struct ChildShape {
    bool (*test)(const page_model::AnalyzedElement&);
};

// Attribute present and, when values is non-empty, equal (case-insensitive) to one of them.
struct AttributeIs {
    std::string name;
    std::vector<std::string> values;
};

struct AriaRoleIs {
    std::string role;
};

enum class ContextFlag { Hero, Form, Card, Nav, Header, Footer, Section };

struct ContextRequires {
    ContextFlag flag;
    bool value = true;
};

using Predicate = std::variant<TagIs, ClassHas, StyleCheck, ContentMatches, ChildShape, AttributeIs,
    AriaRoleIs, ContextRequires>;

struct RecognitionPattern {
    // "<type>.<variant>", e.g. "button.tag"
    std::string id;
    page_model::ComponentType type = page_model::ComponentType::Unknown;
    std::vector<Predicate> predicates;
    int confidence = 0;
    int priority = 0;
};

// Sorted by descending priority; equal priorities keep declaration order.
const std::vector<RecognitionPattern>& pattern_table();

bool matches(const RecognitionPattern& pattern, const page_model::AnalyzedElement& element,
    const page_model::ElementContext& context);

page_model::RecognitionResult recognize(const page_model::AnalyzedElement& element,
    const page_model::ElementContext& context, int min_confidence);

// One entry per element, in pre-order (entry i belongs to element index i).
std::vector<page_model::RecognizedComponent> recognize_document(const page_model::AnalyzedDocument& document,
    int min_confidence);

} // namespace page_analysis
