#pragma once

#include <page_model/element.hpp>
#include <page_model/recognition.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace page_analysis {

enum class TemplatePartKind { Header, Footer, Sidebar };

std::string_view to_string(TemplatePartKind kind);

struct TemplatePosition {
    bool top = false;
    bool bottom = false;
    bool sticky = false;
};

// A site-wide region found on one or more pages. Occurrences are grouped by signature
// (tag, id, classes and child count).
struct TemplatePart {
    TemplatePartKind kind = TemplatePartKind::Header;
    std::string name;
    std::string signature;
    // Markup and element id of the first occurrence.
    std::string html;
    std::string element_id;
    // 0-100
    int confidence = 0;
    TemplatePosition position;
    // Seen on at least half of the pages.
    bool recurring = false;
    std::vector<std::string> page_ids;
};

struct TemplatePartStatistics {
    bool has_header = false;
    bool has_footer = false;
    bool has_sidebar = false;
    int header_pages = 0;
    int footer_pages = 0;
    int sidebar_pages = 0;
    // 0-100
    int consistency = 0;
};

struct TemplateParts {
    std::optional<TemplatePart> header;
    std::optional<TemplatePart> footer;
    std::optional<TemplatePart> sidebar;
    TemplatePartStatistics statistics;
};

struct TemplatePage {
    std::string page_id;
    const page_model::AnalyzedDocument* document = nullptr;
    // Indexed by element index, as returned by recognize_document.
    const std::vector<page_model::RecognizedComponent>* components = nullptr;
};

// Parts below this confidence do not count as present in the statistics.
inline constexpr int template_part_min_confidence = 60;

std::string template_part_signature(const page_model::AnalyzedElement& element);

TemplateParts detect_template_parts(const std::vector<TemplatePage>& pages);

} // namespace page_analysis
