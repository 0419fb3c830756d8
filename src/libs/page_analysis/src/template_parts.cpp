#include <page_analysis/template_parts.hpp>
#include <page_model/logging.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <functional>
#include <iterator>

namespace page_analysis {

namespace {

using page_model::AnalyzedElement;
using page_model::ComponentType;

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

bool any_child(const AnalyzedElement& element, const std::function<bool(const AnalyzedElement&)>& test) {
    return std::any_of(element.children.begin(), element.children.end(), test);
}

bool has_nav_child(const AnalyzedElement& element) {
    return any_child(element, [](const AnalyzedElement& c) { return lowercase(c.tag_name) == "nav"; });
}

bool has_copyright_child(const AnalyzedElement& element) {
    return any_child(element, [](const AnalyzedElement& c) {
        const std::string text = lowercase(c.text_content);
        return contains(text, "\xC2\xA9") || contains(text, "copyright") || contains(text, "all rights reserved");
    });
}

bool has_child_class(const AnalyzedElement& element, const char* keyword) {
    return any_child(element, [keyword](const AnalyzedElement& c) { return c.has_class_containing(keyword); });
}

// Element facts the rules read, lowercased once.
struct Traits {
    std::string tag;
    std::string id;
    ComponentType type = ComponentType::Unknown;
    int depth = 0;
};

bool is_header(const AnalyzedElement& e, const Traits& t) {
    if (t.tag == "header") return true;
    if (contains(t.id, "header") || contains(t.id, "masthead")) return true;
    if (e.has_class_containing("site-header") || e.has_class_containing("main-header")) return true;
    if (t.type == ComponentType::Header || t.type == ComponentType::Menu) return true;
    return t.depth <= 2 && has_nav_child(e);
}

int header_confidence(const AnalyzedElement& e, const Traits& t) {
    int confidence = 0;
    if (t.tag == "header") confidence += 40;
    if (contains(t.id, "header")) confidence += 40;
    if (e.has_class_containing("header")) confidence += 30;
    if (has_nav_child(e)) confidence += 20;
    if (e.styles.position == "fixed" || e.styles.position == "sticky") confidence += 10;
    if (t.depth <= 1) confidence += 10;
    return std::min(confidence, 100);
}

bool is_footer(const AnalyzedElement& e, const Traits& t) {
    if (t.tag == "footer") return true;
    if (contains(t.id, "footer") || contains(t.id, "colophon")) return true;
    if (e.has_class_containing("site-footer") || e.has_class_containing("main-footer")) return true;
    if (t.type == ComponentType::Footer) return true;
    return has_copyright_child(e);
}

int footer_confidence(const AnalyzedElement& e, const Traits& t) {
    int confidence = 0;
    if (t.tag == "footer") confidence += 40;
    if (contains(t.id, "footer")) confidence += 40;
    if (e.has_class_containing("footer")) confidence += 30;
    const std::string text = lowercase(e.text_content);
    if (contains(text, "\xC2\xA9") || contains(text, "copyright")) confidence += 20;
    if (has_child_class(e, "social")) confidence += 10;
    if (t.depth <= 2) confidence += 10;
    return std::min(confidence, 100);
}

bool is_sidebar(const AnalyzedElement& e, const Traits& t) {
    if (t.tag == "aside") return true;
    if (contains(t.id, "sidebar") || contains(t.id, "aside")) return true;
    if (e.has_class_containing("sidebar") || e.has_class_containing("aside")) return true;
    if (t.type == ComponentType::Sidebar) return true;
    return has_child_class(e, "widget");
}

int sidebar_confidence(const AnalyzedElement& e, const Traits& t) {
    int confidence = 0;
    if (t.tag == "aside") confidence += 40;
    if (contains(t.id, "sidebar")) confidence += 40;
    if (e.has_class_containing("sidebar")) confidence += 30;
    if (has_child_class(e, "widget")) confidence += 20;
    return std::min(confidence, 100);
}

TemplatePosition position_of(const AnalyzedElement& e, const Traits& t) {
    TemplatePosition p;
    p.sticky = e.styles.position == "fixed" || e.styles.position == "sticky";
    if (t.depth <= 1) {
        p.top = t.tag == "header";
        p.bottom = t.tag == "footer";
    }
    return p;
}

struct Rule {
    TemplatePartKind kind;
    const char* name;
    bool (*matches)(const AnalyzedElement&, const Traits&);
    int (*confidence)(const AnalyzedElement&, const Traits&);
};

const Rule rules[] = {
    { TemplatePartKind::Header, "Site Header", is_header, header_confidence },
    { TemplatePartKind::Footer, "Site Footer", is_footer, footer_confidence },
    { TemplatePartKind::Sidebar, "Sidebar", is_sidebar, sidebar_confidence },
};

// Candidates per rule, in first-seen order.
using Candidates = std::vector<TemplatePart>;

void add_occurrence(Candidates& candidates, const Rule& rule, const AnalyzedElement& e, const Traits& t,
    const std::string& page_id)
{
    const std::string signature = template_part_signature(e);
    auto it = std::find_if(candidates.begin(), candidates.end(),
        [&](const TemplatePart& p) { return p.signature == signature; });
    if (it == candidates.end()) {
        TemplatePart part;
        part.kind = rule.kind;
        part.name = rule.name;
        part.signature = signature;
        part.html = e.outer_html;
        part.element_id = e.id;
        part.confidence = rule.confidence(e, t);
        part.position = position_of(e, t);
        candidates.push_back(std::move(part));
        it = std::prev(candidates.end());
    }
    if (std::find(it->page_ids.begin(), it->page_ids.end(), page_id) == it->page_ids.end())
        it->page_ids.push_back(page_id);
}

// Nested matches (a nav inside a header) become weaker candidates of their own; scoring picks the part.
void scan(const AnalyzedElement& e, const TemplatePage& page, std::vector<Candidates>& found) {
    Traits t;
    t.tag = lowercase(e.tag_name);
    t.id = lowercase(e.html_id);
    t.depth = e.context.depth;
    if (e.index < page.components->size()) t.type = (*page.components)[e.index].component_type;

    for (std::size_t r = 0; r < std::size(rules); ++r) {
        if (rules[r].matches(e, t)) add_occurrence(found[r], rules[r], e, t, page.page_id);
    }
    for (const auto& child : e.children)
        scan(child, page, found);
}

std::optional<TemplatePart> select_best(Candidates& candidates, std::size_t total_pages) {
    if (candidates.empty()) return std::nullopt;
    auto score = [](const TemplatePart& p) { return static_cast<int>(p.page_ids.size()) * 10 + p.confidence; };
    auto best = std::max_element(candidates.begin(), candidates.end(),
        [&](const TemplatePart& a, const TemplatePart& b) { return score(a) < score(b); });
    best->recurring = static_cast<double>(best->page_ids.size()) >= static_cast<double>(total_pages) * 0.5;
    return *best;
}

bool present(const std::optional<TemplatePart>& part) {
    return part && part->confidence >= template_part_min_confidence;
}

int page_count(const std::optional<TemplatePart>& part) {
    return part ? static_cast<int>(part->page_ids.size()) : 0;
}

} // namespace

std::string_view to_string(TemplatePartKind kind) {
    switch (kind) {
    case TemplatePartKind::Header: return "header";
    case TemplatePartKind::Footer: return "footer";
    case TemplatePartKind::Sidebar: return "sidebar";
    }
    return "header";
}

std::string template_part_signature(const AnalyzedElement& element) {
    std::string classes;
    for (const auto& cls : element.classes) {
        if (!classes.empty()) classes += ' ';
        classes += cls;
    }
    return lowercase(element.tag_name) + "::" + element.html_id + "::" + classes + "::"
        + std::to_string(element.children.size());
}

TemplateParts detect_template_parts(const std::vector<TemplatePage>& pages) {
    std::vector<Candidates> found(std::size(rules));
    for (const auto& page : pages) {
        if (!page.document || !page.components) continue;
        // The page root itself is never a part.
        for (const auto& child : page.document->root.children)
            scan(child, page, found);
    }

    TemplateParts out;
    out.header = select_best(found[0], pages.size());
    out.footer = select_best(found[1], pages.size());
    out.sidebar = select_best(found[2], pages.size());

    auto& stats = out.statistics;
    stats.has_header = present(out.header);
    stats.has_footer = present(out.footer);
    stats.has_sidebar = present(out.sidebar);
    stats.header_pages = page_count(out.header);
    stats.footer_pages = page_count(out.footer);
    stats.sidebar_pages = page_count(out.sidebar);
    if (!pages.empty()) {
        const double total = static_cast<double>(pages.size());
        double consistency = 0;
        if (stats.has_header) consistency += stats.header_pages / total * 33.33;
        if (stats.has_footer) consistency += stats.footer_pages / total * 33.33;
        if (stats.has_sidebar) consistency += stats.sidebar_pages / total * 33.33;
        stats.consistency = static_cast<int>(std::lround(consistency));
    }

    page_model::conversion_logger()->debug("Template parts over {} pages: header={} footer={} sidebar={} consistency={}",
        pages.size(), stats.header_pages, stats.footer_pages, stats.sidebar_pages, stats.consistency);
    return out;
}

} // namespace page_analysis
