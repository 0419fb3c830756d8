#include <page_analysis/recognizer.hpp>
#include <page_analysis/css_values.hpp>
#include <page_model/logging.hpp>
#include <algorithm>
#include <cctype>

namespace page_analysis {

namespace {

using page_model::AnalyzedElement;
using page_model::ComponentType;
using page_model::ElementContext;
using page_model::ExtractedStyles;

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_heading_tag(const std::string& tag) {
    return tag.size() == 2 && tag[0] == 'h' && tag[1] >= '1' && tag[1] <= '6';
}

template <typename Pred>
bool any_descendant(const AnalyzedElement& element, Pred&& pred) {
    for (const auto& child : element.children) {
        if (pred(child) || any_descendant(child, pred)) return true;
    }
    return false;
}

template <typename Pred>
int count_descendants_if(const AnalyzedElement& element, Pred&& pred) {
    int n = 0;
    for (const auto& child : element.children) {
        if (pred(child)) ++n;
        n += count_descendants_if(child, pred);
    }
    return n;
}

// child shapes

bool has_children(const AnalyzedElement& e) { return !e.children.empty(); }
bool has_two_children(const AnalyzedElement& e) { return e.children.size() >= 2; }

bool has_heading(const AnalyzedElement& e) {
    return any_descendant(e, [](const AnalyzedElement& d) { return is_heading_tag(d.tag_name); });
}

bool has_image(const AnalyzedElement& e) {
    return any_descendant(e, [](const AnalyzedElement& d) {
        return d.tag_name == "img" || d.tag_name == "picture" || d.tag_name == "svg";
    });
}

bool has_heading_and_image(const AnalyzedElement& e) { return has_heading(e) && has_image(e); }

bool has_heading_and_children(const AnalyzedElement& e) { return has_children(e) && has_heading(e); }

bool has_icon_and_heading(const AnalyzedElement& e) {
    const bool icon = any_descendant(e, [](const AnalyzedElement& d) {
        return d.tag_name == "svg" || d.tag_name == "i" || d.has_class_containing("icon");
    });
    return icon && has_heading(e);
}

bool has_expandable_items(const AnalyzedElement& e) {
    return count_descendants_if(e, [](const AnalyzedElement& d) { return d.attributes.count("aria-expanded") > 0; }) >= 2;
}

bool has_many_images(const AnalyzedElement& e) {
    return count_descendants_if(e, [](const AnalyzedElement& d) { return d.tag_name == "img"; }) >= 4;
}

bool is_empty(const AnalyzedElement& e) { return e.children.empty() && e.text_content.empty(); }

bool is_text_only(const AnalyzedElement& e) { return e.children.empty() && !e.own_text.empty(); }

bool is_short_text_only(const AnalyzedElement& e) { return is_text_only(e) && e.own_text.size() <= 120; }

bool has_column_class(const AnalyzedElement& e) {
    static const std::regex column_re(R"(^(col(-[a-z]{2})?-\d+|col|elementor-col-\d+|wp-block-column|column)$)");
    return std::any_of(e.classes.begin(), e.classes.end(),
        [](const std::string& c) { return std::regex_match(lowercase(c), column_re); });
}

bool has_row_class(const AnalyzedElement& e) {
    return std::any_of(e.classes.begin(), e.classes.end(), [](const std::string& raw) {
        const std::string c = lowercase(raw);
        return c == "row" || c == "elementor-row" || c == "wp-block-columns" || c == "columns";
    });
}

// style checks

bool tall_with_background(const ExtractedStyles& s) {
    const double height = std::max(parse_pixels(s.min_height), parse_pixels(s.height));
    return height >= 400 && (!s.background_color.empty() || !s.background_image.empty());
}

bool floats_over_page(const ExtractedStyles& s) { return s.position == "fixed" || s.position == "absolute"; }

bool grid_or_flex(const ExtractedStyles& s) {
    return s.display == "grid" || s.display == "inline-grid" || s.display == "flex";
}

bool is_grid(const ExtractedStyles& s) { return s.display == "grid" || s.display == "inline-grid"; }

bool has_height(const ExtractedStyles& s) { return parse_pixels(s.height) > 0 || parse_pixels(s.min_height) > 0; }

// predicate evaluation

bool eval(const TagIs& p, const AnalyzedElement& e, const ElementContext&) {
    return std::find(p.tags.begin(), p.tags.end(), e.tag_name) != p.tags.end();
}

bool eval(const ClassHas& p, const AnalyzedElement& e, const ElementContext&) {
    for (const auto& raw : e.classes) {
        const std::string c = lowercase(raw);
        for (const auto& keyword : p.keywords)
            if (c.find(keyword) != std::string::npos) return true;
    }
    return false;
}

bool eval(const StyleCheck& p, const AnalyzedElement& e, const ElementContext&) { return p.test(e.styles); }

bool eval(const ContentMatches& p, const AnalyzedElement& e, const ElementContext&) {
    return std::regex_search(e.text_content, p.pattern);
}

bool eval(const ChildShape& p, const AnalyzedElement& e, const ElementContext&) { return p.test(e); }

bool eval(const AttributeIs& p, const AnalyzedElement& e, const ElementContext&) {
    auto it = e.attributes.find(p.name);
    if (it == e.attributes.end()) return false;
    if (p.values.empty()) return true;
    const std::string value = lowercase(it->second);
    return std::find(p.values.begin(), p.values.end(), value) != p.values.end();
}

bool eval(const AriaRoleIs& p, const AnalyzedElement& e, const ElementContext&) {
    return lowercase(e.attribute_or("role")) == p.role;
}

bool eval(const ContextRequires& p, const AnalyzedElement&, const ElementContext& ctx) {
    bool flag = false;
    switch (p.flag) {
    case ContextFlag::Hero: flag = ctx.inside_hero; break;
    case ContextFlag::Form: flag = ctx.inside_form; break;
    case ContextFlag::Card: flag = ctx.inside_card; break;
    case ContextFlag::Nav: flag = ctx.inside_nav; break;
    case ContextFlag::Header: flag = ctx.inside_header; break;
    case ContextFlag::Footer: flag = ctx.inside_footer; break;
    case ContextFlag::Section: flag = ctx.inside_section; break;
    }
    return flag == p.value;
}

RecognitionPattern pattern(std::string id, ComponentType type, int confidence, int priority,
    std::vector<Predicate> predicates)
{
    return RecognitionPattern{ std::move(id), type, std::move(predicates), confidence, priority };
}

ContentMatches content(const char* re) {
    return ContentMatches{ std::regex(re, std::regex::icase) };
}

std::vector<RecognitionPattern> build_pattern_table() {
    using T = ComponentType;
    const TagIs block_tags{ { "div", "section", "article", "aside", "li" } };
    const char* price_re = R"((\$|€|£|¥)\s?\d|\d+(\.\d+)?\s?(usd|eur|gbp))";

    std::vector<RecognitionPattern> table = {
        // page regions
        pattern("header.tag", T::Header, 95, 100, { TagIs{ { "header" } } }),
        pattern("footer.tag", T::Footer, 95, 100, { TagIs{ { "footer" } } }),
        pattern("header.class", T::Header, 85, 95, { TagIs{ { "div", "section" } }, ClassHas{ { "site-header", "page-header", "masthead" } } }),
        pattern("footer.class", T::Footer, 85, 95, { TagIs{ { "div", "section" } }, ClassHas{ { "site-footer", "page-footer" } } }),
        pattern("hero.class", T::Hero, 90, 98, { TagIs{ { "section", "div", "header" } }, ClassHas{ { "hero", "banner", "jumbotron" } }, ChildShape{ has_heading } }),
        pattern("hero.style", T::Hero, 75, 96, { TagIs{ { "section", "div" } }, StyleCheck{ tall_with_background }, ChildShape{ has_heading } }),
        pattern("breadcrumbs.aria", T::Breadcrumbs, 95, 96, { AttributeIs{ "aria-label", { "breadcrumb", "breadcrumbs" } } }),
        pattern("modal.role", T::Modal, 95, 95, { AriaRoleIs{ "dialog" } }),
        pattern("menu.nav", T::Menu, 90, 95, { TagIs{ { "nav" } } }),
        pattern("menu.role", T::Menu, 90, 95, { AriaRoleIs{ "navigation" } }),
        pattern("search.role", T::SearchBar, 95, 94, { AriaRoleIs{ "search" } }),
        pattern("search.class", T::SearchBar, 90, 93, { TagIs{ { "form", "div" } }, ClassHas{ { "search" } } }),
        pattern("form.tag", T::Form, 95, 92, { TagIs{ { "form" } } }),
        pattern("search.input", T::SearchBar, 90, 91, { TagIs{ { "input" } }, AttributeIs{ "type", { "search" } } }),
        pattern("submit-button.button", T::SubmitButton, 95, 91, { TagIs{ { "button" } }, AttributeIs{ "type", { "submit" } } }),
        pattern("submit-button.input", T::SubmitButton, 95, 91, { TagIs{ { "input" } }, AttributeIs{ "type", { "submit" } } }),
        pattern("sidebar.tag", T::Sidebar, 85, 90, { TagIs{ { "aside" } } }),
        pattern("sidebar.class", T::Sidebar, 85, 90, { TagIs{ { "div", "section" } }, ClassHas{ { "sidebar" } } }),
        pattern("file-upload.input", T::FileUpload, 95, 90, { TagIs{ { "input" } }, AttributeIs{ "type", { "file" } } }),
        pattern("checkbox.input", T::Checkbox, 95, 90, { TagIs{ { "input" } }, AttributeIs{ "type", { "checkbox" } } }),
        pattern("radio.input", T::Radio, 95, 90, { TagIs{ { "input" } }, AttributeIs{ "type", { "radio" } } }),
        pattern("textarea.tag", T::Textarea, 95, 90, { TagIs{ { "textarea" } } }),
        pattern("select.tag", T::Select, 95, 90, { TagIs{ { "select" } } }),
        pattern("tabs.role", T::Tabs, 95, 90, { AriaRoleIs{ "tablist" } }),

        // content blocks
        pattern("blog-card.class", T::BlogCard, 90, 88, { block_tags, ClassHas{ { "post-card", "blog-card", "blog-post", "article-card" } } }),
        pattern("product-card.class", T::ProductCard, 90, 88, { block_tags, ClassHas{ { "product" } }, content(price_re) }),
        pattern("pricing-table.class", T::PricingTable, 90, 88, { block_tags, ClassHas{ { "pricing", "price-table", "plan" } },
            content(R"((\$|€|£|¥)\s?\d|/\s?(mo|month|yr|year)\b)") }),
        pattern("progress-bar.tag", T::ProgressBar, 95, 88, { TagIs{ { "progress" } } }),
        pattern("progress-bar.role", T::ProgressBar, 95, 88, { AriaRoleIs{ "progressbar" } }),
        pattern("breadcrumbs.class", T::Breadcrumbs, 95, 88, { TagIs{ { "nav", "div", "ol", "ul" } }, ClassHas{ { "breadcrumb" } } }),
        pattern("pagination.class", T::Pagination, 95, 88, { TagIs{ { "nav", "div", "ul" } }, ClassHas{ { "pagination", "pager" } } }),
        pattern("testimonial.class", T::Testimonial, 90, 87, { TagIs{ { "div", "section", "article", "blockquote", "figure" } }, ClassHas{ { "testimonial", "review", "quote-card" } } }),
        pattern("team-member.class", T::TeamMember, 85, 86, { block_tags, ClassHas{ { "team-member", "team-card", "member", "staff" } } }),
        pattern("icon-box.class", T::IconBox, 90, 86, { block_tags, ClassHas{ { "icon-box", "iconbox" } } }),
        pattern("cta.class", T::Cta, 90, 86, { TagIs{ { "div", "section", "aside" } }, ClassHas{ { "cta", "call-to-action" } } }),
        pattern("tabs.class", T::Tabs, 90, 86, { TagIs{ { "div", "section", "ul" } }, ClassHas{ { "tabs", "tab-container" } }, ChildShape{ has_children } }),
        pattern("carousel.class", T::Carousel, 90, 86, { TagIs{ { "div", "section", "ul" } }, ClassHas{ { "carousel", "swiper", "slick" } } }),
        pattern("accordion.class", T::Accordion, 90, 85, { TagIs{ { "div", "section", "dl" } }, ClassHas{ { "accordion", "faq-list", "collapse-group" } }, ChildShape{ has_two_children } }),
        pattern("slider.class", T::Slider, 85, 85, { TagIs{ { "div", "section", "ul" } }, ClassHas{ { "slider", "slideshow" } } }),
        pattern("modal.class", T::Modal, 85, 85, { TagIs{ { "div", "section" } }, ClassHas{ { "modal", "popup", "lightbox" } }, StyleCheck{ floats_over_page } }),
        pattern("countdown.class", T::Countdown, 90, 85, { TagIs{ { "div", "section", "span" } }, ClassHas{ { "countdown", "timer" } } }),
        pattern("section.tag", T::Section, 90, 85, { TagIs{ { "section" } } }),
        pattern("social-share.class", T::SocialShare, 85, 84, { TagIs{ { "div", "ul", "nav" } }, ClassHas{ { "share", "social-share" } } }),
        pattern("accordion.expandable", T::Accordion, 85, 84, { TagIs{ { "div", "section", "dl" } }, ChildShape{ has_expandable_items } }),
        pattern("section.class", T::Section, 75, 84, { TagIs{ { "div" } }, ClassHas{ { "section" } }, ChildShape{ has_children } }),
        pattern("accordion.details", T::Accordion, 85, 83, { TagIs{ { "details" } } }),
        pattern("row.class", T::Row, 85, 83, { TagIs{ { "div", "section" } }, ChildShape{ has_row_class } }),
        pattern("column.class", T::Column, 85, 83, { TagIs{ { "div", "section", "article", "aside" } }, ChildShape{ has_column_class } }),
        pattern("feature-box.class", T::FeatureBox, 80, 82, { block_tags, ClassHas{ { "feature" } }, ChildShape{ has_heading } }),
        pattern("video.youtube", T::Video, 95, 82, { TagIs{ { "iframe" } }, AttributeIs{ "src" }, ChildShape{ [](const AnalyzedElement& e) {
            const std::string src = lowercase(e.attribute_or("src"));
            return src.find("youtube") != std::string::npos || src.find("vimeo") != std::string::npos;
        } } }),
        pattern("google-maps.iframe", T::GoogleMaps, 95, 82, { TagIs{ { "iframe" } }, ChildShape{ [](const AnalyzedElement& e) {
            const std::string src = lowercase(e.attribute_or("src"));
            return src.find("google.com/maps") != std::string::npos || src.find("maps.google") != std::string::npos;
        } } }),
        pattern("gallery.class", T::Gallery, 85, 82, { TagIs{ { "div", "section", "ul", "figure" } }, ClassHas{ { "gallery", "masonry", "lightbox-grid" } } }),
        pattern("card.class", T::Card, 85, 80, { block_tags, ClassHas{ { "card", "tile" } }, ChildShape{ has_children } }),
        pattern("table.tag", T::Table, 95, 80, { TagIs{ { "table" } } }),
        pattern("video.tag", T::Video, 95, 80, { TagIs{ { "video" } } }),
        pattern("google-maps.class", T::GoogleMaps, 85, 80, { TagIs{ { "div" } }, ClassHas{ { "map" } } }),
        pattern("social-feed.class", T::SocialFeed, 85, 80, { TagIs{ { "div", "section", "ul" } }, ClassHas{ { "instagram", "social-feed", "twitter-feed", "feed" } } }),
        pattern("icon-box.shape", T::IconBox, 75, 79, { TagIs{ { "div", "li" } }, ChildShape{ has_icon_and_heading } }),
        pattern("blog-card.article", T::BlogCard, 80, 78, { TagIs{ { "article" } }, ChildShape{ has_heading_and_image } }),
        pattern("blockquote.tag", T::Blockquote, 95, 78, { TagIs{ { "blockquote" } } }),
        pattern("code-block.tag", T::CodeBlock, 95, 78, { TagIs{ { "pre" } } }),
        pattern("grid.style", T::Grid, 75, 76, { TagIs{ { "div", "section", "ul" } }, StyleCheck{ is_grid }, ChildShape{ has_two_children } }),
        pattern("gallery.images", T::Gallery, 80, 75, { TagIs{ { "div", "section", "ul" } }, StyleCheck{ grid_or_flex }, ChildShape{ has_many_images } }),
        pattern("heading.tag", T::Heading, 95, 75, { TagIs{ { "h1", "h2", "h3", "h4", "h5", "h6" } } }),
        pattern("countdown.content", T::Countdown, 80, 74, { TagIs{ { "div" } }, content(R"(\b\d{1,2}\s*:\s*\d{2}\s*:\s*\d{2}\b)") }),
        pattern("menu.nav-list", T::Menu, 88, 72, { TagIs{ { "ul", "ol" } }, ContextRequires{ ContextFlag::Nav } }),

        // basic widgets
        pattern("button.tag", T::Button, 95, 70, { TagIs{ { "button" } } }),
        pattern("button.class", T::Button, 90, 70, { TagIs{ { "a" } }, ClassHas{ { "btn", "button" } } }),
        pattern("button.role", T::Button, 90, 70, { AriaRoleIs{ "button" } }),
        pattern("image.tag", T::Image, 95, 70, { TagIs{ { "img", "picture" } } }),
        pattern("divider.tag", T::Divider, 95, 70, { TagIs{ { "hr" } } }),
        pattern("menu.class", T::Menu, 85, 70, { TagIs{ { "ul" } }, ClassHas{ { "menu", "nav" } } }),
        pattern("image.figure", T::Image, 85, 68, { TagIs{ { "figure" } }, ChildShape{ has_image } }),
        pattern("icon.class", T::Icon, 90, 66, { TagIs{ { "i", "span" } }, ClassHas{ { "icon", "fa-", "dashicons", "bi-" } } }),
        pattern("button.style", T::Button, 75, 65, { TagIs{ { "a", "span", "div" } }, StyleCheck{ looks_like_button } }),
        pattern("icon.svg", T::Icon, 80, 64, { TagIs{ { "svg" } } }),
        pattern("input.tag", T::Input, 90, 60, { TagIs{ { "input" } } }),
        pattern("list.tag", T::List, 85, 60, { TagIs{ { "ul", "ol", "dl" } } }),
        pattern("code-block.inline", T::CodeBlock, 85, 60, { TagIs{ { "code" } } }),
        pattern("heading.style", T::Heading, 70, 55, { TagIs{ { "div", "span", "p" } }, StyleCheck{ looks_like_heading }, ChildShape{ is_short_text_only } }),
        pattern("link.tag", T::Link, 85, 50, { TagIs{ { "a" } } }),
        pattern("paragraph.tag", T::Paragraph, 90, 50, { TagIs{ { "p" } } }),
        pattern("spacer.class", T::Spacer, 90, 45, { TagIs{ { "div", "span" } }, ClassHas{ { "spacer", "gap" } }, ChildShape{ is_empty } }),
        pattern("divider.class", T::Divider, 85, 45, { TagIs{ { "div", "span" } }, ClassHas{ { "divider", "separator" } }, ChildShape{ is_empty } }),
        pattern("spacer.empty", T::Spacer, 80, 40, { TagIs{ { "div" } }, StyleCheck{ has_height }, ChildShape{ is_empty } }),
        pattern("text.inline", T::Text, 75, 30, { TagIs{ { "span", "small", "strong", "em", "b", "i", "label", "figcaption", "cite", "address", "time" } } }),
        pattern("text.list-item", T::Text, 75, 28, { TagIs{ { "li", "dt", "dd" } }, ChildShape{ is_text_only } }),
        pattern("text.block", T::Text, 70, 25, { TagIs{ { "div" } }, ChildShape{ is_text_only } }),
        pattern("container.class", T::Container, 80, 20, { block_tags, ClassHas{ { "container", "wrapper", "inner" } }, ChildShape{ has_children } }),
        pattern("container.root", T::Container, 90, 15, { TagIs{ { "body", "html", "main" } } }),
        pattern("container.generic", T::Container, 70, 10, { TagIs{ { "div", "main", "article", "li", "figure", "span" } }, ChildShape{ has_children } }),
    };

    std::stable_sort(table.begin(), table.end(),
        [](const RecognitionPattern& a, const RecognitionPattern& b) { return a.priority > b.priority; });
    return table;
}

} // namespace

const std::vector<RecognitionPattern>& pattern_table() {
    static const std::vector<RecognitionPattern> table = build_pattern_table();
    return table;
}

bool matches(const RecognitionPattern& pattern, const page_model::AnalyzedElement& element,
    const page_model::ElementContext& context)
{
    if (pattern.predicates.empty()) return false;
    return std::all_of(pattern.predicates.begin(), pattern.predicates.end(), [&](const Predicate& predicate) {
        return std::visit([&](const auto& p) { return eval(p, element, context); }, predicate);
    });
}

page_model::RecognitionResult recognize(const page_model::AnalyzedElement& element,
    const page_model::ElementContext& context, int min_confidence)
{
    page_model::RecognitionResult result;
    const RecognitionPattern* winner = nullptr;
    for (const auto& p : pattern_table()) {
        if (!matches(p, element, context)) continue;
        if (!winner) {
            winner = &p;
            result.matched_patterns.insert(result.matched_patterns.begin(), p.id);
        } else {
            result.matched_patterns.push_back(p.id);
        }
    }

    if (!winner) {
        result.component_type = ComponentType::Unknown;
        result.confidence = 0;
        result.manual_review_needed = true;
        result.reason = "No matching pattern found";
        return result;
    }

    result.component_type = winner->type;
    result.confidence = winner->confidence;
    result.manual_review_needed = winner->confidence < page_model::manual_review_threshold;
    result.reason = "Matched " + winner->id;
    if (winner->confidence < min_confidence) {
        result.fallback_type = ComponentType::Unknown;
        result.reason += " below minimum confidence " + std::to_string(min_confidence);
    }
    return result;
}

std::vector<page_model::RecognizedComponent> recognize_document(const page_model::AnalyzedDocument& document,
    int min_confidence)
{
    std::vector<page_model::RecognizedComponent> out;
    out.reserve(document.element_count);
    std::size_t unknown = 0;
    page_model::for_each_element(document.root, [&](const AnalyzedElement& element) {
        page_model::RecognizedComponent rc;
        rc.element_id = element.id;
        rc.tag_name = element.tag_name;
        rc.recognition = recognize(element, element.context, min_confidence);
        rc.component_type = rc.recognition.component_type;
        if (rc.component_type == ComponentType::Unknown) ++unknown;
        out.push_back(std::move(rc));
    });
    page_model::conversion_logger()->debug("Recognized {} elements ({} unknown) with pattern table v{}",
        out.size(), unknown, pattern_table_version);
    return out;
}

} // namespace page_analysis
