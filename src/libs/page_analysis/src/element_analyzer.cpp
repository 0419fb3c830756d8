#include <page_analysis/element_analyzer.hpp>
#include <page_analysis/css_values.hpp>
#include <page_model/logging.hpp>
#include <regex>
#include <set>
#include <stdexcept>

namespace page_analysis {

namespace {

const std::set<std::string> border_styles = {
    "none", "hidden", "solid", "dashed", "dotted", "double", "groove", "ridge", "inset", "outset"
};

std::string get(const page_model::StyleMap& m, const char* key) {
    auto it = m.find(key);
    return it != m.end() ? it->second : "";
}

bool is_zero_length(const std::string& v) {
    static const std::regex zero_re(R"(^\s*-?0*\.?0+\s*(px|em|rem|%)?\s*$)");
    return v.empty() || std::regex_match(v, zero_re);
}

bool is_length(const std::string& v) {
    static const std::regex length_re(R"(^-?[0-9]*\.?[0-9]+(px|em|rem|pt|%)?$)");
    return v == "thin" || v == "medium" || v == "thick" || std::regex_match(v, length_re);
}

std::optional<page_model::BoxSpacing> extract_box(const page_model::StyleMap& m, const std::string& prefix) {
    const std::string shorthand = get(m, prefix.c_str());
    const std::string top = get(m, (prefix + "-top").c_str());
    const std::string right = get(m, (prefix + "-right").c_str());
    const std::string bottom = get(m, (prefix + "-bottom").c_str());
    const std::string left = get(m, (prefix + "-left").c_str());
    if (shorthand.empty() && top.empty() && right.empty() && bottom.empty() && left.empty())
        return std::nullopt;

    page_model::BoxSpacing box = shorthand.empty() ? page_model::BoxSpacing{} : expand_box_shorthand(shorthand);
    if (!top.empty()) box.top = top;
    if (!right.empty()) box.right = right;
    if (!bottom.empty()) box.bottom = bottom;
    if (!left.empty()) box.left = left;
    return box;
}

std::optional<page_model::BorderStyle> extract_border(const page_model::StyleMap& m) {
    page_model::BorderStyle border;
    for (const auto& part : split_css_values(get(m, "border"))) {
        if (border_styles.count(part)) border.style = part;
        else if (is_length(part)) border.width = part;
        else border.color = normalize_color(part);
    }
    if (auto w = get(m, "border-width"); !w.empty()) border.width = w;
    if (auto s = get(m, "border-style"); !s.empty()) border.style = s;
    if (auto c = get(m, "border-color"); !c.empty()) border.color = normalize_color(c);

    if (border.width.empty() && border.style.empty()) return std::nullopt;
    if (border.style == "none" || border.style == "hidden") return std::nullopt;
    if (!border.width.empty() && is_zero_length(border.width)) return std::nullopt;
    return border;
}

std::optional<page_model::BorderRadius> extract_radius(const page_model::StyleMap& m) {
    page_model::BorderRadius r;
    std::string shorthand = get(m, "border-radius");
    shorthand = shorthand.substr(0, shorthand.find('/'));
    const auto parts = split_css_values(shorthand);
    switch (parts.size()) {
    case 0:
        break;
    case 1:
        r.top_left = r.top_right = r.bottom_right = r.bottom_left = parts[0];
        break;
    case 2:
        r.top_left = r.bottom_right = parts[0];
        r.top_right = r.bottom_left = parts[1];
        break;
    case 3:
        r.top_left = parts[0];
        r.top_right = r.bottom_left = parts[1];
        r.bottom_right = parts[2];
        break;
    default:
        r.top_left = parts[0];
        r.top_right = parts[1];
        r.bottom_right = parts[2];
        r.bottom_left = parts[3];
        break;
    }
    if (auto v = get(m, "border-top-left-radius"); !v.empty()) r.top_left = v;
    if (auto v = get(m, "border-top-right-radius"); !v.empty()) r.top_right = v;
    if (auto v = get(m, "border-bottom-right-radius"); !v.empty()) r.bottom_right = v;
    if (auto v = get(m, "border-bottom-left-radius"); !v.empty()) r.bottom_left = v;

    if (is_zero_length(r.top_left) && is_zero_length(r.top_right)
        && is_zero_length(r.bottom_right) && is_zero_length(r.bottom_left))
        return std::nullopt;
    return r;
}

std::string unless(const std::string& value, const char* neutral) {
    return value == neutral ? "" : value;
}

std::optional<page_model::ExtractedStyles> extract_if_present(const page_model::StyleMap& m) {
    if (m.empty()) return std::nullopt;
    return extract_styles(m);
}

page_model::ResponsiveStyles extract_responsive(const page_model::DomNode& node) {
    page_model::ResponsiveStyles out;
    for (const auto& [breakpoint, styles] : node.responsive_styles) {
        if (breakpoint == "desktop") out.desktop = extract_if_present(styles);
        else if (breakpoint == "laptop") out.laptop = extract_if_present(styles);
        else if (breakpoint == "tablet") out.tablet = extract_if_present(styles);
        else if (breakpoint == "mobile") out.mobile = extract_if_present(styles);
        else page_model::conversion_logger()->debug("Ignoring unknown breakpoint '{}'", breakpoint);
    }
    for (const auto& cb : node.custom_breakpoints)
        out.custom.push_back({ cb.min_width, cb.max_width, extract_styles(cb.styles) });
    return out;
}

page_model::InteractiveStates extract_states(const page_model::DomNode& node,
    const page_model::ExtractedStyles& normal)
{
    page_model::InteractiveStates out;
    out.normal = normal;
    for (const auto& [state, styles] : node.state_styles) {
        if (state == "hover") out.hover = extract_if_present(styles);
        else if (state == "focus") out.focus = extract_if_present(styles);
        else if (state == "active") out.active = extract_if_present(styles);
        else if (state == "before") out.before = extract_if_present(styles);
        else if (state == "after") out.after = extract_if_present(styles);
    }
    return out;
}

void apply_ancestry(page_model::ElementContext& ctx, const std::string& tag,
    const std::vector<std::string>& classes)
{
    if (tag == "form") ctx.inside_form = true;
    if (tag == "nav") ctx.inside_nav = true;
    if (tag == "header") ctx.inside_header = true;
    if (tag == "footer") ctx.inside_footer = true;
    if (tag == "section") ctx.inside_section = true;
    for (const auto& raw : classes) {
        std::string c = raw;
        for (auto& ch : c)
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        if (c.find("hero") != std::string::npos || c.find("banner") != std::string::npos)
            ctx.inside_hero = true;
        if (c.find("card") != std::string::npos || c.find("box") != std::string::npos)
            ctx.inside_card = true;
    }
}

class TreeAnalyzer {
public:
    page_model::AnalyzedElement analyze(const page_model::DomNode& node,
        const page_model::ElementContext* parent_ctx, const page_model::DomNode* parent)
    {
        if (node.tag_name.empty())
            throw std::invalid_argument("analyze_tree: element #" + std::to_string(counter_) + " has no tag name");

        page_model::AnalyzedElement el;
        el.index = counter_++;
        el.id = "el-" + std::to_string(el.index);
        el.tag_name = node.tag_name;
        el.attributes = node.attributes;
        el.classes = page_model::class_list(node);
        el.html_id = page_model::attribute_or(node, "id");
        el.text_content = page_model::text_content(node);
        el.inner_html = page_model::serialize_inner_html(node);
        el.outer_html = page_model::serialize_outer_html(node);
        el.rect = node.rect;

        std::string own = node.text;
        for (const auto& child : node.children)
            if (child.is_text()) own += child.text;
        el.own_text = page_model::text_content(page_model::make_text(own));

        page_model::StyleMap declarations = node.computed_style;
        auto style_attr = node.attributes.find("style");
        if (style_attr != node.attributes.end()) {
            for (auto& [prop, value] : parse_inline_style(style_attr->second))
                declarations.emplace(prop, value);
        }
        el.styles = extract_styles(declarations);
        if (!node.responsive_styles.empty() || !node.custom_breakpoints.empty())
            el.responsive_styles = extract_responsive(node);
        if (!node.state_styles.empty())
            el.interactive_states = extract_states(node, el.styles);

        el.context = page_model::ElementContext{};
        if (parent_ctx) {
            el.context = *parent_ctx;
            el.context.depth = parent_ctx->depth + 1;
        }
        el.context.sibling_tags.clear();
        el.context.parent_tag = parent ? parent->tag_name : "";
        if (parent) {
            for (const auto& sibling : parent->children)
                if (&sibling != &node && !sibling.is_text()) el.context.sibling_tags.push_back(sibling.tag_name);
        }
        apply_ancestry(el.context, el.tag_name, el.classes);

        for (const auto& child : node.children) {
            if (child.is_text()) continue;
            el.children.push_back(analyze(child, &el.context, &node));
        }
        return el;
    }

    std::size_t count() const { return counter_; }

private:
    std::size_t counter_ = 0;
};

} // namespace

page_model::ExtractedStyles extract_styles(const page_model::StyleMap& m) {
    page_model::ExtractedStyles s;

    s.display = get(m, "display");
    s.position = get(m, "position");
    s.flex_direction = get(m, "flex-direction");
    s.flex_wrap = get(m, "flex-wrap");
    s.justify_content = get(m, "justify-content");
    s.align_items = get(m, "align-items");
    s.grid_template_columns = unless(get(m, "grid-template-columns"), "none");
    s.grid_template_rows = unless(get(m, "grid-template-rows"), "none");
    s.grid_template_areas = unless(get(m, "grid-template-areas"), "none");
    s.gap = unless(get(m, "gap"), "normal");

    s.width = unless(get(m, "width"), "auto");
    s.height = unless(get(m, "height"), "auto");
    s.min_width = get(m, "min-width");
    s.max_width = unless(get(m, "max-width"), "none");
    s.min_height = get(m, "min-height");
    s.max_height = unless(get(m, "max-height"), "none");
    s.margin = extract_box(m, "margin");
    s.padding = extract_box(m, "padding");

    s.border = extract_border(m);
    s.border_radius = extract_radius(m);

    s.background_color = normalize_color(get(m, "background-color"));
    const std::string background = get(m, "background");
    if (s.background_color.empty() && !background.empty() && background.find("url(") == std::string::npos
        && background.find("gradient") == std::string::npos)
        s.background_color = normalize_color(background);
    s.color = normalize_color(get(m, "color"));
    s.border_color = s.border ? s.border->color : normalize_color(get(m, "border-color"));

    s.font_family = get(m, "font-family");
    s.font_size = get(m, "font-size");
    s.font_weight = normalize_font_weight(get(m, "font-weight"));
    s.font_style = unless(get(m, "font-style"), "normal");
    s.line_height = unless(get(m, "line-height"), "normal");
    s.letter_spacing = unless(get(m, "letter-spacing"), "normal");
    s.text_align = get(m, "text-align");
    s.text_decoration = unless(get(m, "text-decoration"), "none");
    s.text_transform = unless(get(m, "text-transform"), "none");

    s.box_shadow = unless(get(m, "box-shadow"), "none");
    s.text_shadow = unless(get(m, "text-shadow"), "none");
    s.opacity = unless(get(m, "opacity"), "1");
    s.transition = unless(get(m, "transition"), "none");
    s.transform = unless(get(m, "transform"), "none");
    s.filter = unless(get(m, "filter"), "none");

    s.background_image = extract_url(get(m, "background-image"));
    if (s.background_image.empty()) s.background_image = extract_url(background);
    s.background_size = get(m, "background-size");
    s.background_position = get(m, "background-position");
    s.background_repeat = get(m, "background-repeat");

    s.z_index = unless(get(m, "z-index"), "auto");
    s.overflow = unless(get(m, "overflow"), "visible");
    s.cursor = unless(get(m, "cursor"), "auto");
    s.pointer_events = unless(get(m, "pointer-events"), "auto");
    s.object_fit = get(m, "object-fit");
    return s;
}

page_model::AnalyzedElement analyze_tree(const page_model::DomNode* root) {
    if (!root) throw std::invalid_argument("analyze_tree: root node is null");
    if (root->is_text()) throw std::invalid_argument("analyze_tree: root node is a text node");

    TreeAnalyzer analyzer;
    auto out = analyzer.analyze(*root, nullptr, nullptr);
    page_model::conversion_logger()->debug("Analyzed {} elements under <{}>", analyzer.count(), root->tag_name);
    return out;
}

page_model::AnalyzedDocument analyze_document(const page_model::DomDocument& document) {
    page_model::AnalyzedDocument out;
    out.title = document.title;
    out.root = analyze_tree(&document.root);
    out.element_count = 1 + page_model::count_descendants(out.root);
    return out;
}

} // namespace page_analysis
