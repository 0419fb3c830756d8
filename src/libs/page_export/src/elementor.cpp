#include <page_export/elementor.hpp>
#include <page_export/markup.hpp>
#include <page_analysis/css_values.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <regex>

namespace page_export {

namespace {

using json = nlohmann::json;
using page_model::ComponentType;
using page_model::HierarchyNode;
using page_model::NodeKind;

struct WidgetMapping {
    const char* widget_type;
    bool mapped;
};

WidgetMapping widget_for(ComponentType type) {
    switch (type) {
    case ComponentType::Button:
    case ComponentType::SubmitButton: return { "button", true };
    case ComponentType::Heading: return { "heading", true };
    case ComponentType::Text:
    case ComponentType::Paragraph:
    case ComponentType::Link: return { "text-editor", true };
    case ComponentType::Image: return { "image", true };
    case ComponentType::Video: return { "video", true };
    case ComponentType::Icon: return { "icon", true };
    case ComponentType::Spacer: return { "spacer", true };
    case ComponentType::Divider: return { "divider", true };
    case ComponentType::Input:
    case ComponentType::Textarea:
    case ComponentType::Select:
    case ComponentType::Checkbox:
    case ComponentType::Radio:
    case ComponentType::FileUpload: return { "form", true };
    case ComponentType::Accordion: return { "accordion", true };
    case ComponentType::Tabs: return { "tabs", true };
    case ComponentType::Carousel:
    case ComponentType::Slider: return { "image-carousel", true };
    case ComponentType::Gallery: return { "image-gallery", true };
    case ComponentType::Testimonial: return { "testimonial", true };
    case ComponentType::PricingTable: return { "price-table", true };
    case ComponentType::ProgressBar: return { "progress", true };
    case ComponentType::Countdown: return { "countdown", true };
    case ComponentType::SocialShare: return { "share-buttons", true };
    case ComponentType::Breadcrumbs: return { "breadcrumbs", true };
    case ComponentType::List: return { "icon-list", true };
    case ComponentType::Blockquote: return { "blockquote", true };
    case ComponentType::CodeBlock: return { "code-highlight", true };
    case ComponentType::Cta: return { "call-to-action", true };
    case ComponentType::FeatureBox:
    case ComponentType::TeamMember:
    case ComponentType::BlogCard: return { "image-box", true };
    case ComponentType::IconBox: return { "icon-box", true };
    case ComponentType::SearchBar: return { "search-form", true };
    case ComponentType::Menu: return { "nav-menu", true };
    case ComponentType::GoogleMaps: return { "google_maps", true };
    case ComponentType::Pagination:
    case ComponentType::Table:
    case ComponentType::ProductCard:
    case ComponentType::SocialFeed:
    case ComponentType::Container:
    case ComponentType::Section:
    case ComponentType::Column:
    case ComponentType::Row:
    case ComponentType::Grid:
    case ComponentType::Card:
    case ComponentType::Hero:
    case ComponentType::Sidebar:
    case ComponentType::Header:
    case ComponentType::Footer:
    case ComponentType::Form:
    case ComponentType::Modal: return { "text-editor", false };
    case ComponentType::Unknown: return { "html", false };
    }
    return { "html", false };
}

std::string px_string(const std::string& value) {
    return format_number(pixels(value).value_or(0.0));
}

json dimensions(const page_model::BoxSpacing& box) {
    const bool linked = box.top == box.right && box.top == box.bottom && box.top == box.left;
    return { { "unit", "px" }, { "top", px_string(box.top) }, { "right", px_string(box.right) },
        { "bottom", px_string(box.bottom) }, { "left", px_string(box.left) }, { "isLinked", linked } };
}

json slider(double size, const char* unit = "px") {
    return { { "unit", unit }, { "size", size }, { "sizes", json::array() } };
}

std::string field_type(const HierarchyNode& node) {
    switch (node.component_type) {
    case ComponentType::Textarea: return "textarea";
    case ComponentType::Select: return "select";
    case ComponentType::Checkbox: return "checkbox";
    case ComponentType::Radio: return "radio";
    case ComponentType::FileUpload: return "upload";
    default: break;
    }
    const std::string& t = node.props.input_type;
    if (t == "email" || t == "tel" || t == "url" || t == "number" || t == "date" || t == "password" || t == "hidden")
        return t;
    return "text";
}

class ElementorWriter {
public:
    ElementorWriter(const ExportInputs& inputs, EmitContext& ctx)
        : in_(inputs)
        , ctx_(ctx)
    {
    }

    ElementorDocument write() {
        ElementorDocument doc;
        doc.title = in_.hierarchy.title;
        if (!in_.hierarchy.root_element_id.empty())
            ctx_.trace_element(in_.hierarchy.root_element_id, document_node_id, true);
        for (const auto& section : in_.hierarchy.sections)
            doc.content.push_back(top_section(section));
        doc.page_settings = page_settings();
        return doc;
    }

private:
    std::string next_id() { return fmt::format("{:07x}", ctx_.next_index()); }

    ElementorElement element(const char* el_type) {
        ElementorElement el;
        el.id = next_id();
        el.el_type = el_type;
        return el;
    }

    void trace_layout(const HierarchyNode& node, const std::string& id, bool merged = false) {
        ctx_.review_layout(node);
        if (node.element_id.empty()) return;
        if (merged) ctx_.trace_merged(node, id);
        else ctx_.trace(node, id);
    }

    ElementorElement top_section(const HierarchyNode& section) {
        ElementorElement el = element("section");
        apply_layout_style(el.settings, section.styles, section.responsive_styles);
        trace_layout(section, el.id);

        if (section.children.size() == 1 && section.children.front().kind == NodeKind::Row) {
            const HierarchyNode& row = section.children.front();
            trace_layout(row, el.id, true);
            for (const auto& col : row.children)
                el.elements.push_back(column(col));
            return el;
        }

        ElementorElement col = element("column");
        col.settings["_column_size"] = 100;
        for (const auto& child : section.children)
            col.elements.push_back(content(child));
        el.elements.push_back(std::move(col));
        return el;
    }

    ElementorElement column(const HierarchyNode& node) {
        ElementorElement col = element("column");
        if (node.kind != NodeKind::Column) {
            col.settings["_column_size"] = 100;
            col.elements.push_back(content(node));
            return col;
        }
        col.settings["_column_size"] = static_cast<int>(std::lround(node.column_size));
        if (node.column_size < 100) col.settings["_inline_size"] = node.column_size;
        apply_layout_style(col.settings, node.styles, node.responsive_styles);
        if (in_.options.include_responsive && node.responsive_styles) {
            const auto& r = *node.responsive_styles;
            if (r.tablet)
                if (auto pct = page_analysis::parse_percentage(r.tablet->width)) col.settings["_inline_size_tablet"] = *pct;
            if (r.mobile)
                if (auto pct = page_analysis::parse_percentage(r.mobile->width)) col.settings["_inline_size_mobile"] = *pct;
        }
        trace_layout(node, col.id);
        for (const auto& child : node.children)
            col.elements.push_back(content(child));
        return col;
    }

    // Nested layout inside a column becomes an inner section.
    ElementorElement content(const HierarchyNode& node) {
        if (node.kind == NodeKind::Widget) return widget(node);

        ElementorElement inner = element("section");
        inner.is_inner = true;
        apply_layout_style(inner.settings, node.styles, node.responsive_styles);
        trace_layout(node, inner.id);
        if (node.kind == NodeKind::Row) {
            for (const auto& col : node.children)
                inner.elements.push_back(column(col));
            return inner;
        }
        ElementorElement col = element("column");
        col.settings["_column_size"] = 100;
        for (const auto& child : node.children)
            col.elements.push_back(content(child));
        inner.elements.push_back(std::move(col));
        return inner;
    }

    ElementorElement widget(const HierarchyNode& node) {
        ElementorElement el = element("widget");
        if (ctx_.route_widget(node) == Route::HtmlFallback) {
            el.widget_type = "html";
            el.settings["html"] = fallback_markup(node);
            ctx_.trace(node, el.id, true);
            return el;
        }

        const WidgetMapping mapping = widget_for(node.component_type);
        el.widget_type = mapping.widget_type;
        if (mapping.mapped) {
            el.settings = widget_settings(node);
        } else {
            ctx_.mapping_gap(node, mapping.widget_type);
            el.settings["editor"] = fallback_markup(node);
        }
        apply_widget_style(el.settings, el.widget_type, node);
        ctx_.trace(node, el.id);
        return el;
    }

    json widget_settings(const HierarchyNode& node) {
        const auto& p = node.props;
        json s = json::object();
        switch (node.component_type) {
        case ComponentType::Button:
        case ComponentType::SubmitButton:
            s["text"] = p.text;
            s["link"] = { { "url", p.href }, { "is_external", p.target == "_blank" ? "on" : "" }, { "nofollow", "" } };
            break;
        case ComponentType::Heading:
            s["title"] = p.text;
            s["header_size"] = heading_tag(node);
            break;
        case ComponentType::Paragraph:
            s["editor"] = "<p>" + p.inner_html + "</p>";
            break;
        case ComponentType::Text:
            s["editor"] = wrap("p", p.text);
            break;
        case ComponentType::Link:
            s["editor"] = "<p>" + node.original_html + "</p>";
            break;
        case ComponentType::Image:
            s["image"] = { { "url", p.src }, { "id", "" }, { "alt", p.alt } };
            s["image_size"] = "full";
            break;
        case ComponentType::Video: {
            const std::string provider = video_provider(p.src);
            s["video_type"] = provider;
            if (provider == "hosted") {
                s["hosted_url"] = { { "url", p.src }, { "id", "" } };
                if (!p.poster.empty()) s["image_overlay"] = { { "url", p.poster }, { "id", "" } };
            } else {
                s[provider + "_url"] = p.src;
            }
            break;
        }
        case ComponentType::Icon:
            s["selected_icon"] = { { "value", p.class_name }, { "library", "fa-solid" } };
            break;
        case ComponentType::Spacer:
            s["space"] = slider(pixels(node.styles.height).value_or(50.0));
            break;
        case ComponentType::Input:
        case ComponentType::Textarea:
        case ComponentType::Select:
        case ComponentType::Checkbox:
        case ComponentType::Radio:
        case ComponentType::FileUpload: {
            json field = { { "_id", next_id() }, { "field_type", field_type(node) },
                { "field_label", p.placeholder.empty() ? p.name : p.placeholder }, { "placeholder", p.placeholder },
                { "required", p.required ? "true" : "" } };
            std::string options;
            for (const auto& item : p.items)
                options += (options.empty() ? "" : "\n") + item.title;
            if (!options.empty()) field["field_options"] = options;
            s["form_name"] = p.name;
            s["form_fields"] = json::array({ field });
            break;
        }
        case ComponentType::Accordion:
        case ComponentType::Tabs: {
            json tabs = json::array();
            for (const auto& item : p.items)
                tabs.push_back({ { "_id", next_id() }, { "tab_title", item.title }, { "tab_content", wrap("p", item.content) } });
            s["tabs"] = tabs;
            break;
        }
        case ComponentType::Carousel:
        case ComponentType::Slider:
        case ComponentType::Gallery: {
            json images = json::array();
            for (const auto& img : p.images)
                images.push_back({ { "id", "" }, { "url", img.src } });
            s[node.component_type == ComponentType::Gallery ? "gallery" : "carousel"] = images;
            break;
        }
        case ComponentType::Testimonial:
            s["testimonial_content"] = p.items.empty() ? p.text : p.items.front().content;
            if (!p.items.empty()) s["testimonial_name"] = p.items.front().title;
            break;
        case ComponentType::PricingTable: {
            s["heading"] = p.items.empty() ? "" : p.items.front().title;
            if (auto price = find_price(p.text)) {
                s["currency_symbol"] = price->currency;
                s["price"] = price->amount;
            }
            break;
        }
        case ComponentType::ProgressBar: {
            auto it = p.aria_attributes.find("aria-valuenow");
            const std::string value = it != p.aria_attributes.end() ? it->second : p.value;
            s["title"] = p.text;
            s["percent"] = slider(pixels(value + "px").value_or(0.0), "%");
            break;
        }
        case ComponentType::Countdown: {
            auto it = p.data_attributes.find("data-date");
            s["countdown_type"] = "due_date";
            s["due_date"] = it != p.data_attributes.end() ? it->second : "";
            break;
        }
        case ComponentType::SocialShare: {
            json buttons = json::array();
            for (const auto& item : p.items)
                buttons.push_back({ { "_id", next_id() }, { "button", item.title } });
            s["share_buttons"] = buttons;
            break;
        }
        case ComponentType::List: {
            json items = json::array();
            for (const auto& item : p.items)
                items.push_back({ { "_id", next_id() }, { "text", item.title }, { "link", { { "url", item.href } } } });
            s["icon_list"] = items;
            break;
        }
        case ComponentType::Blockquote:
            s["blockquote_content"] = p.text;
            break;
        case ComponentType::CodeBlock:
            s["language"] = "markup";
            s["code"] = p.text;
            break;
        case ComponentType::Cta:
            s["title"] = p.items.empty() ? "" : p.items.front().title;
            s["description"] = p.items.empty() ? p.text : p.items.front().content;
            s["link"] = { { "url", p.href } };
            break;
        case ComponentType::FeatureBox:
        case ComponentType::TeamMember:
        case ComponentType::BlogCard:
        case ComponentType::IconBox:
            if (node.component_type != ComponentType::IconBox) s["image"] = { { "url", p.src }, { "id", "" } };
            s["title_text"] = p.items.empty() ? "" : p.items.front().title;
            s["description_text"] = p.items.empty() ? p.text : p.items.front().content;
            if (!p.href.empty()) s["link"] = { { "url", p.href } };
            break;
        case ComponentType::SearchBar:
            s["placeholder"] = p.placeholder.empty() ? "Search..." : p.placeholder;
            break;
        case ComponentType::Menu:
            s["layout"] = "horizontal";
            break;
        case ComponentType::GoogleMaps: {
            static const std::regex query_re(R"([?&]q=([^&]+))");
            std::smatch m;
            s["address"] = std::regex_search(p.src, m, query_re) ? m[1].str() : "";
            break;
        }
        default:
            break;
        }
        return s;
    }

    void apply_color(json& settings, const char* key, const std::string& hex) {
        if (hex.empty()) return;
        settings[key] = hex;
        if (auto id = in_.tokens.global_color_id(hex))
            settings["__globals__"][key] = "globals/colors?id=" + *id;
    }

    void apply_box(json& settings, const std::string& key, const std::optional<page_model::ExtractedStyles>& styles,
        std::optional<page_model::BoxSpacing> page_model::ExtractedStyles::*member)
    {
        if (!styles) return;
        const auto& box = (*styles).*member;
        if (box) settings[key] = dimensions(*box);
    }

    void apply_responsive_boxes(json& settings, const std::string& padding_key, const std::string& margin_key,
        const std::optional<page_model::ResponsiveStyles>& responsive)
    {
        if (!in_.options.include_responsive || !responsive) return;
        apply_box(settings, padding_key + "_tablet", responsive->tablet, &page_model::ExtractedStyles::padding);
        apply_box(settings, padding_key + "_mobile", responsive->mobile, &page_model::ExtractedStyles::padding);
        apply_box(settings, margin_key + "_tablet", responsive->tablet, &page_model::ExtractedStyles::margin);
        apply_box(settings, margin_key + "_mobile", responsive->mobile, &page_model::ExtractedStyles::margin);
    }

    void apply_layout_style(json& settings, const page_model::ExtractedStyles& s,
        const std::optional<page_model::ResponsiveStyles>& responsive)
    {
        if (!s.background_color.empty() || !s.background_image.empty()) settings["background_background"] = "classic";
        apply_color(settings, "background_color", s.background_color);
        if (!s.background_image.empty()) settings["background_image"] = { { "url", s.background_image }, { "id", "" } };
        if (s.padding) settings["padding"] = dimensions(*s.padding);
        if (s.margin) settings["margin"] = dimensions(*s.margin);
        if (s.border_radius) {
            page_model::BoxSpacing corners{ s.border_radius->top_left, s.border_radius->top_right,
                s.border_radius->bottom_right, s.border_radius->bottom_left };
            settings["border_radius"] = dimensions(corners);
        }
        if (s.border) {
            settings["border_border"] = s.border->style.empty() ? "solid" : s.border->style;
            const std::string w = s.border->width;
            settings["border_width"] = dimensions(page_model::BoxSpacing{ w, w, w, w });
            apply_color(settings, "border_color", s.border->color);
        }
        if (!s.min_height.empty()) {
            if (auto h = pixels(s.min_height)) {
                settings["height"] = "min-height";
                settings["custom_height"] = slider(*h);
            }
        }
        apply_responsive_boxes(settings, "padding", "margin", responsive);
    }

    void apply_typography(json& settings, const char* color_key, const HierarchyNode& node, bool heading) {
        const auto& s = node.styles;
        apply_color(settings, color_key, s.color);
        if (s.font_family.empty() && s.font_size.empty() && s.font_weight.empty()) return;

        settings["typography_typography"] = "custom";
        if (!s.font_family.empty()) {
            std::string family = s.font_family.substr(0, s.font_family.find(','));
            family.erase(std::remove_if(family.begin(), family.end(), [](char c) { return c == '"' || c == '\''; }), family.end());
            settings["typography_font_family"] = family;
            const auto& global = in_.typography.global;
            const std::string& global_family = heading ? global.heading_font_family : global.base_font_family;
            if (family == global_family)
                settings["__globals__"]["typography_typography"] = std::string("globals/typography?id=") + (heading ? "secondary" : "primary");
        }
        if (auto size = pixels(s.font_size)) settings["typography_font_size"] = slider(*size);
        if (!s.font_weight.empty()) settings["typography_font_weight"] = s.font_weight;
        if (in_.options.include_responsive && node.responsive_styles) {
            const auto& r = *node.responsive_styles;
            if (r.tablet)
                if (auto size = pixels(r.tablet->font_size)) settings["typography_font_size_tablet"] = slider(*size);
            if (r.mobile)
                if (auto size = pixels(r.mobile->font_size)) settings["typography_font_size_mobile"] = slider(*size);
        }
    }

    void apply_widget_style(json& settings, const std::string& widget_type, const HierarchyNode& node) {
        const auto& s = node.styles;
        if (s.padding) settings["_padding"] = dimensions(*s.padding);
        if (s.margin) settings["_margin"] = dimensions(*s.margin);
        apply_responsive_boxes(settings, "_padding", "_margin", node.responsive_styles);

        if (widget_type == "heading") {
            apply_typography(settings, "title_color", node, true);
        } else if (widget_type == "text-editor") {
            apply_typography(settings, "text_color", node, false);
        } else if (widget_type == "button") {
            apply_typography(settings, "button_text_color", node, false);
            apply_color(settings, "background_color", s.background_color);
            if (s.border_radius) {
                page_model::BoxSpacing corners{ s.border_radius->top_left, s.border_radius->top_right,
                    s.border_radius->bottom_right, s.border_radius->bottom_left };
                settings["border_radius"] = dimensions(corners);
            }
            if (s.padding) settings["text_padding"] = dimensions(*s.padding);
        } else if (!s.background_color.empty()) {
            settings["_background_background"] = "classic";
            apply_color(settings, "_background_color", s.background_color);
        }
        if (in_.options.preserve_custom_css && !node.props.class_name.empty())
            settings["_css_classes"] = node.props.class_name;
        if (!node.props.html_id.empty()) settings["_element_id"] = node.props.html_id;
    }

    json page_settings() const {
        json colors = json::array();
        for (const auto& c : in_.tokens.elementor_colors)
            colors.push_back({ { "_id", c.id }, { "title", c.title }, { "color", c.color } });
        json fonts = json::array();
        for (const auto& f : in_.typography.elementor_fonts) {
            json font = { { "_id", f.id }, { "title", f.title }, { "typography_typography", "custom" },
                { "typography_font_family", f.font_family }, { "typography_font_weight", f.font_weight } };
            if (f.font_size > 0) font["typography_font_size"] = slider(f.font_size);
            fonts.push_back(font);
        }
        return { { "system_colors", colors }, { "system_typography", fonts } };
    }

    const ExportInputs& in_;
    EmitContext& ctx_;
};

json element_json(const ElementorElement& el) {
    json out = { { "id", el.id }, { "elType", el.el_type }, { "settings", el.settings } };
    if (el.el_type == "widget") out["widgetType"] = el.widget_type;
    if (el.el_type == "section") out["isInner"] = el.is_inner;
    json children = json::array();
    for (const auto& child : el.elements)
        children.push_back(element_json(child));
    out["elements"] = children;
    return out;
}

} // namespace

ElementorDocument convert_elementor(const ExportInputs& inputs, EmitContext& ctx) {
    ElementorWriter writer(inputs, ctx);
    return writer.write();
}

nlohmann::json to_json(const ElementorDocument& document) {
    json content = json::array();
    for (const auto& el : document.content)
        content.push_back(element_json(el));
    return { { "version", document.version }, { "title", document.title }, { "type", document.type },
        { "content", content }, { "page_settings", document.page_settings } };
}

std::vector<std::string> check_structure(const ElementorDocument& document) {
    std::vector<std::string> problems;
    if (document.version.empty()) problems.push_back("Elementor export has no version");
    if (document.content.empty()) problems.push_back("Elementor export has no sections");
    for (const auto& section : document.content) {
        if (section.el_type != "section") {
            problems.push_back("Top-level element " + section.id + " is not a section");
            continue;
        }
        if (section.elements.empty()) problems.push_back("Section " + section.id + " has no columns");
        for (const auto& col : section.elements)
            if (col.el_type != "column") problems.push_back("Section " + section.id + " holds a non-column element " + col.id);
    }
    return problems;
}

} // namespace page_export
