#include <page_export/oxygen.hpp>
#include <page_export/markup.hpp>
#include <page_analysis/css_values.hpp>
#include <page_layout/layout_constants.hpp>
#include <spdlog/fmt/fmt.h>
#include <cctype>
#include <cmath>
#include <regex>
#include <set>

namespace page_export {

namespace {

using json = nlohmann::json;
using page_model::ComponentType;
using page_model::HierarchyNode;
using page_model::NodeKind;

struct ComponentMapping {
    const char* name;
    bool mapped;
};

ComponentMapping component_for(ComponentType type) {
    switch (type) {
    case ComponentType::Heading: return { "ct_headline", true };
    case ComponentType::Text:
    case ComponentType::Paragraph:
    case ComponentType::Blockquote:
    case ComponentType::List: return { "ct_text_block", true };
    case ComponentType::Link: return { "ct_link_text", true };
    case ComponentType::Image: return { "ct_image", true };
    case ComponentType::Button:
    case ComponentType::SubmitButton: return { "ct_link_button", true };
    case ComponentType::Video: return { "ct_video", true };
    case ComponentType::Icon: return { "ct_fancy_icon", true };
    case ComponentType::Divider:
    case ComponentType::Spacer: return { "ct_div_block", true };
    case ComponentType::Accordion: return { "ct_div_block", true };
    case ComponentType::Carousel:
    case ComponentType::Slider: return { "ct_slider", true };
    case ComponentType::Gallery: return { "oxy_gallery", true };
    case ComponentType::Testimonial: return { "oxy_testimonial", true };
    case ComponentType::PricingTable: return { "oxy_pricing_box", true };
    case ComponentType::ProgressBar: return { "oxy_progress_bar", true };
    case ComponentType::SocialShare: return { "oxy_social_icons", true };
    case ComponentType::CodeBlock: return { "ct_code_block", true };
    case ComponentType::FeatureBox:
    case ComponentType::IconBox:
    case ComponentType::BlogCard: return { "oxy_icon_box", true };
    case ComponentType::SearchBar: return { "oxy_search_form", true };
    case ComponentType::Menu: return { "oxy_nav_menu", true };
    case ComponentType::GoogleMaps: return { "oxy_map", true };
    case ComponentType::Input:
    case ComponentType::Textarea:
    case ComponentType::Select:
    case ComponentType::Checkbox:
    case ComponentType::Radio:
    case ComponentType::FileUpload:
    case ComponentType::Tabs:
    case ComponentType::Countdown:
    case ComponentType::Cta:
    case ComponentType::TeamMember:
    case ComponentType::Breadcrumbs:
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
    case ComponentType::Modal: return { "ct_text_block", false };
    case ComponentType::Unknown: return { "ct_code_block", false };
    }
    return { "ct_code_block", false };
}

// Short selector prefix, e.g. "ct_headline" -> "headline".
std::string selector_prefix(const std::string& name) {
    const auto pos = name.find('_');
    std::string prefix = pos == std::string::npos ? name : name.substr(pos + 1);
    for (auto& c : prefix)
        if (c == '_') c = '-';
    return prefix;
}

void apply_box(json& original, const char* property, const std::optional<page_model::BoxSpacing>& box) {
    if (!box) return;
    const std::string p = property;
    original[p + "-top"] = format_number(pixels(box->top).value_or(0.0));
    original[p + "-right"] = format_number(pixels(box->right).value_or(0.0));
    original[p + "-bottom"] = format_number(pixels(box->bottom).value_or(0.0));
    original[p + "-left"] = format_number(pixels(box->left).value_or(0.0));
}

void merge_into(json& target, const json& source) {
    if (!target.is_object()) target = json::object();
    for (const auto& [key, value] : source.items())
        target[key] = value;
}

json component_json(const OxygenComponent& c) {
    json children = json::array();
    for (const auto& child : c.children)
        children.push_back(component_json(child));
    json out = { { "id", c.id }, { "name", c.name }, { "options", c.options } };
    if (!c.children.empty()) out["children"] = children;
    return out;
}

class OxygenWriter {
public:
    OxygenWriter(const ExportInputs& inputs, EmitContext& ctx)
        : in_(inputs)
        , ctx_(ctx)
    {
    }

    OxygenDocument write() {
        OxygenDocument doc;
        doc.title = in_.hierarchy.title;
        doc.root.id = 0;
        doc.root.name = "root";
        doc.root.options = { { "ct_id", 0 }, { "ct_parent", 0 }, { "selector", "root" } };
        if (!in_.hierarchy.root_element_id.empty())
            ctx_.trace_element(in_.hierarchy.root_element_id, document_node_id, true);
        for (const auto& section : in_.hierarchy.sections)
            doc.root.children.push_back(section_component(section));
        return doc;
    }

private:
    OxygenComponent component(const std::string& name, int parent) {
        OxygenComponent c;
        c.id = ctx_.next_index();
        c.name = name;
        c.options = { { "ct_id", c.id }, { "ct_parent", parent },
            { "selector", selector_prefix(name) + "-" + std::to_string(c.id) + "-page" } };
        return c;
    }

    void trace_layout(const HierarchyNode& node, int id, bool merged = false) {
        ctx_.review_layout(node);
        if (node.element_id.empty()) return;
        if (merged) ctx_.trace_merged(node, std::to_string(id));
        else ctx_.trace(node, std::to_string(id));
    }

    OxygenComponent section_component(const HierarchyNode& section) {
        OxygenComponent c = component("ct_section", 0);
        apply_layout_style(c, section);
        trace_layout(section, c.id);
        for (const auto& child : section.children)
            content(child, c);
        return c;
    }

    void content(const HierarchyNode& node, OxygenComponent& parent) {
        switch (node.kind) {
        case NodeKind::Widget:
            parent.children.push_back(widget(node, parent.id));
            return;
        case NodeKind::Row:
            if (node.children.size() >= 2) {
                parent.children.push_back(columns(node, parent.id));
                return;
            }
            break;
        case NodeKind::Section:
        case NodeKind::Column:
        case NodeKind::Container:
            if (!node.implicit && !node.element_id.empty() && !is_plain_container(node)) {
                OxygenComponent div = component("ct_div_block", parent.id);
                apply_layout_style(div, node);
                trace_layout(node, div.id);
                for (const auto& child : node.children)
                    content(child, div);
                parent.children.push_back(std::move(div));
                return;
            }
            break;
        }
        trace_layout(node, parent.id, true);
        for (const auto& child : node.children)
            content(child, parent);
    }

    OxygenComponent columns(const HierarchyNode& row, int parent) {
        OxygenComponent cols = component("ct_new_columns", parent);
        apply_layout_style(cols, row);
        trace_layout(row, cols.id);
        for (const auto& child : row.children) {
            OxygenComponent col = component("ct_div_block", cols.id);
            if (child.kind == NodeKind::Column) apply_layout_style(col, child);
            col.options["original"]["width"] = format_number(child.column_size);
            col.options["original"]["width-unit"] = "%";
            if (in_.options.include_responsive && child.responsive_styles) {
                const auto& r = *child.responsive_styles;
                if (r.tablet)
                    if (auto pct = page_analysis::parse_percentage(r.tablet->width))
                        col.options["media"]["tablet"]["original"]["width"] = format_number(*pct);
                if (r.mobile)
                    if (auto pct = page_analysis::parse_percentage(r.mobile->width))
                        col.options["media"]["phone-portrait"]["original"]["width"] = format_number(*pct);
            }
            if (child.kind == NodeKind::Column) {
                trace_layout(child, col.id);
                for (const auto& grandchild : child.children)
                    content(grandchild, col);
            } else {
                content(child, col);
            }
            cols.children.push_back(std::move(col));
        }
        return cols;
    }

    OxygenComponent widget(const HierarchyNode& node, int parent) {
        if (ctx_.route_widget(node) == Route::HtmlFallback) {
            OxygenComponent c = component("ct_code_block", parent);
            c.options["original"]["code-php"] = fallback_markup(node);
            ctx_.trace(node, std::to_string(c.id), true);
            return c;
        }
        const ComponentMapping mapping = component_for(node.component_type);
        OxygenComponent c = component(mapping.name, parent);
        if (mapping.mapped) {
            fill_component(c, node);
        } else {
            ctx_.mapping_gap(node, mapping.name);
            c.options["ct_content"] = fallback_markup(node);
        }
        apply_component_style(c, node);
        ctx_.trace(node, std::to_string(c.id));
        return c;
    }

    void fill_component(OxygenComponent& c, const HierarchyNode& node) {
        const auto& p = node.props;
        json& original = c.options["original"];
        switch (node.component_type) {
        case ComponentType::Heading:
            c.options["ct_content"] = p.text;
            original["tag"] = heading_tag(node);
            break;
        case ComponentType::Text:
            c.options["ct_content"] = escape_html(p.text);
            break;
        case ComponentType::Paragraph:
            c.options["ct_content"] = p.inner_html;
            break;
        case ComponentType::Blockquote:
            c.options["ct_content"] = escape_html(p.text);
            original["tag"] = "blockquote";
            break;
        case ComponentType::List: {
            const std::string tag = p.ordered ? "ol" : "ul";
            std::string items;
            for (const auto& item : p.items)
                items += wrap("li", item.title);
            c.options["ct_content"] = "<" + tag + ">" + items + "</" + tag + ">";
            break;
        }
        case ComponentType::Link:
            c.options["ct_content"] = escape_html(p.text);
            original["url"] = p.href;
            if (p.target == "_blank") original["target"] = "_blank";
            break;
        case ComponentType::Image:
            original["src"] = p.src;
            original["alt"] = p.alt;
            break;
        case ComponentType::Button:
        case ComponentType::SubmitButton:
            c.options["ct_content"] = escape_html(p.text);
            original["url"] = p.href;
            if (p.target == "_blank") original["target"] = "_blank";
            break;
        case ComponentType::Video:
            original["embed-src"] = p.src;
            original["use-custom"] = video_provider(p.src) == "hosted" ? "1" : "0";
            break;
        case ComponentType::Icon:
            original["icon-id"] = p.class_name;
            break;
        case ComponentType::Divider:
            original["border-top-width"] = "1";
            original["border-top-style"] = node.styles.border && !node.styles.border->style.empty() ? node.styles.border->style : "solid";
            original["width"] = "100";
            original["width-unit"] = "%";
            break;
        case ComponentType::Spacer:
            original["height"] = format_number(pixels(node.styles.height).value_or(50.0));
            break;
        case ComponentType::Accordion:
            for (const auto& item : p.items) {
                OxygenComponent toggle = component("oxy_toggle", c.id);
                toggle.options["ct_content"] = escape_html(item.title);
                c.children.push_back(std::move(toggle));
                OxygenComponent body = component("ct_text_block", c.id);
                body.options["ct_content"] = escape_html(item.content);
                c.children.push_back(std::move(body));
            }
            break;
        case ComponentType::Carousel:
        case ComponentType::Slider:
            for (const auto& img : p.images) {
                OxygenComponent slide = component("ct_slide", c.id);
                OxygenComponent image = component("ct_image", slide.id);
                image.options["original"]["src"] = img.src;
                image.options["original"]["alt"] = img.alt;
                slide.children.push_back(std::move(image));
                c.children.push_back(std::move(slide));
            }
            break;
        case ComponentType::Gallery: {
            std::string urls;
            for (const auto& img : p.images)
                urls += (urls.empty() ? "" : ",") + img.src;
            original["gallery_source"] = "urls";
            original["image_urls"] = urls;
            break;
        }
        case ComponentType::Testimonial:
            original["testimonial_text"] = p.items.empty() ? p.text : p.items.front().content;
            if (!p.items.empty()) original["testimonial_author"] = p.items.front().title;
            break;
        case ComponentType::PricingTable: {
            original["pricing_box_package_title"] = p.items.empty() ? "" : p.items.front().title;
            if (auto price = find_price(p.text)) {
                original["pricing_box_price_currency"] = price->currency;
                original["pricing_box_price"] = price->amount;
            }
            break;
        }
        case ComponentType::ProgressBar: {
            auto it = p.aria_attributes.find("aria-valuenow");
            original["progress_bar_progress"] = it != p.aria_attributes.end() ? it->second : p.value;
            original["progress_bar_left_text"] = p.text;
            break;
        }
        case ComponentType::SocialShare:
            for (const auto& item : p.items) {
                std::string network = item.title;
                for (auto& ch : network)
                    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
                original["icon-" + network] = item.href;
            }
            break;
        case ComponentType::CodeBlock:
            original["code-php"] = "<pre><code>" + escape_html(p.text) + "</code></pre>";
            break;
        case ComponentType::FeatureBox:
        case ComponentType::IconBox:
        case ComponentType::BlogCard:
            original["icon_box_heading"] = p.items.empty() ? "" : p.items.front().title;
            original["icon_box_text"] = p.items.empty() ? p.text : p.items.front().content;
            break;
        case ComponentType::SearchBar:
            original["placeholder"] = p.placeholder;
            break;
        case ComponentType::Menu:
            original["menu_id"] = "";
            original["dropdowns"] = "on";
            break;
        case ComponentType::GoogleMaps: {
            static const std::regex query_re(R"([?&]q=([^&]+))");
            std::smatch m;
            original["map_address"] = std::regex_search(p.src, m, query_re) ? m[1].str() : "";
            break;
        }
        default:
            break;
        }
        if (original.empty()) c.options.erase("original");
    }

    void apply_original(json& original, const page_model::ExtractedStyles& s, bool text) const {
        if (!s.background_color.empty()) original["background-color"] = s.background_color;
        if (!s.background_image.empty()) original["background-image"] = s.background_image;
        apply_box(original, "padding", s.padding);
        apply_box(original, "margin", s.margin);
        if (s.border) {
            original["border-all-width"] = format_number(pixels(s.border->width).value_or(0.0));
            original["border-all-style"] = s.border->style.empty() ? "solid" : s.border->style;
            original["border-all-color"] = s.border->color;
        }
        if (!text) return;
        if (!s.color.empty()) original["color"] = s.color;
        if (auto size = pixels(s.font_size)) original["font-size"] = format_number(*size);
        if (!s.font_family.empty()) original["font-family"] = page_analysis::normalize_font_family(s.font_family);
        if (!s.font_weight.empty()) original["font-weight"] = s.font_weight;
        if (!s.text_align.empty()) original["text-align"] = s.text_align;
    }

    void apply_common(OxygenComponent& c, const HierarchyNode& node, bool text) const {
        if (in_.options.include_responsive && node.responsive_styles) {
            const auto& r = *node.responsive_styles;
            if (r.tablet) {
                json original = json::object();
                apply_original(original, *r.tablet, text);
                if (!original.empty()) merge_into(c.options["media"]["tablet"]["original"], original);
            }
            if (r.mobile) {
                json original = json::object();
                apply_original(original, *r.mobile, text);
                if (!original.empty()) merge_into(c.options["media"]["phone-portrait"]["original"], original);
            }
        }
        if (in_.options.preserve_custom_css && !node.props.class_name.empty()) {
            json classes = json::array();
            std::string current;
            for (char ch : node.props.class_name + " ") {
                if (ch == ' ') {
                    if (!current.empty()) classes.push_back(current);
                    current.clear();
                } else {
                    current += ch;
                }
            }
            c.options["classes"] = classes;
        }
        if (!node.props.html_id.empty()) c.options["selector"] = node.props.html_id;
    }

    void apply_layout_style(OxygenComponent& c, const HierarchyNode& node) const {
        json original = json::object();
        apply_original(original, node.styles, false);
        if (auto h = pixels(node.styles.min_height)) original["min-height"] = format_number(*h);
        if (!original.empty()) merge_into(c.options["original"], original);
        apply_common(c, node, false);
    }

    void apply_component_style(OxygenComponent& c, const HierarchyNode& node) const {
        json original = json::object();
        apply_original(original, node.styles, true);
        if (!original.empty()) merge_into(c.options["original"], original);
        apply_common(c, node, true);
    }

    const ExportInputs& in_;
    EmitContext& ctx_;
};

void check_component(const OxygenComponent& c, int parent_id, std::set<int>& seen, std::vector<std::string>& problems) {
    if (!seen.insert(c.id).second) problems.push_back("Duplicate component id " + std::to_string(c.id));
    if (c.id < 1) problems.push_back("Component " + c.name + " has id " + std::to_string(c.id));
    if (c.options.value("ct_id", -1) != c.id) problems.push_back("Component " + std::to_string(c.id) + " has a mismatched ct_id");
    if (c.options.value("ct_parent", -1) != parent_id)
        problems.push_back("Component " + std::to_string(c.id) + " does not point at its parent " + std::to_string(parent_id));

    if (c.name == "ct_new_columns") {
        double total = 0;
        for (const auto& col : c.children) {
            if (col.name != "ct_div_block") problems.push_back("Columns " + std::to_string(c.id) + " hold a " + col.name);
            if (col.options.contains("original") && col.options["original"].contains("width"))
                total += page_analysis::parse_percentage(col.options["original"]["width"].get<std::string>() + "%").value_or(0.0);
        }
        if (std::abs(total - page_layout::layout::full_width) > page_layout::layout::column_sum_tolerance)
            problems.push_back(fmt::format("Columns {} add up to {}%", c.id, total));
    }
    for (const auto& child : c.children)
        check_component(child, c.id, seen, problems);
}

} // namespace

OxygenDocument convert_oxygen(const ExportInputs& inputs, EmitContext& ctx) {
    OxygenWriter writer(inputs, ctx);
    return writer.write();
}

nlohmann::json to_json(const OxygenDocument& document) {
    return { { "title", document.title }, { "ct_builder_json", component_json(document.root) } };
}

std::vector<std::string> check_structure(const OxygenDocument& document) {
    std::vector<std::string> problems;
    if (document.root.id != 0 || document.root.name != "root") problems.push_back("Oxygen tree has no root component");
    if (document.root.children.empty()) problems.push_back("Oxygen export has no sections");
    std::set<int> seen;
    for (const auto& child : document.root.children) {
        if (child.name != "ct_section") problems.push_back("Top-level component " + std::to_string(child.id) + " is a " + child.name);
        check_component(child, 0, seen, problems);
    }
    return problems;
}

} // namespace page_export
