#include <page_export/beaver.hpp>
#include <page_export/markup.hpp>
#include <page_analysis/css_values.hpp>
#include <page_layout/layout_constants.hpp>
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <regex>

namespace page_export {

namespace {

using json = nlohmann::json;
using page_model::ComponentType;
using page_model::HierarchyNode;
using page_model::NodeKind;

struct ModuleMapping {
    const char* module_type;
    bool mapped;
};

ModuleMapping module_for(ComponentType type) {
    switch (type) {
    case ComponentType::Heading: return { "heading", true };
    case ComponentType::Text:
    case ComponentType::Paragraph:
    case ComponentType::Link:
    case ComponentType::Blockquote: return { "rich-text", true };
    case ComponentType::Image: return { "photo", true };
    case ComponentType::Button:
    case ComponentType::SubmitButton: return { "button", true };
    case ComponentType::Video: return { "video", true };
    case ComponentType::Icon: return { "icon", true };
    case ComponentType::Divider: return { "separator", true };
    case ComponentType::Input:
    case ComponentType::Textarea:
    case ComponentType::Select:
    case ComponentType::Checkbox:
    case ComponentType::Radio:
    case ComponentType::FileUpload: return { "contact-form", true };
    case ComponentType::Accordion: return { "accordion", true };
    case ComponentType::Tabs: return { "tabs", true };
    case ComponentType::Gallery: return { "gallery", true };
    case ComponentType::Carousel:
    case ComponentType::Slider: return { "slideshow", true };
    case ComponentType::Testimonial: return { "testimonials", true };
    case ComponentType::PricingTable: return { "pricing-table", true };
    case ComponentType::ProgressBar: return { "number-counter", true };
    case ComponentType::Countdown: return { "countdown", true };
    case ComponentType::SocialShare: return { "social-buttons", true };
    case ComponentType::List: return { "list", true };
    case ComponentType::CodeBlock: return { "html", true };
    case ComponentType::Cta: return { "cta", true };
    case ComponentType::FeatureBox:
    case ComponentType::IconBox:
    case ComponentType::TeamMember:
    case ComponentType::BlogCard: return { "callout", true };
    case ComponentType::SearchBar: return { "search", true };
    case ComponentType::Menu: return { "menu", true };
    case ComponentType::GoogleMaps: return { "map", true };
    case ComponentType::Spacer:
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
    case ComponentType::Modal: return { "rich-text", false };
    case ComponentType::Unknown: return { "html", false };
    }
    return { "html", false };
}

// Colors are stored without the leading '#'.
std::string bb_color(const std::string& hex) {
    return !hex.empty() && hex.front() == '#' ? hex.substr(1) : hex;
}

json length(double px) {
    return { { "length", format_number(px) }, { "unit", "px" } };
}

void apply_spacing(json& settings, const std::string& prefix, const std::optional<page_model::BoxSpacing>& box,
    const std::string& suffix = "")
{
    if (!box) return;
    settings[prefix + "_top" + suffix] = format_number(pixels(box->top).value_or(0.0));
    settings[prefix + "_right" + suffix] = format_number(pixels(box->right).value_or(0.0));
    settings[prefix + "_bottom" + suffix] = format_number(pixels(box->bottom).value_or(0.0));
    settings[prefix + "_left" + suffix] = format_number(pixels(box->left).value_or(0.0));
    settings[prefix + "_unit" + suffix] = "px";
}

class BeaverWriter {
public:
    BeaverWriter(const ExportInputs& inputs, EmitContext& ctx)
        : in_(inputs)
        , ctx_(ctx)
    {
    }

    BeaverLayout write() {
        layout_.title = in_.hierarchy.title;
        if (!in_.hierarchy.root_element_id.empty())
            ctx_.trace_element(in_.hierarchy.root_element_id, document_node_id, true);
        for (const auto& section : in_.hierarchy.sections)
            row(section);
        return std::move(layout_);
    }

private:
    std::string add(const char* type, const std::string& parent, json settings = json::object()) {
        BeaverNode n;
        n.node = fmt::format("{:013x}", ctx_.next_index());
        n.type = type;
        n.parent = parent;
        auto& order = layout_.node_order[parent];
        n.position = static_cast<int>(order.size());
        n.settings = std::move(settings);
        order.push_back(n.node);
        layout_.nodes.push_back(std::move(n));
        return layout_.nodes.back().node;
    }

    void trace_layout(const HierarchyNode& node, const std::string& id, bool merged = false) {
        ctx_.review_layout(node);
        if (node.element_id.empty()) return;
        if (merged) ctx_.trace_merged(node, id);
        else ctx_.trace(node, id);
    }

    void row(const HierarchyNode& section) {
        const std::string row_id = add("row", beaver_root_id, layout_settings(section));
        trace_layout(section, row_id);

        // Loose content between rows shares one full-width column.
        std::string open_column;
        for (const auto& child : section.children) {
            if (child.kind == NodeKind::Row) {
                open_column.clear();
                column_group(child, row_id);
                continue;
            }
            if (open_column.empty()) {
                const std::string group = add("column-group", row_id);
                open_column = add("column", group, { { "size", page_layout::layout::full_width } });
            }
            content(child, open_column);
        }
    }

    void column_group(const HierarchyNode& row_node, const std::string& parent) {
        const std::string group = add("column-group", parent);
        trace_layout(row_node, group);
        for (const auto& child : row_node.children)
            column(child, group);
    }

    void column(const HierarchyNode& node, const std::string& group) {
        if (node.kind != NodeKind::Column) {
            const std::string col = add("column", group, { { "size", node.column_size } });
            content(node, col);
            return;
        }
        json settings = layout_settings(node);
        settings["size"] = node.column_size;
        if (in_.options.include_responsive && node.responsive_styles) {
            const auto& r = *node.responsive_styles;
            if (r.tablet)
                if (auto pct = page_analysis::parse_percentage(r.tablet->width)) settings["size_medium"] = *pct;
            if (r.mobile)
                if (auto pct = page_analysis::parse_percentage(r.mobile->width)) settings["size_responsive"] = *pct;
        }
        const std::string col = add("column", group, std::move(settings));
        trace_layout(node, col);
        for (const auto& child : node.children)
            content(child, col);
    }

    void content(const HierarchyNode& node, const std::string& column_id) {
        switch (node.kind) {
        case NodeKind::Widget:
            module(node, column_id);
            return;
        case NodeKind::Row:
            column_group(node, column_id);
            return;
        case NodeKind::Section:
        case NodeKind::Column:
        case NodeKind::Container:
            break;
        }
        if (node.implicit || node.element_id.empty() || is_plain_container(node)) {
            trace_layout(node, column_id, true);
            for (const auto& child : node.children)
                content(child, column_id);
            return;
        }
        // Styled container: nested single-column group.
        const std::string group = add("column-group", column_id);
        json settings = layout_settings(node);
        settings["size"] = page_layout::layout::full_width;
        const std::string inner = add("column", group, std::move(settings));
        trace_layout(node, inner);
        for (const auto& child : node.children)
            content(child, inner);
    }

    void module(const HierarchyNode& node, const std::string& column_id) {
        if (ctx_.route_widget(node) == Route::HtmlFallback) {
            const std::string id = add("module", column_id, { { "type", "html" }, { "html", fallback_markup(node) } });
            ctx_.trace(node, id, true);
            return;
        }
        const ModuleMapping mapping = module_for(node.component_type);
        json settings = json::object();
        if (mapping.mapped) {
            settings = module_settings(node);
        } else {
            ctx_.mapping_gap(node, mapping.module_type);
            settings[mapping.module_type == std::string("html") ? "html" : "text"] = fallback_markup(node);
        }
        settings["type"] = mapping.module_type;
        apply_module_style(settings, mapping.module_type, node);
        const std::string id = add("module", column_id, std::move(settings));
        ctx_.trace(node, id);
    }

    json module_settings(const HierarchyNode& node) {
        const auto& p = node.props;
        json s = json::object();
        switch (node.component_type) {
        case ComponentType::Heading:
            s["heading"] = p.text;
            s["tag"] = heading_tag(node);
            if (!p.href.empty()) s["link"] = p.href;
            break;
        case ComponentType::Paragraph:
            s["text"] = "<p>" + p.inner_html + "</p>";
            break;
        case ComponentType::Text:
            s["text"] = wrap("p", p.text);
            break;
        case ComponentType::Link:
            s["text"] = "<p>" + node.original_html + "</p>";
            break;
        case ComponentType::Blockquote:
            s["text"] = wrap("blockquote", p.text);
            break;
        case ComponentType::Image:
            s["photo_source"] = "url";
            s["photo_url"] = p.src;
            s["alt"] = p.alt;
            if (!p.href.empty()) {
                s["link_type"] = "url";
                s["link_url"] = p.href;
            }
            break;
        case ComponentType::Button:
        case ComponentType::SubmitButton:
            s["text"] = p.text;
            s["link"] = p.href;
            s["link_target"] = p.target == "_blank" ? "_blank" : "_self";
            break;
        case ComponentType::Video: {
            const std::string provider = video_provider(p.src);
            if (provider == "hosted") {
                s["video_type"] = "media_library";
                s["video_url"] = p.src;
                if (!p.poster.empty()) s["poster_url"] = p.poster;
            } else {
                s["video_type"] = "embed";
                s["embed_code"] = p.src;
            }
            break;
        }
        case ComponentType::Icon:
            s["icon"] = p.class_name;
            break;
        case ComponentType::Divider:
            s["style"] = node.styles.border ? node.styles.border->style : "solid";
            break;
        case ComponentType::Input:
        case ComponentType::Textarea:
        case ComponentType::Select:
        case ComponentType::Checkbox:
        case ComponentType::Radio:
        case ComponentType::FileUpload:
            s["name_toggle"] = "show";
            s["name_placeholder"] = p.placeholder.empty() ? p.name : p.placeholder;
            s["message_toggle"] = node.component_type == ComponentType::Textarea ? "show" : "hide";
            break;
        case ComponentType::Accordion:
        case ComponentType::Tabs: {
            json items = json::array();
            for (const auto& item : p.items)
                items.push_back({ { "label", item.title }, { "content", wrap("p", item.content) } });
            s["items"] = items;
            break;
        }
        case ComponentType::Gallery:
        case ComponentType::Carousel:
        case ComponentType::Slider: {
            json photos = json::array();
            for (const auto& img : p.images)
                photos.push_back({ { "url", img.src }, { "alt", img.alt } });
            s["source"] = "urls";
            s["photos"] = photos;
            break;
        }
        case ComponentType::Testimonial: {
            json quotes = json::array();
            if (p.items.empty()) {
                quotes.push_back({ { "testimonial", wrap("p", p.text) } });
            } else {
                for (const auto& item : p.items)
                    quotes.push_back({ { "testimonial", wrap("p", item.content) }, { "author", item.title } });
            }
            s["testimonials"] = quotes;
            break;
        }
        case ComponentType::PricingTable: {
            json column = { { "title", p.items.empty() ? "" : p.items.front().title } };
            if (auto price = find_price(p.text)) column["price"] = price->currency + price->amount;
            s["pricing_columns"] = json::array({ column });
            break;
        }
        case ComponentType::ProgressBar: {
            auto it = p.aria_attributes.find("aria-valuenow");
            s["layout"] = "bars";
            s["number_type"] = "percent";
            s["number"] = it != p.aria_attributes.end() ? it->second : p.value;
            s["before_number_text"] = p.text;
            break;
        }
        case ComponentType::Countdown: {
            auto it = p.data_attributes.find("data-date");
            s["date"] = it != p.data_attributes.end() ? it->second : "";
            break;
        }
        case ComponentType::SocialShare: {
            json buttons = json::array();
            for (const auto& item : p.items)
                buttons.push_back({ { "button", item.title }, { "url", item.href } });
            s["buttons"] = buttons;
            break;
        }
        case ComponentType::List: {
            json items = json::array();
            for (const auto& item : p.items)
                items.push_back({ { "content", item.title } });
            s["list_type"] = p.ordered ? "ol" : "ul";
            s["list_items"] = items;
            break;
        }
        case ComponentType::CodeBlock:
            s["html"] = "<pre><code>" + escape_html(p.text) + "</code></pre>";
            break;
        case ComponentType::Cta:
            s["title"] = p.items.empty() ? "" : p.items.front().title;
            s["text"] = p.items.empty() ? p.text : p.items.front().content;
            s["btn_link"] = p.href;
            break;
        case ComponentType::FeatureBox:
        case ComponentType::IconBox:
        case ComponentType::TeamMember:
        case ComponentType::BlogCard:
            s["title"] = p.items.empty() ? "" : p.items.front().title;
            s["text"] = p.items.empty() ? p.text : p.items.front().content;
            if (!p.src.empty()) {
                s["image_type"] = "photo";
                s["photo_url"] = p.src;
            } else {
                s["image_type"] = node.component_type == ComponentType::IconBox ? "icon" : "none";
            }
            if (!p.href.empty()) s["link"] = p.href;
            break;
        case ComponentType::SearchBar:
            s["placeholder"] = p.placeholder.empty() ? "Search..." : p.placeholder;
            break;
        case ComponentType::Menu: {
            json links = json::array();
            for (const auto& item : p.items)
                links.push_back({ { "label", item.title }, { "url", item.href } });
            s["menu_layout"] = "horizontal";
            s["links"] = links;
            break;
        }
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

    json layout_settings(const HierarchyNode& node) const {
        const auto& s = node.styles;
        json settings = json::object();
        if (!s.background_color.empty()) {
            settings["bg_type"] = "color";
            settings["bg_color"] = bb_color(s.background_color);
        }
        if (!s.background_image.empty()) {
            settings["bg_type"] = "photo";
            settings["bg_photo_source"] = "url";
            settings["bg_photo_url"] = s.background_image;
        }
        if (!s.color.empty()) settings["text_color"] = bb_color(s.color);
        apply_spacing(settings, "padding", s.padding);
        apply_spacing(settings, "margin", s.margin);
        if (s.border) {
            settings["border"] = { { "style", s.border->style.empty() ? "solid" : s.border->style },
                { "color", bb_color(s.border->color) },
                { "width", format_number(pixels(s.border->width).value_or(0.0)) } };
        }
        if (auto h = pixels(s.min_height)) {
            settings["full_height"] = "custom";
            settings["min_height"] = format_number(*h);
        }
        apply_common(settings, node);
        return settings;
    }

    void apply_common(json& settings, const HierarchyNode& node) const {
        if (in_.options.include_responsive && node.responsive_styles) {
            const auto& r = *node.responsive_styles;
            if (r.tablet) {
                apply_spacing(settings, "padding", r.tablet->padding, "_medium");
                apply_spacing(settings, "margin", r.tablet->margin, "_medium");
            }
            if (r.mobile) {
                apply_spacing(settings, "padding", r.mobile->padding, "_responsive");
                apply_spacing(settings, "margin", r.mobile->margin, "_responsive");
            }
        }
        if (in_.options.preserve_custom_css && !node.props.class_name.empty()) settings["class"] = node.props.class_name;
        if (!node.props.html_id.empty()) settings["id"] = node.props.html_id;
    }

    void apply_module_style(json& settings, const std::string& module_type, const HierarchyNode& node) const {
        const auto& s = node.styles;
        apply_spacing(settings, "margin", s.margin);
        if (module_type == "heading" || module_type == "rich-text") {
            if (!s.color.empty()) settings["color"] = bb_color(s.color);
            if (auto size = pixels(s.font_size)) settings["font_size"] = length(*size);
            if (!s.font_family.empty() || !s.font_weight.empty())
                settings["typography"] = { { "font_family", s.font_family.substr(0, s.font_family.find(',')) },
                    { "font_weight", s.font_weight.empty() ? "400" : s.font_weight } };
            if (!s.text_align.empty()) settings["align"] = s.text_align;
        } else if (module_type == "button") {
            if (!s.background_color.empty()) settings["bg_color"] = bb_color(s.background_color);
            if (!s.color.empty()) settings["text_color"] = bb_color(s.color);
            apply_spacing(settings, "padding", s.padding);
        }
        apply_common(settings, node);
    }

    const ExportInputs& in_;
    EmitContext& ctx_;
    BeaverLayout layout_;
};

const char* expected_parent_type(const std::string& type) {
    if (type == "column") return "column-group";
    if (type == "module") return "column";
    return nullptr;
}

} // namespace

const BeaverNode* BeaverLayout::find(const std::string& id) const {
    for (const auto& n : nodes)
        if (n.node == id) return &n;
    return nullptr;
}

const std::vector<std::string>& BeaverLayout::children_of(const std::string& id) const {
    static const std::vector<std::string> none;
    auto it = node_order.find(id);
    return it == node_order.end() ? none : it->second;
}

BeaverLayout convert_beaver(const ExportInputs& inputs, EmitContext& ctx) {
    BeaverWriter writer(inputs, ctx);
    return writer.write();
}

nlohmann::json to_json(const BeaverLayout& layout) {
    json nodes = json::object();
    for (const auto& n : layout.nodes) {
        json parent = n.parent == beaver_root_id ? json(nullptr) : json(n.parent);
        nodes[n.node] = { { "node", n.node }, { "type", n.type }, { "parent", parent }, { "position", n.position },
            { "settings", n.settings } };
    }
    json order = json::object();
    for (const auto& [parent, children] : layout.node_order)
        order[parent] = children;
    return { { "title", layout.title }, { "nodes", nodes }, { "nodeOrder", order } };
}

std::vector<std::string> check_structure(const BeaverLayout& layout) {
    std::vector<std::string> problems;
    if (layout.nodes.empty()) problems.push_back("Beaver Builder layout has no rows");

    for (const auto& n : layout.nodes) {
        const auto& siblings = layout.children_of(n.parent);
        if (n.position < 0 || n.position >= static_cast<int>(siblings.size()) || siblings[n.position] != n.node)
            problems.push_back("Node " + n.node + " is missing from its parent's order");

        if (n.type == "row") {
            if (n.parent != beaver_root_id) problems.push_back("Row " + n.node + " is not top-level");
            continue;
        }
        const BeaverNode* parent = layout.find(n.parent);
        if (!parent) {
            problems.push_back("Node " + n.node + " has an unknown parent " + n.parent);
            continue;
        }
        if (n.type == "column-group") {
            if (parent->type != "row" && parent->type != "column")
                problems.push_back("Column group " + n.node + " sits in a " + parent->type);
            double total = 0;
            for (const auto& id : layout.children_of(n.node))
                if (const BeaverNode* col = layout.find(id)) total += col->settings.value("size", 0.0);
            if (std::abs(total - page_layout::layout::full_width) > page_layout::layout::column_sum_tolerance)
                problems.push_back(fmt::format("Column group {} adds up to {}%", n.node, total));
            continue;
        }
        const char* expected = expected_parent_type(n.type);
        if (!expected) {
            problems.push_back("Node " + n.node + " has unknown type " + n.type);
        } else if (parent->type != expected) {
            problems.push_back(n.type + " " + n.node + " sits in a " + parent->type);
        }
    }
    return problems;
}

} // namespace page_export
