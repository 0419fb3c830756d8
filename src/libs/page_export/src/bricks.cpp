#include <page_export/bricks.hpp>
#include <page_export/markup.hpp>
#include <page_analysis/css_values.hpp>
#include <page_layout/layout_constants.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <map>
#include <regex>
#include <set>

namespace page_export {

namespace {

using json = nlohmann::json;
using page_model::ComponentType;
using page_model::HierarchyNode;
using page_model::NodeKind;

struct ElementMapping {
    const char* name;
    bool mapped;
};

ElementMapping element_for(ComponentType type) {
    switch (type) {
    case ComponentType::Heading: return { "heading", true };
    case ComponentType::Text: return { "text-basic", true };
    case ComponentType::Paragraph:
    case ComponentType::Blockquote: return { "text", true };
    case ComponentType::Link: return { "text-link", true };
    case ComponentType::Image: return { "image", true };
    case ComponentType::Button:
    case ComponentType::SubmitButton: return { "button", true };
    case ComponentType::Video: return { "video", true };
    case ComponentType::Icon: return { "icon", true };
    case ComponentType::Divider: return { "divider", true };
    case ComponentType::Spacer: return { "div", true };
    case ComponentType::Input:
    case ComponentType::Textarea:
    case ComponentType::Select:
    case ComponentType::Checkbox:
    case ComponentType::Radio:
    case ComponentType::FileUpload: return { "form", true };
    case ComponentType::Accordion: return { "accordion", true };
    case ComponentType::Tabs: return { "tabs", true };
    case ComponentType::Carousel:
    case ComponentType::Slider: return { "carousel", true };
    case ComponentType::Gallery: return { "image-gallery", true };
    case ComponentType::Testimonial: return { "testimonials", true };
    case ComponentType::PricingTable: return { "pricing-tables", true };
    case ComponentType::ProgressBar: return { "progress-bar", true };
    case ComponentType::Countdown: return { "countdown", true };
    case ComponentType::SocialShare: return { "social-icons", true };
    case ComponentType::List: return { "list", true };
    case ComponentType::CodeBlock: return { "code", true };
    case ComponentType::FeatureBox:
    case ComponentType::IconBox:
    case ComponentType::BlogCard: return { "icon-box", true };
    case ComponentType::TeamMember: return { "team-members", true };
    case ComponentType::SearchBar: return { "search", true };
    case ComponentType::Menu: return { "nav-menu", true };
    case ComponentType::GoogleMaps: return { "map", true };
    case ComponentType::Cta:
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
    case ComponentType::Modal: return { "text", false };
    case ComponentType::Unknown: return { "code", false };
    }
    return { "code", false };
}

json box(const page_model::BoxSpacing& b) {
    auto side = [](const std::string& v) { return format_number(pixels(v).value_or(0.0)); };
    return { { "top", side(b.top) }, { "right", side(b.right) }, { "bottom", side(b.bottom) }, { "left", side(b.left) } };
}

json link(const std::string& url, const std::string& target = "") {
    json l = { { "type", "external" }, { "url", url } };
    if (target == "_blank") l["newTab"] = true;
    return l;
}

std::string video_id(const std::string& url, const std::string& provider) {
    static const std::regex youtube_re(R"((?:v=|youtu\.be/|embed/)([A-Za-z0-9_-]{6,}))");
    static const std::regex vimeo_re(R"(vimeo\.com/(?:video/)?(\d+))");
    std::smatch m;
    if (std::regex_search(url, m, provider == "youtube" ? youtube_re : vimeo_re)) return m[1].str();
    return "";
}

class BricksWriter {
public:
    BricksWriter(const ExportInputs& inputs, EmitContext& ctx)
        : in_(inputs)
        , ctx_(ctx)
    {
    }

    BricksDocument write() {
        doc_.title = in_.hierarchy.title;
        if (!in_.hierarchy.root_element_id.empty())
            ctx_.trace_element(in_.hierarchy.root_element_id, document_node_id, true);
        for (const auto& section : in_.hierarchy.sections)
            section_element(section);
        return std::move(doc_);
    }

private:
    std::string add(const char* name, const std::string& parent, json settings = json::object()) {
        BricksElement el;
        el.id = bricks_id(ctx_.next_index());
        el.name = name;
        el.parent = parent;
        el.settings = std::move(settings);
        if (parent != bricks_root_parent) doc_.elements[index_.at(parent)].children.push_back(el.id);
        index_[el.id] = doc_.elements.size();
        doc_.elements.push_back(std::move(el));
        return doc_.elements.back().id;
    }

    void trace_layout(const HierarchyNode& node, const std::string& id, bool merged = false) {
        ctx_.review_layout(node);
        if (node.element_id.empty()) return;
        if (merged) ctx_.trace_merged(node, id);
        else ctx_.trace(node, id);
    }

    void section_element(const HierarchyNode& section) {
        const std::string id = add("section", bricks_root_parent, layout_settings(section));
        trace_layout(section, id);

        // Loose content between rows shares one container.
        std::string open_container;
        for (const auto& child : section.children) {
            if (child.kind == NodeKind::Row && child.children.size() >= 2) {
                open_container.clear();
                row(child, id);
                continue;
            }
            if (open_container.empty()) open_container = add("container", id);
            content(child, open_container);
        }
    }

    void row(const HierarchyNode& node, const std::string& parent) {
        json settings = layout_settings(node);
        settings["_direction"] = "row";
        const std::string id = add("container", parent, std::move(settings));
        trace_layout(node, id);
        for (const auto& child : node.children) {
            json col = child.kind == NodeKind::Column ? layout_settings(child) : json::object();
            col["_width"] = format_number(child.column_size) + "%";
            if (in_.options.include_responsive && child.responsive_styles) {
                const auto& r = *child.responsive_styles;
                if (r.tablet)
                    if (auto pct = page_analysis::parse_percentage(r.tablet->width))
                        col["_width:tablet_portrait"] = format_number(*pct) + "%";
                if (r.mobile)
                    if (auto pct = page_analysis::parse_percentage(r.mobile->width))
                        col["_width:mobile_portrait"] = format_number(*pct) + "%";
            }
            const std::string block = add("block", id, std::move(col));
            if (child.kind == NodeKind::Column) {
                trace_layout(child, block);
                for (const auto& grandchild : child.children)
                    content(grandchild, block);
            } else {
                content(child, block);
            }
        }
    }

    void content(const HierarchyNode& node, const std::string& parent) {
        switch (node.kind) {
        case NodeKind::Widget:
            widget(node, parent);
            return;
        case NodeKind::Row:
            if (node.children.size() >= 2) {
                row(node, parent);
                return;
            }
            break;
        case NodeKind::Section:
        case NodeKind::Column:
        case NodeKind::Container:
            if (!node.implicit && !node.element_id.empty() && !is_plain_container(node)) {
                const std::string id = add("block", parent, layout_settings(node));
                trace_layout(node, id);
                for (const auto& child : node.children)
                    content(child, id);
                return;
            }
            break;
        }
        trace_layout(node, parent, true);
        for (const auto& child : node.children)
            content(child, parent);
    }

    void widget(const HierarchyNode& node, const std::string& parent) {
        if (ctx_.route_widget(node) == Route::HtmlFallback) {
            const std::string id = add("code", parent, { { "code", fallback_markup(node) }, { "executeCode", true } });
            ctx_.trace(node, id, true);
            return;
        }
        const ElementMapping mapping = element_for(node.component_type);
        json settings = json::object();
        if (mapping.mapped) {
            settings = element_settings(node);
        } else {
            ctx_.mapping_gap(node, mapping.name);
            settings["text"] = fallback_markup(node);
        }
        apply_element_style(settings, node);
        const std::string id = add(mapping.name, parent, std::move(settings));
        ctx_.trace(node, id);
    }

    json element_settings(const HierarchyNode& node) {
        const auto& p = node.props;
        json s = json::object();
        switch (node.component_type) {
        case ComponentType::Heading:
            s["text"] = p.text;
            s["tag"] = heading_tag(node);
            break;
        case ComponentType::Text:
            s["text"] = p.text;
            break;
        case ComponentType::Paragraph:
            s["text"] = "<p>" + p.inner_html + "</p>";
            break;
        case ComponentType::Blockquote:
            s["text"] = wrap("blockquote", p.text);
            break;
        case ComponentType::Link:
            s["text"] = p.text;
            s["link"] = link(p.href, p.target);
            break;
        case ComponentType::Image:
            s["image"] = { { "url", p.src }, { "external", true } };
            s["altText"] = p.alt;
            if (!p.href.empty()) {
                s["link"] = link(p.href, p.target);
            }
            break;
        case ComponentType::Button:
        case ComponentType::SubmitButton:
            s["text"] = p.text;
            if (!p.href.empty()) s["link"] = link(p.href, p.target);
            break;
        case ComponentType::Video: {
            const std::string provider = video_provider(p.src);
            if (provider == "youtube") {
                s["videoType"] = "youtube";
                s["youTubeId"] = video_id(p.src, provider);
            } else if (provider == "vimeo") {
                s["videoType"] = "vimeo";
                s["vimeoId"] = video_id(p.src, provider);
            } else {
                s["videoType"] = "file";
                s["fileUrl"] = p.src;
            }
            break;
        }
        case ComponentType::Icon:
            s["icon"] = { { "library", "fontawesomeSolid" }, { "icon", p.class_name } };
            break;
        case ComponentType::Divider:
            s["style"] = node.styles.border && !node.styles.border->style.empty() ? node.styles.border->style : "solid";
            break;
        case ComponentType::Spacer:
            s["_height"] = format_number(pixels(node.styles.height).value_or(50.0));
            break;
        case ComponentType::Input:
        case ComponentType::Textarea:
        case ComponentType::Select:
        case ComponentType::Checkbox:
        case ComponentType::Radio:
        case ComponentType::FileUpload: {
            std::string type = "text";
            switch (node.component_type) {
            case ComponentType::Textarea: type = "textarea"; break;
            case ComponentType::Select: type = "select"; break;
            case ComponentType::Checkbox: type = "checkbox"; break;
            case ComponentType::Radio: type = "radio"; break;
            case ComponentType::FileUpload: type = "file"; break;
            default:
                if (p.input_type == "email" || p.input_type == "tel" || p.input_type == "number" || p.input_type == "url")
                    type = p.input_type;
                break;
            }
            json field = { { "id", bricks_id(ctx_.next_index()) }, { "type", type },
                { "label", p.placeholder.empty() ? p.name : p.placeholder }, { "placeholder", p.placeholder } };
            if (p.required) field["required"] = true;
            std::string options;
            for (const auto& item : p.items)
                options += (options.empty() ? "" : "\n") + item.title;
            if (!options.empty()) field["options"] = options;
            s["fields"] = json::array({ field });
            s["actions"] = json::array({ "email" });
            break;
        }
        case ComponentType::Accordion:
        case ComponentType::Tabs: {
            json items = json::array();
            for (const auto& item : p.items)
                items.push_back({ { "title", item.title }, { "content", wrap("p", item.content) } });
            s[node.component_type == ComponentType::Tabs ? "tabs" : "accordions"] = items;
            break;
        }
        case ComponentType::Carousel:
        case ComponentType::Slider:
        case ComponentType::Gallery: {
            json images = json::array();
            for (const auto& img : p.images)
                images.push_back({ { "url", img.src }, { "external", true } });
            s["items"] = { { "images", images } };
            if (node.component_type != ComponentType::Gallery) s["type"] = "media";
            break;
        }
        case ComponentType::Testimonial: {
            json items = json::array();
            if (p.items.empty()) {
                items.push_back({ { "content", p.text } });
            } else {
                for (const auto& item : p.items)
                    items.push_back({ { "content", item.content }, { "name", item.title } });
            }
            s["items"] = items;
            break;
        }
        case ComponentType::PricingTable: {
            json table = { { "title", p.items.empty() ? "" : p.items.front().title } };
            if (auto price = find_price(p.text)) {
                table["currency"] = price->currency;
                table["price"] = price->amount;
            }
            s["pricingTables"] = json::array({ table });
            break;
        }
        case ComponentType::ProgressBar: {
            auto it = p.aria_attributes.find("aria-valuenow");
            s["bars"] = json::array({ { { "title", p.text },
                { "percentage", it != p.aria_attributes.end() ? it->second : p.value } } });
            break;
        }
        case ComponentType::Countdown: {
            auto it = p.data_attributes.find("data-date");
            s["date"] = it != p.data_attributes.end() ? it->second : "";
            break;
        }
        case ComponentType::SocialShare: {
            json icons = json::array();
            for (const auto& item : p.items)
                icons.push_back({ { "label", item.title }, { "link", link(item.href) } });
            s["icons"] = icons;
            break;
        }
        case ComponentType::List: {
            json items = json::array();
            for (const auto& item : p.items)
                items.push_back({ { "title", item.title } });
            s["items"] = items;
            break;
        }
        case ComponentType::CodeBlock:
            s["code"] = p.text;
            s["language"] = "markup";
            break;
        case ComponentType::FeatureBox:
        case ComponentType::IconBox:
        case ComponentType::BlogCard: {
            const std::string title = p.items.empty() ? "" : p.items.front().title;
            const std::string body = p.items.empty() ? p.text : p.items.front().content;
            s["content"] = wrap("h3", title) + wrap("p", body);
            if (!p.href.empty()) s["link"] = link(p.href, p.target);
            break;
        }
        case ComponentType::TeamMember: {
            json member = { { "title", p.items.empty() ? "" : p.items.front().title },
                { "description", p.items.empty() ? p.text : p.items.front().content } };
            if (!p.src.empty()) member["image"] = { { "url", p.src }, { "external", true } };
            s["members"] = json::array({ member });
            break;
        }
        case ComponentType::SearchBar:
            s["placeholder"] = p.placeholder.empty() ? "Search ..." : p.placeholder;
            break;
        case ComponentType::Menu:
            s["menuDirection"] = "row";
            break;
        case ComponentType::GoogleMaps: {
            static const std::regex query_re(R"([?&]q=([^&]+))");
            std::smatch m;
            s["addresses"] = json::array({ { { "address", std::regex_search(p.src, m, query_re) ? m[1].str() : "" } } });
            break;
        }
        default:
            break;
        }
        return s;
    }

    void apply_boxes(json& settings, const page_model::ExtractedStyles& s, const std::string& suffix) const {
        if (s.padding) settings["_padding" + suffix] = box(*s.padding);
        if (s.margin) settings["_margin" + suffix] = box(*s.margin);
    }

    void apply_common(json& settings, const HierarchyNode& node) const {
        apply_boxes(settings, node.styles, "");
        if (in_.options.include_responsive && node.responsive_styles) {
            const auto& r = *node.responsive_styles;
            if (r.tablet) apply_boxes(settings, *r.tablet, ":tablet_portrait");
            if (r.mobile) apply_boxes(settings, *r.mobile, ":mobile_portrait");
        }
        if (in_.options.preserve_custom_css && !node.props.class_name.empty()) settings["_cssClasses"] = node.props.class_name;
        if (!node.props.html_id.empty()) settings["_cssId"] = node.props.html_id;
    }

    json layout_settings(const HierarchyNode& node) const {
        const auto& s = node.styles;
        json settings = json::object();
        if (!s.background_color.empty()) settings["_background"]["color"] = { { "hex", s.background_color } };
        if (!s.background_image.empty()) settings["_background"]["image"] = { { "url", s.background_image }, { "external", true } };
        if (s.border) {
            settings["_border"] = { { "style", s.border->style.empty() ? "solid" : s.border->style },
                { "color", { { "hex", s.border->color } } } };
            const std::string w = format_number(pixels(s.border->width).value_or(0.0));
            settings["_border"]["width"] = { { "top", w }, { "right", w }, { "bottom", w }, { "left", w } };
        }
        if (!s.min_height.empty()) settings["_minHeight"] = s.min_height;
        if (!s.gap.empty()) settings["_columnGap"] = s.gap;
        apply_common(settings, node);
        return settings;
    }

    void apply_element_style(json& settings, const HierarchyNode& node) const {
        const auto& s = node.styles;
        json typography = json::object();
        if (!s.color.empty()) typography["color"] = { { "hex", s.color } };
        if (auto size = pixels(s.font_size)) typography["font-size"] = format_number(*size) + "px";
        if (!s.font_family.empty()) typography["font-family"] = page_analysis::normalize_font_family(s.font_family);
        if (!s.font_weight.empty()) typography["font-weight"] = s.font_weight;
        if (!s.text_align.empty()) typography["text-align"] = s.text_align;
        if (!typography.empty()) settings["_typography"] = typography;
        if (!s.background_color.empty()) settings["_background"]["color"] = { { "hex", s.background_color } };
        apply_common(settings, node);
    }

    const ExportInputs& in_;
    EmitContext& ctx_;
    BricksDocument doc_;
    std::map<std::string, std::size_t> index_;
};

double width_percent(const BricksElement& el) {
    if (!el.settings.contains("_width") || !el.settings["_width"].is_string()) return 0;
    return page_analysis::parse_percentage(el.settings["_width"].get<std::string>()).value_or(0.0);
}

} // namespace

const BricksElement* BricksDocument::find(const std::string& id) const {
    for (const auto& el : elements)
        if (el.id == id) return &el;
    return nullptr;
}

std::string bricks_id(int index) {
    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string id(6, '0');
    for (int i = 5; i >= 0 && index > 0; --i) {
        id[i] = digits[index % 36];
        index /= 36;
    }
    return id;
}

BricksDocument convert_bricks(const ExportInputs& inputs, EmitContext& ctx) {
    BricksWriter writer(inputs, ctx);
    return writer.write();
}

nlohmann::json to_json(const BricksDocument& document) {
    json content = json::array();
    for (const auto& el : document.elements) {
        json parent = el.parent == bricks_root_parent ? json(0) : json(el.parent);
        content.push_back({ { "id", el.id }, { "name", el.name }, { "parent", parent }, { "children", el.children },
            { "settings", el.settings } });
    }
    return { { "title", document.title }, { "content", content } };
}

std::vector<std::string> check_structure(const BricksDocument& document) {
    std::vector<std::string> problems;
    if (document.elements.empty()) problems.push_back("Bricks export has no elements");

    std::set<std::string> seen;
    for (const auto& el : document.elements) {
        if (!seen.insert(el.id).second) problems.push_back("Duplicate element id " + el.id);
        if (el.id.size() != 6) problems.push_back("Element id " + el.id + " is not 6 characters");

        if (el.parent == bricks_root_parent) {
            if (el.name != "section") problems.push_back("Top-level element " + el.id + " is a " + el.name);
        } else {
            const BricksElement* parent = document.find(el.parent);
            if (!parent) {
                problems.push_back("Element " + el.id + " has an unknown parent " + el.parent);
            } else if (std::find(parent->children.begin(), parent->children.end(), el.id) == parent->children.end()) {
                problems.push_back("Element " + el.id + " is missing from its parent's children");
            }
        }
        for (const auto& child_id : el.children) {
            const BricksElement* child = document.find(child_id);
            if (!child || child->parent != el.id) problems.push_back("Child " + child_id + " of " + el.id + " does not point back");
        }

        if (el.name == "container" && el.settings.value("_direction", "") == "row") {
            double total = 0;
            for (const auto& child_id : el.children)
                if (const BricksElement* child = document.find(child_id)) total += width_percent(*child);
            if (std::abs(total - page_layout::layout::full_width) > page_layout::layout::column_sum_tolerance)
                problems.push_back(fmt::format("Row container {} widths add up to {}%", el.id, total));
        }
    }
    return problems;
}

} // namespace page_export
