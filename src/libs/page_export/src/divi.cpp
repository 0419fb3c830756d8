#include <page_export/divi.hpp>
#include <page_export/markup.hpp>
#include <page_layout/layout_constants.hpp>
#include <cctype>
#include <cmath>
#include <regex>

namespace page_export {

namespace {

using json = nlohmann::json;
using page_model::ComponentType;
using page_model::HierarchyNode;
using page_model::NodeKind;

constexpr const char* builder_version = "4.22.0";

struct Fraction {
    int numerator;
    int denominator;
    const char* name;
};

constexpr Fraction fractions[] = {
    { 1, 1, "4_4" }, { 1, 2, "1_2" }, { 1, 3, "1_3" }, { 2, 3, "2_3" }, { 1, 4, "1_4" }, { 3, 4, "3_4" },
    { 1, 5, "1_5" }, { 2, 5, "2_5" }, { 3, 5, "3_5" }, { 4, 5, "4_5" }, { 1, 6, "1_6" }, { 5, 6, "5_6" },
};

struct ModuleMapping {
    const char* tag;
    bool mapped;
};

ModuleMapping module_for(ComponentType type) {
    switch (type) {
    case ComponentType::Heading: return { "et_pb_heading", true };
    case ComponentType::Text:
    case ComponentType::Paragraph:
    case ComponentType::Link:
    case ComponentType::Blockquote:
    case ComponentType::List: return { "et_pb_text", true };
    case ComponentType::Image: return { "et_pb_image", true };
    case ComponentType::Button:
    case ComponentType::SubmitButton: return { "et_pb_button", true };
    case ComponentType::Video: return { "et_pb_video", true };
    case ComponentType::Icon: return { "et_pb_icon", true };
    case ComponentType::Divider:
    case ComponentType::Spacer: return { "et_pb_divider", true };
    case ComponentType::Input:
    case ComponentType::Textarea:
    case ComponentType::Select:
    case ComponentType::Checkbox:
    case ComponentType::Radio:
    case ComponentType::FileUpload: return { "et_pb_contact_form", true };
    case ComponentType::Accordion: return { "et_pb_accordion", true };
    case ComponentType::Tabs: return { "et_pb_tabs", true };
    case ComponentType::Carousel:
    case ComponentType::Slider: return { "et_pb_slider", true };
    case ComponentType::Testimonial: return { "et_pb_testimonial", true };
    case ComponentType::PricingTable: return { "et_pb_pricing_tables", true };
    case ComponentType::ProgressBar: return { "et_pb_counters", true };
    case ComponentType::Countdown: return { "et_pb_countdown_timer", true };
    case ComponentType::SocialShare: return { "et_pb_social_media_follow", true };
    case ComponentType::CodeBlock: return { "et_pb_code", true };
    case ComponentType::Cta: return { "et_pb_cta", true };
    case ComponentType::FeatureBox:
    case ComponentType::IconBox:
    case ComponentType::BlogCard: return { "et_pb_blurb", true };
    case ComponentType::TeamMember: return { "et_pb_team_member", true };
    case ComponentType::SearchBar: return { "et_pb_search", true };
    case ComponentType::Menu: return { "et_pb_menu", true };
    case ComponentType::GoogleMaps: return { "et_pb_map", true };
    case ComponentType::Gallery:
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
    case ComponentType::Modal: return { "et_pb_text", false };
    case ComponentType::Unknown: return { "et_pb_code", false };
    }
    return { "et_pb_code", false };
}

// Brackets inside enclosed content would close the shortcode.
std::string escape_content(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '[') out += "&#91;";
        else if (c == ']') out += "&#93;";
        else out += c;
    }
    return out;
}

std::string box_value(const page_model::BoxSpacing& box) {
    auto side = [](const std::string& v) { return format_number(pixels(v).value_or(0.0)) + "px"; };
    return side(box.top) + "|" + side(box.right) + "|" + side(box.bottom) + "|" + side(box.left) + "|false|false";
}

std::string contact_field_type(const HierarchyNode& node) {
    switch (node.component_type) {
    case ComponentType::Textarea: return "text";
    case ComponentType::Select: return "select";
    case ComponentType::Checkbox: return "checkbox";
    case ComponentType::Radio: return "radio";
    default: break;
    }
    return node.props.input_type == "email" ? "email" : "input";
}

void serialize(const DiviShortcode& sc, std::string& out) {
    out += "[" + sc.tag;
    for (const auto& [name, value] : sc.attrs)
        out += " " + name + "=\"" + escape_shortcode_attr(value) + "\"";
    out += "]";
    if (sc.children.empty()) {
        out += escape_content(sc.content);
    } else {
        for (const auto& child : sc.children)
            serialize(child, out);
    }
    out += "[/" + sc.tag + "]";
}

json shortcode_json(const DiviShortcode& sc) {
    json attrs = json::object();
    for (const auto& [name, value] : sc.attrs)
        attrs[name] = value;
    json children = json::array();
    for (const auto& child : sc.children)
        children.push_back(shortcode_json(child));
    json out = { { "tag", sc.tag }, { "attrs", attrs }, { "children", children } };
    if (!sc.content.empty()) out["content"] = sc.content;
    return out;
}

std::size_t count_shortcodes(const DiviShortcode& sc) {
    std::size_t n = 1;
    for (const auto& child : sc.children)
        n += count_shortcodes(child);
    return n;
}

class DiviWriter {
public:
    DiviWriter(const ExportInputs& inputs, EmitContext& ctx)
        : in_(inputs)
        , ctx_(ctx)
    {
    }

    DiviLayout write() {
        DiviLayout layout;
        layout.title = in_.hierarchy.title;
        if (!in_.hierarchy.root_element_id.empty())
            ctx_.trace_element(in_.hierarchy.root_element_id, document_node_id, true);
        for (const auto& section : in_.hierarchy.sections)
            layout.sections.push_back(section_code(section));
        return layout;
    }

private:
    DiviShortcode shortcode(const char* tag) {
        DiviShortcode sc;
        sc.tag = tag;
        sc.id = "et-" + std::to_string(ctx_.next_index());
        sc.set("_builder_version", builder_version);
        return sc;
    }

    void trace_layout(const HierarchyNode& node, const std::string& id, bool merged = false) {
        ctx_.review_layout(node);
        if (node.element_id.empty()) return;
        if (merged) ctx_.trace_merged(node, id);
        else ctx_.trace(node, id);
    }

    DiviShortcode section_code(const HierarchyNode& section) {
        DiviShortcode sc = shortcode("et_pb_section");
        sc.set("fb_built", "1");
        apply_layout_style(sc, section);
        trace_layout(section, sc.id);

        // Loose content between rows shares one full-width row.
        DiviShortcode* open_column = nullptr;
        for (const auto& child : section.children) {
            if (child.kind == NodeKind::Row) {
                open_column = nullptr;
                sc.children.push_back(row_code(child, "et_pb_row", "et_pb_column"));
                continue;
            }
            if (!open_column) {
                DiviShortcode row = shortcode("et_pb_row");
                row.set("column_structure", "4_4");
                DiviShortcode col = shortcode("et_pb_column");
                col.set("type", "4_4");
                row.children.push_back(std::move(col));
                sc.children.push_back(std::move(row));
                open_column = &sc.children.back().children.back();
            }
            column_content(child, *open_column, false);
        }
        return sc;
    }

    DiviShortcode row_code(const HierarchyNode& row_node, const char* row_tag, const char* column_tag) {
        DiviShortcode row = shortcode(row_tag);
        trace_layout(row_node, row.id);
        const bool inner = std::string(row_tag) == "et_pb_row_inner";

        std::string structure;
        for (const auto& child : row_node.children) {
            const std::string type = divi_fraction(child.column_size);
            structure += (structure.empty() ? "" : ",") + type;

            DiviShortcode col = shortcode(column_tag);
            col.set("type", type);
            if (child.kind == NodeKind::Column) {
                apply_layout_style(col, child);
                trace_layout(child, col.id);
                for (const auto& grandchild : child.children)
                    column_content(grandchild, col, inner);
            } else {
                column_content(child, col, inner);
            }
            row.children.push_back(std::move(col));
        }
        row.attrs.insert(row.attrs.begin() + 1, { "column_structure", structure });
        return row;
    }

    // Containers flatten into the column; one level of nested rows is allowed.
    void column_content(const HierarchyNode& node, DiviShortcode& column, bool inner) {
        switch (node.kind) {
        case NodeKind::Widget:
            column.children.push_back(module(node));
            return;
        case NodeKind::Row:
            if (!inner && node.children.size() >= 2) {
                column.children.push_back(row_code(node, "et_pb_row_inner", "et_pb_column_inner"));
                return;
            }
            break;
        case NodeKind::Section:
        case NodeKind::Column:
        case NodeKind::Container:
            break;
        }
        trace_layout(node, column.id, true);
        for (const auto& child : node.children)
            column_content(child, column, inner);
    }

    DiviShortcode module(const HierarchyNode& node) {
        if (ctx_.route_widget(node) == Route::HtmlFallback) {
            DiviShortcode sc = shortcode("et_pb_code");
            sc.content = fallback_markup(node);
            ctx_.trace(node, sc.id, true);
            return sc;
        }
        const ModuleMapping mapping = module_for(node.component_type);
        DiviShortcode sc = shortcode(mapping.tag);
        if (mapping.mapped) {
            fill_module(sc, node);
        } else {
            ctx_.mapping_gap(node, mapping.tag);
            sc.content = fallback_markup(node);
        }
        apply_module_style(sc, node);
        ctx_.trace(node, sc.id);
        return sc;
    }

    void fill_module(DiviShortcode& sc, const HierarchyNode& node) {
        const auto& p = node.props;
        switch (node.component_type) {
        case ComponentType::Heading:
            sc.set("title", p.text);
            sc.set("title_level", heading_tag(node));
            break;
        case ComponentType::Paragraph:
            sc.content = "<p>" + p.inner_html + "</p>";
            break;
        case ComponentType::Text:
            sc.content = wrap("p", p.text);
            break;
        case ComponentType::Link:
            sc.content = "<p>" + node.original_html + "</p>";
            break;
        case ComponentType::Blockquote:
            sc.content = wrap("blockquote", p.text);
            break;
        case ComponentType::List: {
            const std::string tag = p.ordered ? "ol" : "ul";
            std::string items;
            for (const auto& item : p.items)
                items += wrap("li", item.title);
            sc.content = "<" + tag + ">" + items + "</" + tag + ">";
            break;
        }
        case ComponentType::Image:
            sc.set("src", p.src);
            sc.set("alt", p.alt);
            if (!p.href.empty()) sc.set("url", p.href);
            break;
        case ComponentType::Button:
        case ComponentType::SubmitButton:
            sc.set("button_text", p.text);
            sc.set("button_url", p.href);
            if (p.target == "_blank") sc.set("url_new_window", "on");
            break;
        case ComponentType::Video:
            sc.set("src", p.src);
            if (!p.poster.empty()) sc.set("image_src", p.poster);
            break;
        case ComponentType::Icon:
            sc.set("font_icon", p.class_name);
            break;
        case ComponentType::Divider:
            sc.set("show_divider", "on");
            break;
        case ComponentType::Spacer:
            sc.set("show_divider", "off");
            sc.set("height", format_number(pixels(node.styles.height).value_or(50.0)) + "px");
            break;
        case ComponentType::Input:
        case ComponentType::Textarea:
        case ComponentType::Select:
        case ComponentType::Checkbox:
        case ComponentType::Radio:
        case ComponentType::FileUpload: {
            DiviShortcode field = shortcode("et_pb_contact_field");
            field.set("field_id", p.name.empty() ? "field_" + std::to_string(ctx_.next_index()) : p.name);
            field.set("field_title", p.placeholder.empty() ? p.name : p.placeholder);
            field.set("field_type", contact_field_type(node));
            if (p.required) field.set("required_mark", "on");
            sc.children.push_back(std::move(field));
            break;
        }
        case ComponentType::Accordion:
        case ComponentType::Tabs: {
            const bool tabs = node.component_type == ComponentType::Tabs;
            for (const auto& item : p.items) {
                DiviShortcode panel = shortcode(tabs ? "et_pb_tab" : "et_pb_accordion_item");
                panel.set("title", item.title);
                panel.content = wrap("p", item.content);
                sc.children.push_back(std::move(panel));
            }
            break;
        }
        case ComponentType::Carousel:
        case ComponentType::Slider:
            for (const auto& img : p.images) {
                DiviShortcode slide = shortcode("et_pb_slide");
                slide.set("background_image", img.src);
                slide.set("heading", img.alt);
                sc.children.push_back(std::move(slide));
            }
            break;
        case ComponentType::Testimonial:
            if (!p.items.empty()) sc.set("author", p.items.front().title);
            sc.content = wrap("p", p.items.empty() ? p.text : p.items.front().content);
            break;
        case ComponentType::PricingTable: {
            DiviShortcode table = shortcode("et_pb_pricing_table");
            table.set("title", p.items.empty() ? "" : p.items.front().title);
            if (auto price = find_price(p.text)) {
                table.set("currency", price->currency);
                table.set("sum", price->amount);
            }
            sc.children.push_back(std::move(table));
            break;
        }
        case ComponentType::ProgressBar: {
            auto it = p.aria_attributes.find("aria-valuenow");
            DiviShortcode counter = shortcode("et_pb_counter");
            counter.set("percent", it != p.aria_attributes.end() ? it->second : p.value);
            counter.content = p.text;
            sc.children.push_back(std::move(counter));
            break;
        }
        case ComponentType::Countdown: {
            auto it = p.data_attributes.find("data-date");
            sc.set("date_time", it != p.data_attributes.end() ? it->second : "");
            break;
        }
        case ComponentType::SocialShare:
            for (const auto& item : p.items) {
                DiviShortcode network = shortcode("et_pb_social_media_follow_network");
                std::string name = item.title;
                for (auto& c : name)
                    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                network.set("social_network", name);
                network.set("url", item.href);
                network.content = item.title;
                sc.children.push_back(std::move(network));
            }
            break;
        case ComponentType::CodeBlock:
            sc.content = "<pre><code>" + escape_html(p.text) + "</code></pre>";
            break;
        case ComponentType::Cta:
            sc.set("title", p.items.empty() ? "" : p.items.front().title);
            sc.set("button_url", p.href);
            sc.content = wrap("p", p.items.empty() ? p.text : p.items.front().content);
            break;
        case ComponentType::FeatureBox:
        case ComponentType::IconBox:
        case ComponentType::BlogCard:
            sc.set("title", p.items.empty() ? "" : p.items.front().title);
            if (!p.src.empty()) sc.set("image", p.src);
            if (!p.href.empty()) sc.set("url", p.href);
            if (node.component_type == ComponentType::IconBox) sc.set("use_icon", "on");
            sc.content = wrap("p", p.items.empty() ? p.text : p.items.front().content);
            break;
        case ComponentType::TeamMember:
            sc.set("name", p.items.empty() ? "" : p.items.front().title);
            if (!p.src.empty()) sc.set("image_url", p.src);
            sc.content = wrap("p", p.items.empty() ? p.text : p.items.front().content);
            break;
        case ComponentType::SearchBar:
            sc.set("placeholder", p.placeholder.empty() ? "Search ..." : p.placeholder);
            break;
        case ComponentType::Menu:
            sc.set("menu_style", "left_aligned");
            break;
        case ComponentType::GoogleMaps: {
            static const std::regex query_re(R"([?&]q=([^&]+))");
            std::smatch m;
            sc.set("address", std::regex_search(p.src, m, query_re) ? m[1].str() : "");
            break;
        }
        default:
            break;
        }
    }

    void apply_layout_style(DiviShortcode& sc, const HierarchyNode& node) const {
        const auto& s = node.styles;
        if (!s.background_color.empty()) sc.set("background_color", s.background_color);
        if (!s.background_image.empty()) sc.set("background_image", s.background_image);
        if (s.padding) sc.set("custom_padding", box_value(*s.padding));
        if (s.margin) sc.set("custom_margin", box_value(*s.margin));
        apply_common(sc, node);
    }

    void apply_module_style(DiviShortcode& sc, const HierarchyNode& node) const {
        const auto& s = node.styles;
        const bool text_like = sc.tag == "et_pb_text" || sc.tag == "et_pb_heading";
        if (text_like) {
            const char* prefix = sc.tag == "et_pb_heading" ? "title" : "text";
            if (!s.color.empty()) sc.set(std::string(prefix) + "_text_color", s.color);
            if (auto size = pixels(s.font_size)) sc.set(std::string(prefix) + "_font_size", format_number(*size) + "px");
            if (!s.font_family.empty()) {
                // family|weight|italic|uppercase|underline|...
                const std::string family = s.font_family.substr(0, s.font_family.find(','));
                sc.set(std::string(prefix) + "_font", family + "|" + (s.font_weight.empty() ? "" : s.font_weight) + "|||||||");
            }
            if (!s.text_align.empty()) sc.set(std::string(prefix) + "_text_align", s.text_align);
        } else if (sc.tag == "et_pb_button") {
            sc.set("custom_button", "on");
            if (!s.background_color.empty()) sc.set("button_bg_color", s.background_color);
            if (!s.color.empty()) sc.set("button_text_color", s.color);
        } else if (!s.background_color.empty()) {
            sc.set("background_color", s.background_color);
        }
        if (s.padding) sc.set("custom_padding", box_value(*s.padding));
        if (s.margin) sc.set("custom_margin", box_value(*s.margin));
        apply_common(sc, node);
    }

    void apply_common(DiviShortcode& sc, const HierarchyNode& node) const {
        if (in_.options.include_responsive && node.responsive_styles) {
            const auto& r = *node.responsive_styles;
            bool responsive = false;
            if (r.tablet && r.tablet->padding) {
                sc.set("custom_padding_tablet", box_value(*r.tablet->padding));
                responsive = true;
            }
            if (r.mobile && r.mobile->padding) {
                sc.set("custom_padding_phone", box_value(*r.mobile->padding));
                responsive = true;
            }
            if (responsive) sc.set("custom_padding_last_edited", "on|desktop");
        }
        if (in_.options.preserve_custom_css && !node.props.class_name.empty()) sc.set("module_class", node.props.class_name);
        if (!node.props.html_id.empty()) sc.set("module_id", node.props.html_id);
    }

    const ExportInputs& in_;
    EmitContext& ctx_;
};

void check_column(const DiviShortcode& col, const char* expected, std::vector<std::string>& problems) {
    if (col.tag != expected) {
        problems.push_back(std::string("Row holds ") + col.tag + " instead of " + expected);
        return;
    }
    for (const auto& child : col.children) {
        if (child.tag == "et_pb_section" || child.tag == "et_pb_row" || child.tag == "et_pb_column") {
            problems.push_back("Column holds " + child.tag);
        } else if (child.tag == "et_pb_row_inner") {
            if (std::string(expected) != "et_pb_column") problems.push_back("Inner row nested inside an inner row");
            for (const auto& inner : child.children)
                check_column(inner, "et_pb_column_inner", problems);
        }
    }
}

} // namespace

void DiviShortcode::set(const std::string& name, const std::string& value) {
    for (auto& attr : attrs) {
        if (attr.first == name) {
            attr.second = value;
            return;
        }
    }
    attrs.emplace_back(name, value);
}

const std::string* DiviShortcode::attr(const std::string& name) const {
    for (const auto& attr : attrs)
        if (attr.first == name) return &attr.second;
    return nullptr;
}

DiviLayout convert_divi(const ExportInputs& inputs, EmitContext& ctx) {
    DiviWriter writer(inputs, ctx);
    return writer.write();
}

std::string divi_fraction(double percent) {
    const double ratio = percent / page_layout::layout::full_width;
    const Fraction* best = &fractions[0];
    double best_distance = 2.0;
    for (const auto& f : fractions) {
        const double distance = std::abs(ratio - static_cast<double>(f.numerator) / f.denominator);
        if (distance < best_distance) {
            best_distance = distance;
            best = &f;
        }
    }
    return best->name;
}

std::string escape_shortcode_attr(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
        case '"': out += "%22"; break;
        case '[': out += "%91"; break;
        case ']': out += "%93"; break;
        default: out += c; break;
        }
    }
    return out;
}

std::string serialize_shortcodes(const DiviLayout& layout) {
    std::string out;
    for (const auto& section : layout.sections)
        serialize(section, out);
    return out;
}

std::vector<std::string> shortcode_tags(const std::string& content) {
    static const std::regex tag_re(R"(\[(et_pb_[a-z0-9_]+)[\s\]])");
    std::vector<std::string> out;
    for (auto it = std::sregex_iterator(content.begin(), content.end(), tag_re); it != std::sregex_iterator(); ++it)
        out.push_back((*it)[1].str());
    return out;
}

nlohmann::json to_json(const DiviLayout& layout) {
    json sections = json::array();
    for (const auto& section : layout.sections)
        sections.push_back(shortcode_json(section));
    return { { "title", layout.title }, { "content", serialize_shortcodes(layout) }, { "shortcodes", sections } };
}

std::vector<std::string> check_structure(const DiviLayout& layout) {
    std::vector<std::string> problems;
    if (layout.sections.empty()) problems.push_back("Divi layout has no sections");
    std::size_t total = 0;
    for (const auto& section : layout.sections) {
        total += count_shortcodes(section);
        if (section.tag != "et_pb_section") {
            problems.push_back("Top-level shortcode " + section.tag + " is not a section");
            continue;
        }
        for (const auto& row : section.children) {
            if (row.tag != "et_pb_row") {
                problems.push_back("Section holds " + row.tag);
                continue;
            }
            const std::string* structure = row.attr("column_structure");
            std::string expected;
            for (const auto& col : row.children) {
                const std::string* type = col.attr("type");
                expected += (expected.empty() ? "" : ",") + (type ? *type : std::string("?"));
                check_column(col, "et_pb_column", problems);
            }
            if (!structure || *structure != expected)
                problems.push_back("Row column_structure does not match its columns (" + expected + ")");
        }
    }
    if (shortcode_tags(serialize_shortcodes(layout)).size() != total)
        problems.push_back("Serialized shortcodes do not match the layout tree");
    return problems;
}

} // namespace page_export
