#include <page_layout/hierarchy_builder.hpp>
#include <page_layout/layout_constants.hpp>
#include <page_analysis/css_values.hpp>
#include <page_model/logging.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>

namespace page_layout {

namespace {

using page_model::AnalyzedElement;
using page_model::ComponentType;
using page_model::HierarchyNode;
using page_model::NodeKind;

using ElementList = std::vector<const AnalyzedElement*>;

double round_size(double value) {
    const double scale = std::pow(10.0, layout::size_decimals);
    return std::round(value * scale) / scale;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

ElementList child_list(const AnalyzedElement& e) {
    ElementList out;
    for (const auto& child : e.children)
        out.push_back(&child);
    return out;
}

int grid_track_count(const std::string& template_columns) {
    static const std::regex repeat_re(R"(^repeat\(\s*(\d+)\s*,)");
    int tracks = 0;
    for (const auto& part : page_analysis::split_css_values(template_columns)) {
        std::smatch m;
        if (!std::regex_search(part, m, repeat_re)) {
            ++tracks;
            continue;
        }
        // An unreadable count is one track.
        const int count = page_analysis::parse_integer(m[1].str()).value_or(1);
        tracks += std::clamp(count, 1, layout::max_grid_tracks);
    }
    return tracks;
}

template <typename Pred>
void collect_descendants(const AnalyzedElement& e, Pred&& pred, std::vector<const AnalyzedElement*>& out) {
    for (const auto& child : e.children) {
        if (pred(child)) out.push_back(&child);
        collect_descendants(child, pred, out);
    }
}

std::vector<const AnalyzedElement*> descendants_with_tag(const AnalyzedElement& e,
    std::initializer_list<const char*> tags)
{
    std::vector<const AnalyzedElement*> out;
    collect_descendants(e, [&](const AnalyzedElement& d) {
        return std::any_of(tags.begin(), tags.end(), [&](const char* t) { return d.tag_name == t; });
    }, out);
    return out;
}

const AnalyzedElement* first_descendant_with_tag(const AnalyzedElement& e, std::initializer_list<const char*> tags) {
    auto found = descendants_with_tag(e, tags);
    return found.empty() ? nullptr : found.front();
}

// Title/body split of a panel: the first heading-like descendant is the title.
page_model::ComponentItem panel_item(const AnalyzedElement& panel) {
    page_model::ComponentItem item;
    const auto* title = first_descendant_with_tag(panel, { "summary", "button", "h1", "h2", "h3", "h4", "h5", "h6", "dt", "cite" });
    if (!title) {
        item.title = panel.text_content;
        return item;
    }
    item.title = title->text_content;
    std::string body = panel.text_content;
    if (const auto pos = body.find(item.title); pos != std::string::npos) body.erase(pos, item.title.size());
    item.content = page_model::text_content(page_model::make_text(body));
    return item;
}

std::vector<page_model::ComponentItem> link_items(const AnalyzedElement& e) {
    std::vector<page_model::ComponentItem> out;
    for (const auto* a : descendants_with_tag(e, { "a" }))
        out.push_back({ a->text_content, "", a->attribute_or("href") });
    return out;
}

std::vector<page_model::ComponentItem> tab_items(const AnalyzedElement& e) {
    std::vector<const AnalyzedElement*> tabs;
    std::vector<const AnalyzedElement*> panels;
    collect_descendants(e, [](const AnalyzedElement& d) { return d.attribute_or("role") == "tab"; }, tabs);
    collect_descendants(e, [](const AnalyzedElement& d) { return d.attribute_or("role") == "tabpanel"; }, panels);

    std::vector<page_model::ComponentItem> out;
    if (tabs.empty()) {
        for (const auto& child : e.children)
            out.push_back(panel_item(child));
        return out;
    }
    for (std::size_t i = 0; i < tabs.size(); ++i)
        out.push_back({ tabs[i]->text_content, i < panels.size() ? panels[i]->text_content : "", "" });
    return out;
}

class HierarchyBuilder {
public:
    explicit HierarchyBuilder(const std::vector<page_model::RecognizedComponent>& components)
        : components_(components)
    {
    }

    page_model::ComponentHierarchy build(const page_model::AnalyzedDocument& document) {
        page_model::ComponentHierarchy out;
        out.title = document.title;

        const AnalyzedElement& root = document.root;
        ElementList top_level;
        if (root.tag_name == "html" || root.tag_name == "body" || type_of(root) == ComponentType::Container) {
            out.root_element_id = root.id;
            top_level = child_list(root);
        } else {
            top_level.push_back(&root);
        }

        ElementList run;
        auto flush = [&]() {
            if (run.empty()) return;
            HierarchyNode section = implicit(NodeKind::Section);
            section.children = rows_for(root, run);
            out.sections.push_back(std::move(section));
            run.clear();
        };
        for (const auto* e : top_level) {
            if (page_model::is_section_like(type_of(*e))) {
                flush();
                out.sections.push_back(section(*e));
            } else {
                run.push_back(e);
            }
        }
        flush();

        page_model::conversion_logger()->debug("Hierarchy: {} sections, {} nodes", out.sections.size(), counter_);
        return out;
    }

private:
    ComponentType type_of(const AnalyzedElement& e) const {
        return e.index < components_.size() ? components_[e.index].component_type : ComponentType::Unknown;
    }

    bool is_row_type(ComponentType t) const { return t == ComponentType::Row || t == ComponentType::Grid; }

    HierarchyNode implicit(NodeKind kind) {
        HierarchyNode node;
        node.kind = kind;
        node.id = "node-" + std::to_string(counter_++);
        node.implicit = true;
        switch (kind) {
        case NodeKind::Section: node.component_type = ComponentType::Section; break;
        case NodeKind::Row: node.component_type = ComponentType::Row; break;
        case NodeKind::Column: node.component_type = ComponentType::Column; break;
        case NodeKind::Container: node.component_type = ComponentType::Container; break;
        case NodeKind::Widget: node.component_type = ComponentType::Unknown; break;
        }
        return node;
    }

    HierarchyNode from_element(NodeKind kind, const AnalyzedElement& e) {
        HierarchyNode node;
        node.kind = kind;
        node.id = "node-" + std::to_string(counter_++);
        node.component_type = type_of(e);
        node.element_id = e.id;
        node.tag_name = e.tag_name;
        node.covered_element_ids.push_back(e.id);
        node.styles = e.styles;
        node.responsive_styles = e.responsive_styles;
        node.props = extract_props(e, node.component_type);
        if (e.index < components_.size()) node.recognition = components_[e.index].recognition;
        return node;
    }

    HierarchyNode widget(const AnalyzedElement& e) {
        HierarchyNode node = from_element(NodeKind::Widget, e);
        node.original_html = e.outer_html;
        for (const auto& child : e.children)
            page_model::for_each_element(child, [&](const AnalyzedElement& d) { node.covered_element_ids.push_back(d.id); });
        return node;
    }

    HierarchyNode section(const AnalyzedElement& e) {
        HierarchyNode node = from_element(NodeKind::Section, e);
        node.children = rows_for(e, child_list(e));
        return node;
    }

    HierarchyNode content(const AnalyzedElement& e) {
        const ComponentType t = type_of(e);
        if (page_model::absorbs_children(t) || t == ComponentType::Unknown) return widget(e);

        const ElementList kids = child_list(e);
        if (is_row_type(t) && kids.size() >= 2) return row(e, kids, &e);

        HierarchyNode node = from_element(NodeKind::Container, e);
        node.children = content_list(e, kids);
        return node;
    }

    HierarchyNode column(const AnalyzedElement& kid, double size) {
        if (page_model::is_layout_container(type_of(kid))) {
            HierarchyNode col = from_element(NodeKind::Column, kid);
            col.column_size = size;
            col.children = content_list(kid, child_list(kid));
            return col;
        }
        HierarchyNode col = implicit(NodeKind::Column);
        col.column_size = size;
        col.children.push_back(content(kid));
        return col;
    }

    HierarchyNode row(const AnalyzedElement& parent, const ElementList& kids, const AnalyzedElement* row_element) {
        HierarchyNode node = row_element ? from_element(NodeKind::Row, *row_element) : implicit(NodeKind::Row);
        const bool parent_is_row = is_row_type(type_of(parent));

        std::vector<std::optional<double>> hinted;
        for (const auto* kid : kids)
            hinted.push_back(column_hint(*kid, parent, parent_is_row).size);

        if (auto sizes = resolve_column_sizes(hinted)) {
            for (std::size_t i = 0; i < kids.size(); ++i)
                node.children.push_back(column(*kids[i], (*sizes)[i]));
            return node;
        }

        page_model::conversion_logger()->info("Ambiguous column sizes under {} <{}>, using a single column",
            parent.id, parent.tag_name);
        node.layout_review_needed = true;
        HierarchyNode col = implicit(NodeKind::Column);
        col.column_size = layout::full_width;
        col.layout_review_needed = true;
        for (const auto* kid : kids)
            col.children.push_back(content(*kid));
        node.children.push_back(std::move(col));
        return node;
    }

    // Splits `kids` into runs: two or more adjacent column-like siblings form a row.
    std::vector<ElementList> segments(const AnalyzedElement& parent, const ElementList& kids, std::vector<bool>& is_row) {
        const bool parent_is_row = is_row_type(type_of(parent));
        std::vector<ElementList> out;
        ElementList columns;
        ElementList others;
        auto flush_columns = [&]() {
            if (columns.size() >= 2) {
                if (!others.empty()) {
                    out.push_back(others);
                    is_row.push_back(false);
                    others.clear();
                }
                out.push_back(columns);
                is_row.push_back(true);
            } else {
                others.insert(others.end(), columns.begin(), columns.end());
            }
            columns.clear();
        };
        for (const auto* kid : kids) {
            if (column_hint(*kid, parent, parent_is_row).column_like) {
                columns.push_back(kid);
            } else {
                flush_columns();
                others.push_back(kid);
            }
        }
        flush_columns();
        if (!others.empty()) {
            out.push_back(others);
            is_row.push_back(false);
        }
        return out;
    }

    std::vector<HierarchyNode> content_list(const AnalyzedElement& parent, const ElementList& kids) {
        std::vector<bool> is_row;
        std::vector<HierarchyNode> out;
        const auto parts = segments(parent, kids, is_row);
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (is_row[i]) {
                out.push_back(row(parent, parts[i], nullptr));
                continue;
            }
            for (const auto* kid : parts[i])
                out.push_back(content(*kid));
        }
        return out;
    }

    std::vector<HierarchyNode> rows_for(const AnalyzedElement& parent, const ElementList& kids) {
        std::vector<bool> is_row;
        std::vector<HierarchyNode> out;
        const auto parts = segments(parent, kids, is_row);
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (is_row[i]) {
                out.push_back(row(parent, parts[i], nullptr));
                continue;
            }
            HierarchyNode r = implicit(NodeKind::Row);
            HierarchyNode col = implicit(NodeKind::Column);
            col.column_size = layout::full_width;
            for (const auto* kid : parts[i])
                col.children.push_back(content(*kid));
            r.children.push_back(std::move(col));
            out.push_back(std::move(r));
        }
        return out;
    }

    const std::vector<page_model::RecognizedComponent>& components_;
    std::size_t counter_ = 0;
};

} // namespace

ColumnHint column_hint(const page_model::AnalyzedElement& child, const page_model::AnalyzedElement& parent,
    bool parent_is_row)
{
    static const std::regex bootstrap_re(R"(^col(?:-[a-z]{2})?-(\d{1,2})$)");
    static const std::regex elementor_re(R"(^elementor-col-(\d{1,3})$)");

    ColumnHint hint;
    for (const auto& raw : child.classes) {
        const std::string c = lowercase(raw);
        std::smatch m;
        if (std::regex_match(c, m, bootstrap_re)) {
            const int span = page_analysis::parse_integer(m[1].str()).value_or(0);
            if (span < 1 || span > layout::grid_columns) continue;
            hint.column_like = true;
            hint.size = round_size(span * layout::full_width / layout::grid_columns);
            break;
        }
        if (std::regex_match(c, m, elementor_re)) {
            hint.column_like = true;
            hint.size = round_size(page_analysis::parse_number(m[1].str()).value_or(layout::full_width));
            break;
        }
        if (c == "col" || c == "column" || c == "wp-block-column") hint.column_like = true;
    }

    if (!hint.size) {
        if (auto pct = page_analysis::parse_percentage(child.styles.width)) {
            hint.column_like = true;
            hint.size = round_size(*pct);
        }
    }

    const int tracks = grid_track_count(parent.styles.grid_template_columns);
    if (tracks >= 2) {
        hint.column_like = true;
        if (!hint.size) hint.size = round_size(layout::full_width / tracks);
    }
    if (parent_is_row) hint.column_like = true;
    return hint;
}

std::optional<std::vector<double>> resolve_column_sizes(const std::vector<std::optional<double>>& sizes) {
    double known = 0;
    int unknown = 0;
    for (const auto& s : sizes) {
        if (s) known += *s;
        else ++unknown;
    }

    std::vector<double> out;
    if (unknown > 0) {
        const double remaining = layout::full_width - known;
        if (remaining < 1.0) return std::nullopt;
        const double share = round_size(remaining / unknown);
        for (const auto& s : sizes)
            out.push_back(s ? *s : share);
    } else {
        for (const auto& s : sizes)
            out.push_back(*s);
    }

    double total = 0;
    for (double s : out)
        total += s;
    if (total > layout::full_width + layout::column_sum_tolerance) return std::nullopt;
    return out;
}

page_model::ComponentProps extract_props(const page_model::AnalyzedElement& e, page_model::ComponentType type) {
    page_model::ComponentProps p;
    p.text = e.text_content;
    p.inner_html = e.inner_html;
    p.href = e.attribute_or("href");
    p.target = e.attribute_or("target");
    p.src = e.attribute_or("src");
    p.alt = e.attribute_or("alt");
    p.poster = e.attribute_or("poster");
    p.name = e.attribute_or("name");
    p.placeholder = e.attribute_or("placeholder");
    p.value = e.attribute_or("value");
    p.required = e.attributes.count("required") > 0;
    p.width = e.attribute_or("width");
    p.height = e.attribute_or("height");
    p.html_id = e.html_id;
    for (std::size_t i = 0; i < e.classes.size(); ++i)
        p.class_name += (i ? " " : "") + e.classes[i];

    if (e.tag_name == "input" || e.tag_name == "button") p.input_type = e.attribute_or("type", e.tag_name == "input" ? "text" : "");
    if (e.tag_name == "textarea") p.input_type = "textarea";
    if (e.tag_name == "select") p.input_type = "select";

    for (const auto& [key, value] : e.attributes) {
        if (key.rfind("data-", 0) == 0) p.data_attributes[key] = value;
        if (key.rfind("aria-", 0) == 0) p.aria_attributes[key] = value;
    }

    if (e.tag_name.size() == 2 && e.tag_name[0] == 'h' && std::isdigit(static_cast<unsigned char>(e.tag_name[1])))
        p.level = e.tag_name[1] - '0';
    p.ordered = e.tag_name == "ol";

    if (p.src.empty()) {
        if (const auto* img = first_descendant_with_tag(e, { "img" })) {
            p.src = img->attribute_or("src");
            if (p.alt.empty()) p.alt = img->attribute_or("alt");
        } else if (const auto* source = first_descendant_with_tag(e, { "source" })) {
            p.src = source->attribute_or("src");
        }
    }
    if (p.href.empty() && type != ComponentType::Menu) {
        if (const auto* a = first_descendant_with_tag(e, { "a" })) p.href = a->attribute_or("href");
    }

    switch (type) {
    case ComponentType::List:
        for (const auto& child : e.children)
            p.items.push_back({ child.text_content, "", "" });
        break;
    case ComponentType::Menu:
    case ComponentType::Breadcrumbs:
    case ComponentType::Pagination:
    case ComponentType::SocialShare:
        p.items = link_items(e);
        break;
    case ComponentType::Accordion:
        if (e.tag_name == "details") p.items.push_back(panel_item(e));
        else
            for (const auto& child : e.children)
                p.items.push_back(panel_item(child));
        break;
    case ComponentType::Tabs:
        p.items = tab_items(e);
        break;
    case ComponentType::Select:
        for (const auto* option : descendants_with_tag(e, { "option" }))
            p.items.push_back({ option->text_content, option->attribute_or("value", option->text_content), "" });
        break;
    case ComponentType::Carousel:
    case ComponentType::Slider:
        for (const auto& child : e.children)
            p.items.push_back({ child.text_content, "", "" });
        [[fallthrough]];
    case ComponentType::Gallery:
        for (const auto* img : descendants_with_tag(e, { "img" }))
            p.images.push_back({ img->attribute_or("src"), img->attribute_or("alt") });
        break;
    case ComponentType::FeatureBox:
    case ComponentType::IconBox:
    case ComponentType::TeamMember:
    case ComponentType::BlogCard:
    case ComponentType::ProductCard:
    case ComponentType::PricingTable:
    case ComponentType::Cta:
    case ComponentType::Testimonial:
        p.items.push_back(panel_item(e));
        break;
    case ComponentType::Table:
        for (const auto* tr : descendants_with_tag(e, { "tr" })) {
            std::vector<std::string> cells;
            for (const auto& cell : tr->children)
                if (cell.tag_name == "td" || cell.tag_name == "th") cells.push_back(cell.text_content);
            p.rows.push_back(std::move(cells));
        }
        break;
    default:
        break;
    }
    return p;
}

page_model::ComponentHierarchy build_hierarchy(const page_model::AnalyzedDocument& document,
    const std::vector<page_model::RecognizedComponent>& components)
{
    HierarchyBuilder builder(components);
    return builder.build(document);
}

} // namespace page_layout
