#include <page_export/gutenberg.hpp>
#include <page_export/markup.hpp>
#include <page_model/logging.hpp>
#include <algorithm>
#include <optional>
#include <regex>

namespace page_export {

namespace {

using json = nlohmann::json;
using page_model::ComponentType;
using page_model::HierarchyNode;
using page_model::NodeKind;

const char* social_services[] = { "facebook", "twitter", "x.com", "linkedin", "instagram", "youtube",
    "pinterest", "tiktok", "github", "whatsapp", "telegram", "mastodon" };

std::string comment_name(const std::string& name) {
    return name.rfind("core/", 0) == 0 ? name.substr(5) : name;
}

std::string attrs_text(const json& attrs) {
    if (attrs.empty()) return "";
    std::string text = attrs.dump();
    for (std::size_t pos = text.find("--"); pos != std::string::npos; pos = text.find("--", pos))
        text.replace(pos, 2, "\\u002d\\u002d");
    return " " + text;
}

void serialize_block(const GutenbergBlock& block, std::string& out) {
    const std::string name = comment_name(block.name);
    if (block.inner_blocks.empty() && block.inner_html.empty()) {
        out += "<!-- wp:" + name + attrs_text(block.attrs) + " /-->\n";
        return;
    }
    out += "<!-- wp:" + name + attrs_text(block.attrs) + " -->\n";
    if (block.inner_blocks.empty()) {
        out += block.inner_html + "\n";
    } else {
        if (!block.wrapper_open.empty()) out += block.wrapper_open + "\n";
        for (const auto& inner : block.inner_blocks)
            serialize_block(inner, out);
        if (!block.wrapper_close.empty()) out += block.wrapper_close + "\n";
    }
    out += "<!-- /wp:" + name + " -->\n";
}

void collect_markers(const GutenbergBlock& block, std::vector<BlockMarker>& out) {
    out.push_back({ block.name, block.attrs });
    for (const auto& inner : block.inner_blocks)
        collect_markers(inner, out);
}

json block_json(const GutenbergBlock& block) {
    json inner = json::array();
    for (const auto& b : block.inner_blocks)
        inner.push_back(block_json(b));
    return { { "blockName", block.name }, { "attrs", block.attrs }, { "innerBlocks", inner } };
}

// Styling worth keeping a wrapper block for.
bool has_own_styling(const HierarchyNode& node) {
    const auto& s = node.styles;
    if (!node.props.class_name.empty() || !node.props.html_id.empty()) return true;
    if (!s.background_color.empty() || !s.background_image.empty() || s.border) return true;
    return node.kind == NodeKind::Container && !is_plain_container(node);
}

class GutenbergWriter {
public:
    GutenbergWriter(const ExportInputs& inputs, EmitContext& ctx)
        : in_(inputs)
        , ctx_(ctx)
    {
    }

    GutenbergDocument write() {
        GutenbergDocument doc;
        doc.title = in_.hierarchy.title;
        if (!in_.hierarchy.root_element_id.empty())
            ctx_.trace_element(in_.hierarchy.root_element_id, document_node_id, true);
        for (const auto& section : in_.hierarchy.sections)
            emit(section, document_node_id, doc.blocks);
        return doc;
    }

private:
    GutenbergBlock block(std::string name) {
        GutenbergBlock b;
        b.name = std::move(name);
        b.client_id = "block-" + std::to_string(ctx_.next_index());
        return b;
    }

    void merge(const HierarchyNode& node, const std::string& enclosing) {
        ctx_.review_layout(node);
        if (!node.element_id.empty()) ctx_.trace_merged(node, enclosing);
    }

    void emit_children(const HierarchyNode& node, const std::string& enclosing, std::vector<GutenbergBlock>& out) {
        for (const auto& child : node.children)
            emit(child, enclosing, out);
    }

    void emit(const HierarchyNode& node, const std::string& enclosing, std::vector<GutenbergBlock>& out) {
        switch (node.kind) {
        case NodeKind::Widget:
            out.push_back(widget(node));
            return;
        case NodeKind::Row:
            if (node.children.size() >= 2) {
                out.push_back(columns(node));
                return;
            }
            merge(node, enclosing);
            emit_children(node, enclosing, out);
            return;
        case NodeKind::Section:
        case NodeKind::Column:
        case NodeKind::Container:
            if (node.implicit || node.element_id.empty() || !has_own_styling(node)) {
                merge(node, enclosing);
                emit_children(node, enclosing, out);
                return;
            }
            out.push_back(group(node));
            return;
        }
    }

    GutenbergBlock group(const HierarchyNode& node) {
        GutenbergBlock g = block("core/group");
        ctx_.review_layout(node);
        ctx_.trace(node, g.client_id);

        std::string tag = "div";
        if (node.tag_name == "section" || node.tag_name == "header" || node.tag_name == "footer"
            || node.tag_name == "main" || node.tag_name == "aside" || node.tag_name == "article")
            tag = node.tag_name;
        if (tag != "div") g.attrs["tagName"] = tag;

        std::string classes = "wp-block-group";
        if (in_.options.preserve_custom_css && !node.props.class_name.empty()) {
            g.attrs["className"] = node.props.class_name;
            classes += " " + node.props.class_name;
        }
        std::string style;
        if (!node.styles.background_color.empty()) {
            g.attrs["style"]["color"]["background"] = node.styles.background_color;
            classes += " has-background";
            style += "background-color:" + node.styles.background_color + ";";
        }
        if (!node.styles.color.empty()) {
            g.attrs["style"]["color"]["text"] = node.styles.color;
            style += "color:" + node.styles.color + ";";
        }
        if (node.styles.padding) {
            const auto& p = *node.styles.padding;
            g.attrs["style"]["spacing"]["padding"] = { { "top", p.top }, { "right", p.right }, { "bottom", p.bottom }, { "left", p.left } };
            style += "padding-top:" + p.top + ";padding-right:" + p.right + ";padding-bottom:" + p.bottom + ";padding-left:" + p.left + ";";
        }
        g.attrs["layout"] = { { "type", "constrained" } };

        g.wrapper_open = "<" + tag + " class=\"" + classes + "\"" + (style.empty() ? "" : " style=\"" + style + "\"") + ">";
        g.wrapper_close = "</" + tag + ">";
        emit_children(node, g.client_id, g.inner_blocks);
        if (g.inner_blocks.empty()) g.inner_html = g.wrapper_open + g.wrapper_close;
        return g;
    }

    GutenbergBlock columns(const HierarchyNode& row) {
        GutenbergBlock cols = block("core/columns");
        ctx_.review_layout(row);
        if (!row.element_id.empty()) ctx_.trace(row, cols.client_id);
        cols.wrapper_open = "<div class=\"wp-block-columns\">";
        cols.wrapper_close = "</div>";

        for (const auto& node : row.children) {
            GutenbergBlock col = block("core/column");
            const std::string width = format_number(node.column_size) + "%";
            col.attrs["width"] = width;
            col.wrapper_open = "<div class=\"wp-block-column\" style=\"flex-basis:" + width + "\">";
            col.wrapper_close = "</div>";
            if (node.kind == NodeKind::Column) {
                ctx_.review_layout(node);
                if (!node.element_id.empty()) ctx_.trace(node, col.client_id);
                emit_children(node, col.client_id, col.inner_blocks);
            } else {
                emit(node, col.client_id, col.inner_blocks);
            }
            if (col.inner_blocks.empty()) col.inner_html = col.wrapper_open + col.wrapper_close;
            cols.inner_blocks.push_back(std::move(col));
        }
        return cols;
    }

    GutenbergBlock html_block(const HierarchyNode& node) {
        GutenbergBlock b = block("core/html");
        b.inner_html = fallback_markup(node);
        return b;
    }

    GutenbergBlock widget(const HierarchyNode& node) {
        if (ctx_.route_widget(node) == Route::HtmlFallback) {
            GutenbergBlock b = html_block(node);
            ctx_.trace(node, b.client_id, true);
            return b;
        }
        std::optional<GutenbergBlock> mapped = leaf(node);
        if (!mapped) {
            ctx_.mapping_gap(node, "core/html");
            mapped = html_block(node);
        }
        ctx_.trace(node, mapped->client_id);
        return std::move(*mapped);
    }

    GutenbergBlock paragraph(const std::string& html) {
        GutenbergBlock p = block("core/paragraph");
        p.inner_html = "<p>" + html + "</p>";
        return p;
    }

    GutenbergBlock image(const std::string& src, const std::string& alt) {
        GutenbergBlock img = block("core/image");
        img.attrs["sizeSlug"] = "full";
        img.inner_html = "<figure class=\"wp-block-image size-full\"><img src=\"" + escape_html(src) + "\" alt=\""
            + escape_html(alt) + "\"/></figure>";
        return img;
    }

    std::optional<GutenbergBlock> leaf(const HierarchyNode& node) {
        const auto& p = node.props;
        switch (node.component_type) {
        case ComponentType::Heading: {
            GutenbergBlock b = block("core/heading");
            b.attrs["level"] = p.level >= 1 && p.level <= 6 ? p.level : 2;
            const std::string tag = heading_tag(node);
            b.inner_html = "<" + tag + " class=\"wp-block-heading\">" + escape_html(p.text) + "</" + tag + ">";
            return b;
        }
        case ComponentType::Paragraph:
            return paragraph(p.inner_html);
        case ComponentType::Text:
            return paragraph(escape_html(p.text));
        case ComponentType::Link:
            return paragraph(node.original_html);
        case ComponentType::Image:
            return image(p.src, p.alt);
        case ComponentType::Video: {
            const std::string provider = video_provider(p.src);
            if (provider == "hosted") {
                GutenbergBlock b = block("core/video");
                b.inner_html = "<figure class=\"wp-block-video\"><video controls src=\"" + escape_html(p.src) + "\"></video></figure>";
                return b;
            }
            GutenbergBlock b = block("core/embed");
            b.attrs = { { "url", p.src }, { "type", "video" }, { "providerNameSlug", provider } };
            b.inner_html = "<figure class=\"wp-block-embed is-type-video is-provider-" + provider + " wp-block-embed-" + provider
                + "\"><div class=\"wp-block-embed__wrapper\">\n" + p.src + "\n</div></figure>";
            return b;
        }
        case ComponentType::List: {
            GutenbergBlock b = block("core/list");
            const std::string tag = p.ordered ? "ol" : "ul";
            if (p.ordered) b.attrs["ordered"] = true;
            b.wrapper_open = "<" + tag + " class=\"wp-block-list\">";
            b.wrapper_close = "</" + tag + ">";
            for (const auto& item : p.items) {
                GutenbergBlock li = block("core/list-item");
                li.inner_html = wrap("li", item.title);
                b.inner_blocks.push_back(std::move(li));
            }
            if (b.inner_blocks.empty()) b.inner_html = b.wrapper_open + b.wrapper_close;
            return b;
        }
        case ComponentType::Blockquote:
        case ComponentType::Testimonial: {
            GutenbergBlock b = block("core/quote");
            b.wrapper_open = "<blockquote class=\"wp-block-quote\">";
            std::string quote = p.text;
            std::string cite;
            if (node.component_type == ComponentType::Testimonial && !p.items.empty()) {
                quote = p.items.front().content;
                cite = p.items.front().title;
            }
            b.wrapper_close = (cite.empty() ? "" : wrap("cite", cite)) + "</blockquote>";
            b.inner_blocks.push_back(paragraph(escape_html(quote)));
            return b;
        }
        case ComponentType::CodeBlock: {
            GutenbergBlock b = block("core/code");
            b.inner_html = "<pre class=\"wp-block-code\"><code>" + escape_html(p.text) + "</code></pre>";
            return b;
        }
        case ComponentType::Divider: {
            GutenbergBlock b = block("core/separator");
            b.inner_html = "<hr class=\"wp-block-separator has-alpha-channel-opacity\"/>";
            return b;
        }
        case ComponentType::Spacer: {
            GutenbergBlock b = block("core/spacer");
            const std::string height = format_number(pixels(node.styles.height).value_or(50.0)) + "px";
            b.attrs["height"] = height;
            b.inner_html = "<div style=\"height:" + height + "\" aria-hidden=\"true\" class=\"wp-block-spacer\"></div>";
            return b;
        }
        case ComponentType::Button:
        case ComponentType::SubmitButton: {
            GutenbergBlock group = block("core/buttons");
            group.wrapper_open = "<div class=\"wp-block-buttons\">";
            group.wrapper_close = "</div>";
            GutenbergBlock b = block("core/button");
            if (!node.styles.background_color.empty()) b.attrs["backgroundColor"] = node.styles.background_color;
            b.inner_html = "<div class=\"wp-block-button\"><a class=\"wp-block-button__link wp-element-button\""
                + (p.href.empty() ? std::string() : " href=\"" + escape_html(p.href) + "\"") + ">" + escape_html(p.text) + "</a></div>";
            group.inner_blocks.push_back(std::move(b));
            return group;
        }
        case ComponentType::Table: {
            GutenbergBlock b = block("core/table");
            std::string rows;
            for (const auto& row : p.rows) {
                rows += "<tr>";
                for (const auto& cell : row)
                    rows += wrap("td", cell);
                rows += "</tr>";
            }
            b.inner_html = "<figure class=\"wp-block-table\"><table><tbody>" + rows + "</tbody></table></figure>";
            return b;
        }
        case ComponentType::Gallery:
        case ComponentType::Carousel:
        case ComponentType::Slider: {
            if (node.component_type != ComponentType::Gallery) ctx_.mapping_gap(node, "core/gallery");
            GutenbergBlock b = block("core/gallery");
            b.attrs["linkTo"] = "none";
            b.wrapper_open = "<figure class=\"wp-block-gallery has-nested-images columns-default is-cropped\">";
            b.wrapper_close = "</figure>";
            for (const auto& img : p.images)
                b.inner_blocks.push_back(image(img.src, img.alt));
            if (b.inner_blocks.empty()) b.inner_html = b.wrapper_open + b.wrapper_close;
            return b;
        }
        case ComponentType::SearchBar: {
            GutenbergBlock b = block("core/search");
            b.attrs = { { "label", "Search" }, { "buttonText", "Search" } };
            if (!p.placeholder.empty()) b.attrs["placeholder"] = p.placeholder;
            return b;
        }
        case ComponentType::Menu: {
            GutenbergBlock b = block("core/navigation");
            for (const auto& item : p.items) {
                GutenbergBlock link = block("core/navigation-link");
                link.attrs = { { "label", item.title }, { "url", item.href } };
                b.inner_blocks.push_back(std::move(link));
            }
            return b;
        }
        case ComponentType::SocialShare: {
            GutenbergBlock b = block("core/social-links");
            b.wrapper_open = "<ul class=\"wp-block-social-links\">";
            b.wrapper_close = "</ul>";
            for (const auto& item : p.items) {
                std::string service = "chain";
                for (const char* candidate : social_services) {
                    if (item.href.find(candidate) != std::string::npos) {
                        service = candidate == std::string("x.com") ? "x" : candidate;
                        break;
                    }
                }
                GutenbergBlock link = block("core/social-link");
                link.attrs = { { "url", item.href }, { "service", service } };
                b.inner_blocks.push_back(std::move(link));
            }
            if (b.inner_blocks.empty()) b.inner_html = b.wrapper_open + b.wrapper_close;
            return b;
        }
        case ComponentType::Accordion: {
            std::vector<GutenbergBlock> panels;
            for (const auto& item : p.items) {
                GutenbergBlock d = block("core/details");
                d.attrs["summary"] = item.title;
                d.wrapper_open = "<details class=\"wp-block-details\"><summary>" + escape_html(item.title) + "</summary>";
                d.wrapper_close = "</details>";
                d.inner_blocks.push_back(paragraph(escape_html(item.content)));
                panels.push_back(std::move(d));
            }
            if (panels.size() == 1) return std::move(panels.front());
            GutenbergBlock g = block("core/group");
            g.attrs["layout"] = { { "type", "constrained" } };
            g.wrapper_open = "<div class=\"wp-block-group\">";
            g.wrapper_close = "</div>";
            g.inner_blocks = std::move(panels);
            if (g.inner_blocks.empty()) g.inner_html = g.wrapper_open + g.wrapper_close;
            return g;
        }
        case ComponentType::Icon:
        case ComponentType::Input:
        case ComponentType::Textarea:
        case ComponentType::Select:
        case ComponentType::Checkbox:
        case ComponentType::Radio:
        case ComponentType::FileUpload:
        case ComponentType::Tabs:
        case ComponentType::PricingTable:
        case ComponentType::ProgressBar:
        case ComponentType::Countdown:
        case ComponentType::Breadcrumbs:
        case ComponentType::Pagination:
        case ComponentType::Cta:
        case ComponentType::FeatureBox:
        case ComponentType::IconBox:
        case ComponentType::TeamMember:
        case ComponentType::BlogCard:
        case ComponentType::ProductCard:
        case ComponentType::GoogleMaps:
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
        case ComponentType::Modal:
        case ComponentType::Unknown:
            return std::nullopt;
        }
        return std::nullopt;
    }

    const ExportInputs& in_;
    EmitContext& ctx_;
};

void check_block(const GutenbergBlock& block, std::vector<std::string>& problems) {
    if (block.name.find('/') == std::string::npos) problems.push_back("Block name '" + block.name + "' has no namespace");
    if (block.name == "core/columns") {
        for (const auto& inner : block.inner_blocks)
            if (inner.name != "core/column") problems.push_back("core/columns holds " + inner.name);
    }
    if (block.name == "core/column" && block.attrs.contains("width") && !block.attrs["width"].is_string())
        problems.push_back("core/column width is not a string");
    for (const auto& inner : block.inner_blocks)
        check_block(inner, problems);
}

} // namespace

GutenbergDocument convert_gutenberg(const ExportInputs& inputs, EmitContext& ctx) {
    GutenbergWriter writer(inputs, ctx);
    return writer.write();
}

std::string serialize_blocks(const GutenbergDocument& document) {
    std::string out;
    for (std::size_t i = 0; i < document.blocks.size(); ++i) {
        if (i) out += "\n";
        serialize_block(document.blocks[i], out);
    }
    return out;
}

std::vector<BlockMarker> parse_block_markers(const std::string& content) {
    static const std::regex marker_re(R"(<!--\s+wp:([a-z][a-z0-9_-]*(?:/[a-z][a-z0-9_-]*)?)\s+(\{[\s\S]*?\}\s+)?/?-->)");
    std::vector<BlockMarker> out;
    for (auto it = std::sregex_iterator(content.begin(), content.end(), marker_re); it != std::sregex_iterator(); ++it) {
        const std::smatch& m = *it;
        BlockMarker marker;
        marker.name = m[1].str();
        if (marker.name.find('/') == std::string::npos) marker.name = "core/" + marker.name;
        if (m[2].matched) {
            json attrs = json::parse(m[2].str(), nullptr, false);
            if (attrs.is_discarded()) {
                page_model::conversion_logger()->warn("Block {} has unparsable attributes", marker.name);
            } else {
                marker.attrs = std::move(attrs);
            }
        }
        out.push_back(std::move(marker));
    }
    return out;
}

std::vector<BlockMarker> block_markers(const GutenbergDocument& document) {
    std::vector<BlockMarker> out;
    for (const auto& block : document.blocks)
        collect_markers(block, out);
    return out;
}

nlohmann::json to_json(const GutenbergDocument& document) {
    json blocks = json::array();
    for (const auto& b : document.blocks)
        blocks.push_back(block_json(b));
    return { { "title", document.title }, { "content", serialize_blocks(document) }, { "blocks", blocks } };
}

std::vector<std::string> check_structure(const GutenbergDocument& document) {
    std::vector<std::string> problems;
    if (document.blocks.empty()) problems.push_back("Gutenberg export has no blocks");
    for (const auto& block : document.blocks)
        check_block(block, problems);
    const auto parsed = parse_block_markers(serialize_blocks(document));
    if (parsed.size() != block_markers(document).size())
        problems.push_back("Serialized content does not round-trip its block markers");
    return problems;
}

} // namespace page_export
