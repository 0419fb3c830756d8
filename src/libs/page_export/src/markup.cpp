#include <page_export/markup.hpp>
#include <page_analysis/css_values.hpp>
#include <spdlog/fmt/fmt.h>
#include <regex>

namespace page_export {

std::string escape_html(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        default: out += c; break;
        }
    }
    return out;
}

std::string video_provider(const std::string& url) {
    if (url.find("youtube.com") != std::string::npos || url.find("youtu.be") != std::string::npos) return "youtube";
    if (url.find("vimeo.com") != std::string::npos) return "vimeo";
    return "hosted";
}

std::string heading_tag(const page_model::HierarchyNode& node) {
    const int level = node.props.level >= 1 && node.props.level <= 6 ? node.props.level : 2;
    return "h" + std::to_string(level);
}

std::string wrap(const std::string& tag, const std::string& text) {
    return "<" + tag + ">" + escape_html(text) + "</" + tag + ">";
}

std::optional<double> pixels(const std::string& value) {
    if (value.empty()) return std::nullopt;
    if (value == "0") return 0.0;
    const double px = page_analysis::parse_pixels(value);
    if (px == 0.0 && value.find("px") == std::string::npos) return std::nullopt;
    return px;
}

std::string format_number(double value) {
    return fmt::format("{}", value);
}

std::optional<Price> find_price(const std::string& text) {
    // Alternation, not a bracket set: the symbols are multi-byte UTF-8.
    static const std::regex price_re(R"((\$|€|£|¥)\s?(\d+(?:[.,]\d+)?))");
    std::smatch m;
    if (!std::regex_search(text, m, price_re)) return std::nullopt;
    return Price{ m[1].str(), m[2].str() };
}

bool is_plain_container(const page_model::HierarchyNode& node) {
    if (node.kind != page_model::NodeKind::Container) return false;
    const auto& s = node.styles;
    auto zero_box = [](const std::optional<page_model::BoxSpacing>& box) {
        if (!box) return true;
        for (const auto* side : { &box->top, &box->right, &box->bottom, &box->left })
            if (page_analysis::parse_pixels(*side) != 0.0) return false;
        return true;
    };
    return node.props.class_name.empty() && node.props.html_id.empty() && s.background_color.empty()
        && s.background_image.empty() && !s.border && zero_box(s.padding);
}

std::string fallback_markup(const page_model::HierarchyNode& node) {
    if (!node.original_html.empty()) return node.original_html;
    return wrap(node.tag_name.empty() ? "div" : node.tag_name, node.props.text);
}

} // namespace page_export
