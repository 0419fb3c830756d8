#include <page_analysis/css_values.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <map>
#include <regex>

namespace page_analysis {

namespace {

const double root_font_size = 16.0;

const std::map<std::string, std::string> named_colors = {
    { "black", "#000000" }, { "white", "#ffffff" }, { "red", "#ff0000" },
    { "green", "#008000" }, { "blue", "#0000ff" }, { "gray", "#808080" },
    { "grey", "#808080" }, { "yellow", "#ffff00" }, { "orange", "#ffa500" },
    { "purple", "#800080" }, { "silver", "#c0c0c0" }, { "navy", "#000080" },
};

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<double> parse_number_with_unit(const std::string& value, const std::string& unit) {
    static const std::regex number_re(R"(^\s*(-?[0-9]*\.?[0-9]+)\s*([a-z%]*)\s*$)");
    std::smatch m;
    if (!std::regex_match(value, m, number_re)) return std::nullopt;
    if (lowercase(m[2].str()) != unit) return std::nullopt;
    return parse_number(m[1].str());
}

} // namespace

std::optional<double> parse_number(std::string_view text) {
    double value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc() || ptr != end) return std::nullopt;
    return value;
}

std::optional<int> parse_integer(std::string_view text) {
    int value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc() || ptr != end) return std::nullopt;
    return value;
}

double parse_pixels(const std::string& value) {
    auto px = parse_number_with_unit(value, "px");
    return px ? *px : 0.0;
}

std::optional<double> font_size_to_px(const std::string& value) {
    if (auto px = parse_number_with_unit(value, "px")) return *px;
    if (auto rem = parse_number_with_unit(value, "rem")) return *rem * root_font_size;
    if (auto em = parse_number_with_unit(value, "em")) return *em * root_font_size;
    return std::nullopt;
}

std::optional<double> parse_percentage(const std::string& value) {
    return parse_number_with_unit(value, "%");
}

std::string normalize_color(const std::string& value) {
    const std::string v = lowercase(trim(value));
    if (v.empty() || v == "transparent" || v == "none") return "";

    static const std::regex rgb_re(
        R"(^rgba?\(\s*(\d{1,3})\s*,\s*(\d{1,3})\s*,\s*(\d{1,3})\s*(?:,\s*([0-9.]+)\s*)?\)$)");
    std::smatch m;
    if (std::regex_match(v, m, rgb_re)) {
        std::optional<double> alpha;
        if (m[4].matched) {
            alpha = parse_number(m[4].str());
            if (!alpha) return v;
            if (*alpha == 0.0) return "";
        }
        const int r = std::min(255, parse_integer(m[1].str()).value_or(0));
        const int g = std::min(255, parse_integer(m[2].str()).value_or(0));
        const int b = std::min(255, parse_integer(m[3].str()).value_or(0));
        char buf[8];
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", r, g, b);
        return buf;
    }
    if (v.size() == 4 && v[0] == '#') {
        std::string out = "#";
        for (std::size_t i = 1; i < 4; ++i) {
            out += v[i];
            out += v[i];
        }
        return out;
    }
    if (v[0] == '#') return v;
    auto it = named_colors.find(v);
    return it != named_colors.end() ? it->second : v;
}

std::string normalize_font_weight(const std::string& weight) {
    const std::string w = lowercase(trim(weight));
    if (w == "normal") return "400";
    if (w == "bold" || w == "bolder") return "700";
    if (w == "lighter") return "300";
    return w;
}

std::string normalize_font_family(const std::string& family) {
    std::string first = family.substr(0, family.find(','));
    first.erase(std::remove_if(first.begin(), first.end(),
        [](char c) { return c == '"' || c == '\''; }), first.end());
    return trim(first);
}

std::string extract_url(const std::string& value) {
    static const std::regex url_re(R"re(url\(\s*['"]?([^'")]+)['"]?\s*\))re");
    std::smatch m;
    if (std::regex_search(value, m, url_re)) return trim(m[1].str());
    return "";
}

std::vector<std::string> split_css_values(const std::string& value) {
    std::vector<std::string> out;
    std::string current;
    int depth = 0;
    for (char c : value) {
        if (c == '(') ++depth;
        if (c == ')') depth = std::max(0, depth - 1);
        if (std::isspace(static_cast<unsigned char>(c)) && depth == 0) {
            if (!current.empty()) out.push_back(current);
            current.clear();
            continue;
        }
        current += c;
    }
    if (!current.empty()) out.push_back(current);
    return out;
}

page_model::BoxSpacing expand_box_shorthand(const std::string& value) {
    const auto parts = split_css_values(value);
    page_model::BoxSpacing box;
    switch (parts.size()) {
    case 0:
        break;
    case 1:
        box.top = box.right = box.bottom = box.left = parts[0];
        break;
    case 2:
        box.top = box.bottom = parts[0];
        box.right = box.left = parts[1];
        break;
    case 3:
        box.top = parts[0];
        box.right = box.left = parts[1];
        box.bottom = parts[2];
        break;
    default:
        box.top = parts[0];
        box.right = parts[1];
        box.bottom = parts[2];
        box.left = parts[3];
        break;
    }
    return box;
}

page_model::StyleMap parse_inline_style(const std::string& style_attribute) {
    page_model::StyleMap out;
    std::size_t start = 0;
    while (start < style_attribute.size()) {
        std::size_t end = style_attribute.find(';', start);
        if (end == std::string::npos) end = style_attribute.size();
        const std::string declaration = style_attribute.substr(start, end - start);
        start = end + 1;

        const auto colon = declaration.find(':');
        if (colon == std::string::npos) continue;
        const std::string property = lowercase(trim(declaration.substr(0, colon)));
        const std::string value = trim(declaration.substr(colon + 1));
        if (property.empty() || value.empty()) continue;
        out[property] = value;
    }
    return out;
}

bool looks_like_button(const page_model::ExtractedStyles& styles) {
    int score = 0;
    if (!styles.background_color.empty()) ++score;
    if (styles.padding && (parse_pixels(styles.padding->top) > 5 || parse_pixels(styles.padding->left) > 10))
        ++score;
    if (styles.border_radius && parse_pixels(styles.border_radius->top_left) > 0) ++score;
    if (styles.cursor == "pointer") ++score;
    if (styles.display == "inline-block" || styles.display == "inline-flex" || styles.display == "flex")
        ++score;
    return score >= 3;
}

bool looks_like_heading(const page_model::ExtractedStyles& styles) {
    const double size = font_size_to_px(styles.font_size.empty() ? "16px" : styles.font_size).value_or(16.0);
    const int weight = parse_integer(styles.font_weight).value_or(400);
    return size > 20 && weight >= 600;
}

} // namespace page_analysis
