#pragma once

#include <page_model/dom.hpp>
#include <page_model/styles.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace page_analysis {

// Whole-string decimal parse; nullopt for empty, partial or out-of-range text.
std::optional<double> parse_number(std::string_view text);
std::optional<int> parse_integer(std::string_view text);

// "12px" -> 12, anything else -> 0.
double parse_pixels(const std::string& value);

// px passthrough, rem/em against a 16px root; nullopt for keywords and percentages.
std::optional<double> font_size_to_px(const std::string& value);

// "50%" -> 50.
std::optional<double> parse_percentage(const std::string& value);

// Lowercase hex; empty for transparent. Unknown formats are returned unchanged.
std::string normalize_color(const std::string& value);

// normal -> 400, bold/bolder -> 700, lighter -> 300.
std::string normalize_font_weight(const std::string& weight);

// Strips quotes and keeps the first family of a comma list.
std::string normalize_font_family(const std::string& family);

// Target of the first url(...) or empty.
std::string extract_url(const std::string& value);

// Whitespace split that keeps parenthesised groups together ("1fr repeat(2, 1fr)").
std::vector<std::string> split_css_values(const std::string& value);

// CSS 1-4 value box shorthand.
page_model::BoxSpacing expand_box_shorthand(const std::string& value);

// "color: red; font-size: 12px" -> map; later declarations win.
page_model::StyleMap parse_inline_style(const std::string& style_attribute);

bool looks_like_button(const page_model::ExtractedStyles& styles);
bool looks_like_heading(const page_model::ExtractedStyles& styles);

} // namespace page_analysis
