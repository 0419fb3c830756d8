#pragma once

#include <page_model/hierarchy.hpp>
#include <optional>
#include <string>

namespace page_export {

std::string escape_html(const std::string& text);

// "youtube", "vimeo" or "hosted".
std::string video_provider(const std::string& url);

// "h1".."h6"; nodes without a level are emitted as h2.
std::string heading_tag(const page_model::HierarchyNode& node);

// Plain text of a node wrapped in a single tag.
std::string wrap(const std::string& tag, const std::string& text);

// Pixel value of a CSS length, nullopt for non-px values.
std::optional<double> pixels(const std::string& value);

// Numbers without a trailing ".0" ("12", "12.5").
std::string format_number(double value);

struct Price {
    // "$", "€", "£" or "¥"
    std::string currency;
    std::string amount;
};

// First currency-prefixed amount in the text ("€29", "$ 9.99").
std::optional<Price> find_price(const std::string& text);

// Container with no class, id, background, border or padding of its own.
bool is_plain_container(const page_model::HierarchyNode& node);

// Markup kept for HTML fallbacks and generic text widgets.
std::string fallback_markup(const page_model::HierarchyNode& node);

} // namespace page_export
