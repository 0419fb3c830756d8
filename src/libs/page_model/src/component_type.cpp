#include <page_model/component_type.hpp>

namespace page_model {

namespace {

constexpr std::array<std::string_view, component_type_count> type_names = {
    "button", "heading", "text", "paragraph", "image", "video", "icon", "spacer", "divider", "link",
    "container", "section", "column", "row", "grid", "card", "hero", "sidebar", "header", "footer",
    "form", "input", "textarea", "select", "checkbox", "radio", "submit-button", "file-upload",
    "accordion", "tabs", "modal", "carousel", "slider", "gallery", "testimonial", "pricing-table",
    "progress-bar", "countdown", "social-share", "breadcrumbs", "pagination", "table", "list",
    "blockquote", "code-block", "cta", "feature-box", "icon-box", "team-member", "blog-card",
    "product-card", "search-bar", "menu", "google-maps", "social-feed", "unknown",
};

std::array<ComponentType, component_type_count> make_all_types() {
    std::array<ComponentType, component_type_count> out{};
    for (std::size_t i = 0; i < component_type_count; ++i)
        out[i] = static_cast<ComponentType>(i);
    return out;
}

} // namespace

std::string_view to_string(ComponentType type) {
    const auto index = static_cast<std::size_t>(type);
    return index < type_names.size() ? type_names[index] : type_names.back();
}

std::optional<ComponentType> component_type_from_string(std::string_view name) {
    for (std::size_t i = 0; i < type_names.size(); ++i)
        if (type_names[i] == name) return static_cast<ComponentType>(i);
    return std::nullopt;
}

const std::array<ComponentType, component_type_count>& all_component_types() {
    static const auto all = make_all_types();
    return all;
}

bool absorbs_children(ComponentType type) {
    switch (type) {
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
        return false;
    case ComponentType::Button:
    case ComponentType::Heading:
    case ComponentType::Text:
    case ComponentType::Paragraph:
    case ComponentType::Image:
    case ComponentType::Video:
    case ComponentType::Icon:
    case ComponentType::Spacer:
    case ComponentType::Divider:
    case ComponentType::Link:
    case ComponentType::Input:
    case ComponentType::Textarea:
    case ComponentType::Select:
    case ComponentType::Checkbox:
    case ComponentType::Radio:
    case ComponentType::SubmitButton:
    case ComponentType::FileUpload:
    case ComponentType::Accordion:
    case ComponentType::Tabs:
    case ComponentType::Carousel:
    case ComponentType::Slider:
    case ComponentType::Gallery:
    case ComponentType::Testimonial:
    case ComponentType::PricingTable:
    case ComponentType::ProgressBar:
    case ComponentType::Countdown:
    case ComponentType::SocialShare:
    case ComponentType::Breadcrumbs:
    case ComponentType::Pagination:
    case ComponentType::Table:
    case ComponentType::List:
    case ComponentType::Blockquote:
    case ComponentType::CodeBlock:
    case ComponentType::Cta:
    case ComponentType::FeatureBox:
    case ComponentType::IconBox:
    case ComponentType::TeamMember:
    case ComponentType::BlogCard:
    case ComponentType::ProductCard:
    case ComponentType::SearchBar:
    case ComponentType::Menu:
    case ComponentType::GoogleMaps:
    case ComponentType::SocialFeed:
        return true;
    }
    return false;
}

bool is_section_like(ComponentType type) {
    return type == ComponentType::Section || type == ComponentType::Hero
        || type == ComponentType::Header || type == ComponentType::Footer;
}

bool is_layout_container(ComponentType type) {
    return !absorbs_children(type) && type != ComponentType::Unknown;
}

} // namespace page_model
