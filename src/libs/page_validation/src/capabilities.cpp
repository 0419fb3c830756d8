#include <page_validation/capabilities.hpp>
#include <algorithm>

namespace page_validation {

const std::vector<page_model::Viewport>& standard_viewports() {
    static const std::vector<page_model::Viewport> viewports = {
        { "mobile", 375, 667 },
        { "tablet", 768, 1024 },
        { "laptop", 1366, 768 },
        { "desktop", 1920, 1080 },
    };
    return viewports;
}

std::optional<page_model::Viewport> find_viewport(std::string_view name) {
    const auto& viewports = standard_viewports();
    auto it = std::find_if(viewports.begin(), viewports.end(),
        [name](const page_model::Viewport& v) { return v.name == name; });
    if (it == viewports.end()) return std::nullopt;
    return *it;
}

} // namespace page_validation
