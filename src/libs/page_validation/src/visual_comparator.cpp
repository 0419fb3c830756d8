#include <page_validation/visual_comparator.hpp>
#include <page_model/logging.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <map>
#include <set>

namespace page_validation {

namespace {

using page_model::DiscrepancySeverity;

bool pixel_at(const Screenshot& shot, int x, int y, const std::uint8_t*& out) {
    if (x >= shot.width || y >= shot.height) return false;
    size_t offset = (static_cast<size_t>(y) * shot.width + x) * 4;
    if (offset + 4 > shot.rgba.size()) return false;
    out = shot.rgba.data() + offset;
    return true;
}

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

// First occurrence wins for duplicated selectors.
std::map<std::string, const RenderedElement*> index_by_selector(const std::vector<RenderedElement>& elements) {
    std::map<std::string, const RenderedElement*> index;
    for (const auto& e : elements) index.emplace(e.selector, &e);
    return index;
}

} // namespace

PixelDiff diff_pixels(const Screenshot& original, const Screenshot& converted, double threshold) {
    PixelDiff diff;
    diff.dimensions_match = original.width == converted.width && original.height == converted.height;
    const int width = std::max(original.width, converted.width);
    const int height = std::max(original.height, converted.height);
    diff.total = static_cast<long long>(width) * height;

    const int limit = static_cast<int>(std::lround(std::clamp(threshold, 0.0, 1.0) * 255.0));
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const std::uint8_t* a = nullptr;
            const std::uint8_t* b = nullptr;
            if (!pixel_at(original, x, y, a) || !pixel_at(converted, x, y, b)) {
                diff.different++;
                continue;
            }
            for (int c = 0; c < 4; ++c) {
                if (std::abs(int(a[c]) - int(b[c])) > limit) {
                    diff.different++;
                    break;
                }
            }
        }
    }
    return diff;
}

DiscrepancySeverity discrepancy_severity(std::string_view property) {
    if (property == "display" || property == "position" || property == "width" || property == "height")
        return DiscrepancySeverity::Major;
    if (property == "font-size" || property == "color" || property == "background-color")
        return DiscrepancySeverity::Moderate;
    return DiscrepancySeverity::Minor;
}

page_model::VisualComparisonResult compare_snapshots(const RenderSnapshot& original, const RenderSnapshot& converted,
    const page_model::Viewport& viewport, double threshold) {
    page_model::VisualComparisonResult result;
    result.viewport = viewport;

    const PixelDiff diff = diff_pixels(original.screenshot, converted.screenshot, threshold);
    result.pixel_difference = diff.different;
    result.total_pixels = diff.total;
    result.dimensions_match = diff.dimensions_match;
    result.diff_percentage = diff.total > 0 ? round2(100.0 * diff.different / diff.total) : 0.0;
    result.similarity_score = round2(100.0 - result.diff_percentage);

    const auto converted_index = index_by_selector(converted.elements);
    const auto original_index = index_by_selector(original.elements);

    std::set<std::string> seen;
    for (const auto& element : original.elements) {
        if (!seen.insert(element.selector).second) continue;
        auto match = converted_index.find(element.selector);
        if (match == converted_index.end()) {
            result.missing_elements.push_back(element.selector);
            continue;
        }
        const auto& converted_styles = match->second->styles;
        for (const auto& [property, value] : element.styles) {
            auto other = converted_styles.find(property);
            std::string converted_value = other == converted_styles.end() ? std::string() : other->second;
            if (converted_value == value) continue;
            result.style_discrepancies.push_back(
                { element.selector, property, value, converted_value, discrepancy_severity(property) });
        }
        for (const auto& [property, value] : converted_styles) {
            if (element.styles.count(property)) continue;
            result.style_discrepancies.push_back(
                { element.selector, property, std::string(), value, discrepancy_severity(property) });
        }
    }
    seen.clear();
    for (const auto& element : converted.elements) {
        if (!seen.insert(element.selector).second) continue;
        if (!original_index.count(element.selector)) result.extra_elements.push_back(element.selector);
    }

    page_model::conversion_logger()->info("Visual comparison at {} ({}x{}): similarity {:.2f}%, {} missing, {} extra",
        viewport.name, viewport.width, viewport.height, result.similarity_score, result.missing_elements.size(),
        result.extra_elements.size());
    return result;
}

} // namespace page_validation
