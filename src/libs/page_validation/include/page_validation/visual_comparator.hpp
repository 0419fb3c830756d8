#pragma once

#include <page_validation/capabilities.hpp>
#include <page_model/validation.hpp>
#include <string_view>

namespace page_validation {

struct PixelDiff {
    long long different = 0;
    long long total = 0;
    bool dimensions_match = true;
};

// Compares over the union of both canvases; pixels present in only one image count as different.
// A pixel differs when any channel moves by more than threshold (0..1) of its range.
PixelDiff diff_pixels(const Screenshot& original, const Screenshot& converted, double threshold);

// display/position/width/height major; font-size/color/background-color moderate; the rest minor.
page_model::DiscrepancySeverity discrepancy_severity(std::string_view property);

page_model::VisualComparisonResult compare_snapshots(const RenderSnapshot& original, const RenderSnapshot& converted,
    const page_model::Viewport& viewport, double threshold);

} // namespace page_validation
