#pragma once

#include <page_model/element.hpp>
#include <page_model/recognition.hpp>
#include <page_model/typography.hpp>
#include <string>
#include <vector>

namespace page_analysis {

// One styled text run, with inherited values already resolved.
struct TypographySample {
    std::string family;
    double size_px = 16;
    std::string weight = "400";
    std::string line_height;
    std::string letter_spacing;
    std::string text_transform;
    std::string color;
    page_model::TextRole role = page_model::TextRole::Body;
};

// Ratios the scale snaps to.
inline constexpr double scale_ratios[] = { 1.125, 1.2, 1.25, 1.333, 1.414, 1.5, 1.618 };

double snap_ratio(double ratio);

// Name of a size relative to the base ("xs" .. "6xl").
std::string scale_name(double px, double base);

// Walks the document in pre-order; `components` is indexed by element index.
std::vector<TypographySample> collect_typography_samples(const page_model::AnalyzedDocument& document,
    const std::vector<page_model::RecognizedComponent>& components);

page_model::TypographySystem summarize_typography(const std::vector<TypographySample>& samples);

page_model::TypographySystem extract_typography(const page_model::AnalyzedDocument& document,
    const std::vector<page_model::RecognizedComponent>& components);

} // namespace page_analysis
