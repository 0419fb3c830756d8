#include <page_analysis/typography.hpp>
#include <page_analysis/css_values.hpp>
#include <page_model/logging.hpp>
#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <set>

namespace page_analysis {

namespace {

using page_model::TextRole;

const double min_base_size = 14.0;
const double max_base_size = 18.0;
const double default_base_size = 16.0;
const double default_ratio = 1.25;

const std::vector<std::string> google_font_families = {
    "Roboto", "Open Sans", "Lato", "Montserrat", "Poppins", "Inter", "Raleway", "Oswald",
    "Source Sans Pro", "Nunito", "Playfair Display", "Merriweather", "Ubuntu", "PT Sans",
    "Noto Sans", "Rubik", "Work Sans", "Mulish", "Barlow", "DM Sans", "Lora", "Quicksand",
};

struct Inherited {
    std::string family;
    double size_px = default_base_size;
    std::string color;
    std::string line_height;
};

struct FamilyTally {
    page_model::FontUsage usage;
    std::size_t first_seen = 0;
    int heading_uses = 0;
};

struct TypographyFold {
    std::map<std::string, FamilyTally> families;
    std::map<int, int> size_counts;
    std::map<TextRole, page_model::TextStyle> first_styles;
};

bool is_heading(TextRole role) {
    return role == TextRole::H1 || role == TextRole::H2 || role == TextRole::H3
        || role == TextRole::H4 || role == TextRole::H5 || role == TextRole::H6;
}

TextRole role_for(const page_model::AnalyzedElement& element, page_model::ComponentType type) {
    const std::string& tag = element.tag_name;
    if (tag == "h1") return TextRole::H1;
    if (tag == "h2") return TextRole::H2;
    if (tag == "h3") return TextRole::H3;
    if (tag == "h4") return TextRole::H4;
    if (tag == "h5") return TextRole::H5;
    if (tag == "h6") return TextRole::H6;
    if (type == page_model::ComponentType::Button || type == page_model::ComponentType::SubmitButton)
        return TextRole::Button;
    if (tag == "a") return TextRole::Link;
    if (tag == "small" || tag == "figcaption" || tag == "caption") return TextRole::Caption;
    return TextRole::Body;
}

TypographyFold fold_sample(TypographyFold acc, const TypographySample& s) {
    if (!s.family.empty()) {
        auto [it, inserted] = acc.families.try_emplace(s.family);
        FamilyTally& tally = it->second;
        if (inserted) {
            tally.usage.family = s.family;
            tally.first_seen = acc.families.size() - 1;
        }
        tally.usage.weights.insert(s.weight);
        ++tally.usage.usage_count;
        ++tally.usage.role_counts[s.role];
        if (is_heading(s.role)) ++tally.heading_uses;
    }
    ++acc.size_counts[static_cast<int>(std::lround(s.size_px))];

    page_model::TextStyle style;
    style.font_family = s.family;
    style.font_size = s.size_px;
    style.font_weight = s.weight;
    style.line_height = s.line_height;
    style.letter_spacing = s.letter_spacing;
    style.text_transform = s.text_transform;
    style.color = s.color;
    acc.first_styles.emplace(s.role, std::move(style));
    return acc;
}

double pick_base_size(const std::map<int, int>& size_counts) {
    double base = default_base_size;
    int best = 0;
    for (const auto& [px, count] : size_counts) {
        if (px < min_base_size || px > max_base_size) continue;
        if (count > best) {
            best = count;
            base = px;
        }
    }
    return base;
}

double compute_ratio(const std::map<int, int>& size_counts, double base) {
    std::vector<double> above;
    for (const auto& [px, count] : size_counts)
        if (px > base) above.push_back(px);
    if (above.empty()) return default_ratio;

    double previous = base;
    double sum = 0;
    for (double px : above) {
        sum += px / previous;
        previous = px;
    }
    return snap_ratio(sum / static_cast<double>(above.size()));
}

std::vector<page_model::FontUsage> ranked_fonts(const std::map<std::string, FamilyTally>& families) {
    std::vector<const FamilyTally*> order;
    for (const auto& [name, tally] : families)
        order.push_back(&tally);
    std::sort(order.begin(), order.end(), [](const FamilyTally* a, const FamilyTally* b) {
        if (a->usage.usage_count != b->usage.usage_count) return a->usage.usage_count > b->usage.usage_count;
        return a->first_seen < b->first_seen;
    });
    std::vector<page_model::FontUsage> out;
    for (const auto* tally : order)
        out.push_back(tally->usage);
    return out;
}

std::string heading_family(const std::map<std::string, FamilyTally>& families) {
    const FamilyTally* best = nullptr;
    for (const auto& [name, tally] : families) {
        if (tally.heading_uses == 0) continue;
        if (!best || tally.heading_uses > best->heading_uses
            || (tally.heading_uses == best->heading_uses && tally.first_seen < best->first_seen))
            best = &tally;
    }
    return best ? best->usage.family : "";
}

page_model::ScaleQuality rate_scale(int sizes, int fonts) {
    if (sizes <= 8 && fonts <= 2) return page_model::ScaleQuality::Excellent;
    if (sizes <= 12 && fonts <= 3) return page_model::ScaleQuality::Good;
    if (sizes <= 16 && fonts <= 4) return page_model::ScaleQuality::Fair;
    return page_model::ScaleQuality::Poor;
}

void collect(const page_model::AnalyzedElement& element, const Inherited& parent,
    const std::vector<page_model::RecognizedComponent>& components, std::vector<TypographySample>& out)
{
    Inherited here = parent;
    if (!element.styles.font_family.empty()) here.family = normalize_font_family(element.styles.font_family);
    if (auto px = font_size_to_px(element.styles.font_size)) here.size_px = *px;
    if (!element.styles.color.empty()) here.color = element.styles.color;
    if (!element.styles.line_height.empty()) here.line_height = element.styles.line_height;

    const auto type = element.index < components.size()
        ? components[element.index].component_type
        : page_model::ComponentType::Unknown;
    const TextRole role = role_for(element, type);
    const bool emphasised = is_heading(role) || role == TextRole::Button;
    if (!element.own_text.empty() || (emphasised && !element.text_content.empty())) {
        TypographySample s;
        s.family = here.family;
        s.size_px = here.size_px;
        s.weight = element.styles.font_weight.empty() ? (is_heading(role) ? "700" : "400") : element.styles.font_weight;
        s.line_height = here.line_height;
        s.letter_spacing = element.styles.letter_spacing;
        s.text_transform = element.styles.text_transform;
        s.color = here.color;
        s.role = role;
        out.push_back(std::move(s));
    }
    for (const auto& child : element.children)
        collect(child, here, components, out);
}

} // namespace

double snap_ratio(double ratio) {
    double best = scale_ratios[0];
    for (double candidate : scale_ratios) {
        if (std::abs(candidate - ratio) < std::abs(best - ratio)) best = candidate;
    }
    return best;
}

std::string scale_name(double px, double base) {
    const double r = px / base;
    if (r <= 0.75) return "xs";
    if (r <= 0.875) return "sm";
    if (r <= 1.125) return "base";
    if (r <= 1.25) return "lg";
    if (r <= 1.5) return "xl";
    if (r <= 1.875) return "2xl";
    if (r <= 2.25) return "3xl";
    if (r <= 3) return "4xl";
    if (r <= 4) return "5xl";
    return "6xl";
}

std::vector<TypographySample> collect_typography_samples(const page_model::AnalyzedDocument& document,
    const std::vector<page_model::RecognizedComponent>& components)
{
    std::vector<TypographySample> out;
    collect(document.root, Inherited{}, components, out);
    return out;
}

page_model::TypographySystem summarize_typography(const std::vector<TypographySample>& samples) {
    const TypographyFold fold = std::accumulate(samples.begin(), samples.end(), TypographyFold{}, fold_sample);

    page_model::TypographySystem out;
    out.fonts = ranked_fonts(fold.families);
    out.role_styles = fold.first_styles;

    out.scale.base_size = pick_base_size(fold.size_counts);
    out.scale.ratio = compute_ratio(fold.size_counts, out.scale.base_size);
    std::set<std::string> taken;
    for (const auto& [px, count] : fold.size_counts) {
        const std::string name = scale_name(px, out.scale.base_size);
        if (!taken.insert(name).second) continue;
        out.scale.sizes.push_back({ name, static_cast<double>(px), px / default_base_size });
    }

    out.global.base_font_family = out.fonts.empty() ? "sans-serif" : out.fonts.front().family;
    out.global.base_font_size = out.scale.base_size;
    const std::string heading = heading_family(fold.families);
    out.global.heading_font_family = heading.empty() ? out.global.base_font_family : heading;

    out.statistics.distinct_fonts = static_cast<int>(out.fonts.size());
    out.statistics.distinct_sizes = static_cast<int>(fold.size_counts.size());
    out.statistics.quality = rate_scale(out.statistics.distinct_sizes, out.statistics.distinct_fonts);

    for (const auto& font : out.fonts) {
        if (std::find(google_font_families.begin(), google_font_families.end(), font.family) != google_font_families.end())
            out.google_fonts.push_back(font.family);
    }

    out.elementor_fonts.push_back({ "primary", "Primary", out.global.base_font_family, "400", out.scale.base_size });
    out.elementor_fonts.push_back({ "secondary", "Secondary", out.global.heading_font_family, "700", 0 });
    const std::pair<TextRole, const char*> headings[] = {
        { TextRole::H1, "Heading 1" }, { TextRole::H2, "Heading 2" }, { TextRole::H3, "Heading 3" }
    };
    for (const auto& [role, title] : headings) {
        const auto* style = out.style_for(role);
        if (!style) continue;
        out.elementor_fonts.push_back({ std::string(page_model::to_string(role)), title,
            style->font_family.empty() ? out.global.heading_font_family : style->font_family,
            style->font_weight, style->font_size });
    }
    return out;
}

page_model::TypographySystem extract_typography(const page_model::AnalyzedDocument& document,
    const std::vector<page_model::RecognizedComponent>& components)
{
    const auto samples = collect_typography_samples(document, components);
    auto out = summarize_typography(samples);
    page_model::conversion_logger()->debug("Typography: {} samples, {} fonts, base {}px, ratio {}",
        samples.size(), out.fonts.size(), out.scale.base_size, out.scale.ratio);
    return out;
}

} // namespace page_analysis
