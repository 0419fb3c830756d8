#include <page_analysis/design_tokens.hpp>
#include <page_analysis/css_values.hpp>
#include <page_model/logging.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <regex>
#include <set>

namespace page_analysis {

namespace {

const double neutral_saturation = 10.0;

void count_color(std::map<std::string, page_model::ColorToken>& palette, const std::string& hex, const char* context) {
    if (!hsl_saturation(hex)) return;
    auto& token = palette[hex];
    token.hex = hex;
    ++token.usage;
    token.contexts.insert(context);
}

void collect_spacing(const std::optional<page_model::BoxSpacing>& box, std::set<double>& out) {
    if (!box) return;
    for (const auto* side : { &box->top, &box->right, &box->bottom, &box->left }) {
        const double px = parse_pixels(*side);
        if (px > 0) out.insert(px);
    }
}

} // namespace

std::optional<double> hsl_saturation(const std::string& hex) {
    static const std::regex hex_re("^#[0-9a-f]{6}$");
    if (!std::regex_match(hex, hex_re)) return std::nullopt;

    const double r = std::stoi(hex.substr(1, 2), nullptr, 16) / 255.0;
    const double g = std::stoi(hex.substr(3, 2), nullptr, 16) / 255.0;
    const double b = std::stoi(hex.substr(5, 2), nullptr, 16) / 255.0;
    const double max = std::max({ r, g, b });
    const double min = std::min({ r, g, b });
    const double delta = max - min;
    if (delta == 0) return 0.0;
    const double lightness = (max + min) / 2;
    return delta / (1 - std::abs(2 * lightness - 1)) * 100.0;
}

page_model::DesignTokens extract_design_tokens(const page_model::AnalyzedDocument& document) {
    std::map<std::string, page_model::ColorToken> palette;
    std::set<double> spacing;
    page_model::for_each_element(document.root, [&](const page_model::AnalyzedElement& e) {
        count_color(palette, e.styles.color, "text");
        count_color(palette, e.styles.background_color, "background");
        if (e.styles.border) count_color(palette, e.styles.border->color, "border");
        collect_spacing(e.styles.padding, spacing);
        collect_spacing(e.styles.margin, spacing);
        for (const auto& part : split_css_values(e.styles.gap)) {
            const double px = parse_pixels(part);
            if (px > 0) spacing.insert(px);
        }
    });

    page_model::DesignTokens out;
    for (auto& [hex, token] : palette)
        out.colors.push_back(std::move(token));
    std::sort(out.colors.begin(), out.colors.end(), [](const auto& a, const auto& b) {
        if (a.usage != b.usage) return a.usage > b.usage;
        return a.hex < b.hex;
    });

    int vivid = 0;
    for (auto& token : out.colors) {
        if (*hsl_saturation(token.hex) < neutral_saturation) {
            token.role = page_model::ColorRole::Neutral;
            continue;
        }
        token.role = vivid == 0 ? page_model::ColorRole::Primary
            : vivid == 1        ? page_model::ColorRole::Secondary
                                : page_model::ColorRole::Accent;
        ++vivid;
    }

    auto first_with = [&](auto pred) -> const page_model::ColorToken* {
        auto it = std::find_if(out.colors.begin(), out.colors.end(), pred);
        return it != out.colors.end() ? &*it : nullptr;
    };
    const std::pair<const char*, const page_model::ColorToken*> globals[] = {
        { "primary", first_with([](const auto& t) { return t.role == page_model::ColorRole::Primary; }) },
        { "secondary", first_with([](const auto& t) { return t.role == page_model::ColorRole::Secondary; }) },
        { "text", first_with([](const auto& t) { return t.contexts.count("text") > 0; }) },
        { "accent", first_with([](const auto& t) { return t.role == page_model::ColorRole::Accent; }) },
    };
    for (const auto& [id, token] : globals) {
        if (!token) continue;
        std::string title = id;
        title[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(title[0])));
        out.elementor_colors.push_back({ id, title, token->hex });
    }

    int n = 0;
    for (double px : spacing)
        out.spacing.push_back({ "space-" + std::to_string(++n), px });

    page_model::conversion_logger()->debug("Design tokens: {} colors, {} spacing steps", out.colors.size(), out.spacing.size());
    return out;
}

} // namespace page_analysis
