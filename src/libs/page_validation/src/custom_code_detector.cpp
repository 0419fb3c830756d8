#include <page_validation/custom_code_detector.hpp>
#include <page_model/logging.hpp>
#include <algorithm>
#include <regex>

namespace page_validation {

namespace {

using page_model::ConversionWarning;
using page_model::CustomCodeDetection;
using page_model::DetectedFeature;
using page_model::Impact;
using page_model::Incompatibility;
using page_model::WarningSeverity;

struct LibraryRule {
    const char* name;
    const char* pattern;
    bool supported;
};

const LibraryRule inline_libraries[] = {
    { "jQuery", R"(\$\(|jQuery\()", true },
    { "React", R"(React\.|ReactDOM)", false },
    { "Vue", R"(new Vue\(|Vue\.)", false },
    { "Angular", R"(angular\.|ng-)", false },
    { "GSAP", R"(gsap\.|TweenMax|TweenLite)", true },
    { "Three.js", R"(THREE\.)", false },
    { "D3.js", R"(d3\.)", false },
};

// Matched case-insensitively against script URLs.
const LibraryRule url_libraries[] = {
    { "jQuery", "jquery", true },
    { "React", "react", false },
    { "Vue", "vue", false },
    { "Angular", "angular", false },
    { "Bootstrap JS", R"(bootstrap.*\.js)", true },
    { "Swiper", "swiper", true },
    { "Slick", "slick", true },
    { "AOS", "aos", true },
    { "GSAP", "gsap|tweenmax", true },
};

struct DomRule {
    const char* pattern;
    const char* feature;
};

const DomRule dom_manipulation[] = {
    { R"(\.innerHTML|\.outerHTML)", "innerHTML manipulation" },
    { R"(\.appendChild|\.removeChild|\.insertBefore)", "DOM tree manipulation" },
    { R"(\.createElement|\.createTextNode)", "Dynamic element creation" },
    { R"(\.classList\.|\.className)", "Class manipulation" },
    { R"(\.setAttribute|\.removeAttribute)", "Attribute manipulation" },
};

bool matches(const std::string& text, const char* pattern, bool icase = false) {
    auto flags = std::regex::ECMAScript;
    if (icase) flags |= std::regex::icase;
    return std::regex_search(text, std::regex(pattern, flags));
}

void warn(CustomCodeDetection& out, const char* type, WarningSeverity severity, std::string message,
    std::string suggestion, bool can_auto_fix = false) {
    out.warnings.push_back({ type, severity, std::move(message), std::move(suggestion), can_auto_fix });
}

void feature(CustomCodeDetection& out, const char* type, std::string name, std::string description, bool supported,
    std::string alternative = {}) {
    out.features.push_back({ type, std::move(name), std::move(description), supported, std::move(alternative) });
}

void incompatible(CustomCodeDetection& out, const char* type, std::string name, std::string reason, Impact impact,
    std::string workaround) {
    out.incompatibilities.push_back({ type, std::move(name), std::move(reason), impact, std::move(workaround) });
}

void scan_inline_libraries(const std::string& code, CustomCodeDetection& out) {
    for (const auto& lib : inline_libraries) {
        if (!matches(code, lib.pattern)) continue;
        if (lib.supported) {
            feature(out, "javascript", lib.name, std::string(lib.name) + " library detected", true);
        } else {
            incompatible(out, "library", lib.name,
                std::string(lib.name) + " requires JavaScript runtime and cannot be converted to page builder widgets",
                Impact::Blocking,
                "Consider using page builder native widgets or custom HTML widget with embedded code");
        }
    }
}

void scan_script_url(const std::string& url, CustomCodeDetection& out) {
    for (const auto& lib : url_libraries) {
        if (!matches(url, lib.pattern, true)) continue;
        if (lib.supported) {
            feature(out, "javascript", lib.name, std::string(lib.name) + " library loaded via " + url, true);
        } else {
            incompatible(out, "library", lib.name,
                std::string(lib.name) + " framework detected, cannot be directly converted", Impact::Blocking,
                "Use custom HTML widget to embed the framework code");
        }
    }
}

void scan_script(const std::string& code, CustomCodeDetection& out) {
    scan_inline_libraries(code, out);

    for (const auto& rule : dom_manipulation) {
        if (!matches(code, rule.pattern)) continue;
        warn(out, "javascript", WarningSeverity::Warning,
            std::string(rule.feature) + " detected - may not work in converted page",
            "Use page builder native widgets instead of DOM manipulation");
        feature(out, "javascript", rule.feature, std::string("Dynamic ") + rule.feature + " found in code", false,
            "Use page builder widgets with dynamic content capabilities");
    }

    if (matches(code, R"(addEventListener|on\w+\s*=|\.on\()")) {
        warn(out, "javascript", WarningSeverity::Warning, "Event listeners detected - may need custom HTML widget",
            "Page builders support basic interactions. Complex event handling may require custom code widget.");
        feature(out, "javascript", "Event Listeners", "Custom event handling code detected", false,
            "Use page builder interaction features or custom HTML widget");
    }

    if (matches(code, R"(\$\.ajax|\$\.get|\$\.post|fetch\(|axios\.)", true)
        || matches(code, R"(async\s+function|await\s+)")) {
        warn(out, "javascript", WarningSeverity::Critical, "Asynchronous data fetching detected",
            "Use page builder dynamic data widgets or custom HTML widget with embedded script");
        feature(out, "javascript", "AJAX/Fetch", "Asynchronous data loading detected", false,
            "Use page builder dynamic content features or embed as custom code");
    }

    if (matches(code, R"(\.animate\(|requestAnimationFrame|setInterval|setTimeout.*animate)")) {
        warn(out, "javascript", WarningSeverity::Warning, "JavaScript animations detected",
            "Consider using CSS animations or page builder animation features");
        feature(out, "javascript", "JS Animations", "JavaScript-based animations found", true,
            "CSS animations or page builder animation widgets");
    }

    if (matches(code, R"(\.submit\(|\.preventDefault\(\)|FormData|serialize)")) {
        warn(out, "javascript", WarningSeverity::Warning, "Custom form handling detected",
            "Use page builder form widgets with built-in submission handling");
        feature(out, "javascript", "Form Handling", "Custom form submission logic", false,
            "Page builder form widgets");
    }

    if (matches(code, R"(getContext\(['"]webgl|getContext\(['"]2d)")) {
        incompatible(out, "javascript", "Canvas/WebGL", "Canvas and WebGL require custom JavaScript runtime",
            Impact::Blocking, "Embed as custom HTML widget");
    }
    if (matches(code, R"(new Worker\()")) {
        incompatible(out, "javascript", "Web Workers", "Web Workers cannot be converted to page builder widgets",
            Impact::Blocking, "Use custom HTML widget");
    }
    if (matches(code, R"(new WebSocket\()")) {
        incompatible(out, "javascript", "WebSockets", "WebSocket connections require custom code", Impact::Degraded,
            "Embed as custom HTML widget with script");
    }
    if (matches(code, R"(localStorage\.|sessionStorage\.)")) {
        warn(out, "javascript", WarningSeverity::Info, "Browser storage usage detected",
            "Ensure storage keys don't conflict with page builder");
    }
}

void scan_style(const std::string& css, CustomCodeDetection& out) {
    if (matches(css, "@media"))
        feature(out, "css", "Media Queries", "Responsive CSS with media queries", true);
    if (matches(css, "::before|::after|::first-line|::first-letter"))
        feature(out, "css", "Pseudo-elements", "CSS pseudo-elements for decorative content", true);
    if (matches(css, "transform:|transition:"))
        feature(out, "css", "Transforms & Transitions", "CSS transforms and transitions", true);
    if (matches(css, "filter:|backdrop-filter:"))
        feature(out, "css", "CSS Filters", "Visual effects using CSS filters", true);

    if (matches(css, "@keyframes")) {
        feature(out, "css", "CSS Animations", "Keyframe-based CSS animations", true,
            "Page builder animation widgets may offer similar effects");
        warn(out, "css", WarningSeverity::Info, "CSS animations detected - may need manual adjustment in page builder",
            "Use page builder animation features for better control");
    }

    if (matches(css, R"(--[\w-]+:)"))
        feature(out, "css", "CSS Custom Properties", "CSS variables (custom properties)", true);
    if (matches(css, R"(display:\s*grid)"))
        feature(out, "css", "CSS Grid", "Modern grid layout system", true);
    if (matches(css, R"(display:\s*flex)"))
        feature(out, "css", "Flexbox", "Flexible box layout", true);

    if (matches(css, "-webkit-|-moz-|-ms-|-o-")) {
        warn(out, "css", WarningSeverity::Warning, "Vendor prefixes detected - may indicate legacy CSS",
            "Modern page builders handle browser compatibility automatically", true);
    }
    if (matches(css, R"(:has\(|:is\(|:where\()")) {
        warn(out, "css", WarningSeverity::Warning, "Advanced CSS selectors detected",
            "Ensure page builder supports these modern selectors");
    }
}

std::string raw_text(const page_model::DomNode& node) {
    std::string out;
    for (const auto& child : node.children) {
        if (child.is_text()) out += child.text;
    }
    return out;
}

void collect(const page_model::DomNode& node, CodeSources& out) {
    if (node.tag_name == "script") {
        auto src = node.attributes.find("src");
        if (src != node.attributes.end() && !src->second.empty())
            out.script_urls.push_back(src->second);
        else
            out.inline_scripts.push_back(raw_text(node));
        return;
    }
    if (node.tag_name == "style") {
        out.styles.push_back(raw_text(node));
        return;
    }
    for (const auto& child : node.children) collect(child, out);
}

} // namespace

CodeSources collect_code(const page_model::DomNode& root) {
    CodeSources sources;
    collect(root, sources);
    return sources;
}

int conversion_score(const CustomCodeDetection& detection) {
    int score = 100;
    if (detection.has_custom_js) score -= 10;
    if (detection.has_custom_css) score -= 5;
    for (const auto& incompatibility : detection.incompatibilities) {
        switch (incompatibility.impact) {
        case Impact::Blocking: score -= 30; break;
        case Impact::Degraded: score -= 15; break;
        case Impact::Minimal: score -= 5; break;
        }
    }
    for (const auto& f : detection.features) {
        if (!f.is_supported) score -= 5;
    }
    return std::clamp(score, 0, 100);
}

CustomCodeDetection detect_custom_code(const CodeSources& sources) {
    CustomCodeDetection out;
    out.has_custom_js = !sources.inline_scripts.empty() || !sources.script_urls.empty();
    out.has_custom_css = !sources.styles.empty();

    for (const auto& code : sources.inline_scripts) scan_script(code, out);
    for (const auto& url : sources.script_urls) scan_script_url(url, out);
    for (const auto& style : sources.styles) scan_style(style, out);

    out.conversion_score = conversion_score(out);
    bool blocking = std::any_of(out.incompatibilities.begin(), out.incompatibilities.end(),
        [](const Incompatibility& i) { return i.impact == Impact::Blocking; });
    out.can_be_converted = out.conversion_score >= 50 && !blocking;

    page_model::conversion_logger()->debug("Custom code scan: js={} css={} score={} incompatibilities={}",
        out.has_custom_js, out.has_custom_css, out.conversion_score, out.incompatibilities.size());
    return out;
}

CustomCodeDetection detect_custom_code(const page_model::DomNode& root) {
    return detect_custom_code(collect_code(root));
}

} // namespace page_validation
