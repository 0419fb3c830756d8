#include <page_loaders/json_loader.hpp>
#include <page_model/logging.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace page_loaders {

namespace {

const int max_tree_depth = 512;

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string string_or(const nlohmann::json& j, const char* key, const std::string& fallback = "") {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : fallback;
}

double number_or(const nlohmann::json& j, const char* key, double fallback = 0) {
    return j.contains(key) && j[key].is_number() ? j[key].get<double>() : fallback;
}

// Numbers are accepted for convenience ("opacity": 0.5).
page_model::StyleMap parse_style_map(const nlohmann::json& j) {
    page_model::StyleMap out;
    if (!j.is_object()) return out;
    for (const auto& [key, value] : j.items()) {
        if (value.is_string()) out[key] = value.get<std::string>();
        else if (value.is_number()) out[key] = value.dump();
    }
    return out;
}

std::optional<page_model::DomNode> parse_node(const nlohmann::json& j, int depth) {
    if (depth > max_tree_depth) return std::nullopt;

    page_model::DomNode node;
    if (j.is_string()) {
        node.tag_name = page_model::text_tag;
        node.text = j.get<std::string>();
        return node;
    }
    if (!j.is_object()) return std::nullopt;

    if (!j.contains("tag") || !j["tag"].is_string()) {
        if (!j.contains("text") || !j["text"].is_string()) return std::nullopt;
        node.tag_name = page_model::text_tag;
        node.text = j["text"].get<std::string>();
        return node;
    }
    node.tag_name = lowercase(j["tag"].get<std::string>());
    if (node.tag_name.empty()) return std::nullopt;
    node.text = string_or(j, "text");

    if (j.contains("attributes") && j["attributes"].is_object()) {
        for (const auto& [key, value] : j["attributes"].items()) {
            if (value.is_string()) node.attributes[lowercase(key)] = value.get<std::string>();
            else if (value.is_boolean() && value.get<bool>()) node.attributes[lowercase(key)] = "";
            else if (value.is_number()) node.attributes[lowercase(key)] = value.dump();
        }
    }
    if (j.contains("styles")) node.computed_style = parse_style_map(j["styles"]);

    if (j.contains("responsive") && j["responsive"].is_object()) {
        for (const auto& [breakpoint, styles] : j["responsive"].items())
            node.responsive_styles[breakpoint] = parse_style_map(styles);
    }
    if (j.contains("custom_breakpoints") && j["custom_breakpoints"].is_array()) {
        for (const auto& b : j["custom_breakpoints"]) {
            page_model::CustomBreakpointStyles cb;
            if (b.contains("min_width") && b["min_width"].is_number()) cb.min_width = b["min_width"].get<double>();
            if (b.contains("max_width") && b["max_width"].is_number()) cb.max_width = b["max_width"].get<double>();
            if (b.contains("styles")) cb.styles = parse_style_map(b["styles"]);
            node.custom_breakpoints.push_back(std::move(cb));
        }
    }
    if (j.contains("states") && j["states"].is_object()) {
        for (const auto& [state, styles] : j["states"].items())
            node.state_styles[state] = parse_style_map(styles);
    }
    if (j.contains("rect") && j["rect"].is_object()) {
        const auto& r = j["rect"];
        node.rect.x = number_or(r, "x");
        node.rect.y = number_or(r, "y");
        node.rect.width = number_or(r, "width");
        node.rect.height = number_or(r, "height");
    }

    if (j.contains("children")) {
        if (!j["children"].is_array()) return std::nullopt;
        for (const auto& c : j["children"]) {
            auto child = parse_node(c, depth + 1);
            if (!child) return std::nullopt;
            node.children.push_back(std::move(*child));
        }
    }
    return node;
}

std::optional<page_model::DomDocument> parse_document(const nlohmann::json& j) {
    page_model::DomDocument doc;
    if (j.is_object() && j.contains("root")) {
        auto root = parse_node(j["root"], 0);
        if (!root) return std::nullopt;
        doc.root = std::move(*root);
        doc.title = string_or(j, "title");
    } else {
        auto root = parse_node(j, 0);
        if (!root) return std::nullopt;
        doc.root = std::move(*root);
    }
    if (doc.root.is_text()) return std::nullopt;
    if (doc.title.empty()) doc.title = "Converted Page";
    return doc;
}

page_model::AppConfig parse_config(const nlohmann::json& j) {
    page_model::AppConfig cfg;

    if (j.contains("conversion") && j["conversion"].is_object()) {
        const auto& c = j["conversion"];
        auto& opts = cfg.conversion;
        if (c.contains("target") && c["target"].is_string()) {
            auto target = page_model::target_builder_from_string(c["target"].get<std::string>());
            if (target) opts.target = *target;
            else page_model::conversion_logger()->warn("Unknown target '{}' in config, keeping {}",
                c["target"].get<std::string>(), page_model::to_string(opts.target));
        }
        if (c.contains("min_confidence") && c["min_confidence"].is_number())
            opts.min_confidence = std::clamp(c["min_confidence"].get<int>(), 0, 100);
        if (c.contains("fallback_to_html") && c["fallback_to_html"].is_boolean())
            opts.fallback_to_html = c["fallback_to_html"].get<bool>();
        if (c.contains("preserve_custom_css") && c["preserve_custom_css"].is_boolean())
            opts.preserve_custom_css = c["preserve_custom_css"].get<bool>();
        if (c.contains("include_responsive") && c["include_responsive"].is_boolean())
            opts.include_responsive = c["include_responsive"].get<bool>();
        if (c.contains("include_animations") && c["include_animations"].is_boolean())
            opts.include_animations = c["include_animations"].get<bool>();
        if (c.contains("optimize_assets") && c["optimize_assets"].is_boolean())
            opts.optimize_assets = c["optimize_assets"].get<bool>();
    }

    if (j.contains("validation") && j["validation"].is_object()) {
        const auto& v = j["validation"];
        auto& val = cfg.validation;
        if (v.contains("enabled") && v["enabled"].is_boolean()) val.enabled = v["enabled"].get<bool>();
        if (v.contains("timeout_ms") && v["timeout_ms"].is_number())
            val.timeout_ms = std::max(1, v["timeout_ms"].get<int>());
        if (v.contains("workers") && v["workers"].is_number())
            val.workers = std::clamp(v["workers"].get<int>(), 1, 32);
        if (v.contains("check_external_assets") && v["check_external_assets"].is_boolean())
            val.check_external_assets = v["check_external_assets"].get<bool>();
        if (v.contains("pixel_threshold") && v["pixel_threshold"].is_number())
            val.pixel_threshold = std::clamp(v["pixel_threshold"].get<double>(), 0.0, 1.0);
        if (v.contains("viewports") && v["viewports"].is_array()) {
            val.viewports.clear();
            for (const auto& name : v["viewports"])
                if (name.is_string()) val.viewports.push_back(name.get<std::string>());
        }
    }

    if (j.contains("logging") && j["logging"].is_object()) {
        const auto& l = j["logging"];
        cfg.logging.file = string_or(l, "file", cfg.logging.file);
        cfg.logging.level = string_or(l, "level", cfg.logging.level);
    }
    return cfg;
}

} // namespace

std::optional<page_model::DomDocument> load_document_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_document(j);
    } catch (const nlohmann::json::exception& e) {
        page_model::conversion_logger()->error("Failed to parse DOM document: {}", e.what());
        return std::nullopt;
    }
}

std::optional<page_model::DomDocument> load_document_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_document_from_json(f);
}

std::optional<page_model::AppConfig> load_config_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        if (!j.is_object()) return std::nullopt;
        return parse_config(j);
    } catch (const nlohmann::json::exception& e) {
        page_model::conversion_logger()->error("Failed to parse config: {}", e.what());
        return std::nullopt;
    }
}

std::optional<page_model::AppConfig> load_config_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_config_from_json(f);
}

} // namespace page_loaders
