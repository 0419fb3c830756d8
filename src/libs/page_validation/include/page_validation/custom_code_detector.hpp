#pragma once

#include <page_model/dom.hpp>
#include <page_model/validation.hpp>
#include <string>
#include <vector>

namespace page_validation {

// Script and style sources found in a page.
struct CodeSources {
    std::vector<std::string> inline_scripts;
    std::vector<std::string> script_urls;
    std::vector<std::string> styles;
};

CodeSources collect_code(const page_model::DomNode& root);

page_model::CustomCodeDetection detect_custom_code(const CodeSources& sources);
page_model::CustomCodeDetection detect_custom_code(const page_model::DomNode& root);

// 100, minus 10 for scripts, 5 for styles, 30/15/5 per blocking/degraded/minimal
// incompatibility and 5 per unsupported feature; clamped to 0..100.
int conversion_score(const page_model::CustomCodeDetection& detection);

} // namespace page_validation
