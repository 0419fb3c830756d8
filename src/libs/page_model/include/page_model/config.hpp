#pragma once

#include <page_model/conversion.hpp>
#include <page_model/logging.hpp>
#include <string>
#include <vector>

namespace page_model {

struct ValidationSettings {
    bool enabled = false;
    int timeout_ms = 5000;
    int workers = 4;
    // mobile / tablet / laptop / desktop
    std::vector<std::string> viewports = { "desktop" };
    bool check_external_assets = true;
    // Per-channel colour distance (0..1) under which pixels count as equal.
    double pixel_threshold = 0.1;
};

struct AppConfig {
    ConversionOptions conversion;
    ValidationSettings validation;
    LogSettings logging;
};

} // namespace page_model
