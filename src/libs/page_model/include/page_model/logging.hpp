#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace page_model {

struct LogSettings {
    // Empty path keeps the console logger.
    std::string file;
    std::string level = "info";
};

// Shared logger for the conversion pipeline ("page_convert").
std::shared_ptr<spdlog::logger> conversion_logger();

// Installs a file-backed logger; falls back to the default logger when the sink cannot be opened.
void configure_logging(const LogSettings& settings);

} // namespace page_model
