#include <page_model/logging.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>
#include <mutex>

namespace page_model {

namespace {

const char* logger_name = "page_convert";
const char* log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> active_logger;

std::shared_ptr<spdlog::logger> make_console_logger() {
    auto logger = spdlog::default_logger()->clone(logger_name);
    logger->set_pattern(log_pattern);
    logger->set_level(spdlog::level::warn);
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> conversion_logger() {
    std::lock_guard lock(logger_mutex);
    if (!active_logger) active_logger = make_console_logger();
    return active_logger;
}

void configure_logging(const LogSettings& settings) {
    std::shared_ptr<spdlog::logger> logger;
    if (!settings.file.empty()) {
        try {
            const std::filesystem::path log_file(settings.file);
            if (log_file.has_parent_path())
                std::filesystem::create_directories(log_file.parent_path());
            spdlog::drop(logger_name);
            logger = spdlog::basic_logger_mt(logger_name, log_file.string(), true);
            logger->flush_on(spdlog::level::info);
            logger->set_pattern(log_pattern);
        } catch (const spdlog::spdlog_ex&) {
            logger = make_console_logger();
        } catch (const std::filesystem::filesystem_error&) {
            logger = make_console_logger();
        }
    } else {
        logger = make_console_logger();
    }
    logger->set_level(spdlog::level::from_str(settings.level));

    std::lock_guard lock(logger_mutex);
    active_logger = logger;
    logger->info("Logger initialized. file={} level={}",
        settings.file.empty() ? "<console>" : settings.file, settings.level);
}

} // namespace page_model
