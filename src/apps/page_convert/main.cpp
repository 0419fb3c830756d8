// Page converter: DOM JSON in, page-builder export out (C++20)

#include <page_export/converter.hpp>
#include <page_loaders/debug_page.hpp>
#include <page_loaders/json_loader.hpp>
#include <page_model/config.hpp>
#include <page_model/logging.hpp>
#include <page_validation/conversion_job.hpp>
#include <page_validation/pipeline.hpp>
#include <page_validation/validator.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

struct CliArgs {
    std::string input;
    std::string config;
    std::string output;
    std::string report;
    std::optional<std::string> target;
    std::optional<int> min_confidence;
    bool no_html_fallback = false;
    bool responsive = false;
    std::optional<std::string> log_file;
    std::optional<std::string> log_level;
    bool debug_page = false;
};

void print_usage() {
    (void)fprintf(stderr,
        "usage: page_convert [--input dom.json] [--config config.json] [--target name] [--output file]\n"
        "                    [--report file] [--min-confidence n] [--no-html-fallback] [--responsive]\n"
        "                    [--log-file path] [--log-level level] [--debug-page]\n"
        "targets: elementor gutenberg beaver-builder divi bricks oxygen\n");
}

// Returns nullopt after printing usage on a malformed command line.
std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    CliArgs args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string(argv[++i]);
        };
        std::optional<std::string> v;
        if (arg == "--no-html-fallback") {
            args.no_html_fallback = true;
        } else if (arg == "--responsive") {
            args.responsive = true;
        } else if (arg == "--debug-page") {
            args.debug_page = true;
        } else if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (!(v = value())) {
            (void)fprintf(stderr, "missing value for %s\n", arg.c_str());
            return std::nullopt;
        } else if (arg == "--input") {
            args.input = *v;
        } else if (arg == "--config") {
            args.config = *v;
        } else if (arg == "--target") {
            args.target = *v;
        } else if (arg == "--output") {
            args.output = *v;
        } else if (arg == "--report") {
            args.report = *v;
        } else if (arg == "--min-confidence") {
            char* end = nullptr;
            long n = std::strtol(v->c_str(), &end, 10);
            if (end == v->c_str() || *end != '\0' || n < 0 || n > 100) {
                (void)fprintf(stderr, "--min-confidence expects 0..100, got %s\n", v->c_str());
                return std::nullopt;
            }
            args.min_confidence = static_cast<int>(n);
        } else if (arg == "--log-file") {
            args.log_file = *v;
        } else if (arg == "--log-level") {
            args.log_level = *v;
        } else {
            (void)fprintf(stderr, "unknown option %s\n", arg.c_str());
            return std::nullopt;
        }
    }
    return args;
}

bool write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    if (!out) return false;
    out << content;
    return static_cast<bool>(out);
}

} // namespace

int main(int argc, char* argv[])
{
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 2;
    }

    page_model::AppConfig config;
    if (!args->config.empty()) {
        auto loaded = page_loaders::load_config_from_json_file(args->config);
        if (!loaded) {
            (void)fprintf(stderr, "cannot read config %s\n", args->config.c_str());
            return 1;
        }
        config = std::move(*loaded);
    }
    if (args->target) {
        auto target = page_model::target_builder_from_string(*args->target);
        if (!target) {
            (void)fprintf(stderr, "unknown target %s\n", args->target->c_str());
            return 2;
        }
        config.conversion.target = *target;
    }
    if (args->min_confidence) config.conversion.min_confidence = *args->min_confidence;
    if (args->no_html_fallback) config.conversion.fallback_to_html = false;
    if (args->responsive) config.conversion.include_responsive = true;
    if (args->log_file) config.logging.file = *args->log_file;
    if (args->log_level) config.logging.level = *args->log_level;

    page_model::configure_logging(config.logging);
    auto log = page_model::conversion_logger();

    page_model::DomDocument document;
    if (!args->input.empty() && !args->debug_page) {
        auto loaded = page_loaders::load_document_from_json_file(args->input);
        if (!loaded) {
            (void)fprintf(stderr, "cannot read page %s\n", args->input.c_str());
            return 1;
        }
        document = std::move(*loaded);
    } else {
        log->info("No input page; converting the debug page");
        document = page_loaders::generate_debug_page();
    }

    // No headless renderer or network probe ships with the CLI: validation covers custom code and
    // asset discovery only.
    std::unique_ptr<page_validation::Validator> validator;
    if (config.validation.enabled)
        validator = std::make_unique<page_validation::Validator>(config.validation, nullptr, nullptr);

    page_validation::ConversionJob job(document.title.empty() ? "page" : document.title);
    page_export::ConversionResult result;
    try {
        result = page_validation::run_conversion(job, document, config.conversion, validator.get());
    } catch (const std::invalid_argument& e) {
        (void)fprintf(stderr, "conversion failed: %s\n", e.what());
        return 1;
    }

    const std::string exported = page_export::export_text(result.export_data);
    if (args->output.empty()) {
        (void)fprintf(stdout, "%s\n", exported.c_str());
    } else if (!write_file(args->output, exported)) {
        (void)fprintf(stderr, "cannot write %s\n", args->output.c_str());
        return 1;
    }
    if (!args->report.empty() && !write_file(args->report, page_export::to_json(result).dump(2))) {
        (void)fprintf(stderr, "cannot write %s\n", args->report.c_str());
        return 1;
    }

    const auto& stats = result.stats;
    (void)fprintf(stderr, "%s: %d elements, %d native, %d html fallbacks, %d manual review, avg confidence %d%s\n",
        std::string(page_model::to_string(result.target)).c_str(), stats.total_elements, stats.native_widgets,
        stats.html_fallbacks, stats.manual_review, stats.confidence_average,
        result.manual_review_needed ? " (review needed)" : "");
    if (!result.validation.errors.empty()) {
        for (const auto& error : result.validation.errors)
            (void)fprintf(stderr, "error: %s\n", error.message.c_str());
        return 3;
    }
    return 0;
}
