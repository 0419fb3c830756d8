#pragma once

#include <page_validation/conversion_job.hpp>
#include <page_validation/validator.hpp>
#include <page_analysis/template_parts.hpp>
#include <page_export/converter.hpp>
#include <page_model/conversion.hpp>
#include <page_model/design_tokens.hpp>
#include <page_model/dom.hpp>
#include <page_model/typography.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace page_validation {

struct BatchPage {
    std::string id;
    std::string url;
    page_model::DomDocument document;
};

struct BatchOptions {
    page_model::ConversionOptions conversion;
    // Attempts running at once.
    int concurrency = 3;
    // Attempts per page, the first included.
    int max_attempts = 2;
    // Per attempt, counted from the moment a worker picks it up.
    int timeout_ms = 60000;
    bool extract_shared_styles = true;
    bool detect_template_parts = true;
};

struct BatchError {
    std::string page_id;
    std::string url;
    std::string error;
    int attempt = 1;
};

struct BatchPageResult {
    std::string page_id;
    std::string url;
    std::string title;
    bool success = false;
    int attempts = 0;
    std::optional<page_export::ConversionResult> result;
    // Last failure; empty on success.
    std::string error;
    // From the first attempt's launch to the final outcome.
    std::chrono::milliseconds duration{ 0 };
};

// Site-wide styles over every converted page.
struct SharedStyles {
    page_model::TypographySystem typography;
    page_model::DesignTokens tokens;
    // Classes used on at least half of the converted pages.
    std::vector<std::string> common_classes;
};

struct BatchProgress {
    int total = 0;
    int completed = 0;
    int failed = 0;
    int in_progress = 0;
    std::string current_page;

    // Settled pages (completed or failed) in percent.
    int percentage() const;
};

struct BatchResult {
    // In input order.
    std::vector<BatchPageResult> pages;
    // One entry per failed attempt, retried or not.
    std::vector<BatchError> errors;
    int success_count = 0;
    int failed_count = 0;
    bool cancelled = false;
    std::optional<SharedStyles> shared_styles;
    std::optional<page_analysis::TemplateParts> template_parts;
    std::chrono::milliseconds duration{ 0 };
};

// One conversion attempt; runs on a batch worker and may throw.
using PageConverter =
    std::function<page_export::ConversionResult(ConversionJob& job, const page_model::DomDocument& document)>;

// Converts many pages with bounded concurrency. Failed attempts are retried, except for malformed
// input (std::invalid_argument). A timed-out attempt counts as failed; it keeps its worker until it
// returns, and its result is dropped.
class BatchConverter {
public:
    // Each attempt goes through run_conversion, validated by `validator` when it is set.
    explicit BatchConverter(BatchOptions options, std::shared_ptr<Validator> validator = nullptr);
    BatchConverter(BatchOptions options, PageConverter converter);

    // Called on the thread running convert().
    void on_progress(std::function<void(const BatchProgress&)> callback);

    BatchResult convert(const std::vector<BatchPage>& pages);

    // Pages not yet started are skipped and attempts in flight finish without retry.
    // Safe from any thread, the progress callback included.
    void cancel();

    const BatchOptions& options() const { return options_; }

private:
    BatchOptions options_;
    PageConverter converter_;
    std::function<void(const BatchProgress&)> on_progress_;
    std::atomic<bool> cancelled_{ false };
};

// Typography and tokens over all pages together. `pages` carry the analyzed document and
// recognized components of each converted page.
SharedStyles extract_shared_styles(const std::vector<page_analysis::TemplatePage>& pages);

} // namespace page_validation
