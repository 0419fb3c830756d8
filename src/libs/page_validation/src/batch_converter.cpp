#include <page_validation/batch_converter.hpp>
#include <page_validation/pipeline.hpp>
#include <page_validation/thread_pool.hpp>
#include <page_analysis/design_tokens.hpp>
#include <page_analysis/element_analyzer.hpp>
#include <page_analysis/typography.hpp>
#include <page_model/logging.hpp>
#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <utility>

namespace page_validation {

namespace {

using Clock = std::chrono::steady_clock;

// Workers mark it when an attempt starts or settles; the coordinator sleeps on it.
struct Board {
    std::mutex mutex;
    std::condition_variable changed;
    bool dirty = false;

    void mark() {
        {
            std::lock_guard lock(mutex);
            dirty = true;
        }
        changed.notify_one();
    }
};

struct Attempt {
    std::size_t page = 0;
    int number = 1;
    // Written by the worker under Board::mutex.
    std::optional<Clock::time_point> started;
    std::future<page_export::ConversionResult> result;
};

std::chrono::milliseconds since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

} // namespace

int BatchProgress::percentage() const {
    if (total <= 0) return 0;
    return static_cast<int>(std::lround(100.0 * (completed + failed) / total));
}

BatchConverter::BatchConverter(BatchOptions options, std::shared_ptr<Validator> validator)
    : options_(std::move(options))
{
    converter_ = [conversion = options_.conversion, validator](ConversionJob& job, const page_model::DomDocument& doc) {
        return run_conversion(job, doc, conversion, validator.get());
    };
}

BatchConverter::BatchConverter(BatchOptions options, PageConverter converter)
    : options_(std::move(options))
    , converter_(std::move(converter))
{
}

void BatchConverter::on_progress(std::function<void(const BatchProgress&)> callback) {
    on_progress_ = std::move(callback);
}

void BatchConverter::cancel() {
    cancelled_ = true;
}

BatchResult BatchConverter::convert(const std::vector<BatchPage>& pages) {
    auto log = page_model::conversion_logger();
    const auto batch_started = Clock::now();
    const auto timeout = std::chrono::milliseconds(options_.timeout_ms);
    const std::size_t limit = static_cast<std::size_t>(std::max(options_.concurrency, 1));
    const int max_attempts = std::max(options_.max_attempts, 1);
    cancelled_ = false;

    BatchResult out;
    out.pages.resize(pages.size());
    std::vector<std::shared_ptr<const BatchPage>> inputs;
    inputs.reserve(pages.size());
    std::deque<std::pair<std::size_t, int>> queue;
    for (std::size_t i = 0; i < pages.size(); ++i) {
        out.pages[i].page_id = pages[i].id;
        out.pages[i].url = pages[i].url;
        out.pages[i].title = pages[i].document.title;
        // Workers hold their own copy; a timed-out attempt may outlive this call.
        inputs.push_back(std::make_shared<const BatchPage>(pages[i]));
        queue.emplace_back(i, 1);
    }
    std::vector<std::optional<Clock::time_point>> first_launch(pages.size());

    BatchProgress progress;
    progress.total = static_cast<int>(pages.size());
    auto report = [&]() {
        if (on_progress_) on_progress_(progress);
    };

    log->info("Batch of {} pages: concurrency={} attempts={} timeout={} ms", pages.size(), limit, max_attempts,
        options_.timeout_ms);

    auto board = std::make_shared<Board>();
    ThreadPool pool(limit);
    std::vector<std::shared_ptr<Attempt>> in_flight;

    auto launch = [&](std::size_t index, int number) {
        auto attempt = std::make_shared<Attempt>();
        attempt->page = index;
        attempt->number = number;
        auto promise = std::make_shared<std::promise<page_export::ConversionResult>>();
        attempt->result = promise->get_future();

        pool.submit([board, attempt, promise, page = inputs[index], converter = converter_]() {
            {
                std::lock_guard lock(board->mutex);
                attempt->started = Clock::now();
                board->dirty = true;
            }
            board->changed.notify_one();
            try {
                ConversionJob job(page->id + "#" + std::to_string(attempt->number));
                promise->set_value(converter(job, page->document));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
            board->mark();
        });

        if (!first_launch[index]) first_launch[index] = Clock::now();
        in_flight.push_back(std::move(attempt));
        ++progress.in_progress;
        progress.current_page = out.pages[index].title.empty() ? out.pages[index].page_id : out.pages[index].title;
        report();
    };

    auto settle = [&](const Attempt& attempt, std::optional<std::string> failure, bool retryable) {
        auto& page = out.pages[attempt.page];
        --progress.in_progress;
        if (failure) {
            out.errors.push_back({ page.page_id, page.url, *failure, attempt.number });
            log->warn("Page {} attempt {}/{} failed: {}", page.page_id, attempt.number, max_attempts, *failure);
            if (retryable && attempt.number < max_attempts && !cancelled_) {
                queue.emplace_front(attempt.page, attempt.number + 1);
                report();
                return;
            }
            page.error = std::move(*failure);
            ++progress.failed;
        } else {
            ++progress.completed;
        }
        page.attempts = attempt.number;
        page.duration = since(*first_launch[attempt.page]);
        report();
    };

    while (!queue.empty() || !in_flight.empty()) {
        while (!cancelled_ && !queue.empty() && in_flight.size() < limit) {
            auto [index, number] = queue.front();
            queue.pop_front();
            launch(index, number);
        }
        if (in_flight.empty()) {
            if (cancelled_) break;
            continue;
        }

        {
            std::unique_lock lock(board->mutex);
            std::optional<Clock::time_point> wake;
            for (const auto& attempt : in_flight) {
                if (!attempt->started) continue;
                const auto deadline = *attempt->started + timeout;
                if (!wake || deadline < *wake) wake = deadline;
            }
            auto woken = [&board]() { return board->dirty; };
            if (wake) board->changed.wait_until(lock, *wake, woken);
            else board->changed.wait(lock, woken);
            board->dirty = false;
        }

        const auto now = Clock::now();
        for (auto it = in_flight.begin(); it != in_flight.end();) {
            Attempt& attempt = **it;
            std::optional<Clock::time_point> started;
            {
                std::lock_guard lock(board->mutex);
                started = attempt.started;
            }
            if (attempt.result.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                try {
                    out.pages[attempt.page].result = attempt.result.get();
                    out.pages[attempt.page].success = true;
                    settle(attempt, std::nullopt, false);
                } catch (const std::invalid_argument& e) {
                    settle(attempt, std::string(e.what()), false);
                } catch (const std::exception& e) {
                    settle(attempt, std::string(e.what()), true);
                }
            } else if (started && now >= *started + timeout) {
                settle(attempt, "Conversion timeout after " + std::to_string(options_.timeout_ms) + " ms", true);
            } else {
                ++it;
                continue;
            }
            it = in_flight.erase(it);
        }
    }

    if (cancelled_) {
        out.cancelled = true;
        for (auto& page : out.pages) {
            if (page.success || !page.error.empty()) continue;
            page.error = "batch cancelled";
            ++progress.failed;
        }
        report();
    }

    for (const auto& page : out.pages) {
        if (page.success) ++out.success_count;
        else ++out.failed_count;
    }

    if (options_.extract_shared_styles || options_.detect_template_parts) {
        // Analysis is deterministic, so element indexes line up with each result's components.
        std::vector<page_model::AnalyzedDocument> analyzed;
        std::vector<std::size_t> sources;
        for (std::size_t i = 0; i < pages.size(); ++i) {
            if (!out.pages[i].success) continue;
            analyzed.push_back(page_analysis::analyze_document(pages[i].document));
            sources.push_back(i);
        }
        std::vector<page_analysis::TemplatePage> converted;
        for (std::size_t k = 0; k < analyzed.size(); ++k) {
            const auto& page = out.pages[sources[k]];
            converted.push_back({ page.page_id, &analyzed[k], &page.result->components });
        }
        if (options_.extract_shared_styles && !converted.empty()) out.shared_styles = extract_shared_styles(converted);
        if (options_.detect_template_parts && !converted.empty())
            out.template_parts = page_analysis::detect_template_parts(converted);
    }

    out.duration = since(batch_started);
    log->info("Batch done in {} ms: {} converted, {} failed, {} failed attempts{}", out.duration.count(),
        out.success_count, out.failed_count, out.errors.size(), out.cancelled ? " (cancelled)" : "");
    return out;
}

SharedStyles extract_shared_styles(const std::vector<page_analysis::TemplatePage>& pages) {
    SharedStyles out;
    std::vector<page_analysis::TypographySample> samples;
    page_model::AnalyzedDocument site;
    site.title = "site";
    site.root.tag_name = "body";
    std::map<std::string, int> class_pages;

    for (const auto& page : pages) {
        if (!page.document || !page.components) continue;
        auto page_samples = page_analysis::collect_typography_samples(*page.document, *page.components);
        samples.insert(samples.end(), page_samples.begin(), page_samples.end());

        std::set<std::string> classes;
        page_model::for_each_element(page.document->root, [&classes](const page_model::AnalyzedElement& e) {
            classes.insert(e.classes.begin(), e.classes.end());
        });
        for (const auto& cls : classes)
            ++class_pages[cls];

        site.root.children.push_back(page.document->root);
        site.element_count += page.document->element_count;
    }

    out.typography = page_analysis::summarize_typography(samples);
    out.tokens = page_analysis::extract_design_tokens(site);
    for (const auto& [cls, count] : class_pages) {
        if (count * 2 >= static_cast<int>(pages.size())) out.common_classes.push_back(cls);
    }
    page_model::conversion_logger()->debug("Shared styles over {} pages: {} fonts, {} colors, {} common classes",
        pages.size(), out.typography.fonts.size(), out.tokens.colors.size(), out.common_classes.size());
    return out;
}

} // namespace page_validation
