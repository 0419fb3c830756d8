#include <page_validation/batch_converter.hpp>
#include <page_model/dom.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace page_validation;
using page_model::make_element;
using page_model::make_text;

namespace {

BatchPage site_page(const std::string& id, const std::string& title) {
    BatchPage page;
    page.id = id;
    page.url = "https://example.com/" + id;
    page.document.title = title;
    page.document.root = make_element("body", {}, {
        make_element("header", { { "class", "site-header" } }, {
            make_element("nav", {}, { make_element("a", { { "href", "/" } }, { make_text("Home") }) }),
        }),
        make_element("main", {}, {
            make_element("h1", { { "style", "font-family: Georgia; font-size: 40px; color: #1a73e8" } }, { make_text(title) }),
            make_element("p", { { "class", "lead" }, { "style", "font-family: Inter; font-size: 16px" } },
                { make_text("Welcome to " + title) }),
            make_element("p", { { "style", "font-family: Inter; font-size: 16px" } }, { make_text("More below.") }),
        }),
        make_element("footer", { { "class", "site-footer" } }, { make_element("p", {}, { make_text("\xC2\xA9 2026") }) }),
    });
    return page;
}

BatchPage malformed_page(const std::string& id) {
    BatchPage page;
    page.id = id;
    page.document.root = make_text("not an element");
    return page;
}

BatchOptions options(int concurrency = 2) {
    BatchOptions o;
    o.concurrency = concurrency;
    o.timeout_ms = 5000;
    return o;
}

} // namespace

// ---------------------------------------------------------------------------
// Whole batches
// ---------------------------------------------------------------------------
TEST(BatchConverterTest, ConvertsEveryPageInInputOrder) {
    BatchConverter batch(options());
    std::vector<BatchProgress> seen;
    batch.on_progress([&seen](const BatchProgress& p) { seen.push_back(p); });

    auto result = batch.convert({ site_page("home", "Home"), site_page("about", "About"), site_page("blog", "Blog") });

    EXPECT_EQ(result.success_count, 3);
    EXPECT_EQ(result.failed_count, 0);
    EXPECT_TRUE(result.errors.empty());
    ASSERT_EQ(result.pages.size(), 3u);
    EXPECT_EQ(result.pages[1].page_id, "about");
    EXPECT_EQ(result.pages[1].title, "About");
    for (const auto& page : result.pages) {
        EXPECT_TRUE(page.success) << page.page_id;
        EXPECT_EQ(page.attempts, 1);
        ASSERT_TRUE(page.result.has_value());
        EXPECT_GT(page.result->stats.total_elements, 0);
    }

    ASSERT_FALSE(seen.empty());
    EXPECT_EQ(seen.back().percentage(), 100);
    EXPECT_EQ(seen.back().completed, 3);
    for (const auto& p : seen)
        EXPECT_LE(p.in_progress, 2);
}

TEST(BatchConverterTest, SharedStylesAndTemplatePartsSpanPages) {
    BatchConverter batch(options());
    auto result = batch.convert({ site_page("home", "Home"), site_page("about", "About") });

    ASSERT_TRUE(result.shared_styles.has_value());
    const auto& shared = *result.shared_styles;
    EXPECT_EQ(shared.typography.global.heading_font_family, "Georgia");
    EXPECT_EQ(shared.typography.global.base_font_family, "Inter");
    EXPECT_TRUE(std::any_of(shared.tokens.colors.begin(), shared.tokens.colors.end(),
        [](const page_model::ColorToken& c) { return c.hex == "#1a73e8" && c.usage == 2; }));
    EXPECT_NE(std::find(shared.common_classes.begin(), shared.common_classes.end(), "site-header"),
        shared.common_classes.end());

    ASSERT_TRUE(result.template_parts.has_value());
    ASSERT_TRUE(result.template_parts->header.has_value());
    EXPECT_EQ(result.template_parts->header->page_ids, (std::vector<std::string>{ "home", "about" }));
    EXPECT_TRUE(result.template_parts->header->recurring);
    ASSERT_TRUE(result.template_parts->footer.has_value());
    EXPECT_TRUE(result.template_parts->statistics.has_footer);
}

TEST(BatchConverterTest, SiteExtrasCanBeSwitchedOff) {
    auto o = options();
    o.extract_shared_styles = false;
    o.detect_template_parts = false;
    BatchConverter batch(o);
    auto result = batch.convert({ site_page("home", "Home") });
    EXPECT_EQ(result.success_count, 1);
    EXPECT_FALSE(result.shared_styles.has_value());
    EXPECT_FALSE(result.template_parts.has_value());
}

// ---------------------------------------------------------------------------
// Failures and retries
// ---------------------------------------------------------------------------
TEST(BatchConverterTest, FailedAttemptIsRetried) {
    auto calls = std::make_shared<std::map<std::string, int>>();
    auto mutex = std::make_shared<std::mutex>();
    BatchConverter batch(options(), [calls, mutex](ConversionJob& job, const page_model::DomDocument& doc) {
        {
            std::lock_guard lock(*mutex);
            if (++(*calls)[doc.title] == 1) throw std::runtime_error("renderer busy");
        }
        job.start();
        auto result = page_export::convert_page(doc, page_model::ConversionOptions{});
        job.complete();
        return result;
    });

    auto result = batch.convert({ site_page("home", "Home"), site_page("about", "About") });
    EXPECT_EQ(result.success_count, 2);
    ASSERT_EQ(result.errors.size(), 2u);
    EXPECT_EQ(result.errors[0].error, "renderer busy");
    EXPECT_EQ(result.errors[0].attempt, 1);
    for (const auto& page : result.pages) {
        EXPECT_TRUE(page.success);
        EXPECT_EQ(page.attempts, 2);
        EXPECT_TRUE(page.error.empty());
    }
}

TEST(BatchConverterTest, AttemptsAreBounded) {
    auto o = options();
    o.max_attempts = 3;
    BatchConverter batch(o, [](ConversionJob&, const page_model::DomDocument&) -> page_export::ConversionResult {
        throw std::runtime_error("always down");
    });
    auto result = batch.convert({ site_page("home", "Home") });
    EXPECT_EQ(result.failed_count, 1);
    EXPECT_EQ(result.errors.size(), 3u);
    EXPECT_EQ(result.pages[0].attempts, 3);
    EXPECT_EQ(result.pages[0].error, "always down");
    EXPECT_FALSE(result.shared_styles.has_value());
}

TEST(BatchConverterTest, MalformedPageFailsWithoutRetry) {
    BatchConverter batch(options());
    auto result = batch.convert({ malformed_page("broken"), site_page("home", "Home") });
    EXPECT_EQ(result.success_count, 1);
    EXPECT_EQ(result.failed_count, 1);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].page_id, "broken");
    EXPECT_FALSE(result.pages[0].success);
    EXPECT_EQ(result.pages[0].attempts, 1);
    EXPECT_FALSE(result.pages[0].error.empty());
    EXPECT_TRUE(result.pages[1].success);
}

TEST(BatchConverterTest, SlowPageTimesOutWithoutHoldingTheBatch) {
    auto o = options(2);
    o.timeout_ms = 50;
    BatchConverter batch(o, [](ConversionJob& job, const page_model::DomDocument& doc) {
        if (doc.title == "Slow") std::this_thread::sleep_for(std::chrono::milliseconds(600));
        job.start();
        auto result = page_export::convert_page(doc, page_model::ConversionOptions{});
        job.complete();
        return result;
    });

    const auto started = std::chrono::steady_clock::now();
    auto result = batch.convert({ site_page("slow", "Slow"), site_page("fast", "Fast") });
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, std::chrono::milliseconds(600));
    EXPECT_TRUE(result.pages[1].success);
    EXPECT_FALSE(result.pages[0].success);
    EXPECT_EQ(result.pages[0].attempts, 2);
    EXPECT_NE(result.pages[0].error.find("timeout"), std::string::npos);
    EXPECT_EQ(result.errors.size(), 2u);
}

// ---------------------------------------------------------------------------
// Cancellation
// ---------------------------------------------------------------------------
TEST(BatchConverterTest, CancelSkipsPagesNotStarted) {
    BatchConverter batch(options(1));
    batch.on_progress([&batch](const BatchProgress& p) {
        if (p.completed == 1) batch.cancel();
    });

    auto result = batch.convert({ site_page("a", "A"), site_page("b", "B"), site_page("c", "C") });
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.success_count, 1);
    EXPECT_EQ(result.failed_count, 2);
    EXPECT_TRUE(result.pages[0].success);
    EXPECT_EQ(result.pages[2].error, "batch cancelled");
    EXPECT_EQ(result.pages[2].attempts, 0);
    EXPECT_TRUE(result.errors.empty());
}
