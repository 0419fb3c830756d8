#include <page_validation/validator.hpp>
#include <page_validation/custom_code_detector.hpp>
#include <page_validation/visual_comparator.hpp>
#include <page_model/logging.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <future>
#include <optional>
#include <stdexcept>
#include <utility>

namespace page_validation {

namespace {

using page_model::Severity;
using page_model::ValidationIssue;
using page_model::ValidationResult;
using Clock = std::chrono::steady_clock;

void add_error(ValidationResult& result, std::string type, std::string message, std::string component = {},
    Severity severity = Severity::High) {
    result.errors.push_back({ std::move(type), std::move(message), std::move(component), severity });
}

void add_warning(ValidationResult& result, std::string type, std::string message, std::string component = {},
    Severity severity = Severity::Medium) {
    result.warnings.push_back({ std::move(type), std::move(message), std::move(component), severity });
}

void record_timeout(ValidationResult& result, const std::string& check, const std::string& component,
    int timeout_ms) {
    add_warning(result, "validation-timeout", fmt::format("{} timed out after {} ms", check, timeout_ms), component);
    result.requires_override = true;
    page_model::conversion_logger()->warn("{} timed out after {} ms ({})", check, timeout_ms, component);
}

void record_unreachable(ValidationResult& result, const std::string& check, const std::string& component,
    const std::string& reason) {
    add_warning(result, "validation-unreachable", fmt::format("{} failed: {}", check, reason), component);
    result.requires_override = true;
    page_model::conversion_logger()->warn("{} failed ({}): {}", check, component, reason);
}

std::string join_first(const std::vector<std::string>& items, size_t count) {
    std::string out;
    for (size_t i = 0; i < items.size() && i < count; ++i) {
        if (i) out += ", ";
        out += items[i];
    }
    return out;
}

void aggregate_visual(ValidationResult& result, const page_model::VisualComparisonResult& visual) {
    const std::string& viewport = visual.viewport.name;
    if (visual.similarity_score < 80) {
        add_error(result, "visual-similarity", fmt::format("Visual similarity is low: {:.2f}%", visual.similarity_score),
            viewport);
        result.suggestions.push_back("Review diff image to identify visual discrepancies");
    } else if (visual.similarity_score < 90) {
        add_warning(result, "visual-similarity",
            fmt::format("Visual similarity could be improved: {:.2f}%", visual.similarity_score), viewport);
    }
    if (!visual.dimensions_match) {
        add_warning(result, "visual-dimensions", "Page dimensions do not match between original and converted",
            viewport);
        result.suggestions.push_back("Check for missing content or layout issues");
    }
    if (!visual.missing_elements.empty()) {
        add_error(result, "visual-missing-elements",
            fmt::format("{} elements missing in converted page", visual.missing_elements.size()), viewport);
        result.suggestions.push_back("Missing elements: " + join_first(visual.missing_elements, 5));
    }
    if (!visual.extra_elements.empty()) {
        add_warning(result, "visual-extra-elements",
            fmt::format("{} extra elements in converted page", visual.extra_elements.size()), viewport);
    }
    auto major = std::count_if(visual.style_discrepancies.begin(), visual.style_discrepancies.end(),
        [](const page_model::StyleDiscrepancy& d) { return d.severity == page_model::DiscrepancySeverity::Major; });
    if (major > 0) {
        add_error(result, "visual-style", fmt::format("{} major style discrepancies detected", major), viewport);
        result.suggestions.push_back("Review style differences in critical elements");
    }
}

void aggregate_assets(ValidationResult& result, const page_model::AssetVerificationResult& assets) {
    if (!assets.broken_assets.empty()) {
        add_error(result, "asset-broken", fmt::format("{} broken assets detected", assets.broken_assets.size()));
        for (size_t i = 0; i < assets.broken_assets.size() && i < 3; ++i) {
            const auto& asset = assets.broken_assets[i];
            result.suggestions.push_back(fmt::format("Fix broken {}: {}", page_model::to_string(asset.type), asset.url));
        }
    }
    std::vector<const page_model::MissingAsset*> critical;
    for (const auto& asset : assets.missing_assets) {
        if (asset.severity == page_model::WarningSeverity::Critical) critical.push_back(&asset);
    }
    if (!critical.empty()) {
        add_error(result, "asset-missing", fmt::format("{} critical assets missing", critical.size()), {},
            Severity::Critical);
        for (size_t i = 0; i < critical.size() && i < 3; ++i) {
            result.suggestions.push_back(
                fmt::format("Add missing {}: {}", page_model::to_string(critical[i]->type), critical[i]->url));
        }
    }
    if (assets.verification_score < 90) {
        add_warning(result, "asset-score", fmt::format("Asset verification score: {}%", assets.verification_score));
        result.suggestions.push_back("Ensure all assets are properly linked and accessible");
    }
}

void aggregate_code(ValidationResult& result, const page_model::CustomCodeDetection& code) {
    if (!code.can_be_converted) {
        add_error(result, "custom-code", "Page contains code that cannot be automatically converted");
        result.suggestions.push_back("Consider using custom HTML widgets for complex functionality");
    }
    if (code.conversion_score < 70) {
        add_warning(result, "custom-code-score", fmt::format("Conversion score is low: {}%", code.conversion_score));
    }
    for (const auto& incompatibility : code.incompatibilities) {
        if (incompatibility.impact != page_model::Impact::Blocking) continue;
        add_error(result, "incompatibility",
            fmt::format("Blocking incompatibility: {} - {}", incompatibility.name, incompatibility.reason),
            incompatibility.name, Severity::Critical);
        if (!incompatibility.workaround.empty())
            result.suggestions.push_back("Workaround: " + incompatibility.workaround);
    }
    for (const auto& warning : code.warnings) {
        if (warning.severity == page_model::WarningSeverity::Critical) {
            add_error(result, warning.type, warning.message, {}, Severity::Critical);
            if (!warning.suggestion.empty()) result.suggestions.push_back(warning.suggestion);
        } else if (warning.severity == page_model::WarningSeverity::Warning) {
            add_warning(result, warning.type, warning.message);
        }
    }
    for (const auto& feature : code.features) {
        if (!feature.is_supported && !feature.alternative.empty())
            result.suggestions.push_back(feature.feature + ": " + feature.alternative);
    }
}

// Waits for a pool result until the shared deadline. Exceptions raised by the capability surface as
// std::exception from get().
template<typename T>
std::optional<T> await(std::future<T>& future, Clock::time_point deadline) {
    if (future.wait_until(deadline) != std::future_status::ready) return std::nullopt;
    return future.get();
}

// Set once validate() stops waiting; tasks still queued then skip their capability call.
using CancelFlag = std::shared_ptr<std::atomic<bool>>;

void throw_if_abandoned(const CancelFlag& cancelled) {
    if (cancelled->load()) throw std::runtime_error("validation run abandoned");
}

} // namespace

void aggregate(ValidationResult& result) {
    for (const auto& visual : result.visual_comparisons) aggregate_visual(result, visual);
    if (result.asset_verification) aggregate_assets(result, *result.asset_verification);
    if (result.custom_code) aggregate_code(result, *result.custom_code);

    double score = 100;
    for (const auto& visual : result.visual_comparisons) score = std::min(score, visual.similarity_score);
    if (result.asset_verification)
        score = std::min(score, static_cast<double>(result.asset_verification->verification_score));
    if (result.custom_code) score = std::min(score, static_cast<double>(result.custom_code->conversion_score));
    result.overall_score = static_cast<int>(std::lround(score));

    result.is_valid = result.errors.empty() && *result.overall_score >= 80;

    size_t blocking = 0;
    size_t critical = 0;
    if (result.custom_code) {
        for (const auto& i : result.custom_code->incompatibilities) {
            if (i.impact == page_model::Impact::Blocking) ++blocking;
        }
        for (const auto& w : result.custom_code->warnings) {
            if (w.severity == page_model::WarningSeverity::Critical) ++critical;
        }
    }
    if (result.asset_verification) {
        for (const auto& a : result.asset_verification->missing_assets) {
            if (a.severity == page_model::WarningSeverity::Critical) ++critical;
        }
    }
    for (const auto& visual : result.visual_comparisons) {
        for (const auto& d : visual.style_discrepancies) {
            if (d.severity == page_model::DiscrepancySeverity::Major) ++critical;
        }
    }
    result.can_export = blocking == 0 && critical == 0;
}

Validator::Validator(page_model::ValidationSettings settings, std::shared_ptr<RenderCapability> renderer,
    std::shared_ptr<AssetProbe> probe)
    : settings_(std::move(settings))
    , renderer_(std::move(renderer))
    , probe_(std::move(probe))
    , pool_(static_cast<size_t>(std::max(settings_.workers, 1)))
{
}

void Validator::stop() {
    pool_.stop();
    page_model::conversion_logger()->info("Validator stopped");
}

ValidationResult Validator::validate(const ValidationRequest& request) {
    if (pool_.stopped()) throw std::runtime_error("validator is stopped");
    auto log = page_model::conversion_logger();
    const auto started = Clock::now();
    const auto deadline = started + std::chrono::milliseconds(settings_.timeout_ms);
    ValidationResult result;

    // Shared with the pool so abandoned tasks never outlive their inputs.
    auto shared = std::make_shared<const ValidationRequest>(request);
    auto cancelled = std::make_shared<std::atomic<bool>>(false);

    struct PendingRender {
        page_model::Viewport viewport;
        std::future<std::pair<RenderSnapshot, RenderSnapshot>> future;
    };
    std::vector<PendingRender> renders;
    if (renderer_) {
        for (const auto& name : settings_.viewports) {
            auto viewport = find_viewport(name);
            if (!viewport) {
                add_warning(result, "validation-viewport", "Unknown viewport: " + name, name, Severity::Low);
                continue;
            }
            auto renderer = renderer_;
            renders.push_back({ *viewport, pool_.submit([renderer, shared, cancelled, v = *viewport]() {
                throw_if_abandoned(cancelled);
                auto original = renderer->render(shared->original_source, v);
                auto converted = renderer->render(shared->converted_source, v);
                return std::make_pair(std::move(original), std::move(converted));
            }) });
        }
    }

    struct PendingProbe {
        const AssetReference* asset;
        std::optional<std::future<ProbeResponse>> future;
    };
    const auto assets = collect_assets(shared->original);
    std::vector<PendingProbe> probes;
    for (const auto& asset : assets) {
        PendingProbe pending { &asset, std::nullopt };
        if (probe_ && settings_.check_external_assets && is_external_url(asset.url)) {
            auto probe = probe_;
            pending.future = pool_.submit([probe, cancelled, url = asset.url]() {
                throw_if_abandoned(cancelled);
                return probe->probe(url);
            });
        }
        probes.push_back(std::move(pending));
    }

    // The scan is pure; it runs here while the pool works.
    result.custom_code = detect_custom_code(shared->original);

    for (auto& pending : renders) {
        const std::string check = "Visual comparison";
        try {
            auto snapshots = await(pending.future, deadline);
            if (!snapshots) {
                record_timeout(result, check, pending.viewport.name, settings_.timeout_ms);
                continue;
            }
            result.visual_comparisons.push_back(compare_snapshots(snapshots->first, snapshots->second,
                pending.viewport, settings_.pixel_threshold));
        } catch (const std::exception& e) {
            record_unreachable(result, check, pending.viewport.name, e.what());
        }
    }

    page_model::AssetVerificationResult asset_result;
    for (auto& pending : probes) {
        if (!pending.future) {
            record_asset(asset_result, *pending.asset, std::nullopt);
            continue;
        }
        const std::string check = "Asset probe";
        try {
            auto response = await(*pending.future, deadline);
            if (!response) {
                // Excluded from the totals.
                record_timeout(result, check, pending.asset->url, settings_.timeout_ms);
                continue;
            }
            record_asset(asset_result, *pending.asset, response);
        } catch (const std::exception& e) {
            record_unreachable(result, check, pending.asset->url, e.what());
        }
    }
    cancelled->store(true);
    finish_verification(asset_result);
    result.asset_verification = std::move(asset_result);

    aggregate(result);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started).count();
    log->info("Validation finished in {} ms: score={} valid={} can_export={} errors={} warnings={}", elapsed,
        *result.overall_score, result.is_valid, result.can_export, result.errors.size(), result.warnings.size());
    return result;
}

} // namespace page_validation
