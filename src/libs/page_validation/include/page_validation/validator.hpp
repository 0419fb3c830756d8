#pragma once

#include <page_validation/asset_verifier.hpp>
#include <page_validation/capabilities.hpp>
#include <page_validation/thread_pool.hpp>
#include <page_model/config.hpp>
#include <page_model/dom.hpp>
#include <page_model/validation.hpp>
#include <memory>
#include <string>

namespace page_validation {

struct ValidationRequest {
    page_model::DomNode original;
    // Markup handed to the renderer for each side.
    std::string original_source;
    std::string converted_source;
};

// Post-conversion checks. Renders and probes run on the worker pool; each waits at most
// settings.timeout_ms measured from the start of validate(). Checks still queued when
// validate() returns are skipped.
class Validator {
public:
    // Either capability may be null: no renderer skips the visual comparison, no probe treats
    // every asset as reachable.
    Validator(page_model::ValidationSettings settings, std::shared_ptr<RenderCapability> renderer,
        std::shared_ptr<AssetProbe> probe);

    // Throws std::runtime_error after stop().
    page_model::ValidationResult validate(const ValidationRequest& request);

    // Drops queued checks and releases the workers without waiting for calls in flight.
    // The destructor does the same.
    void stop();

    const page_model::ValidationSettings& settings() const { return settings_; }

private:
    page_model::ValidationSettings settings_;
    std::shared_ptr<RenderCapability> renderer_;
    std::shared_ptr<AssetProbe> probe_;
    ThreadPool pool_;
};

// Folds the sub-results into errors, warnings, suggestions, the overall score and the export gate.
void aggregate(page_model::ValidationResult& result);

} // namespace page_validation
