#include <page_validation/pipeline.hpp>
#include <page_model/logging.hpp>
#include <exception>

namespace page_validation {

void merge_validation(page_model::ValidationResult& into, page_model::ValidationResult from) {
    auto structure_errors = std::move(into.errors);
    auto structure_warnings = std::move(into.warnings);
    auto structure_suggestions = std::move(into.suggestions);
    into = std::move(from);
    into.errors.insert(into.errors.begin(), structure_errors.begin(), structure_errors.end());
    into.warnings.insert(into.warnings.begin(), structure_warnings.begin(), structure_warnings.end());
    into.suggestions.insert(into.suggestions.begin(), structure_suggestions.begin(), structure_suggestions.end());
    into.is_valid = into.errors.empty() && (!into.overall_score || *into.overall_score >= 80);
}

page_export::ConversionResult run_conversion(ConversionJob& job, const page_model::DomDocument& document,
    const page_model::ConversionOptions& options, Validator* validator) {
    job.start();
    page_export::ConversionResult result;
    try {
        result = page_export::convert_page(document, options);
    } catch (const std::exception& e) {
        job.fail(e.what());
        throw;
    }

    if (!validator) {
        job.complete();
        return result;
    }

    job.begin_validation();
    ValidationRequest request;
    request.original = document.root;
    request.original_source = page_model::serialize_outer_html(document.root);
    request.converted_source = page_export::export_text(result.export_data);
    try {
        merge_validation(result.validation, validator->validate(request));
    } catch (const std::exception& e) {
        job.fail(e.what());
        throw;
    }
    job.complete();

    page_model::conversion_logger()->info("Job {} done: valid={} can_export={} requires_override={}", job.id(),
        result.validation.is_valid, result.validation.can_export, result.validation.requires_override);
    return result;
}

} // namespace page_validation
