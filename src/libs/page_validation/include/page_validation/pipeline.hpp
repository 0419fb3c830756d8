#pragma once

#include <page_validation/conversion_job.hpp>
#include <page_validation/validator.hpp>
#include <page_export/converter.hpp>
#include <page_model/conversion.hpp>
#include <page_model/dom.hpp>
#include <page_model/validation.hpp>

namespace page_validation {

// Appends the validator's findings to the conversion's own (export structure) findings.
void merge_validation(page_model::ValidationResult& into, page_model::ValidationResult from);

// Drives the job through converting and, with a validator, validating. Any exception from either
// stage fails the job and is rethrown; malformed input surfaces as std::invalid_argument.
page_export::ConversionResult run_conversion(ConversionJob& job, const page_model::DomDocument& document,
    const page_model::ConversionOptions& options, Validator* validator = nullptr);

} // namespace page_validation
