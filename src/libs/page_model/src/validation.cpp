#include <page_model/validation.hpp>

namespace page_model {

std::string_view to_string(Severity severity) {
    switch (severity) {
    case Severity::Critical: return "critical";
    case Severity::High: return "high";
    case Severity::Medium: return "medium";
    case Severity::Low: return "low";
    }
    return "medium";
}

std::string_view to_string(DiscrepancySeverity severity) {
    switch (severity) {
    case DiscrepancySeverity::Minor: return "minor";
    case DiscrepancySeverity::Moderate: return "moderate";
    case DiscrepancySeverity::Major: return "major";
    }
    return "minor";
}

std::string_view to_string(WarningSeverity severity) {
    switch (severity) {
    case WarningSeverity::Critical: return "critical";
    case WarningSeverity::Warning: return "warning";
    case WarningSeverity::Info: return "info";
    }
    return "warning";
}

std::string_view to_string(Impact impact) {
    switch (impact) {
    case Impact::Blocking: return "blocking";
    case Impact::Degraded: return "degraded";
    case Impact::Minimal: return "minimal";
    }
    return "minimal";
}

std::string_view to_string(AssetType type) {
    switch (type) {
    case AssetType::Image: return "image";
    case AssetType::Font: return "font";
    case AssetType::Video: return "video";
    case AssetType::Stylesheet: return "stylesheet";
    case AssetType::Script: return "script";
    }
    return "image";
}

} // namespace page_model
