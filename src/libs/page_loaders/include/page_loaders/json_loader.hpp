#pragma once

#include <page_model/config.hpp>
#include <page_model/dom.hpp>
#include <optional>
#include <istream>
#include <string>

namespace page_loaders {

// Accepts either a bare node object or {"title": ..., "root": node}.
std::optional<page_model::DomDocument> load_document_from_json(std::istream& in);
std::optional<page_model::DomDocument> load_document_from_json_file(const std::string& path);

// Missing keys keep their defaults.
std::optional<page_model::AppConfig> load_config_from_json(std::istream& in);
std::optional<page_model::AppConfig> load_config_from_json_file(const std::string& path);

} // namespace page_loaders
