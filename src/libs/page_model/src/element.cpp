#include <page_model/element.hpp>
#include <algorithm>
#include <cctype>

namespace page_model {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

bool AnalyzedElement::has_class_containing(const std::string& keyword) const {
    const std::string needle = lowercase(keyword);
    for (const auto& cls : classes)
        if (lowercase(cls).find(needle) != std::string::npos) return true;
    return false;
}

std::string AnalyzedElement::attribute_or(const std::string& name, const std::string& fallback) const {
    auto it = attributes.find(name);
    return it != attributes.end() ? it->second : fallback;
}

std::size_t count_descendants(const AnalyzedElement& element) {
    std::size_t n = 0;
    for (const auto& child : element.children)
        n += 1 + count_descendants(child);
    return n;
}

} // namespace page_model
