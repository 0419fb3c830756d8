#pragma once

#include <page_model/dom.hpp>
#include <page_model/validation.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace page_validation {

struct Screenshot {
    int width = 0;
    int height = 0;
    // Row-major, 4 bytes per pixel.
    std::vector<std::uint8_t> rgba;
};

struct RenderedElement {
    std::string selector;
    page_model::StyleMap styles;
};

struct RenderSnapshot {
    Screenshot screenshot;
    std::vector<RenderedElement> elements;
};

// Headless renderer supplied by the host. May throw std::runtime_error when the page cannot be rendered.
class RenderCapability {
public:
    virtual ~RenderCapability() = default;
    virtual RenderSnapshot render(const std::string& source, const page_model::Viewport& viewport) = 0;
};

struct ProbeResponse {
    std::optional<int> status_code;
    // Transport failure; empty when a status arrived.
    std::string error;
};

// Reachability check for one asset URL.
class AssetProbe {
public:
    virtual ~AssetProbe() = default;
    virtual ProbeResponse probe(const std::string& url) = 0;
};

// mobile 375x667, tablet 768x1024, laptop 1366x768, desktop 1920x1080
const std::vector<page_model::Viewport>& standard_viewports();
std::optional<page_model::Viewport> find_viewport(std::string_view name);

} // namespace page_validation
