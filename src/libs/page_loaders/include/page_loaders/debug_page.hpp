#pragma once

#include <page_model/dom.hpp>

namespace page_loaders {

// Landing page exercising most component families; used when no input is given.
page_model::DomDocument generate_debug_page();

} // namespace page_loaders
