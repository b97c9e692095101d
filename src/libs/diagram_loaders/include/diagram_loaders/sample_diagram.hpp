#pragma once

#include <diagram_model/types.hpp>

namespace diagram_loaders {

// A small three-tier web stack covering every built-in resource kind.
diagram_model::Diagram generate_sample_diagram();

} // namespace diagram_loaders
