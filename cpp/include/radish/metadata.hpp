#pragma once

#include "radish/container.hpp"
#include "radish/convention.hpp"
#include "radish/model.hpp"

namespace radish {

// Reads global attributes, scalar variables and the sweep table only; never
// touches ray-sized or gate-sized payloads. Optional fields fall back to
// their defaults.
VolumeMetadata extract_metadata(const Container& container, const ConventionMap& map);

}  // namespace radish
