#pragma once

#include "radish/container.hpp"
#include "radish/convention.hpp"
#include "radish/model.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace radish {

struct ReadOptions {
  // Moment names to decode; empty decodes every catalog field. Names that are
  // not in the file are ignored.
  std::vector<std::string> moments;
  // Decode sweeps in separate HPX tasks when an HPX runtime is running.
  bool parallel_sweeps = false;
  // Also mask stored values outside valid_min/valid_max (or valid_range).
  bool mask_outside_valid_range = false;
};

// State shared by every sweep of one volume: the range coordinate, read once,
// and the selected moment fields.
struct SweepContext {
  std::vector<float> range;
  std::vector<std::string> fields;
  bool has_time = false;
};

// Validates the ray and gate coordinate variables against the convention map
// and reads the range coordinate.
SweepContext prepare_sweep_context(const Container& container, const ConventionMap& map,
                                   const ReadOptions& options);

SweepData materialize_sweep(const Container& container, const ConventionMap& map,
                            const SweepContext& context, std::size_t sweep_index,
                            const ReadOptions& options);

// All sweeps in index order. The first failing sweep (lowest index) aborts the
// read with its error.
std::vector<SweepData> materialize_sweeps(const Container& container, const ConventionMap& map,
                                          const ReadOptions& options);

}  // namespace radish
