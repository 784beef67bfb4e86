#pragma once

#include "radish/container.hpp"
#include "radish/model.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace radish {

// One row of the sweep table; ray indices are inclusive.
struct SweepRange {
  int32_t index = 0;
  std::size_t start_ray = 0;
  std::size_t end_ray = 0;
  double fixed_angle = 0.0;
  int32_t sweep_number = 0;
  SweepMode mode = SweepMode::kAzimuthSurveillance;

  std::size_t num_rays() const { return end_ray - start_ray + 1; }
};

struct ConventionMap {
  std::string ray_dim;
  std::string gate_dim;
  std::size_t num_rays_total = 0;
  std::size_t num_gates = 0;
  std::vector<SweepRange> sweeps;
  std::vector<std::string> fields;  // moment variables in file order
};

// Coordinate and auxiliary variable names that are never moments.
bool is_reserved_variable(const std::string& name);

// Builds the sweep table and the field catalog. Throws SchemaError when a
// required CfRadial1 element is missing or the sweep table is inconsistent.
ConventionMap map_convention(const Container& container);

}  // namespace radish
