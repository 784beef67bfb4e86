#include "radish/convention.hpp"

#include "radish/error.hpp"
#include "radish/event_log.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <unordered_set>

namespace radish {

namespace {

const std::vector<double>& checked_same_length(const Container& container,
                                               const std::vector<double>& values,
                                               const std::string& name, std::size_t expected) {
  if (values.size() != expected) {
    throw SchemaError(container.path(),
                      "has " + std::to_string(values.size()) + " entries, expected " +
                          std::to_string(expected) + " (one per sweep)",
                      name);
  }
  return values;
}

std::size_t ray_index(const Container& container, double value, const std::string& name,
                      int32_t sweep) {
  if (!std::isfinite(value) || value < 0.0 || value != std::floor(value)) {
    throw SchemaError(container.path(), "ray index must be a non-negative integer", name, sweep);
  }
  if (value >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
    throw SchemaError(container.path(), "ray index is out of range", name, sweep);
  }
  return static_cast<std::size_t>(value);
}

std::optional<int32_t> as_sweep_number(double value) {
  if (!std::isfinite(value) || value < std::numeric_limits<int32_t>::min() ||
      value > std::numeric_limits<int32_t>::max()) {
    return std::nullopt;
  }
  return static_cast<int32_t>(value);
}

}  // namespace

bool is_reserved_variable(const std::string& name) {
  static const std::unordered_set<std::string> kReserved = {
      "time",
      "range",
      "azimuth",
      "elevation",
      "ray_start_range",
      "ray_gate_spacing",
      "ray_n_gates",
      "ray_start_index",
      "ray_times_increase",
      "ray_angle_res",
      "ray_accum_time",
      "ray_correction",
      "scan_rate",
      "antenna_transition",
      "georefs_applied",
      "n_samples",
      "pulse_width",
      "prt",
      "prt_ratio",
      "nyquist_velocity",
      "unambiguous_range",
      "radar_estimated_noise_dbz_hc",
      "radar_estimated_noise_dbz_vc",
      "measured_transmit_power_h",
      "measured_transmit_power_v",
  };
  return kReserved.count(name) > 0;
}

ConventionMap map_convention(const Container& container) {
  const std::string& path = container.path();
  for (const char* required :
       {"sweep_start_ray_index", "sweep_end_ray_index", "fixed_angle", "range"}) {
    if (container.variable(required) == nullptr) {
      throw SchemaError(path, "required CfRadial1 variable is missing", required);
    }
  }

  ConventionMap map;

  const VariableInfo& range = *container.variable("range");
  if (range.shape.size() != 1) {
    throw SchemaError(path, "range must be one-dimensional", "range");
  }
  map.gate_dim = range.dims[0];
  map.num_gates = range.shape[0];

  // CfRadial1 names the ray dimension "time"; other writers are followed
  // through the leading dimension of azimuth.
  map.ray_dim = "time";
  if (container.dimension("time") == nullptr) {
    const VariableInfo* azimuth = container.variable("azimuth");
    if (azimuth != nullptr && !azimuth->dims.empty()) {
      map.ray_dim = azimuth->dims[0];
    }
  }
  if (const Dimension* dim = container.dimension(map.ray_dim)) {
    map.num_rays_total = dim->size;
  }

  // Sweep-sized arrays only.
  const std::vector<double> starts = container.read_doubles("sweep_start_ray_index");
  const std::size_t num_sweeps = starts.size();
  const std::vector<double> ends =
      checked_same_length(container, container.read_doubles("sweep_end_ray_index"),
                          "sweep_end_ray_index", num_sweeps);
  const std::vector<double> fixed_angles = checked_same_length(
      container, container.read_doubles("fixed_angle"), "fixed_angle", num_sweeps);

  std::vector<double> sweep_numbers;
  if (container.variable("sweep_number") != nullptr) {
    sweep_numbers = container.read_doubles("sweep_number");
    if (sweep_numbers.size() != num_sweeps) {
      log_warning("ConventionMapper", "sweep_number length does not match the sweep count in " +
                                          path + "; using sweep indices");
      sweep_numbers.clear();
    }
  }

  std::vector<std::string> sweep_modes;
  if (const VariableInfo* mode_var = container.variable("sweep_mode")) {
    if (mode_var->type == DataType::kString) {
      sweep_modes = container.read_strings("sweep_mode");
    }
    if (sweep_modes.size() != num_sweeps) {
      log_warning("ConventionMapper", "sweep_mode is unusable in " + path +
                                          "; assuming azimuth_surveillance");
      sweep_modes.clear();
    }
  }

  map.sweeps.reserve(num_sweeps);
  for (std::size_t i = 0; i < num_sweeps; ++i) {
    const auto index = static_cast<int32_t>(i);
    SweepRange sweep;
    sweep.index = index;
    sweep.start_ray = ray_index(container, starts[i], "sweep_start_ray_index", index);
    sweep.end_ray = ray_index(container, ends[i], "sweep_end_ray_index", index);
    if (sweep.start_ray > sweep.end_ray) {
      throw SchemaError(path,
                        "start ray " + std::to_string(sweep.start_ray) + " is after end ray " +
                            std::to_string(sweep.end_ray),
                        "sweep_end_ray_index", index);
    }
    if (sweep.end_ray >= map.num_rays_total) {
      throw SchemaError(path,
                        "end ray " + std::to_string(sweep.end_ray) + " is outside the " +
                            std::to_string(map.num_rays_total) + " rays of the volume",
                        "sweep_end_ray_index", index);
    }
    sweep.fixed_angle = fixed_angles[i];
    sweep.sweep_number = index;
    if (!sweep_numbers.empty()) {
      if (const auto number = as_sweep_number(sweep_numbers[i])) {
        sweep.sweep_number = *number;
      } else {
        log_warning("ConventionMapper", "sweep_number of sweep " + std::to_string(i) + " in " +
                                            path + " is not a usable integer; using the index");
      }
    }
    sweep.mode = sweep_modes.empty() ? SweepMode::kAzimuthSurveillance
                                     : parse_sweep_mode(sweep_modes[i]);
    map.sweeps.push_back(sweep);
  }

  for (const auto& var : container.variables()) {
    if (is_reserved_variable(var.name)) {
      continue;
    }
    if (var.dims.size() != 2 || var.dims[0] != map.ray_dim || var.dims[1] != map.gate_dim) {
      continue;
    }
    if (!is_numeric(var.type)) {
      log_warning("ConventionMapper", "skipping " + var.name + " in " + path +
                                          ": storage type " + data_type_name(var.type) +
                                          " is not numeric");
      continue;
    }
    log_verbose("ConventionMapper", "moment " + var.name + " (" + data_type_name(var.type) + ")");
    map.fields.push_back(var.name);
  }
  return map;
}

}  // namespace radish
