#include "radish/materializer.hpp"

#include "radish/error.hpp"
#include "radish/event_log.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <unordered_set>

#ifdef RADISH_USE_HPX
#include <hpx/include/async.hpp>
#include <hpx/include/lcos.hpp>
#include <hpx/runtime.hpp>
#endif

namespace radish {

namespace {

struct Packing {
  double scale = 1.0;
  double offset = 0.0;
  std::optional<double> valid_min;
  std::optional<double> valid_max;
};

std::optional<double> numeric_attribute(const Container& container, const VariableInfo& var,
                                        const std::string& attr_name, int32_t sweep) {
  const AttributeValue* attr = var.attribute(attr_name);
  if (attr == nullptr) {
    return std::nullopt;
  }
  const std::optional<double> value = attr->as_double();
  if (!value.has_value() || !std::isfinite(*value)) {
    throw DecodeError(container.path(), attr_name + " is not a finite number", var.name, sweep);
  }
  return value;
}

Packing read_packing(const Container& container, const VariableInfo& var, int32_t sweep,
                     bool with_valid_range) {
  Packing packing;
  packing.scale = numeric_attribute(container, var, "scale_factor", sweep).value_or(1.0);
  packing.offset = numeric_attribute(container, var, "add_offset", sweep).value_or(0.0);
  if (with_valid_range) {
    packing.valid_min = numeric_attribute(container, var, "valid_min", sweep);
    packing.valid_max = numeric_attribute(container, var, "valid_max", sweep);
    if (const AttributeValue* range = var.attribute("valid_range")) {
      if (range->values.size() == 2) {
        if (!packing.valid_min) packing.valid_min = range->values[0];
        if (!packing.valid_max) packing.valid_max = range->values[1];
      }
    }
  }
  return packing;
}

template <typename T>
std::vector<float> decode_as(const Container& container, const VariableInfo& var,
                             const RawArray& raw, const Packing& packing) {
  // Fill values compare exactly in the stored type.
  const std::optional<T> fill = container.read_attribute_as<T>(var.name, "_FillValue");
  const std::size_t n = raw.count();
  const T* in = raw.as<T>();
  std::vector<float> out(n);
  for (std::size_t i = 0; i < n; ++i) {
    const T v = in[i];
    if (fill.has_value() && v == *fill) {
      out[i] = kNoData;
      continue;
    }
    const double stored = static_cast<double>(v);
    if ((packing.valid_min && stored < *packing.valid_min) ||
        (packing.valid_max && stored > *packing.valid_max)) {
      out[i] = kNoData;
      continue;
    }
    out[i] = static_cast<float>(stored * packing.scale + packing.offset);
  }
  return out;
}

std::vector<float> decode_values(const Container& container, const VariableInfo& var,
                                 const RawArray& raw, const Packing& packing, int32_t sweep) {
  switch (raw.type) {
    case DataType::kInt8:
      return decode_as<int8_t>(container, var, raw, packing);
    case DataType::kUInt8:
      return decode_as<uint8_t>(container, var, raw, packing);
    case DataType::kInt16:
      return decode_as<int16_t>(container, var, raw, packing);
    case DataType::kUInt16:
      return decode_as<uint16_t>(container, var, raw, packing);
    case DataType::kInt32:
      return decode_as<int32_t>(container, var, raw, packing);
    case DataType::kUInt32:
      return decode_as<uint32_t>(container, var, raw, packing);
    case DataType::kInt64:
      return decode_as<int64_t>(container, var, raw, packing);
    case DataType::kUInt64:
      return decode_as<uint64_t>(container, var, raw, packing);
    case DataType::kFloat32:
      return decode_as<float>(container, var, raw, packing);
    case DataType::kFloat64:
      return decode_as<double>(container, var, raw, packing);
    default:
      break;
  }
  throw DecodeError(container.path(),
                    std::string("unsupported storage type ") + data_type_name(raw.type), var.name,
                    sweep);
}

std::string text_attribute(const VariableInfo& var, const std::string& attr_name) {
  const AttributeValue* attr = var.attribute(attr_name);
  return attr == nullptr ? std::string() : attr->to_string();
}

std::optional<double> provenance_attribute(const VariableInfo& var, const std::string& attr_name) {
  const AttributeValue* attr = var.attribute(attr_name);
  return attr == nullptr ? std::nullopt : attr->as_double();
}

std::vector<float> to_float(const std::vector<double>& values) {
  std::vector<float> out(values.size());
  std::transform(values.begin(), values.end(), out.begin(),
                 [](double v) { return static_cast<float>(v); });
  return out;
}

const VariableInfo& require_ray_coordinate(const Container& container, const ConventionMap& map,
                                           const std::string& name) {
  const VariableInfo* var = container.variable(name);
  if (var == nullptr) {
    throw SchemaError(container.path(), "required coordinate variable is missing", name);
  }
  if (var->shape.size() != 1 || var->shape[0] != map.num_rays_total) {
    throw DecodeError(container.path(),
                      "expected one value per ray (" + std::to_string(map.num_rays_total) + ")",
                      name);
  }
  return *var;
}

MomentData decode_moment(const Container& container, const ConventionMap& map,
                         const SweepRange& sweep, const std::string& name,
                         const ReadOptions& options) {
  const VariableInfo* var = container.variable(name);
  if (var == nullptr) {
    throw SchemaError(container.path(), "moment variable disappeared from the catalog", name,
                      sweep.index);
  }
  if (var->shape.size() != 2 || var->shape[0] != map.num_rays_total ||
      var->shape[1] != map.num_gates) {
    throw DecodeError(container.path(),
                      "moment shape does not match (" + std::to_string(map.num_rays_total) + ", " +
                          std::to_string(map.num_gates) + ")",
                      name, sweep.index);
  }
  const Packing packing =
      read_packing(container, *var, sweep.index, options.mask_outside_valid_range);
  const RawArray raw = container.read_rows(name, sweep.start_ray, sweep.num_rays());
  std::vector<float> values = decode_values(container, *var, raw, packing, sweep.index);

  MomentData moment(name, text_attribute(*var, "units"), sweep.num_rays(), map.num_gates,
                    std::move(values));
  moment.standard_name = text_attribute(*var, "standard_name");
  moment.long_name = text_attribute(*var, "long_name");
  moment.scale_factor = provenance_attribute(*var, "scale_factor");
  moment.add_offset = provenance_attribute(*var, "add_offset");
  moment.fill_value = provenance_attribute(*var, "_FillValue");
  return moment;
}

SweepData decode_sweep(const Container& container, const ConventionMap& map,
                       const SweepContext& context, const SweepRange& sweep,
                       const ReadOptions& options) {
  SweepGeometry geometry;
  geometry.index = sweep.index;
  geometry.sweep_number = sweep.sweep_number;
  geometry.mode = sweep.mode;
  geometry.fixed_angle = sweep.fixed_angle;
  geometry.azimuth = to_float(container.read_doubles("azimuth", sweep.start_ray, sweep.num_rays()));
  geometry.elevation =
      to_float(container.read_doubles("elevation", sweep.start_ray, sweep.num_rays()));
  if (context.has_time) {
    geometry.time = container.read_doubles("time", sweep.start_ray, sweep.num_rays());
  }
  geometry.range = context.range;

  std::vector<MomentData> moments;
  moments.reserve(context.fields.size());
  for (const auto& field : context.fields) {
    moments.push_back(decode_moment(container, map, sweep, field, options));
  }
  return SweepData(std::move(geometry), std::move(moments));
}

// Errors raised below the sweep loop do not know which sweep they belong to.
[[noreturn]] void rethrow_with_sweep(const Error& e, int32_t sweep) {
  switch (e.kind()) {
    case ErrorKind::kDecode:
      throw DecodeError(e.path(), e.message(), e.variable(), sweep);
    case ErrorKind::kSchema:
      throw SchemaError(e.path(), e.message(), e.variable(), sweep);
    case ErrorKind::kNotFound:
      throw NotFoundError(e.path(), e.message());
    case ErrorKind::kFormat:
      throw FormatError(e.path(), e.message());
  }
  throw e;
}

}  // namespace

SweepContext prepare_sweep_context(const Container& container, const ConventionMap& map,
                                   const ReadOptions& options) {
  require_ray_coordinate(container, map, "azimuth");
  require_ray_coordinate(container, map, "elevation");

  SweepContext context;
  if (container.variable("time") != nullptr) {
    require_ray_coordinate(container, map, "time");
    context.has_time = true;
  }

  const VariableInfo* range = container.variable("range");
  if (range == nullptr) {
    throw SchemaError(container.path(), "required CfRadial1 variable is missing", "range");
  }
  if (range->shape.size() != 1 || range->shape[0] != map.num_gates) {
    throw DecodeError(container.path(),
                      "expected one value per gate (" + std::to_string(map.num_gates) + ")",
                      "range");
  }
  context.range = to_float(container.read_doubles("range"));
  for (std::size_t g = 1; g < context.range.size(); ++g) {
    if (context.range[g] < context.range[g - 1]) {
      throw DecodeError(container.path(),
                        "range decreases at gate " + std::to_string(g), "range");
    }
  }

  if (options.moments.empty()) {
    context.fields = map.fields;
  } else {
    const std::unordered_set<std::string> wanted(options.moments.begin(), options.moments.end());
    for (const auto& field : map.fields) {
      if (wanted.count(field) > 0) {
        context.fields.push_back(field);
      }
    }
  }
  return context;
}

SweepData materialize_sweep(const Container& container, const ConventionMap& map,
                            const SweepContext& context, std::size_t sweep_index,
                            const ReadOptions& options) {
  if (sweep_index >= map.sweeps.size()) {
    throw std::out_of_range("sweep index " + std::to_string(sweep_index) + " out of range (" +
                            std::to_string(map.sweeps.size()) + " sweeps)");
  }
  const SweepRange& sweep = map.sweeps[sweep_index];

  DecodeEvent event;
  event.name = "read_sweep";
  event.path = container.path();
  event.sweep = sweep.index;
  event.start = now_seconds();
  try {
    SweepData data = decode_sweep(container, map, context, sweep, options);
    if (has_event_log()) {
      event.status = "ok";
      event.end = now_seconds();
      log_decode_event(event);
    }
    return data;
  } catch (const Error& e) {
    if (has_event_log()) {
      event.status = "error";
      event.variable = e.variable();
      event.message = e.message();
      event.end = now_seconds();
      log_decode_event(event);
    }
    if (e.sweep().has_value()) {
      throw;
    }
    rethrow_with_sweep(e, sweep.index);
  }
}

std::vector<SweepData> materialize_sweeps(const Container& container, const ConventionMap& map,
                                          const ReadOptions& options) {
  const SweepContext context = prepare_sweep_context(container, map, options);
  std::vector<SweepData> sweeps;
  sweeps.reserve(map.sweeps.size());

#ifdef RADISH_USE_HPX
  if (options.parallel_sweeps && map.sweeps.size() > 1 && hpx::get_runtime_ptr() != nullptr) {
    // Sweeps above the lowest failed index are skipped; sweeps below it still
    // run so the surfaced error is always the lowest-index one.
    std::atomic<std::size_t> first_failed{std::numeric_limits<std::size_t>::max()};
    std::vector<hpx::future<std::optional<SweepData>>> futures;
    futures.reserve(map.sweeps.size());
    for (std::size_t i = 0; i < map.sweeps.size(); ++i) {
      futures.push_back(hpx::async([&, i]() -> std::optional<SweepData> {
        if (i > first_failed.load()) {
          return std::nullopt;
        }
        try {
          return materialize_sweep(container, map, context, i, options);
        } catch (...) {
          std::size_t current = first_failed.load();
          while (i < current && !first_failed.compare_exchange_weak(current, i)) {
          }
          throw;
        }
      }));
    }
    auto done = hpx::when_all(futures).get();
    for (auto& fut : done) {
      if (fut.has_exception()) {
        fut.get();
      }
    }
    for (auto& fut : done) {
      sweeps.push_back(*fut.get());
    }
    return sweeps;
  }
#endif

  for (std::size_t i = 0; i < map.sweeps.size(); ++i) {
    sweeps.push_back(materialize_sweep(container, map, context, i, options));
  }
  return sweeps;
}

}  // namespace radish
