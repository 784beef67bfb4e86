#include "radish/metadata.hpp"

#include "radish/event_log.hpp"

#include <cmath>
#include <limits>
#include <optional>

namespace radish {

namespace {

// Element 0 of a numeric variable (scalar, or per-ray position for moving
// platforms).
std::optional<double> first_value(const Container& container, const std::string& name) {
  const VariableInfo* var = container.variable(name);
  if (var == nullptr || !is_numeric(var->type) || var->num_elements() == 0) {
    return std::nullopt;
  }
  const std::vector<double> values =
      var->shape.empty() ? container.read_doubles(name) : container.read_doubles(name, 0, 1);
  if (values.empty()) {
    return std::nullopt;
  }
  return values.front();
}

// Global text attribute, else a character variable of the same name.
std::string text_field(const Container& container, const std::string& name) {
  if (const AttributeValue* attr = container.global_attribute(name)) {
    if (attr->is_text()) {
      return attr->text;
    }
  }
  const VariableInfo* var = container.variable(name);
  if (var != nullptr && var->type == DataType::kString) {
    const std::vector<std::string> values = container.read_strings(name);
    if (!values.empty()) {
      return values.front();
    }
  }
  return {};
}

// Integral value of a numeric scalar; 0 when absent, non-finite or outside
// the int64 range.
int64_t integer_value(const Container& container, const std::string& name) {
  const std::optional<double> value = first_value(container, name);
  if (!value.has_value()) {
    return 0;
  }
  if (!std::isfinite(*value) ||
      *value < static_cast<double>(std::numeric_limits<int64_t>::min()) ||
      *value >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
    log_warning("MetadataExtractor", name + " in " + container.path() +
                                         " is not a representable integer; using 0");
    return 0;
  }
  return static_cast<int64_t>(*value);
}

std::string global_text(const Container& container, const std::string& name) {
  const AttributeValue* attr = container.global_attribute(name);
  if (attr == nullptr) {
    return {};
  }
  return attr->to_string();
}

}  // namespace

VolumeMetadata extract_metadata(const Container& container, const ConventionMap& map) {
  VolumeMetadata meta;
  meta.instrument_name = text_field(container, "instrument_name");
  meta.institution = global_text(container, "institution");
  meta.title = global_text(container, "title");
  meta.source = global_text(container, "source");
  meta.site_name = text_field(container, "site_name");
  meta.conventions = global_text(container, "Conventions");

  meta.latitude = first_value(container, "latitude").value_or(0.0);
  meta.longitude = first_value(container, "longitude").value_or(0.0);
  meta.altitude = first_value(container, "altitude").value_or(0.0);
  meta.altitude_agl = first_value(container, "altitude_agl");
  meta.frequency = first_value(container, "frequency");
  meta.volume_number = integer_value(container, "volume_number");

  const std::string platform = text_field(container, "platform_type");
  meta.platform_type = parse_platform_type(platform);
  if (!platform.empty() && meta.platform_type == PlatformType::kUnknown) {
    log_verbose("MetadataExtractor", "unrecognized platform_type '" + platform + "' in " +
                                         container.path());
  }

  meta.time_coverage_start = text_field(container, "time_coverage_start");
  meta.time_coverage_end = text_field(container, "time_coverage_end");

  meta.num_sweeps = map.sweeps.size();
  meta.sweep_fixed_angles.reserve(map.sweeps.size());
  meta.sweep_numbers.reserve(map.sweeps.size());
  meta.sweep_group_names.reserve(map.sweeps.size());
  for (const auto& sweep : map.sweeps) {
    meta.sweep_fixed_angles.push_back(sweep.fixed_angle);
    meta.sweep_numbers.push_back(sweep.sweep_number);
    meta.sweep_group_names.push_back("sweep_" + std::to_string(sweep.index));
  }

  for (const auto& attr : container.global_attributes()) {
    meta.global_attributes[attr.name] = attr.value.to_string();
  }
  return meta;
}

}  // namespace radish
