#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace radish {

// Value stored for samples that carry no data (fill values and masked samples).
inline constexpr float kNoData = std::numeric_limits<float>::quiet_NaN();

inline bool is_no_data(float value) { return std::isnan(value); }

enum class SweepMode {
  kAzimuthSurveillance,
  kElevationSurveillance,
  kSector,
  kCoplane,
  kPointing,
  kManualPpi,
  kManualRhi,
  kIdle,
  kCalibration,
  kVerticalPointing,
};

const char* sweep_mode_name(SweepMode mode);
// Parses a CfRadial1 sweep_mode string; unknown or empty values map to
// azimuth surveillance.
SweepMode parse_sweep_mode(const std::string& text);

enum class PlatformType { kUnknown, kFixed, kVehicle, kShip, kAircraft, kSatellite };

const char* platform_type_name(PlatformType type);
PlatformType parse_platform_type(const std::string& text);

struct VolumeMetadata {
  std::string instrument_name;
  std::string institution;
  std::string title;
  std::string source;
  std::string site_name;
  std::string conventions;
  double latitude = 0.0;
  double longitude = 0.0;
  double altitude = 0.0;
  std::optional<double> altitude_agl;
  std::optional<double> frequency;
  int64_t volume_number = 0;
  PlatformType platform_type = PlatformType::kUnknown;
  std::string time_coverage_start;
  std::string time_coverage_end;
  std::size_t num_sweeps = 0;
  std::vector<double> sweep_fixed_angles;
  std::vector<int32_t> sweep_numbers;
  std::vector<std::string> sweep_group_names;
  std::map<std::string, std::string> global_attributes;
};

class MomentData {
 public:
  MomentData(std::string name, std::string units, std::size_t num_rays, std::size_t num_gates,
             std::vector<float> values);

  const std::string& name() const { return name_; }
  const std::string& units() const { return units_; }
  std::array<std::size_t, 2> shape() const { return {num_rays_, num_gates_}; }
  std::size_t num_rays() const { return num_rays_; }
  std::size_t num_gates() const { return num_gates_; }
  const std::vector<float>& values() const { return values_; }
  const float* data() const { return values_.data(); }
  float at(std::size_t ray, std::size_t gate) const;

  std::string standard_name;
  std::string long_name;
  std::optional<double> scale_factor;
  std::optional<double> add_offset;
  std::optional<double> fill_value;

 private:
  std::string name_;
  std::string units_;
  std::size_t num_rays_ = 0;
  std::size_t num_gates_ = 0;
  std::vector<float> values_;
};

struct SweepGeometry {
  int32_t index = 0;
  int32_t sweep_number = 0;
  SweepMode mode = SweepMode::kAzimuthSurveillance;
  double fixed_angle = 0.0;
  std::vector<float> azimuth;
  std::vector<float> elevation;
  std::vector<float> range;
  std::vector<double> time;  // empty when the file has no time coordinate
};

class SweepData {
 public:
  SweepData(SweepGeometry geometry, std::vector<MomentData> moments);

  int32_t index() const { return geometry_.index; }
  int32_t sweep_number() const { return geometry_.sweep_number; }
  SweepMode mode() const { return geometry_.mode; }
  double fixed_angle() const { return geometry_.fixed_angle; }
  std::size_t num_rays() const { return geometry_.azimuth.size(); }
  std::size_t num_gates() const { return geometry_.range.size(); }
  const std::vector<float>& azimuth() const { return geometry_.azimuth; }
  const std::vector<float>& elevation() const { return geometry_.elevation; }
  const std::vector<float>& range() const { return geometry_.range; }
  const std::vector<double>& time() const { return geometry_.time; }

  const std::vector<MomentData>& moments() const { return moments_; }
  std::vector<std::string> moment_names() const;
  // Exact, case-sensitive lookup; nullptr when absent.
  const MomentData* get_moment(const std::string& name) const;

 private:
  SweepGeometry geometry_;
  std::vector<MomentData> moments_;
  std::unordered_map<std::string, std::size_t> moment_index_;
};

class VolumeData {
 public:
  VolumeData(VolumeMetadata metadata, std::vector<SweepData> sweeps);

  const VolumeMetadata& metadata() const { return metadata_; }
  const std::vector<SweepData>& sweeps() const { return sweeps_; }
  std::size_t num_sweeps() const { return sweeps_.size(); }
  // nullptr for index < 0 or index >= num_sweeps().
  const SweepData* get_sweep(int64_t index) const;

 private:
  VolumeMetadata metadata_;
  std::vector<SweepData> sweeps_;
};

}  // namespace radish
