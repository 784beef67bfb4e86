#include "radish/model.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace radish {

namespace {

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

}  // namespace

const char* sweep_mode_name(SweepMode mode) {
  switch (mode) {
    case SweepMode::kAzimuthSurveillance:
      return "azimuth_surveillance";
    case SweepMode::kElevationSurveillance:
      return "elevation_surveillance";
    case SweepMode::kSector:
      return "sector";
    case SweepMode::kCoplane:
      return "coplane";
    case SweepMode::kPointing:
      return "pointing";
    case SweepMode::kManualPpi:
      return "manual_ppi";
    case SweepMode::kManualRhi:
      return "manual_rhi";
    case SweepMode::kIdle:
      return "idle";
    case SweepMode::kCalibration:
      return "calibration";
    case SweepMode::kVerticalPointing:
      return "vertical_pointing";
  }
  return "azimuth_surveillance";
}

SweepMode parse_sweep_mode(const std::string& text) {
  const std::string mode = lowercase(text);
  if (mode == "azimuth_surveillance" || mode == "ppi" || mode == "sur") {
    return SweepMode::kAzimuthSurveillance;
  }
  if (mode == "elevation_surveillance" || mode == "rhi") {
    return SweepMode::kElevationSurveillance;
  }
  if (mode == "sector" || mode == "sec") {
    return SweepMode::kSector;
  }
  if (mode == "coplane") {
    return SweepMode::kCoplane;
  }
  if (mode == "pointing" || mode == "pnt") {
    return SweepMode::kPointing;
  }
  if (mode == "manual_ppi") {
    return SweepMode::kManualPpi;
  }
  if (mode == "manual_rhi") {
    return SweepMode::kManualRhi;
  }
  if (mode == "idle") {
    return SweepMode::kIdle;
  }
  if (mode == "calibration" || mode == "cal") {
    return SweepMode::kCalibration;
  }
  if (mode == "vertical_pointing" || mode == "vert") {
    return SweepMode::kVerticalPointing;
  }
  return SweepMode::kAzimuthSurveillance;
}

const char* platform_type_name(PlatformType type) {
  switch (type) {
    case PlatformType::kFixed:
      return "fixed";
    case PlatformType::kVehicle:
      return "vehicle";
    case PlatformType::kShip:
      return "ship";
    case PlatformType::kAircraft:
      return "aircraft";
    case PlatformType::kSatellite:
      return "satellite";
    case PlatformType::kUnknown:
      break;
  }
  return "unknown";
}

PlatformType parse_platform_type(const std::string& text) {
  const std::string type = lowercase(text);
  if (type == "fixed") return PlatformType::kFixed;
  if (type == "vehicle") return PlatformType::kVehicle;
  if (type == "ship") return PlatformType::kShip;
  if (type == "aircraft") return PlatformType::kAircraft;
  if (type == "satellite") return PlatformType::kSatellite;
  return PlatformType::kUnknown;
}

MomentData::MomentData(std::string name, std::string units, std::size_t num_rays,
                       std::size_t num_gates, std::vector<float> values)
    : name_(std::move(name)),
      units_(std::move(units)),
      num_rays_(num_rays),
      num_gates_(num_gates),
      values_(std::move(values)) {
  if (name_.empty()) {
    throw std::invalid_argument("MomentData: name must not be empty");
  }
  if (values_.size() != num_rays_ * num_gates_) {
    throw std::invalid_argument("MomentData: " + name_ + " has " +
                                std::to_string(values_.size()) + " values, expected " +
                                std::to_string(num_rays_) + "x" + std::to_string(num_gates_));
  }
}

float MomentData::at(std::size_t ray, std::size_t gate) const {
  if (ray >= num_rays_ || gate >= num_gates_) {
    throw std::out_of_range("MomentData: index out of range for " + name_);
  }
  return values_[ray * num_gates_ + gate];
}

SweepData::SweepData(SweepGeometry geometry, std::vector<MomentData> moments)
    : geometry_(std::move(geometry)), moments_(std::move(moments)) {
  const std::string label = "SweepData " + std::to_string(geometry_.index) + ": ";
  if (geometry_.elevation.size() != geometry_.azimuth.size()) {
    throw std::invalid_argument(label + "elevation and azimuth lengths differ");
  }
  if (!geometry_.time.empty() && geometry_.time.size() != geometry_.azimuth.size()) {
    throw std::invalid_argument(label + "time and azimuth lengths differ");
  }
  for (std::size_t g = 1; g < geometry_.range.size(); ++g) {
    if (geometry_.range[g] < geometry_.range[g - 1]) {
      throw std::invalid_argument(label + "range is not monotonically non-decreasing");
    }
  }
  moment_index_.reserve(moments_.size());
  for (std::size_t i = 0; i < moments_.size(); ++i) {
    const auto& moment = moments_[i];
    if (moment.num_rays() != num_rays() || moment.num_gates() != num_gates()) {
      throw std::invalid_argument(label + "moment " + moment.name() +
                                  " does not match the sweep shape");
    }
    if (!moment_index_.emplace(moment.name(), i).second) {
      throw std::invalid_argument(label + "duplicate moment " + moment.name());
    }
  }
}

std::vector<std::string> SweepData::moment_names() const {
  std::vector<std::string> names;
  names.reserve(moments_.size());
  for (const auto& moment : moments_) {
    names.push_back(moment.name());
  }
  return names;
}

const MomentData* SweepData::get_moment(const std::string& name) const {
  auto it = moment_index_.find(name);
  if (it == moment_index_.end()) {
    return nullptr;
  }
  return &moments_[it->second];
}

VolumeData::VolumeData(VolumeMetadata metadata, std::vector<SweepData> sweeps)
    : metadata_(std::move(metadata)), sweeps_(std::move(sweeps)) {
  if (metadata_.num_sweeps != sweeps_.size()) {
    throw std::invalid_argument("VolumeData: metadata lists " +
                                std::to_string(metadata_.num_sweeps) + " sweeps, got " +
                                std::to_string(sweeps_.size()));
  }
  for (std::size_t i = 0; i < sweeps_.size(); ++i) {
    if (sweeps_[i].index() != static_cast<int32_t>(i)) {
      throw std::invalid_argument("VolumeData: sweep at position " + std::to_string(i) +
                                  " has index " + std::to_string(sweeps_[i].index()));
    }
  }
}

const SweepData* VolumeData::get_sweep(int64_t index) const {
  if (index < 0 || static_cast<uint64_t>(index) >= sweeps_.size()) {
    return nullptr;
  }
  return &sweeps_[static_cast<std::size_t>(index)];
}

}  // namespace radish
