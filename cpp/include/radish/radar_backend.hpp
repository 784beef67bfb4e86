#pragma once

#include "radish/materializer.hpp"
#include "radish/model.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace radish {

class RadarBackend {
 public:
  virtual ~RadarBackend() = default;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;
  virtual std::vector<std::string> supported_extensions() const { return {}; }

  virtual VolumeMetadata scan_file(const std::string& path) const = 0;
  virtual SweepData read_sweep(const std::string& path, std::size_t sweep_index) const = 0;
  virtual VolumeData read_volume(const std::string& path,
                                 const ReadOptions& options = {}) const = 0;
};

}  // namespace radish
