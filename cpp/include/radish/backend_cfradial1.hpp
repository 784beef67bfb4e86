#pragma once

#include "radish/container.hpp"
#include "radish/convention.hpp"
#include "radish/materializer.hpp"
#include "radish/model.hpp"
#include "radish/radar_backend.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace radish {

// Scoped read session over one CfRadial1 file. The container, sweep table and
// metadata are loaded on construction; sweeps are decoded on demand.
class CfRadial1File {
 public:
  explicit CfRadial1File(const std::string& path);
  // In-memory file image; label stands in for the path in errors and events.
  CfRadial1File(const std::vector<std::uint8_t>& image, std::string label);

  const std::string& path() const { return container_.path(); }
  const VolumeMetadata& metadata() const { return metadata_; }
  std::size_t num_sweeps() const { return map_.sweeps.size(); }
  const ConventionMap& convention() const { return map_; }
  const Container& container() const { return container_; }

  // Throws std::out_of_range for sweep_index >= num_sweeps().
  SweepData read_sweep(std::size_t sweep_index, const ReadOptions& options = {}) const;
  VolumeData read_volume(const ReadOptions& options = {}) const;

 private:
  Container container_;
  ConventionMap map_;
  VolumeMetadata metadata_;
};

class CfRadial1Backend : public RadarBackend {
 public:
  std::string name() const override { return "cfradial1"; }
  std::string description() const override { return "CF/Radial NetCDF format (version 1)"; }
  std::vector<std::string> supported_extensions() const override { return {"nc", "nc4", "netcdf"}; }

  VolumeMetadata scan_file(const std::string& path) const override;
  SweepData read_sweep(const std::string& path, std::size_t sweep_index) const override;
  VolumeData read_volume(const std::string& path, const ReadOptions& options = {}) const override;
};

VolumeMetadata scan(const std::string& path);
VolumeData read(const std::string& path, const ReadOptions& options = {});
VolumeMetadata scan_image(const std::vector<std::uint8_t>& image);
VolumeData read_image(const std::vector<std::uint8_t>& image, const ReadOptions& options = {});

}  // namespace radish
