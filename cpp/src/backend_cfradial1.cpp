#include "radish/backend_cfradial1.hpp"

#include "radish/error.hpp"
#include "radish/event_log.hpp"
#include "radish/metadata.hpp"

#include <stdexcept>
#include <utility>

namespace radish {

namespace {

// Runs one top-level call and records it in the event log.
template <typename Fn>
auto with_event(const char* name, const std::string& path, Fn&& fn) -> decltype(fn()) {
  if (!has_event_log()) {
    return fn();
  }
  DecodeEvent event;
  event.name = name;
  event.path = path;
  event.start = now_seconds();
  try {
    auto result = fn();
    event.status = "ok";
    event.end = now_seconds();
    log_decode_event(event);
    return result;
  } catch (const Error& e) {
    event.status = "error";
    event.sweep = e.sweep().value_or(-1);
    event.variable = e.variable();
    event.message = e.message();
    event.end = now_seconds();
    log_decode_event(event);
    throw;
  }
}

}  // namespace

CfRadial1File::CfRadial1File(const std::string& path)
    : container_(Container::open(path)),
      map_(map_convention(container_)),
      metadata_(extract_metadata(container_, map_)) {}

CfRadial1File::CfRadial1File(const std::vector<std::uint8_t>& image, std::string label)
    : container_(Container::open_image(image, std::move(label))),
      map_(map_convention(container_)),
      metadata_(extract_metadata(container_, map_)) {}

SweepData CfRadial1File::read_sweep(std::size_t sweep_index, const ReadOptions& options) const {
  if (sweep_index >= map_.sweeps.size()) {
    throw std::out_of_range("CfRadial1File: sweep index " + std::to_string(sweep_index) +
                            " out of range for " + path() + " (" +
                            std::to_string(map_.sweeps.size()) + " sweeps)");
  }
  const SweepContext context = prepare_sweep_context(container_, map_, options);
  return materialize_sweep(container_, map_, context, sweep_index, options);
}

VolumeData CfRadial1File::read_volume(const ReadOptions& options) const {
  std::vector<SweepData> sweeps = materialize_sweeps(container_, map_, options);
  return VolumeData(metadata_, std::move(sweeps));
}

VolumeMetadata CfRadial1Backend::scan_file(const std::string& path) const { return scan(path); }

SweepData CfRadial1Backend::read_sweep(const std::string& path, std::size_t sweep_index) const {
  CfRadial1File file(path);
  return file.read_sweep(sweep_index);
}

VolumeData CfRadial1Backend::read_volume(const std::string& path,
                                         const ReadOptions& options) const {
  return read(path, options);
}

VolumeMetadata scan(const std::string& path) {
  return with_event("scan", path, [&] { return CfRadial1File(path).metadata(); });
}

VolumeData read(const std::string& path, const ReadOptions& options) {
  return with_event("read", path, [&] { return CfRadial1File(path).read_volume(options); });
}

VolumeMetadata scan_image(const std::vector<std::uint8_t>& image) {
  return with_event("scan", "<memory>",
                    [&] { return CfRadial1File(image, "<memory>").metadata(); });
}

VolumeData read_image(const std::vector<std::uint8_t>& image, const ReadOptions& options) {
  return with_event("read", "<memory>",
                    [&] { return CfRadial1File(image, "<memory>").read_volume(options); });
}

}  // namespace radish
