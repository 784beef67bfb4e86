#include "radish/dataset_tree.hpp"

#ifdef RADISH_USE_MSGPACK
#include <msgpack.hpp>
#endif

namespace radish {

namespace {

template <typename T>
LabeledArray make_array(std::vector<std::string> dims, std::vector<std::size_t> shape,
                        const std::vector<T>& values) {
  LabeledArray array;
  array.dims = std::move(dims);
  array.shape = std::move(shape);
  array.values = std::span<const T>(values.data(), values.size());
  return array;
}

template <typename T>
LabeledArray make_1d(const std::string& dim, const std::vector<T>& values) {
  return make_array<T>({dim}, {values.size()}, values);
}

const LabeledArray* find_array(const std::vector<NamedArray>& arrays, const std::string& key) {
  for (const auto& entry : arrays) {
    if (entry.first == key) {
      return &entry.second;
    }
  }
  return nullptr;
}

DatasetNode sweep_node(const SweepData& sweep, const VolumeMetadata& meta) {
  DatasetNode node;
  node.name = "sweep_" + std::to_string(sweep.index());
  node.attrs["sweep_number"] = static_cast<int64_t>(sweep.sweep_number());
  node.attrs["fixed_angle"] = sweep.fixed_angle();
  node.attrs["sweep_mode"] = std::string(sweep_mode_name(sweep.mode()));
  node.attrs["instrument_name"] = meta.instrument_name;

  LabeledArray azimuth = make_1d("time", sweep.azimuth());
  azimuth.attrs["units"] = std::string("degrees");
  LabeledArray elevation = make_1d("time", sweep.elevation());
  elevation.attrs["units"] = std::string("degrees");
  LabeledArray range = make_1d("range", sweep.range());
  range.attrs["units"] = std::string("meters");
  node.coords.emplace_back("azimuth", std::move(azimuth));
  node.coords.emplace_back("elevation", std::move(elevation));
  node.coords.emplace_back("range", std::move(range));
  if (!sweep.time().empty()) {
    LabeledArray time = make_1d("time", sweep.time());
    time.attrs["units"] = std::string("seconds");
    node.coords.emplace_back("time", std::move(time));
  }

  for (const auto& moment : sweep.moments()) {
    LabeledArray values =
        make_array<float>({"time", "range"}, {moment.num_rays(), moment.num_gates()},
                          moment.values());
    values.attrs["units"] = moment.units();
    if (!moment.standard_name.empty()) {
      values.attrs["standard_name"] = moment.standard_name;
    }
    if (!moment.long_name.empty()) {
      values.attrs["long_name"] = moment.long_name;
    }
    node.data_vars.emplace_back(moment.name(), std::move(values));
  }
  return node;
}

#ifdef RADISH_USE_MSGPACK
using Packer = msgpack::packer<msgpack::sbuffer>;

void pack_attrs(Packer& pk, const AttrMap& attrs) {
  pk.pack_map(static_cast<uint32_t>(attrs.size()));
  for (const auto& [key, value] : attrs) {
    pk.pack(key);
    std::visit([&](const auto& v) { pk.pack(v); }, value);
  }
}

void pack_array(Packer& pk, const LabeledArray& array) {
  pk.pack_map(5);
  pk.pack(std::string("dims"));
  pk.pack(array.dims);
  pk.pack(std::string("shape"));
  pk.pack_array(static_cast<uint32_t>(array.shape.size()));
  for (auto extent : array.shape) {
    pk.pack_uint64(extent);
  }
  pk.pack(std::string("dtype"));
  pk.pack(std::string(array.dtype()));
  pk.pack(std::string("data"));
  const auto bytes = array.bytes();
  pk.pack_bin(static_cast<uint32_t>(bytes.size()));
  pk.pack_bin_body(reinterpret_cast<const char*>(bytes.data()), static_cast<uint32_t>(bytes.size()));
  pk.pack(std::string("attrs"));
  pack_attrs(pk, array.attrs);
}

void pack_arrays(Packer& pk, const std::vector<NamedArray>& arrays) {
  pk.pack_map(static_cast<uint32_t>(arrays.size()));
  for (const auto& [key, array] : arrays) {
    pk.pack(key);
    pack_array(pk, array);
  }
}

void pack_node(Packer& pk, const DatasetNode& node) {
  pk.pack_map(5);
  pk.pack(std::string("name"));
  pk.pack(node.name);
  pk.pack(std::string("attrs"));
  pack_attrs(pk, node.attrs);
  pk.pack(std::string("coords"));
  pack_arrays(pk, node.coords);
  pk.pack(std::string("data_vars"));
  pack_arrays(pk, node.data_vars);
  pk.pack(std::string("children"));
  pk.pack_array(static_cast<uint32_t>(node.children.size()));
  for (const auto& child : node.children) {
    pack_node(pk, child);
  }
}
#endif

}  // namespace

const char* LabeledArray::dtype() const {
  return std::holds_alternative<std::span<const float>>(values) ? "float32" : "float64";
}

std::size_t LabeledArray::size() const {
  return std::visit([](const auto& span) { return span.size(); }, values);
}

std::span<const std::uint8_t> LabeledArray::bytes() const {
  return std::visit(
      [](const auto& span) {
        return std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(span.data()),
                                             span.size_bytes());
      },
      values);
}

const LabeledArray* DatasetNode::coord(const std::string& key) const {
  return find_array(coords, key);
}

const LabeledArray* DatasetNode::data_var(const std::string& key) const {
  return find_array(data_vars, key);
}

const DatasetNode* DatasetNode::child(const std::string& key) const {
  for (const auto& node : children) {
    if (node.name == key) {
      return &node;
    }
  }
  return nullptr;
}

DatasetNode to_dataset_tree(const VolumeData& volume) {
  const VolumeMetadata& meta = volume.metadata();
  DatasetNode root;
  root.name = "/";
  root.attrs["instrument_name"] = meta.instrument_name;
  root.attrs["institution"] = meta.institution;
  root.attrs["Conventions"] = std::string("CF/Radial");
  root.attrs["latitude"] = meta.latitude;
  root.attrs["longitude"] = meta.longitude;
  root.attrs["altitude"] = meta.altitude;
  root.attrs["volume_number"] = meta.volume_number;
  root.attrs["platform_type"] = std::string(platform_type_name(meta.platform_type));
  if (!meta.time_coverage_start.empty()) {
    root.attrs["time_coverage_start"] = meta.time_coverage_start;
  }
  if (!meta.time_coverage_end.empty()) {
    root.attrs["time_coverage_end"] = meta.time_coverage_end;
  }

  LabeledArray fixed_angles = make_1d("sweep", meta.sweep_fixed_angles);
  fixed_angles.attrs["units"] = std::string("degrees");
  root.data_vars.emplace_back("sweep_fixed_angle", std::move(fixed_angles));

  root.children.reserve(volume.num_sweeps());
  for (const auto& sweep : volume.sweeps()) {
    root.children.push_back(sweep_node(sweep, meta));
  }
  return root;
}

#ifdef RADISH_USE_MSGPACK
std::vector<std::uint8_t> pack_dataset_tree(const DatasetNode& root) {
  msgpack::sbuffer buffer;
  Packer pk(&buffer);
  pack_node(pk, root);
  const auto* data = reinterpret_cast<const std::uint8_t*>(buffer.data());
  return std::vector<std::uint8_t>(data, data + buffer.size());
}
#endif

}  // namespace radish
