#include "radish/backend_cfradial1.hpp"
#include "radish/dataset_tree.hpp"
#include "radish/error.hpp"
#include "radish/event_log.hpp"

#ifdef RADISH_USE_NANOBIND
#include <nanobind/nanobind.h>
#include <nanobind/ndarray.h>
#include <nanobind/stl/map.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

namespace nb = nanobind;

namespace {

using FloatRows = nb::ndarray<nb::numpy, const float, nb::ndim<2>>;
using FloatVector = nb::ndarray<nb::numpy, const float, nb::ndim<1>>;
using DoubleVector = nb::ndarray<nb::numpy, const double, nb::ndim<1>>;

FloatVector float_view(const std::vector<float>& values) {
  std::size_t shape[1] = {values.size()};
  return FloatVector(values.data(), 1, shape, nb::handle());
}

DoubleVector double_view(const std::vector<double>& values) {
  std::size_t shape[1] = {values.size()};
  return DoubleVector(values.data(), 1, shape, nb::handle());
}

radish::ReadOptions make_options(const nb::object& moments_obj, bool parallel_sweeps,
                                 bool mask_outside_valid_range) {
  radish::ReadOptions options;
  if (!moments_obj.is_none()) {
    options.moments = nb::cast<std::vector<std::string>>(moments_obj);
  }
  options.parallel_sweeps = parallel_sweeps;
  options.mask_outside_valid_range = mask_outside_valid_range;
  return options;
}

}  // namespace

NB_MODULE(_radish, m) {
  auto error = nb::exception<radish::Error>(m, "RadishError");
  nb::exception<radish::NotFoundError>(m, "NotFoundError", error);
  nb::exception<radish::FormatError>(m, "FormatError", error);
  nb::exception<radish::SchemaError>(m, "SchemaError", error);
  nb::exception<radish::DecodeError>(m, "DecodeError", error);

  nb::class_<radish::VolumeMetadata>(m, "VolumeMetadata")
      .def_ro("instrument_name", &radish::VolumeMetadata::instrument_name)
      .def_ro("institution", &radish::VolumeMetadata::institution)
      .def_ro("title", &radish::VolumeMetadata::title)
      .def_ro("source", &radish::VolumeMetadata::source)
      .def_ro("site_name", &radish::VolumeMetadata::site_name)
      .def_ro("conventions", &radish::VolumeMetadata::conventions)
      .def_ro("latitude", &radish::VolumeMetadata::latitude)
      .def_ro("longitude", &radish::VolumeMetadata::longitude)
      .def_ro("altitude", &radish::VolumeMetadata::altitude)
      .def_ro("altitude_agl", &radish::VolumeMetadata::altitude_agl)
      .def_ro("frequency", &radish::VolumeMetadata::frequency)
      .def_ro("volume_number", &radish::VolumeMetadata::volume_number)
      .def_prop_ro("platform_type",
                   [](const radish::VolumeMetadata& meta) {
                     return std::string(radish::platform_type_name(meta.platform_type));
                   })
      .def_ro("time_coverage_start", &radish::VolumeMetadata::time_coverage_start)
      .def_ro("time_coverage_end", &radish::VolumeMetadata::time_coverage_end)
      .def_ro("num_sweeps", &radish::VolumeMetadata::num_sweeps)
      .def_ro("sweep_fixed_angles", &radish::VolumeMetadata::sweep_fixed_angles)
      .def_ro("sweep_numbers", &radish::VolumeMetadata::sweep_numbers)
      .def_ro("sweep_group_names", &radish::VolumeMetadata::sweep_group_names)
      .def_ro("global_attributes", &radish::VolumeMetadata::global_attributes);

  nb::class_<radish::MomentData>(m, "MomentData")
      .def_prop_ro("name", &radish::MomentData::name)
      .def_prop_ro("units", &radish::MomentData::units)
      .def_ro("standard_name", &radish::MomentData::standard_name)
      .def_ro("long_name", &radish::MomentData::long_name)
      .def_ro("scale_factor", &radish::MomentData::scale_factor)
      .def_ro("add_offset", &radish::MomentData::add_offset)
      .def_ro("fill_value", &radish::MomentData::fill_value)
      .def_prop_ro("shape",
                   [](const radish::MomentData& moment) {
                     return nb::make_tuple(moment.num_rays(), moment.num_gates());
                   })
      .def_prop_ro(
          "data",
          [](const radish::MomentData& moment) {
            std::size_t shape[2] = {moment.num_rays(), moment.num_gates()};
            return FloatRows(moment.data(), 2, shape, nb::handle());
          },
          nb::rv_policy::reference_internal);

  nb::class_<radish::SweepData>(m, "SweepData")
      .def_prop_ro("index", &radish::SweepData::index)
      .def_prop_ro("sweep_number", &radish::SweepData::sweep_number)
      .def_prop_ro("fixed_angle", &radish::SweepData::fixed_angle)
      .def_prop_ro("sweep_mode",
                   [](const radish::SweepData& sweep) {
                     return std::string(radish::sweep_mode_name(sweep.mode()));
                   })
      .def_prop_ro("num_rays", &radish::SweepData::num_rays)
      .def_prop_ro("num_gates", &radish::SweepData::num_gates)
      .def_prop_ro(
          "azimuth", [](const radish::SweepData& sweep) { return float_view(sweep.azimuth()); },
          nb::rv_policy::reference_internal)
      .def_prop_ro(
          "elevation",
          [](const radish::SweepData& sweep) { return float_view(sweep.elevation()); },
          nb::rv_policy::reference_internal)
      .def_prop_ro(
          "range", [](const radish::SweepData& sweep) { return float_view(sweep.range()); },
          nb::rv_policy::reference_internal)
      .def_prop_ro(
          "time", [](const radish::SweepData& sweep) { return double_view(sweep.time()); },
          nb::rv_policy::reference_internal)
      .def("moment_names", &radish::SweepData::moment_names)
      .def("get_moment", &radish::SweepData::get_moment, nb::arg("name"),
           nb::rv_policy::reference_internal);

  nb::class_<radish::VolumeData>(m, "VolumeData")
      .def_prop_ro("metadata", &radish::VolumeData::metadata, nb::rv_policy::reference_internal)
      .def_prop_ro("num_sweeps", &radish::VolumeData::num_sweeps)
      .def("get_sweep", &radish::VolumeData::get_sweep, nb::arg("index"),
           nb::rv_policy::reference_internal);

  m.def(
      "read_cfradial1",
      [](const std::string& path, nb::object moments, bool parallel_sweeps,
         bool mask_outside_valid_range) {
        radish::ReadOptions options = make_options(moments, parallel_sweeps, mask_outside_valid_range);
        nb::gil_scoped_release release;
        return radish::read(path, options);
      },
      nb::arg("path"), nb::arg("moments") = nb::none(), nb::arg("parallel_sweeps") = false,
      nb::arg("mask_outside_valid_range") = false);

  m.def(
      "scan_cfradial1",
      [](const std::string& path) {
        nb::gil_scoped_release release;
        return radish::scan(path);
      },
      nb::arg("path"));

  m.def("set_event_log_path", &radish::set_event_log_path);
  m.def("flush_event_log", &radish::flush_event_log);

#ifdef RADISH_USE_MSGPACK
  m.def("dataset_tree_msgpack", [](const radish::VolumeData& volume) {
    const auto packed = radish::pack_dataset_tree(radish::to_dataset_tree(volume));
    return nb::bytes(reinterpret_cast<const char*>(packed.data()), packed.size());
  });
#endif
}

#endif  // RADISH_USE_NANOBIND
