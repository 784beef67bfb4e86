#include "radish/backend_cfradial1.hpp"
#include "radish/error.hpp"
#include "cfradial_fixture.hpp"

#include <array>
#include <cstring>
#include <memory>
#include <stdexcept>

#include <catch2/catch.hpp>

using namespace radish;
using radish::testing::FixtureOptions;
using radish::testing::ScopedVolume;

namespace {

bool same_bits(const std::vector<float>& a, const std::vector<float>& b) {
  return a.size() == b.size() && std::memcmp(a.data(), b.data(), a.size() * sizeof(float)) == 0;
}

}  // namespace

TEST_CASE("Two-sweep volume scenario", "[cfradial1][scenario]") {
  ScopedVolume file;
  const VolumeData volume = radish::read(file.path());

  REQUIRE(volume.num_sweeps() == 2);
  REQUIRE(volume.sweeps()[0].num_rays() == 100);
  REQUIRE(volume.sweeps()[1].num_rays() == 80);

  const MomentData* dbz = volume.get_sweep(0)->get_moment("DBZ");
  REQUIRE(dbz != nullptr);
  REQUIRE(dbz->shape() == std::array<std::size_t, 2>{100, 500});
  REQUIRE(is_no_data(dbz->at(0, 0)));
  REQUIRE(dbz->at(0, 1) == Approx(5.0));

  REQUIRE(volume.metadata().instrument_name == "KTLX");
  REQUIRE(volume.metadata().num_sweeps == 2);
}

TEST_CASE("NetCDF-3 classic volume scenario", "[cfradial1][scenario]") {
  FixtureOptions options;
  options.format = radish::testing::FileFormat::kClassic;
  options.num_rays = 4;
  options.num_gates = 3;
  options.sweeps = {{0, 1}, {2, 3}};
  ScopedVolume file(options, "classic");

  const VolumeMetadata meta = radish::scan(file.path());
  REQUIRE(meta.num_sweeps == 2);
  REQUIRE(meta.sweep_numbers == std::vector<int32_t>{1, 2});
  REQUIRE(meta.volume_number == 42);

  const VolumeData volume = radish::read(file.path());
  REQUIRE(volume.num_sweeps() == 2);
  const MomentData* first = volume.get_sweep(0)->get_moment("DBZ");
  REQUIRE(first->shape() == std::array<std::size_t, 2>{2, 3});
  REQUIRE(is_no_data(first->at(0, 0)));
  REQUIRE(first->at(0, 1) == Approx(5.0));

  const SweepData* second = volume.get_sweep(1);
  REQUIRE(second->num_rays() == 2);
  REQUIRE(second->azimuth() == std::vector<float>{4.0f, 6.0f});
  for (std::size_t r = 0; r < 2; ++r) {
    for (std::size_t g = 0; g < 3; ++g) {
      const int16_t raw = radish::testing::dbz_raw(2 + r, g);
      const float value = second->get_moment("DBZ")->at(r, g);
      if (raw == radish::testing::kDbzFill) {
        REQUIRE(is_no_data(value));
      } else {
        REQUIRE(value == Approx(raw * radish::testing::kDbzScale));
      }
    }
  }
}

TEST_CASE("Every sweep is consistently shaped", "[cfradial1]") {
  ScopedVolume file;
  const VolumeData volume = radish::read(file.path());
  for (const auto& sweep : volume.sweeps()) {
    REQUIRE(sweep.azimuth().size() == sweep.num_rays());
    REQUIRE(sweep.elevation().size() == sweep.num_rays());
    for (const auto& moment : sweep.moments()) {
      REQUIRE(moment.num_rays() == sweep.num_rays());
      REQUIRE(moment.num_gates() == sweep.num_gates());
    }
  }
}

TEST_CASE("Fill values never decode to finite numbers", "[cfradial1]") {
  ScopedVolume file;
  const VolumeData volume = radish::read(file.path());
  for (const auto& sweep : volume.sweeps()) {
    const std::size_t first_ray = sweep.index() == 0 ? 0 : 100;
    const MomentData* dbz = sweep.get_moment("DBZ");
    const MomentData* vel = sweep.get_moment("VEL");
    for (std::size_t r = 0; r < sweep.num_rays(); ++r) {
      for (std::size_t g = 0; g < sweep.num_gates(); ++g) {
        if (radish::testing::dbz_raw(first_ray + r, g) == radish::testing::kDbzFill) {
          REQUIRE(is_no_data(dbz->at(r, g)));
        }
        if (radish::testing::vel_raw(first_ray + r, g) == radish::testing::kVelFill) {
          REQUIRE(is_no_data(vel->at(r, g)));
        }
      }
    }
  }
}

TEST_CASE("Scan agrees with read", "[cfradial1]") {
  ScopedVolume file;
  const VolumeMetadata meta = radish::scan(file.path());
  const VolumeData volume = radish::read(file.path());

  REQUIRE(meta.num_sweeps == volume.num_sweeps());
  std::vector<double> angles;
  for (const auto& sweep : volume.sweeps()) {
    angles.push_back(sweep.fixed_angle());
  }
  REQUIRE(meta.sweep_fixed_angles == angles);
  REQUIRE(meta.global_attributes == volume.metadata().global_attributes);
}

TEST_CASE("Reading twice gives identical results", "[cfradial1]") {
  ScopedVolume file;
  const VolumeData first = radish::read(file.path());
  const VolumeData second = radish::read(file.path());

  REQUIRE(first.metadata().global_attributes == second.metadata().global_attributes);
  REQUIRE(first.metadata().time_coverage_end == second.metadata().time_coverage_end);
  for (std::size_t s = 0; s < first.num_sweeps(); ++s) {
    const SweepData& a = first.sweeps()[s];
    const SweepData& b = second.sweeps()[s];
    REQUIRE(same_bits(a.azimuth(), b.azimuth()));
    REQUIRE(same_bits(a.range(), b.range()));
    for (const auto& name : a.moment_names()) {
      REQUIRE(same_bits(a.get_moment(name)->values(), b.get_moment(name)->values()));
    }
  }
}

TEST_CASE("Sweep lookup outside the volume is absent", "[cfradial1]") {
  ScopedVolume file;
  const VolumeData volume = radish::read(file.path());
  REQUIRE(volume.get_sweep(2) == nullptr);
  REQUIRE(volume.get_sweep(-1) == nullptr);
  REQUIRE(volume.get_sweep(1) != nullptr);
}

TEST_CASE("Failures surface as typed errors", "[cfradial1]") {
  SECTION("missing sweep_end_ray_index") {
    FixtureOptions options;
    options.omit = {"sweep_end_ray_index"};
    ScopedVolume file(options);
    REQUIRE_THROWS_AS(radish::read(file.path()), SchemaError);
    REQUIRE_THROWS_AS(radish::scan(file.path()), SchemaError);
  }

  SECTION("missing file") {
    REQUIRE_THROWS_AS(radish::read("/nonexistent/radish.nc"), NotFoundError);
  }

  SECTION("not a NetCDF container") {
    radish::testing::ScopedFile file("text");
    radish::testing::write_file_bytes(file.path(), {'n', 'o', 't', ' ', 'n', 'c'});
    REQUIRE_THROWS_AS(radish::scan(file.path()), FormatError);
  }

  SECTION("scan succeeds where only sweep decoding fails") {
    FixtureOptions options;
    options.azimuth_length = 120;
    ScopedVolume file(options);
    REQUIRE(radish::scan(file.path()).num_sweeps == 2);
    REQUIRE_THROWS_AS(radish::read(file.path()), DecodeError);
  }
}

TEST_CASE("Scoped file session", "[cfradial1]") {
  ScopedVolume file;
  CfRadial1File session(file.path());

  REQUIRE(session.path() == file.path());
  REQUIRE(session.num_sweeps() == 2);
  REQUIRE(session.metadata().volume_number == 42);

  SECTION("on-demand sweep decoding") {
    const SweepData sweep = session.read_sweep(1);
    REQUIRE(sweep.index() == 1);
    REQUIRE(sweep.num_rays() == 80);
    REQUIRE_THROWS_AS(session.read_sweep(2), std::out_of_range);
  }

  SECTION("volume from the session matches the free function") {
    ReadOptions options;
    options.moments = {"DBZ"};
    const VolumeData volume = session.read_volume(options);
    REQUIRE(volume.sweeps()[0].moment_names() == std::vector<std::string>{"DBZ"});
    REQUIRE(same_bits(volume.sweeps()[0].get_moment("DBZ")->values(),
                      radish::read(file.path()).sweeps()[0].get_moment("DBZ")->values()));
  }
}

TEST_CASE("In-memory images", "[cfradial1]") {
  ScopedVolume file;
  const auto bytes = radish::testing::read_file_bytes(file.path());

  const VolumeMetadata meta = scan_image(bytes);
  REQUIRE(meta.num_sweeps == 2);

  const VolumeData volume = read_image(bytes);
  REQUIRE(volume.get_sweep(0)->get_moment("DBZ")->at(0, 1) == Approx(5.0));

  REQUIRE_THROWS_AS(read_image({}), FormatError);
}

TEST_CASE("Backend interface", "[cfradial1]") {
  std::unique_ptr<RadarBackend> backend = std::make_unique<CfRadial1Backend>();
  REQUIRE(backend->name() == "cfradial1");
  REQUIRE(backend->description() == "CF/Radial NetCDF format (version 1)");

  ScopedVolume file;
  REQUIRE(backend->scan_file(file.path()).num_sweeps == 2);
  REQUIRE(backend->read_sweep(file.path(), 0).num_rays() == 100);
  REQUIRE(backend->read_volume(file.path()).num_sweeps() == 2);
}
