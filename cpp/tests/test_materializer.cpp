#include "radish/materializer.hpp"
#include "radish/error.hpp"
#include "cfradial_fixture.hpp"

#include <cmath>
#include <stdexcept>

#include <catch2/catch.hpp>

using namespace radish;
using radish::testing::FixtureOptions;
using radish::testing::ScopedVolume;
using radish::testing::dbz_raw;
using radish::testing::vel_raw;

namespace {

struct OpenVolume {
  explicit OpenVolume(const FixtureOptions& options = {})
      : file(options, "materializer"),
        container(Container::open(file.path())),
        map(map_convention(container)) {}

  ScopedVolume file;
  Container container;
  ConventionMap map;
};

SweepData read_one(const OpenVolume& volume, std::size_t index, const ReadOptions& options = {}) {
  const SweepContext context = prepare_sweep_context(volume.container, volume.map, options);
  return materialize_sweep(volume.container, volume.map, context, index, options);
}

}  // namespace

TEST_CASE("Sweep geometry is sliced from the ray coordinates", "[materializer]") {
  OpenVolume volume;
  const SweepData sweep = read_one(volume, 1);

  REQUIRE(sweep.index() == 1);
  REQUIRE(sweep.sweep_number() == 2);
  REQUIRE(sweep.fixed_angle() == Approx(1.5));
  REQUIRE(sweep.mode() == SweepMode::kAzimuthSurveillance);
  REQUIRE(sweep.num_rays() == 80);
  REQUIRE(sweep.num_gates() == 500);

  REQUIRE(sweep.azimuth().front() == Approx(radish::testing::azimuth_at(100)));
  REQUIRE(sweep.azimuth().back() == Approx(radish::testing::azimuth_at(179)));
  REQUIRE(sweep.elevation().front() == Approx(1.5));
  REQUIRE(sweep.time().size() == 80);
  REQUIRE(sweep.time().front() == Approx(150.0));
  REQUIRE(sweep.range().front() == Approx(2125.0));
  REQUIRE(sweep.range().back() == Approx(radish::testing::range_at(499)));
}

TEST_CASE("Packed moments are decoded to physical values", "[materializer]") {
  OpenVolume volume;
  const SweepData sweep = read_one(volume, 0);
  const MomentData* dbz = sweep.get_moment("DBZ");
  REQUIRE(dbz != nullptr);
  REQUIRE(dbz->shape() == std::array<std::size_t, 2>{100, 500});
  REQUIRE(dbz->units() == "dBZ");
  REQUIRE(dbz->standard_name == "equivalent_reflectivity_factor");
  REQUIRE(dbz->scale_factor.has_value());
  REQUIRE(*dbz->scale_factor == Approx(0.01));
  REQUIRE(dbz->fill_value == -32768.0);

  SECTION("fill values become no-data") {
    REQUIRE(is_no_data(dbz->at(0, 0)));
    REQUIRE(is_no_data(dbz->at(0, 5)));
    REQUIRE(is_no_data(dbz->at(3, 2)));
  }

  SECTION("stored values are scaled") {
    REQUIRE(dbz->at(0, 1) == Approx(5.0));
    for (std::size_t r = 1; r < 100; r += 17) {
      for (std::size_t g = 0; g < 500; g += 41) {
        const int16_t raw = dbz_raw(r, g);
        if (raw == radish::testing::kDbzFill) {
          REQUIRE(is_no_data(dbz->at(r, g)));
        } else {
          REQUIRE(dbz->at(r, g) == Approx(raw * radish::testing::kDbzScale));
        }
      }
    }
  }

  SECTION("unpacked float moments keep their values") {
    const MomentData* vel = sweep.get_moment("VEL");
    REQUIRE(vel != nullptr);
    REQUIRE_FALSE(vel->scale_factor.has_value());
    REQUIRE(is_no_data(vel->at(1, 1)));
    REQUIRE(vel->at(0, 0) == Approx(-20.0));
    REQUIRE(vel->at(2, 39) == Approx(vel_raw(2, 39)));
  }
}

TEST_CASE("Moments in the second sweep come from its own rays", "[materializer]") {
  OpenVolume volume;
  const SweepData sweep = read_one(volume, 1);
  const MomentData* dbz = sweep.get_moment("DBZ");
  REQUIRE(dbz->num_rays() == 80);
  for (std::size_t g = 0; g < 500; g += 53) {
    const int16_t raw = dbz_raw(100 + 7, g);
    if (raw == radish::testing::kDbzFill) {
      REQUIRE(is_no_data(dbz->at(7, g)));
    } else {
      REQUIRE(dbz->at(7, g) == Approx(raw * radish::testing::kDbzScale));
    }
  }
}

TEST_CASE("Valid range masking is opt-in", "[materializer]") {
  OpenVolume volume;

  ReadOptions options;
  REQUIRE(read_one(volume, 0, options).get_moment("VEL")->at(0, 0) == Approx(-20.0));

  options.mask_outside_valid_range = true;
  const SweepData masked = read_one(volume, 0, options);
  const MomentData* vel = masked.get_moment("VEL");
  REQUIRE(is_no_data(vel->at(0, 0)));
  REQUIRE(vel->at(0, 20) == Approx(0.0));
  REQUIRE(vel->at(0, 38) == Approx(18.0));
  REQUIRE(is_no_data(vel->at(3, 39)));
}

TEST_CASE("Moment selection", "[materializer]") {
  OpenVolume volume;

  SECTION("all catalog fields by default") {
    REQUIRE(read_one(volume, 0).moment_names() == std::vector<std::string>{"DBZ", "VEL"});
  }

  SECTION("only requested fields, unknown names ignored") {
    ReadOptions options;
    options.moments = {"VEL", "ZDR"};
    const SweepData sweep = read_one(volume, 0, options);
    REQUIRE(sweep.moment_names() == std::vector<std::string>{"VEL"});
    REQUIRE(sweep.get_moment("DBZ") == nullptr);
  }

  SECTION("reserved auxiliary variables are not moments") {
    REQUIRE(read_one(volume, 0).get_moment("ray_gate_spacing") == nullptr);
  }
}

TEST_CASE("Volumes without a time coordinate", "[materializer]") {
  FixtureOptions options;
  options.with_time = false;
  OpenVolume volume(options);
  const SweepData sweep = read_one(volume, 0);
  REQUIRE(sweep.time().empty());
  REQUIRE(sweep.num_rays() == 100);
}

TEST_CASE("Coordinate validation", "[materializer]") {
  SECTION("azimuth shorter than the ray dimension") {
    FixtureOptions options;
    options.azimuth_length = 170;
    OpenVolume volume(options);
    try {
      prepare_sweep_context(volume.container, volume.map, {});
      FAIL("expected DecodeError");
    } catch (const DecodeError& e) {
      REQUIRE(e.variable() == "azimuth");
    }
  }

  SECTION("decreasing range") {
    FixtureOptions options;
    options.decreasing_range = true;
    OpenVolume volume(options);
    REQUIRE_THROWS_AS(prepare_sweep_context(volume.container, volume.map, {}), DecodeError);
  }

  SECTION("missing elevation") {
    FixtureOptions options;
    options.omit = {"elevation"};
    OpenVolume volume(options);
    try {
      prepare_sweep_context(volume.container, volume.map, {});
      FAIL("expected SchemaError");
    } catch (const SchemaError& e) {
      REQUIRE(e.variable() == "elevation");
    }
  }
}

TEST_CASE("Sweep errors carry the sweep index", "[materializer]") {
  OpenVolume volume;
  const SweepContext context = prepare_sweep_context(volume.container, volume.map, {});

  SECTION("index past the sweep table") {
    REQUIRE_THROWS_AS(materialize_sweep(volume.container, volume.map, context, 2, {}),
                      std::out_of_range);
  }

  SECTION("rays past the stored extent") {
    ConventionMap broken = volume.map;
    broken.sweeps[1].end_ray = 200;
    try {
      materialize_sweep(volume.container, broken, context, 1, {});
      FAIL("expected DecodeError");
    } catch (const DecodeError& e) {
      REQUIRE(e.sweep() == 1);
      REQUIRE(std::string(e.what()).find("sweep=1") != std::string::npos);
    }
  }
}

TEST_CASE("Moments over a different gate dimension", "[materializer]") {
  FixtureOptions options;
  options.with_short_moment = true;
  OpenVolume volume(options);
  REQUIRE(volume.map.fields == std::vector<std::string>{"DBZ", "VEL"});

  ConventionMap forced = volume.map;
  forced.fields.push_back("ZDR");
  const SweepContext context = prepare_sweep_context(volume.container, forced, {});
  REQUIRE(context.fields.back() == "ZDR");
  try {
    materialize_sweep(volume.container, forced, context, 1, {});
    FAIL("expected DecodeError");
  } catch (const DecodeError& e) {
    REQUIRE(e.variable() == "ZDR");
    REQUIRE(e.sweep() == 1);
    REQUIRE(std::string(e.what()).find("(180, 500)") != std::string::npos);
  }
}

TEST_CASE("All sweeps in index order", "[materializer]") {
  OpenVolume volume;
  const std::vector<SweepData> sweeps = materialize_sweeps(volume.container, volume.map, {});
  REQUIRE(sweeps.size() == 2);
  REQUIRE(sweeps[0].index() == 0);
  REQUIRE(sweeps[1].index() == 1);
  REQUIRE(sweeps[0].num_rays() + sweeps[1].num_rays() == 180);

  SECTION("parallel flag without a runtime decodes sequentially") {
    ReadOptions options;
    options.parallel_sweeps = true;
    const auto again = materialize_sweeps(volume.container, volume.map, options);
    REQUIRE(again.size() == 2);
    REQUIRE(again[1].get_moment("DBZ")->values().size() == 80 * 500);
  }
}
