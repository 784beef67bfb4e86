#include "radish/metadata.hpp"
#include "cfradial_fixture.hpp"

#include <limits>

#include <catch2/catch.hpp>

using namespace radish;
using radish::testing::FixtureOptions;
using radish::testing::ScopedVolume;

namespace {

VolumeMetadata metadata_for(const FixtureOptions& options) {
  ScopedVolume volume(options, "metadata");
  Container container = Container::open(volume.path());
  return extract_metadata(container, map_convention(container));
}

}  // namespace

TEST_CASE("Volume metadata from attributes and scalars", "[metadata]") {
  const VolumeMetadata meta = metadata_for({});

  REQUIRE(meta.instrument_name == "KTLX");
  REQUIRE(meta.institution == "radish test suite");
  REQUIRE(meta.title == "synthetic volume");
  REQUIRE(meta.conventions == "CF/Radial instrument_parameters");
  REQUIRE(meta.source.empty());

  REQUIRE(meta.latitude == Approx(35.333));
  REQUIRE(meta.longitude == Approx(-97.278));
  REQUIRE(meta.altitude == Approx(384.0));
  REQUIRE_FALSE(meta.altitude_agl.has_value());
  REQUIRE(meta.frequency.has_value());
  REQUIRE(*meta.frequency == Approx(2.8e9));
  REQUIRE(meta.volume_number == 42);
  REQUIRE(meta.platform_type == PlatformType::kFixed);

  REQUIRE(meta.time_coverage_start == "2024-05-06T12:00:00Z");
  REQUIRE(meta.time_coverage_end == "2024-05-06T12:04:30Z");
}

TEST_CASE("Sweep summary", "[metadata]") {
  const VolumeMetadata meta = metadata_for({});
  REQUIRE(meta.num_sweeps == 2);
  REQUIRE(meta.sweep_fixed_angles.size() == 2);
  REQUIRE(meta.sweep_fixed_angles[0] == Approx(0.5));
  REQUIRE(meta.sweep_fixed_angles[1] == Approx(1.5));
  REQUIRE(meta.sweep_numbers == std::vector<int32_t>{1, 2});
  REQUIRE(meta.sweep_group_names == std::vector<std::string>{"sweep_0", "sweep_1"});
}

TEST_CASE("Global attributes are rendered as text", "[metadata]") {
  const VolumeMetadata meta = metadata_for({});
  REQUIRE(meta.global_attributes.at("institution") == "radish test suite");
  REQUIRE(meta.global_attributes.at("volume_scan_index") == "7");
  REQUIRE(meta.global_attributes.count("_NCProperties") == 0);
}

TEST_CASE("Optional metadata falls back to defaults", "[metadata]") {
  SECTION("position defaults to zero") {
    FixtureOptions options;
    options.omit = {"latitude", "longitude", "altitude"};
    const VolumeMetadata meta = metadata_for(options);
    REQUIRE(meta.latitude == 0.0);
    REQUIRE(meta.longitude == 0.0);
    REQUIRE(meta.altitude == 0.0);
  }

  SECTION("volume_number that is not a representable integer") {
    FixtureOptions options;
    options.float_volume_number = std::numeric_limits<double>::quiet_NaN();
    REQUIRE(metadata_for(options).volume_number == 0);
    options.float_volume_number = 1.0e300;
    REQUIRE(metadata_for(options).volume_number == 0);
    options.float_volume_number = 12.0;
    REQUIRE(metadata_for(options).volume_number == 12);
  }

  SECTION("no frequency") {
    FixtureOptions options;
    options.with_frequency = false;
    REQUIRE_FALSE(metadata_for(options).frequency.has_value());
  }

  SECTION("unknown and missing platform types") {
    FixtureOptions options;
    options.platform_type = "balloon";
    REQUIRE(metadata_for(options).platform_type == PlatformType::kUnknown);
    options.platform_type.clear();
    REQUIRE(metadata_for(options).platform_type == PlatformType::kUnknown);
  }

  SECTION("moving platform") {
    FixtureOptions options;
    options.platform_type = "aircraft";
    REQUIRE(metadata_for(options).platform_type == PlatformType::kAircraft);
  }
}

TEST_CASE("Instrument name stored as a character variable", "[metadata]") {
  FixtureOptions options;
  options.instrument_name_as_variable = true;
  options.instrument_name = "SPOL";
  REQUIRE(metadata_for(options).instrument_name == "SPOL");
}

TEST_CASE("Metadata extraction never reads ray-sized payloads", "[metadata]") {
  ScopedVolume volume;
  Container container = Container::open(volume.path());
  const ConventionMap map = map_convention(container);
  const VolumeMetadata meta = extract_metadata(container, map);
  REQUIRE(meta.num_sweeps == 2);
  // One ray-sized array alone would be 180 elements.
  REQUIRE(container.elements_read() < 180);
}
