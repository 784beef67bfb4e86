#include "radish/backend_cfradial1.hpp"
#include "radish/error.hpp"
#include "radish/materializer.hpp"
#include "cfradial_fixture.hpp"

#include <cstring>

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <hpx/hpx_init.hpp>
#include <hpx/runtime.hpp>

using namespace radish;
using radish::testing::FixtureOptions;
using radish::testing::ScopedVolume;

namespace {

FixtureOptions five_sweeps() {
  FixtureOptions options;
  options.num_rays = 250;
  options.sweeps = {{0, 49}, {50, 99}, {100, 149}, {150, 199}, {200, 249}};
  options.fixed_angles = {0.5, 1.5, 2.5, 3.5, 4.5};
  options.sweep_numbers = {1, 2, 3, 4, 5};
  return options;
}

}  // namespace

TEST_CASE("Parallel sweep decoding matches sequential decoding", "[hpx]") {
  REQUIRE(hpx::get_runtime_ptr() != nullptr);
  ScopedVolume file(five_sweeps(), "parallel");

  ReadOptions sequential;
  ReadOptions parallel;
  parallel.parallel_sweeps = true;

  const VolumeData a = radish::read(file.path(), sequential);
  const VolumeData b = radish::read(file.path(), parallel);

  REQUIRE(a.num_sweeps() == 5);
  REQUIRE(b.num_sweeps() == 5);
  for (std::size_t s = 0; s < a.num_sweeps(); ++s) {
    const SweepData& x = a.sweeps()[s];
    const SweepData& y = b.sweeps()[s];
    REQUIRE(y.index() == static_cast<int32_t>(s));
    REQUIRE(x.moment_names() == y.moment_names());
    for (const auto& name : x.moment_names()) {
      const auto& lhs = x.get_moment(name)->values();
      const auto& rhs = y.get_moment(name)->values();
      REQUIRE(lhs.size() == rhs.size());
      REQUIRE(std::memcmp(lhs.data(), rhs.data(), lhs.size() * sizeof(float)) == 0);
    }
  }
}

TEST_CASE("Parallel decoding surfaces the lowest failing sweep", "[hpx]") {
  ScopedVolume file(five_sweeps(), "parallel");
  Container container = Container::open(file.path());
  ConventionMap map = map_convention(container);
  map.sweeps[2].end_ray = 400;
  map.sweeps[4].end_ray = 500;

  ReadOptions options;
  options.parallel_sweeps = true;
  for (int attempt = 0; attempt < 5; ++attempt) {
    try {
      materialize_sweeps(container, map, options);
      FAIL("expected DecodeError");
    } catch (const DecodeError& e) {
      REQUIRE(e.sweep() == 2);
    }
  }
}

int hpx_main(int argc, char** argv) {
  const int result = Catch::Session().run(argc, argv);
  hpx::finalize();
  return result;
}

int main(int argc, char* argv[]) {
  hpx::init_params params;
  params.cfg = {"hpx.commandline.allow_unknown=1"};
  return hpx::init(argc, argv, params);
}
