#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <random>
#include <vector>
#include <numeric>
#include <cmath>

#include "RngUtils.h"
#include "randutils.hpp"

using Catch::Approx;
using abvalue::rng_utils::get_engine;
using abvalue::rng_utils::get_random_uniform_01;
using abvalue::rng_utils::get_random_uniform_open01;
using abvalue::rng_utils::get_standard_normal;
using abvalue::rng_utils::make_monte_carlo_rng;
using abvalue::rng_utils::splitmix64;

TEST_CASE("RngUtils: get_engine returns alias for wrapped and plain engines", "[rng][engine]")
{
  std::mt19937_64 stdrng(12345u);
  REQUIRE(&get_engine(stdrng) == &stdrng);

  randutils::seed_seq_fe128 seed{1u, 2u, 3u, 4u};
  randutils::mt19937_rng rrng(seed);
  REQUIRE(&get_engine(rrng) == &rrng.engine());
}

TEST_CASE("RngUtils: seeded Monte Carlo engines are reproducible", "[rng][seed]")
{
  auto a = make_monte_carlo_rng(std::optional<std::uint64_t>(42u));
  auto b = make_monte_carlo_rng(std::optional<std::uint64_t>(42u));
  auto c = make_monte_carlo_rng(std::optional<std::uint64_t>(43u));

  bool differsFromOtherSeed = false;
  for (int i = 0; i < 20; ++i)
  {
    const double va = get_random_uniform_01(a);
    const double vb = get_random_uniform_01(b);
    const double vc = get_random_uniform_01(c);
    REQUIRE(va == vb);
    if (va != vc)
      differsFromOtherSeed = true;
  }
  REQUIRE(differsFromOtherSeed);
}

TEST_CASE("RngUtils: uniform and normal draws", "[rng][draws]")
{
  auto rng = make_monte_carlo_rng(std::optional<std::uint64_t>(2025u));
  const int n = 20000;

  std::vector<double> uniforms(n), normals(n);
  for (int i = 0; i < n; ++i)
  {
    uniforms[i] = get_random_uniform_open01(rng);
    normals[i]  = get_standard_normal(rng);
    REQUIRE(uniforms[i] > 0.0);
    REQUIRE(uniforms[i] < 1.0);
  }

  const double meanU = std::accumulate(uniforms.begin(), uniforms.end(), 0.0) / n;
  const double meanZ = std::accumulate(normals.begin(), normals.end(), 0.0) / n;
  double ss = 0.0;
  for (double z : normals) ss += (z - meanZ) * (z - meanZ);

  REQUIRE(meanU == Approx(0.5).margin(0.02));
  REQUIRE(meanZ == Approx(0.0).margin(0.05));
  REQUIRE(std::sqrt(ss / (n - 1)) == Approx(1.0).margin(0.05));
}

TEST_CASE("RngUtils: unseeded engines still produce values", "[rng][seed]")
{
  auto rng = make_monte_carlo_rng(std::nullopt);
  const double u = get_random_uniform_01(rng);
  REQUIRE(u >= 0.0);
  REQUIRE(u < 1.0);
}

TEST_CASE("RngUtils: splitmix64 is deterministic", "[rng][hash]")
{
  REQUIRE(splitmix64(0u) == splitmix64(0u));
  REQUIRE(splitmix64(1u) != splitmix64(2u));
}
