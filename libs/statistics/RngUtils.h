#pragma once

#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <random>
#include <optional>
#include "randutils.hpp"

namespace abvalue
{
  namespace rng_utils
  {
    // Engine used by every Monte Carlo simulation in the project.
    using MonteCarloRng = randutils::mt19937_rng;

    // --- Detection: does Rng have .engine()? (e.g., randutils::mt19937_rng) ---
    template <typename T, typename = void>
    struct has_engine_method : std::false_type {};

    template <typename T>
    struct has_engine_method<T, std::void_t<decltype(std::declval<T&>().engine())>> : std::true_type {};

    // Return a reference to the underlying engine, whether wrapped or direct.
    template <typename Rng>
    inline auto& get_engine(Rng& rng)
    {
      if constexpr (has_engine_method<Rng>::value)
	return rng.engine();     // e.g., randutils::mt19937_rng::engine()
      else
	return rng;              // e.g., std::mt19937_64
    }

    /**
     * @brief Draw a double in [0, 1) from the underlying engine.
     */
    template <typename Rng>
    inline double get_random_uniform_01(Rng& rng)
    {
      std::uniform_real_distribution<double> dist(0.0, 1.0);
      return dist(get_engine(rng));
    }

    /**
     * @brief Draw a uniform double in the open interval (0, 1).
     *
     * Used for inverse-CDF sampling where the quantile function is undefined
     * at both end points.
     */
    template <typename Rng>
    inline double get_random_uniform_open01(Rng& rng)
    {
      double u = 0.0;
      do {
	u = get_random_uniform_01(rng);
      } while (u <= 0.0);
      return u;
    }

    /**
     * @brief Draw a standard normal variate N(0, 1).
     */
    template <typename Rng>
    inline double get_standard_normal(Rng& rng)
    {
      std::normal_distribution<double> dist(0.0, 1.0);
      return dist(get_engine(rng));
    }

    // Simple 64-bit splitmix hash (deterministic, good avalanche)
    inline std::uint64_t splitmix64(std::uint64_t x)
    {
      x += 0x9e3779b97f4a7c15ull;
      x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
      x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
      return x ^ (x >> 31);
    }

    /**
     * @brief Build a Monte Carlo engine, deterministic when a seed is given.
     *
     * A 64-bit seed is expanded into four 32-bit words through two rounds of
     * SplitMix64 and fed to randutils::seed_seq_fe128. Without a seed the
     * generator is auto-seeded by randutils from system entropy.
     */
    inline MonteCarloRng make_monte_carlo_rng(const std::optional<std::uint64_t>& seed)
    {
      if (!seed)
	return MonteCarloRng();

      const std::uint64_t s0 = splitmix64(*seed);
      const std::uint64_t s1 = splitmix64(s0 ^ 0xd1342543de82ef95ull);

      randutils::seed_seq_fe128 seq{ static_cast<std::uint32_t>(s0),
				     static_cast<std::uint32_t>(s0 >> 32),
				     static_cast<std::uint32_t>(s1),
				     static_cast<std::uint32_t>(s1 >> 32) };
      MonteCarloRng rng(seq);
      return rng;
    }
  } // namespace rng_utils
} // namespace abvalue
