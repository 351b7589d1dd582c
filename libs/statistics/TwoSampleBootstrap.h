#pragma once

#include <vector>
#include <algorithm>
#include <iterator>
#include <cmath>
#include <stdexcept>
#include <cstddef>
#include <limits>
#include <ostream>
#include <string>
#include <type_traits>

#include "randutils.hpp"
#include "RngUtils.h"
#include "Resampling.h"
#include "ConfidenceInterval.h"
#include "DescriptiveStats.h"
#include "QuantileUtils.h"
#include "StatisticsException.h"
#include "EffectSizeConfiguration.h"

namespace effectsizes
{
  namespace analysis
  {

    /**
     * @brief Two-sample percentile bootstrap confidence interval.
     *
     * Given two samples xs (size nx) and ys (size ny) and a reducer
     * f(xs, ys) -> Decimal, for each replicate b = 0..B-1:
     *   1. Construct a per-replicate engine,
     *   2. Draw rx_b of length nx from xs and ry_b of length ny from ys
     *      via the injected Resampler,
     *   3. Compute θ*_b = f(rx_b, ry_b).
     * The interval is [Q(lowTail), Q(highTail)] where Q is the type-7
     * empirical quantile of {θ*_b} and the tails come from
     * twoTailedQuantile(coverage).
     *
     * Replicates are independent of one another; each draws only from its
     * own engine. A resample with zero spread yields ±inf, which is ordered
     * and kept; only NaN replicates, which have no order, are skipped. The
     * run throws only when every replicate is NaN.
     *
     * @tparam Decimal
     *   Numeric value type of the samples and of the statistic.
     * @tparam Reducer
     *   Callable `Decimal(const std::vector<Decimal>&, const std::vector<Decimal>&)`.
     * @tparam Resampler
     *   Provides `void operator()(const std::vector<Decimal>& x,
     *                             std::vector<Decimal>& y,
     *                             std::size_t m,
     *                             Engine& rng) const;`
     * @tparam Rng
     *   Random-number generator type; also the type of the per-replicate engines.
     */
    template<
      class Decimal,
      class Reducer,
      class Resampler = resampling::IIDResampler<Decimal>,
      class Rng       = randutils::mt19937_rng
      >
    class TwoSampleBootstrap
    {
    public:
      struct Result
      {
        Decimal                     estimate;     // f(xs, ys) on the original samples
        ConfidenceInterval<Decimal> interval;     // percentile interval, resampleCount = B
        std::size_t                 effective_B;  // ordered reps (finite or ±inf)
        std::size_t                 skipped;      // NaN reps skipped
        std::size_t                 nx;           // first sample size
        std::size_t                 ny;           // second sample size
        double                      se_boot;      // standard error of the finite reps
      };

    public:
      /**
       * @param B
       *   Number of bootstrap replicates; must be > 1.
       * @param coverage
       *   Two-sided coverage in [0, 1].
       * @param resampler
       *   Resampler used for both samples.
       *
       * @throws InvalidCoverageException     if coverage is outside [0, 1]
       * @throws InvalidResampleCountException if B <= 1
       */
      TwoSampleBootstrap(std::size_t      B,
                         double           coverage,
                         const Resampler& resampler = Resampler())
        : m_B(B),
          m_coverage(coverage),
          m_resampler(resampler),
          m_diagBootstrapStats(),
          m_diagMeanBoot(0.0),
          m_diagVarBoot(0.0),
          m_diagSeBoot(0.0),
          m_diagValid(false)
      {
        validateCoverage(m_coverage);
        if (m_B < EffectSizeConfiguration::kMinResampleCount) {
          throw InvalidResampleCountException(
            "TwoSampleBootstrap: resample count must be > 1, got " + std::to_string(m_B));
        }
      }

      /**
       * @brief Run the bootstrap using a caller-supplied RNG.
       *
       * Each replicate gets its own engine seeded by one draw from @p rng, so a
       * seeded @p rng reproduces the interval exactly.
       */
      Result run(const std::vector<Decimal>& xs,
                 const std::vector<Decimal>& ys,
                 Reducer                     reducer,
                 Rng&                        rng,
                 std::ostream*               os = nullptr) const
      {
        auto make_engine = [&rng](std::size_t /*b*/) {
          return rng_utils::derive_engine<Rng>(rng);
        };

        return run_core_(xs, ys, reducer, make_engine, os);
      }

      /**
       * @brief Run the bootstrap with an engine provider (CRN-friendly).
       *
       * @tparam Provider Type with `Rng make_engine(std::size_t) const`, such as
       *                  rng_utils::CRNRng<Rng>. Replicate b always receives
       *                  provider.make_engine(b).
       */
      template<class Provider>
      Result run(const std::vector<Decimal>& xs,
                 const std::vector<Decimal>& ys,
                 Reducer                     reducer,
                 const Provider&             provider,
                 std::ostream*               os = nullptr) const
      {
        auto make_engine = [&provider](std::size_t b) {
          return provider.make_engine(b);
        };

        return run_core_(xs, ys, reducer, make_engine, os);
      }

      std::size_t      B()         const { return m_B; }
      double           coverage()  const { return m_coverage; }
      const Resampler& resampler() const { return m_resampler; }

      bool hasDiagnostics() const noexcept
      {
        return m_diagValid;
      }

      /**
       * @brief Non-NaN replicate statistics {θ*_b} from the last run, in replicate order.
       * @throws std::logic_error if run(...) has not completed yet.
       */
      const std::vector<double>& getBootstrapStatistics() const
      {
        ensureDiagnosticsAvailable();
        return m_diagBootstrapStats;
      }

      double getBootstrapMean() const
      {
        ensureDiagnosticsAvailable();
        return m_diagMeanBoot;
      }

      double getBootstrapVariance() const
      {
        ensureDiagnosticsAvailable();
        return m_diagVarBoot;
      }

      double getBootstrapSe() const
      {
        ensureDiagnosticsAvailable();
        return m_diagSeBoot;
      }

    private:
      void ensureDiagnosticsAvailable() const
      {
        if (!m_diagValid) {
          throw std::logic_error(
            "TwoSampleBootstrap diagnostics are not available: run() has not been called on this instance.");
        }
      }

      template<class EngineMaker>
      Result run_core_(const std::vector<Decimal>& xs,
                       const std::vector<Decimal>& ys,
                       Reducer&                    reducer,
                       EngineMaker&&               make_engine,
                       std::ostream*               os) const
      {
        const std::size_t nx = xs.size();
        const std::size_t ny = ys.size();
        if (nx == 0 || ny == 0) {
          m_diagValid = false;
          throw DegenerateSampleException("TwoSampleBootstrap: both samples must be non-empty");
        }

        const Decimal estimate = reducer(xs, ys);

        std::vector<double> thetas;
        thetas.reserve(m_B);
        std::size_t skipped = 0;

        std::vector<Decimal> rx;
        std::vector<Decimal> ry;
        for (std::size_t b = 0; b < m_B; ++b) {
          auto rng_b = make_engine(b);
          m_resampler(xs, rx, nx, rng_b);
          m_resampler(ys, ry, ny, rng_b);

          const double v = static_cast<double>(reducer(rx, ry));
          if (std::isnan(v))
            ++skipped;
          else
            thetas.push_back(v);
        }

        if (thetas.empty()) {
          m_diagValid = false;
          throw DegenerateBootstrapException(
            "TwoSampleBootstrap: all " + std::to_string(m_B) + " replicates are NaN");
        }

        const std::size_t m = thetas.size();

        // Moments are taken over the finite replicates; ±inf only enters the quantiles.
        std::vector<double> finite;
        finite.reserve(m);
        std::copy_if(thetas.begin(), thetas.end(), std::back_inserter(finite),
                     [](double v) { return std::isfinite(v); });

        const SampleMoments<double> moments(finite);
        const double mean_boot = finite.empty()
          ? std::numeric_limits<double>::quiet_NaN()
          : moments.getMean();
        const double var_boot = (finite.size() > 1) ? moments.getVariance() : 0.0;
        const double se_boot  = std::sqrt(var_boot);

        const auto   tails = twoTailedQuantile(m_coverage);
        const double lb    = empiricalQuantile(thetas, tails.first);
        const double ub    = empiricalQuantile(thetas, tails.second);

        if (os) {
          (*os) << "[TwoSampleBootstrap] B=" << m_B
                << " effective_B=" << m
                << " skipped=" << skipped
                << " tails=(" << tails.first << ", " << tails.second << ")"
                << " lower=" << lb
                << " upper=" << ub
                << " se_boot=" << se_boot
                << std::endl;
        }

        m_diagBootstrapStats = thetas;
        m_diagMeanBoot       = mean_boot;
        m_diagVarBoot        = var_boot;
        m_diagSeBoot         = se_boot;
        m_diagValid          = true;

        return Result{
          /*estimate    =*/ estimate,
          /*interval    =*/ ConfidenceInterval<Decimal>(Decimal(lb), Decimal(ub), m_coverage, m_B),
          /*effective_B =*/ m,
          /*skipped     =*/ skipped,
          /*nx          =*/ nx,
          /*ny          =*/ ny,
          /*se_boot     =*/ se_boot
        };
      }

    private:
      std::size_t m_B;
      double      m_coverage;
      Resampler   m_resampler;

      // Diagnostics from most recent run(...)
      mutable std::vector<double> m_diagBootstrapStats;
      mutable double              m_diagMeanBoot;
      mutable double              m_diagVarBoot;
      mutable double              m_diagSeBoot;
      mutable bool                m_diagValid;
    };

    /**
     * @brief Bootstrap percentile interval for reducer(xs, ys) with a caller-supplied engine.
     *
     * Coverage and resampleCount are validated before any resampling.
     */
    template <class Decimal,
              class Reducer,
              class Rng,
              class = std::enable_if_t<!std::is_arithmetic<Rng>::value>>
    ConfidenceInterval<Decimal>
    buildBootstrapInterval(const std::vector<Decimal>& xs,
                           const std::vector<Decimal>& ys,
                           Reducer                     reducer,
                           Rng&                        rng,
                           std::size_t                 resampleCount = EffectSizeConfiguration::kDefaultResampleCount,
                           double                      coverage      = EffectSizeConfiguration::kDefaultCoverage)
    {
      TwoSampleBootstrap<Decimal, Reducer, resampling::IIDResampler<Decimal, Rng>, Rng>
        bootstrap(resampleCount, coverage);
      return bootstrap.run(xs, ys, reducer, rng).interval;
    }

    /**
     * @brief Same as above with a freshly auto-seeded randutils engine.
     *
     * Repeated calls give different, statistically consistent bounds.
     */
    template <class Decimal, class Reducer>
    ConfidenceInterval<Decimal>
    buildBootstrapInterval(const std::vector<Decimal>& xs,
                           const std::vector<Decimal>& ys,
                           Reducer                     reducer,
                           std::size_t                 resampleCount = EffectSizeConfiguration::kDefaultResampleCount,
                           double                      coverage      = EffectSizeConfiguration::kDefaultCoverage)
    {
      randutils::mt19937_rng rng;
      return buildBootstrapInterval(xs, ys, reducer, rng, resampleCount, coverage);
    }

  } // namespace analysis
} // namespace effectsizes
