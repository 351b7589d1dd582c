// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, December 2024
//

#pragma once

#include <vector>
#include <cmath>
#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>

#include "ConfidenceInterval.h"
#include "DescriptiveStats.h"
#include "EffectSizeConfiguration.h"
#include "NormalApproximationInterval.h"
#include "QuantileUtils.h"
#include "Resampling.h"
#include "StatisticsException.h"
#include "TwoSampleBootstrap.h"

namespace effectsizes
{
  namespace analysis
  {
    /**
     * @brief The supported standardized mean differences.
     *
     * COHEN_D:     pooled SD with n - 2 degrees of freedom, bias corrected
     * HEDGE_G:     pooled SD over n, bias corrected
     * GLASS_DELTA: control-group SD only, no correction
     */
    enum class EffectSizeKind
    {
      COHEN_D,
      HEDGE_G,
      GLASS_DELTA
    };

    inline const char* kindName(EffectSizeKind kind)
    {
      switch (kind)
	{
	case EffectSizeKind::COHEN_D:
	  return "Cohen's d";
	case EffectSizeKind::HEDGE_G:
	  return "Hedge's g";
	case EffectSizeKind::GLASS_DELTA:
	  return "Glass's delta";
	}
      return "unknown";
    }

    /**
     * @brief Conventional magnitude descriptor for |value|.
     *
     *   |es| < 0.2  negligible
     *   |es| < 0.5  small
     *   |es| < 0.8  medium
     *   otherwise   large
     */
    inline const char* magnitudeLabel(double value)
    {
      const double a = std::fabs(value);
      if (a < EffectSizeConfiguration::kSmallEffectThreshold)
	return "negligible";
      if (a < EffectSizeConfiguration::kMediumEffectThreshold)
	return "small";
      if (a < EffectSizeConfiguration::kLargeEffectThreshold)
	return "medium";
      return "large";
    }

    /**
     * @brief Small-sample bias correction J(n) = ((n - 3) / (n - 2.25)) · √((n - 2) / n).
     *
     * @param n Combined sample size nx + ny.
     * @throws DegenerateSampleException if n <= 1.
     */
    inline double smallSampleCorrection(std::size_t n)
    {
      if (n <= 1)
	throw DegenerateSampleException(
	  "smallSampleCorrection: combined sample size must be > 1, got " + std::to_string(n));

      const double nd = static_cast<double>(n);
      return ((nd - EffectSizeConfiguration::kCorrectionNumeratorOffset) /
	      (nd - EffectSizeConfiguration::kCorrectionDenominatorOffset)) *
	std::sqrt((nd - 2.0) / nd);
    }

    namespace detail
    {
      template <class Decimal>
      inline void requireAtLeast(const std::vector<Decimal>& sample,
				 std::size_t                 minSize,
				 const char*                 who)
      {
	if (sample.size() < minSize)
	  {
	    throw DegenerateSampleException(
	      std::string(who) + ": sample needs at least " + std::to_string(minSize)
	      + " observations, got " + std::to_string(sample.size()));
	  }
      }

      // Sum of squared deviations of both samples, (nx-1)·var(xs) + (ny-1)·var(ys)
      template <class Decimal>
      inline double pooledSumOfSquares(const SampleMoments<Decimal>& mx,
				       const SampleMoments<Decimal>& my)
      {
	return static_cast<double>(mx.getCount() - 1) * mx.getVariance() +
	  static_cast<double>(my.getCount() - 1) * my.getVariance();
      }
    } // namespace detail

    /**
     * @brief √(((nx-1)·var(xs) + (ny-1)·var(ys)) / (nx + ny - 2))
     * @throws DegenerateSampleException if either sample has fewer than 2 values.
     */
    template <class Decimal>
    double pooledStdDevCohen(const std::vector<Decimal>& xs, const std::vector<Decimal>& ys)
    {
      detail::requireAtLeast(xs, 2, "pooledStdDevCohen");
      detail::requireAtLeast(ys, 2, "pooledStdDevCohen");

      const SampleMoments<Decimal> mx(xs);
      const SampleMoments<Decimal> my(ys);
      const double dof = static_cast<double>(xs.size() + ys.size() - 2);
      return std::sqrt(detail::pooledSumOfSquares(mx, my) / dof);
    }

    /**
     * @brief √(((nx-1)·var(xs) + (ny-1)·var(ys)) / (nx + ny))
     * @throws DegenerateSampleException if either sample has fewer than 2 values.
     */
    template <class Decimal>
    double pooledStdDevHedge(const std::vector<Decimal>& xs, const std::vector<Decimal>& ys)
    {
      detail::requireAtLeast(xs, 2, "pooledStdDevHedge");
      detail::requireAtLeast(ys, 2, "pooledStdDevHedge");

      const SampleMoments<Decimal> mx(xs);
      const SampleMoments<Decimal> my(ys);
      const double n = static_cast<double>(xs.size() + ys.size());
      return std::sqrt(detail::pooledSumOfSquares(mx, my) / n);
    }

    /**
     * @brief Cohen's d = (mean(xs) - mean(ys)) / s_pooled · J(nx + ny).
     *
     * Positive when xs has the larger mean. Zero pooled spread gives ±inf,
     * or NaN when the means also agree; the bootstrap keeps the infinities
     * and skips NaN replicates.
     */
    template <class Decimal>
    Decimal cohenD(const std::vector<Decimal>& xs, const std::vector<Decimal>& ys)
    {
      const double s = pooledStdDevCohen(xs, ys);
      const double diff = computeMean(xs) - computeMean(ys);
      return Decimal((diff / s) * smallSampleCorrection(xs.size() + ys.size()));
    }

    /**
     * @brief Hedge's g: as Cohen's d with the pooled SD taken over nx + ny.
     */
    template <class Decimal>
    Decimal hedgeG(const std::vector<Decimal>& xs, const std::vector<Decimal>& ys)
    {
      const double s = pooledStdDevHedge(xs, ys);
      const double diff = computeMean(xs) - computeMean(ys);
      return Decimal((diff / s) * smallSampleCorrection(xs.size() + ys.size()));
    }

    /**
     * @brief Glass's Δ = (mean(treatment) - mean(control)) / sd(control).
     *
     * Preferred when the two groups' spreads differ substantially.
     * @throws DegenerateSampleException if treatment is empty or control has fewer than 2 values.
     */
    template <class Decimal>
    Decimal glassDelta(const std::vector<Decimal>& treatment, const std::vector<Decimal>& control)
    {
      detail::requireAtLeast(treatment, 1, "glassDelta");
      detail::requireAtLeast(control, 2, "glassDelta");

      const SampleMoments<Decimal> mc(control);
      return Decimal((computeMean(treatment) - mc.getMean()) / mc.getStdDev());
    }

    template <class Decimal>
    using EffectSizeReducer = Decimal (*)(const std::vector<Decimal>&, const std::vector<Decimal>&);

    // Point-estimate function for kind; also the bootstrap reducer.
    template <class Decimal>
    EffectSizeReducer<Decimal> reducerFor(EffectSizeKind kind)
    {
      switch (kind)
	{
	case EffectSizeKind::COHEN_D:
	  return &cohenD<Decimal>;
	case EffectSizeKind::HEDGE_G:
	  return &hedgeG<Decimal>;
	case EffectSizeKind::GLASS_DELTA:
	  return &glassDelta<Decimal>;
	}
      throw std::invalid_argument("reducerFor: unknown effect size kind");
    }

    /**
     * @class EffectSizeResult
     * @brief A point estimate together with the confidence interval built for it.
     *
     * The interval is held by value and lives exactly as long as the result.
     */
    template <class Decimal>
    class EffectSizeResult
    {
    public:
      EffectSizeResult(EffectSizeKind kind,
		       const Decimal& effectSize,
		       const ConfidenceInterval<Decimal>& interval)
	: m_kind(kind),
	  m_effectSize(effectSize),
	  m_interval(interval)
      {}

      EffectSizeKind getKind() const
      {
	return m_kind;
      }

      const Decimal& getEffectSize() const
      {
	return m_effectSize;
      }

      const ConfidenceInterval<Decimal>& getConfidenceInterval() const
      {
	return m_interval;
      }

      double getCoverage() const
      {
	return m_interval.getCoverage();
      }

      const char* getMagnitude() const
      {
	return magnitudeLabel(static_cast<double>(m_effectSize));
      }

      bool operator==(const EffectSizeResult& rhs) const
      {
	return (m_kind == rhs.m_kind) &&
	  (m_effectSize == rhs.m_effectSize) &&
	  (m_interval == rhs.m_interval);
      }

      bool operator!=(const EffectSizeResult& rhs) const
      {
	return !(*this == rhs);
      }

    private:
      EffectSizeKind              m_kind;
      Decimal                     m_effectSize;
      ConfidenceInterval<Decimal> m_interval;
    };

    template <class Decimal>
    inline Decimal effectSize(const EffectSizeResult<Decimal>& result)
    {
      return result.getEffectSize();
    }

    template <class Decimal>
    inline const ConfidenceInterval<Decimal>& confint(const EffectSizeResult<Decimal>& result)
    {
      return result.getConfidenceInterval();
    }

    /**
     * @brief Effect size with a normal-approximation interval.
     *
     * @throws InvalidCoverageException  before any computation if coverage is outside [0, 1]
     * @throws DegenerateSampleException if the samples are too small for kind
     */
    template <class Decimal>
    EffectSizeResult<Decimal>
    computeEffectSize(EffectSizeKind              kind,
		      const std::vector<Decimal>& xs,
		      const std::vector<Decimal>& ys,
		      double                      coverage = EffectSizeConfiguration::kDefaultCoverage,
		      std::ostream*               os = nullptr)
    {
      validateCoverage(coverage);

      const Decimal es = reducerFor<Decimal>(kind)(xs, ys);
      return EffectSizeResult<Decimal>(kind, es, buildNormalInterval(xs, ys, es, coverage, os));
    }

    /**
     * @brief Effect size with a bootstrap percentile interval of resampleCount replicates.
     *
     * The point estimate is the reducer on the original samples; the interval
     * comes from the same reducer applied to resamples drawn with @p rng.
     *
     * @throws InvalidCoverageException     if coverage is outside [0, 1]
     * @throws InvalidResampleCountException if resampleCount <= 1
     * @throws DegenerateSampleException    if the samples are too small for kind
     * @throws DegenerateBootstrapException if every replicate is NaN
     */
    template <class Decimal, class Rng>
    EffectSizeResult<Decimal>
    computeEffectSize(EffectSizeKind              kind,
		      const std::vector<Decimal>& xs,
		      const std::vector<Decimal>& ys,
		      Rng&                        rng,
		      std::size_t                 resampleCount,
		      double                      coverage = EffectSizeConfiguration::kDefaultCoverage,
		      std::ostream*               os = nullptr)
    {
      using Bootstrap = TwoSampleBootstrap<Decimal,
					   EffectSizeReducer<Decimal>,
					   resampling::IIDResampler<Decimal, Rng>,
					   Rng>;

      const Bootstrap bootstrap(resampleCount, coverage);
      const auto result = bootstrap.run(xs, ys, reducerFor<Decimal>(kind), rng, os);
      return EffectSizeResult<Decimal>(kind, result.estimate, result.interval);
    }

    template <class Decimal>
    EffectSizeResult<Decimal>
    makeCohenD(const std::vector<Decimal>& xs,
	       const std::vector<Decimal>& ys,
	       double coverage = EffectSizeConfiguration::kDefaultCoverage)
    {
      return computeEffectSize(EffectSizeKind::COHEN_D, xs, ys, coverage);
    }

    template <class Decimal, class Rng>
    EffectSizeResult<Decimal>
    makeCohenD(const std::vector<Decimal>& xs,
	       const std::vector<Decimal>& ys,
	       Rng& rng,
	       std::size_t resampleCount,
	       double coverage = EffectSizeConfiguration::kDefaultCoverage)
    {
      return computeEffectSize(EffectSizeKind::COHEN_D, xs, ys, rng, resampleCount, coverage);
    }

    template <class Decimal>
    EffectSizeResult<Decimal>
    makeHedgeG(const std::vector<Decimal>& xs,
	       const std::vector<Decimal>& ys,
	       double coverage = EffectSizeConfiguration::kDefaultCoverage)
    {
      return computeEffectSize(EffectSizeKind::HEDGE_G, xs, ys, coverage);
    }

    template <class Decimal, class Rng>
    EffectSizeResult<Decimal>
    makeHedgeG(const std::vector<Decimal>& xs,
	       const std::vector<Decimal>& ys,
	       Rng& rng,
	       std::size_t resampleCount,
	       double coverage = EffectSizeConfiguration::kDefaultCoverage)
    {
      return computeEffectSize(EffectSizeKind::HEDGE_G, xs, ys, rng, resampleCount, coverage);
    }

    template <class Decimal>
    EffectSizeResult<Decimal>
    makeGlassDelta(const std::vector<Decimal>& treatment,
		   const std::vector<Decimal>& control,
		   double coverage = EffectSizeConfiguration::kDefaultCoverage)
    {
      return computeEffectSize(EffectSizeKind::GLASS_DELTA, treatment, control, coverage);
    }

    template <class Decimal, class Rng>
    EffectSizeResult<Decimal>
    makeGlassDelta(const std::vector<Decimal>& treatment,
		   const std::vector<Decimal>& control,
		   Rng& rng,
		   std::size_t resampleCount,
		   double coverage = EffectSizeConfiguration::kDefaultCoverage)
    {
      return computeEffectSize(EffectSizeKind::GLASS_DELTA, treatment, control, rng, resampleCount, coverage);
    }
  } // namespace analysis
} // namespace effectsizes
