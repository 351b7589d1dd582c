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

#include "ConfidenceInterval.h"
#include "NormalQuantile.h"
#include "QuantileUtils.h"
#include "StatisticsException.h"

namespace effectsizes
{
  namespace analysis
  {
    /**
     * @brief Large-sample variance of a standardized mean difference.
     *
     *   σ² = (nx + ny) / (nx · ny) + es² / (2 (nx + ny))
     *
     * @throws DegenerateSampleException if either sample size is zero.
     */
    inline double computeNormalApproximationVariance(std::size_t nx,
						      std::size_t ny,
						      double      estimate)
    {
      if (nx == 0 || ny == 0)
	throw DegenerateSampleException("normal approximation: both samples must be non-empty");

      const double n  = static_cast<double>(nx + ny);
      const double nn = static_cast<double>(nx) * static_cast<double>(ny);
      return n / nn + (estimate * estimate) / (2.0 * n);
    }

    /**
     * @brief Analytic confidence interval for an effect size.
     *
     * CI construction:
     *   1) σ² from computeNormalApproximationVariance(nx, ny, es)
     *   2) (lowTail, highTail) = twoTailedQuantile(coverage)
     *   3) z = Φ⁻¹(highTail)
     *   4) CI = [ es - z·σ , es + z·σ ]
     *
     * Closed form and deterministic. Coverage 0 yields a zero-width interval
     * at the estimate; coverage 1 yields (-inf, +inf).
     *
     * @param xs       First sample (only its size is used)
     * @param ys       Second sample (only its size is used)
     * @param estimate Precomputed effect size
     * @param coverage Two-sided coverage in [0, 1]
     * @param os       Optional diagnostic stream
     *
     * @throws InvalidCoverageException  if coverage is outside [0, 1]
     * @throws DegenerateSampleException if a sample is empty or the estimate is not finite
     */
    template <class Decimal>
    ConfidenceInterval<Decimal>
    buildNormalInterval(const std::vector<Decimal>& xs,
			const std::vector<Decimal>& ys,
			const Decimal&              estimate,
			double                      coverage,
			std::ostream*               os = nullptr)
    {
      validateCoverage(coverage);

      const double es = static_cast<double>(estimate);
      if (!std::isfinite(es))
	throw DegenerateSampleException("buildNormalInterval: effect size estimate is not finite");

      const double variance = computeNormalApproximationVariance(xs.size(), ys.size(), es);
      const auto   tails    = twoTailedQuantile(coverage);
      const double z        = detail::upper_critical_value(tails.second);
      const double margin   = (z == 0.0) ? 0.0 : z * std::sqrt(variance);

      if (os)
	{
	  (*os) << "[NormalInterval] nx=" << xs.size()
		<< " ny=" << ys.size()
		<< " es=" << es
		<< " var=" << variance
		<< " z=" << z
		<< " margin=" << margin
		<< std::endl;
	}

      return ConfidenceInterval<Decimal>(Decimal(es - margin),
					 Decimal(es + margin),
					 coverage);
    }
  } // namespace analysis
} // namespace effectsizes
