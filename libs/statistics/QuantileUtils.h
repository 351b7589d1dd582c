#pragma once

#include <vector>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

#include "StatisticsException.h"

namespace effectsizes
{
  namespace analysis
  {
    /**
     * @brief Throws InvalidCoverageException unless 0 <= coverage <= 1.
     *
     * Every interval builder calls this before doing any work. NaN is
     * rejected because both comparisons fail.
     */
    inline void validateCoverage(double coverage)
    {
      if (!(coverage >= 0.0 && coverage <= 1.0))
      {
        throw InvalidCoverageException(
          "coverage must be in [0, 1], got " + std::to_string(coverage));
      }
    }

    /**
     * @brief Splits a central coverage level into the two tail quantiles.
     *
     *   low  = (1 - c) / 2
     *   high = 1 - low
     *
     * so that low + high == 1 exactly in floating point and high - low == c
     * up to rounding. For c = 0.95 the tails are
     * (0.025, 0.975): the percentile cut points of a two-sided interval.
     *
     * @throws InvalidCoverageException if c is outside [0, 1].
     */
    inline std::pair<double, double> twoTailedQuantile(double coverage)
    {
      validateCoverage(coverage);

      const double low  = (1.0 - coverage) / 2.0;
      const double high = 1.0 - low;
      return { low, high };
    }

    /**
     * @brief Hyndman–Fan type-7 empirical quantile (linear interpolation).
     *
     * With the values sorted as x(1) <= ... <= x(n), let h = (n - 1) p. The
     * result is x(⌊h⌋+1) + (h - ⌊h⌋) (x(⌊h⌋+2) - x(⌊h⌋+1)). Selection uses two
     * nth_element passes on the by-value copy instead of a full sort.
     *
     * p <= 0 returns the minimum and p >= 1 the maximum. Infinite values are
     * ordered like any other: equal neighbours return that value, and an
     * infinite neighbour dominates the interpolation. Between -inf and +inf
     * the nearer order statistic is returned.
     *
     * @throws DegenerateSampleException if values is empty.
     * @throws std::domain_error if p is NaN.
     */
    inline double empiricalQuantile(std::vector<double> values, double p)
    {
      if (values.empty())
        throw DegenerateSampleException("empiricalQuantile: empty input");
      if (std::isnan(p))
        throw std::domain_error("empiricalQuantile: quantile probability is NaN");

      if (p <= 0.0)
        return *std::min_element(values.begin(), values.end());
      if (p >= 1.0)
        return *std::max_element(values.begin(), values.end());

      const double      h  = (static_cast<double>(values.size()) - 1.0) * p;
      const std::size_t lo = static_cast<std::size_t>(std::floor(h));
      const double      frac = h - static_cast<double>(lo);

      std::nth_element(values.begin(),
                       values.begin() + static_cast<std::ptrdiff_t>(lo),
                       values.end());
      const double xlo = values[lo];

      if (frac == 0.0 || lo + 1 >= values.size())
        return xlo;

      // Everything after position lo is >= xlo, so the next order statistic
      // is the minimum of that tail.
      const double xhi = *std::min_element(values.begin() + static_cast<std::ptrdiff_t>(lo + 1),
                                           values.end());
      if (xlo == xhi)
        return xlo;

      if (std::isinf(xlo) || std::isinf(xhi))
      {
        if (std::isinf(xlo) && std::isinf(xhi))
          return (frac < 0.5) ? xlo : xhi;
        return std::isinf(xlo) ? xlo : xhi;
      }

      return xlo + (xhi - xlo) * frac;
    }
  } // namespace analysis
} // namespace effectsizes
