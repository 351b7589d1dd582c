// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, December 2024
//

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "QuantileUtils.h"
#include "StatisticsException.h"

namespace effectsizes
{
  namespace analysis
  {
    /**
     * @brief How a confidence interval was constructed.
     *
     * NORMAL_APPROXIMATION: closed-form interval from the normal approximation
     *                       of the effect-size sampling variance
     * BOOTSTRAP_PERCENTILE: empirical percentile interval from B resamples
     */
    enum class IntervalMethod
    {
      NORMAL_APPROXIMATION,
      BOOTSTRAP_PERCENTILE
    };

    inline const char* methodName(IntervalMethod method)
    {
      switch (method)
	{
	case IntervalMethod::NORMAL_APPROXIMATION:
	  return "normal";
	case IntervalMethod::BOOTSTRAP_PERCENTILE:
	  return "bootstrap";
	}
      return "unknown";
    }

    /**
     * @class ConfidenceInterval
     * @brief Immutable [lower, upper] band around a point estimate at a stated coverage.
     *
     * One record type serves both construction methods; getMethod() is the
     * discriminator and only the bootstrap variant carries a resample count.
     *
     * Invariants, checked at construction in this order:
     *   - 0 <= coverage <= 1               (InvalidCoverageException)
     *   - lower <= upper, neither NaN       (InvertedBoundsException)
     *   - resampleCount > 1 for bootstrap   (InvalidResampleCountException)
     *
     * @tparam Decimal Numeric type of the bounds.
     */
    template <class Decimal>
    class ConfidenceInterval
    {
    public:
      /**
       * @brief Analytic (normal-approximation) interval.
       */
      ConfidenceInterval(const Decimal& lower, const Decimal& upper, double coverage)
	: m_lower(lower),
	  m_upper(upper),
	  m_coverage(coverage),
	  m_method(IntervalMethod::NORMAL_APPROXIMATION),
	  m_resampleCount(0)
      {
	validateCoverage(coverage);
	validateBounds(lower, upper);
      }

      /**
       * @brief Bootstrap percentile interval built from resampleCount replicates.
       */
      ConfidenceInterval(const Decimal& lower,
			 const Decimal& upper,
			 double coverage,
			 std::size_t resampleCount)
	: m_lower(lower),
	  m_upper(upper),
	  m_coverage(coverage),
	  m_method(IntervalMethod::BOOTSTRAP_PERCENTILE),
	  m_resampleCount(resampleCount)
      {
	validateCoverage(coverage);
	validateBounds(lower, upper);
	if (resampleCount <= 1)
	  {
	    throw InvalidResampleCountException(
	      "ConfidenceInterval: resample count must be > 1, got "
	      + std::to_string(resampleCount));
	  }
      }

      const Decimal& getLowerBound() const
      {
	return m_lower;
      }

      const Decimal& getUpperBound() const
      {
	return m_upper;
      }

      std::pair<Decimal, Decimal> getBounds() const
      {
	return { m_lower, m_upper };
      }

      double getCoverage() const
      {
	return m_coverage;
      }

      IntervalMethod getMethod() const
      {
	return m_method;
      }

      bool isBootstrap() const
      {
	return m_method == IntervalMethod::BOOTSTRAP_PERCENTILE;
      }

      /**
       * @throws std::logic_error for an analytic interval.
       */
      std::size_t getResampleCount() const
      {
	if (!isBootstrap())
	  throw std::logic_error("ConfidenceInterval: analytic interval has no resample count");

	return m_resampleCount;
      }

      Decimal getWidth() const
      {
	return m_upper - m_lower;
      }

      bool contains(const Decimal& value) const
      {
	return (m_lower <= value) && (value <= m_upper);
      }

      bool operator==(const ConfidenceInterval& rhs) const
      {
	return (m_lower == rhs.m_lower) &&
	  (m_upper == rhs.m_upper) &&
	  (m_coverage == rhs.m_coverage) &&
	  (m_method == rhs.m_method) &&
	  (m_resampleCount == rhs.m_resampleCount);
      }

      bool operator!=(const ConfidenceInterval& rhs) const
      {
	return !(*this == rhs);
      }

    private:
      static void validateBounds(const Decimal& lower, const Decimal& upper)
      {
	if (!(lower <= upper))
	  {
	    throw InvertedBoundsException(
	      "ConfidenceInterval: lower bound " + std::to_string(static_cast<double>(lower))
	      + " exceeds upper bound " + std::to_string(static_cast<double>(upper)));
	  }
      }

    private:
      Decimal        m_lower;
      Decimal        m_upper;
      double         m_coverage;
      IntervalMethod m_method;
      std::size_t    m_resampleCount;
    };

    template <class Decimal>
    inline Decimal lowerBound(const ConfidenceInterval<Decimal>& ci)
    {
      return ci.getLowerBound();
    }

    template <class Decimal>
    inline Decimal upperBound(const ConfidenceInterval<Decimal>& ci)
    {
      return ci.getUpperBound();
    }

    template <class Decimal>
    inline std::pair<Decimal, Decimal> confint(const ConfidenceInterval<Decimal>& ci)
    {
      return ci.getBounds();
    }

    template <class Decimal>
    inline double coverage(const ConfidenceInterval<Decimal>& ci)
    {
      return ci.getCoverage();
    }

    // Empty for analytic intervals.
    template <class Decimal>
    inline std::optional<std::size_t> resampleCount(const ConfidenceInterval<Decimal>& ci)
    {
      if (!ci.isBootstrap())
	return std::nullopt;

      return ci.getResampleCount();
    }
  } // namespace analysis
} // namespace effectsizes
