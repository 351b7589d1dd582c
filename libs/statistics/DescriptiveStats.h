// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, December 2024
//

#ifndef __EFFECTSIZES_DESCRIPTIVE_STATS_H
#define __EFFECTSIZES_DESCRIPTIVE_STATS_H 1

#include <vector>
#include <cmath>
#include <cstddef>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>

#include "StatisticsException.h"

namespace effectsizes
{
  namespace analysis
  {
    /**
     * @class SampleMoments
     * @brief Count, mean and unbiased variance of one sample in a single pass.
     *
     * Built on Boost.Accumulators. The accumulator's variance is the
     * population (divide-by-n) moment; getVariance() rescales it by
     * n / (n - 1) to the unbiased sample variance used throughout the
     * effect-size formulas.
     *
     * @tparam Decimal Element type (converted to double for accumulation)
     */
    template <class Decimal>
    class SampleMoments
    {
    private:
      using AccumulatorType = boost::accumulators::accumulator_set<
	double,
	boost::accumulators::stats<
	  boost::accumulators::tag::count,
	  boost::accumulators::tag::mean,
	  boost::accumulators::tag::variance
	  >
	>;

    public:
      explicit SampleMoments(const std::vector<Decimal>& data)
	: m_accumulator()
      {
	for (const auto& v : data)
	  m_accumulator(static_cast<double>(v));
      }

      std::size_t getCount() const
      {
	return boost::accumulators::count(m_accumulator);
      }

      /**
       * @throws DegenerateSampleException if the sample is empty.
       */
      double getMean() const
      {
	if (getCount() == 0)
	  throw DegenerateSampleException("SampleMoments: mean of an empty sample");

	return boost::accumulators::mean(m_accumulator);
      }

      /**
       * @brief Unbiased (n - 1) sample variance.
       * @throws DegenerateSampleException if fewer than two values were seen.
       */
      double getVariance() const
      {
	const std::size_t n = getCount();
	if (n < 2)
	  throw DegenerateSampleException("SampleMoments: variance needs at least two values");

	const double populationVariance = boost::accumulators::variance(m_accumulator);
	return populationVariance * static_cast<double>(n) / static_cast<double>(n - 1);
      }

      double getStdDev() const
      {
	return std::sqrt(getVariance());
      }

    private:
      AccumulatorType m_accumulator;
    };

    template <class Decimal>
    inline double computeMean(const std::vector<Decimal>& data)
    {
      return SampleMoments<Decimal>(data).getMean();
    }

    template <class Decimal>
    inline double computeVariance(const std::vector<Decimal>& data)
    {
      return SampleMoments<Decimal>(data).getVariance();
    }

    template <class Decimal>
    inline double computeStdDev(const std::vector<Decimal>& data)
    {
      return SampleMoments<Decimal>(data).getStdDev();
    }
  } // namespace analysis
} // namespace effectsizes

#endif // __EFFECTSIZES_DESCRIPTIVE_STATS_H
