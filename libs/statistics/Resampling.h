// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, December 2024
//

#pragma once

#include <vector>
#include <cstddef>

#include "randutils.hpp"
#include "RngUtils.h"
#include "StatisticsException.h"

namespace effectsizes
{
  namespace resampling
  {
    /**
     * @struct IIDResampler
     * @brief Classic i.i.d. bootstrap resampler.
     *
     * Draws each output element independently and uniformly, with
     * replacement, from the input sample. Elements may repeat and the
     * relative order of the input carries no meaning in the output.
     *
     * The only side effect is consuming entropy from the supplied engine.
     *
     * @tparam Decimal Element type of the sample.
     * @tparam Rng     Random engine. Either a randutils wrapper (the default)
     *                 or a bare standard engine such as std::mt19937_64.
     */
    template <class Decimal, class Rng = randutils::mt19937_rng>
    struct IIDResampler
    {
      /**
       * @brief Resample x to a new vector of the same length.
       * @throws DegenerateSampleException if x is empty.
       */
      std::vector<Decimal>
      operator()(const std::vector<Decimal>& x, Rng& rng) const
      {
	std::vector<Decimal> y;
	(*this)(x, y, x.size(), rng);
	return y;
      }

      /**
       * @brief Fill y with m draws from x, reusing y's storage.
       * @throws DegenerateSampleException if x is empty.
       */
      template <class Engine>
      void operator()(const std::vector<Decimal>& x,
		      std::vector<Decimal>&       y,
		      std::size_t                 m,
		      Engine&                     rng) const
      {
	if (x.empty())
	  {
	    throw DegenerateSampleException("IIDResampler: empty sample.");
	  }

	y.resize(m);
	for (std::size_t j = 0; j < m; ++j)
	  {
	    y[j] = x[rng_utils::get_random_index(rng, x.size())];
	  }
      }
    };
  } // namespace resampling
} // namespace effectsizes
