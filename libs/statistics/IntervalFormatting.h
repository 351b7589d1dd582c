#pragma once

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

#include "ConfidenceInterval.h"
#include "EffectSize.h"

namespace effectsizes
{
  namespace analysis
  {
    /**
     * @brief Round value to precision decimal places for display.
     *
     * Non-finite values pass through unchanged.
     * @throws std::invalid_argument if precision is negative.
     */
    inline double roundForDisplay(double value, int precision)
    {
      if (precision < 0)
	throw std::invalid_argument("roundForDisplay: precision must be non-negative");

      if (!std::isfinite(value))
	return value;

      const double scale = std::pow(10.0, precision);
      return std::round(value * scale) / scale;
    }

    // "0.95CI (lower, upper)"
    template <class Decimal>
    std::string formatInterval(const ConfidenceInterval<Decimal>& ci, int precision)
    {
      std::ostringstream os;
      os.precision(15);
      os << ci.getCoverage() << "CI ("
	 << roundForDisplay(static_cast<double>(ci.getLowerBound()), precision) << ", "
	 << roundForDisplay(static_cast<double>(ci.getUpperBound()), precision) << ")";
      return os.str();
    }

    // "effectSize, 0.95CI (lower, upper)"
    template <class Decimal>
    std::string formatEffectSize(const EffectSizeResult<Decimal>& result, int precision)
    {
      std::ostringstream os;
      os.precision(15);
      os << roundForDisplay(static_cast<double>(result.getEffectSize()), precision) << ", "
	 << formatInterval(result.getConfidenceInterval(), precision);
      return os.str();
    }
  } // namespace analysis
} // namespace effectsizes
