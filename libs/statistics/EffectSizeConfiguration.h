#pragma once

#include <cstddef>

namespace EffectSizeConfiguration
{
  // Interval construction defaults
  constexpr double      kDefaultCoverage      = 0.95;  ///< Two-sided coverage used when the caller gives none
  constexpr std::size_t kDefaultResampleCount = 1000;  ///< Bootstrap replicates B
  constexpr std::size_t kMinResampleCount     = 2;     ///< A single resample cannot define a distribution

  // Small-sample bias correction J(n) = ((n - 3) / (n - 2.25)) * sqrt((n - 2) / n)
  constexpr double kCorrectionNumeratorOffset   = 3.0;
  constexpr double kCorrectionDenominatorOffset = 2.25;

  // Conventional effect-size magnitude thresholds (Cohen, 1988)
  constexpr double kSmallEffectThreshold  = 0.2;
  constexpr double kMediumEffectThreshold = 0.5;
  constexpr double kLargeEffectThreshold  = 0.8;
} // namespace EffectSizeConfiguration
