// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, December 2024
//

#ifndef __EFFECTSIZES_STATISTICS_EXCEPTION_H
#define __EFFECTSIZES_STATISTICS_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace effectsizes
{
  // Base for input validation failures. Derives from std::domain_error so
  // callers can treat every rejected input uniformly.
  class EffectSizeDomainException : public std::domain_error
  {
  public:
    explicit EffectSizeDomainException(const std::string& msg)
      : std::domain_error(msg)
    {}

    virtual ~EffectSizeDomainException() = default;
  };

  // Coverage level outside [0, 1]
  class InvalidCoverageException : public EffectSizeDomainException
  {
  public:
    explicit InvalidCoverageException(const std::string& msg)
      : EffectSizeDomainException(msg)
    {}
  };

  // Bootstrap resample count <= 1
  class InvalidResampleCountException : public EffectSizeDomainException
  {
  public:
    explicit InvalidResampleCountException(const std::string& msg)
      : EffectSizeDomainException(msg)
    {}
  };

  // Sample too small for the requested resampling or variance estimate
  class DegenerateSampleException : public EffectSizeDomainException
  {
  public:
    explicit DegenerateSampleException(const std::string& msg)
      : EffectSizeDomainException(msg)
    {}
  };

  /**
   * @brief Raised when a confidence interval is constructed with lower > upper.
   *
   * This is never an input condition the caller can recover from; it signals
   * an inconsistent reducer or a bug in an interval builder.
   */
  class InvertedBoundsException : public std::logic_error
  {
  public:
    explicit InvertedBoundsException(const std::string& msg)
      : std::logic_error(msg)
    {}
  };

  // No orderable (non-NaN) bootstrap replicate to form an empirical distribution
  class DegenerateBootstrapException : public std::runtime_error
  {
  public:
    explicit DegenerateBootstrapException(const std::string& msg)
      : std::runtime_error(msg)
    {}
  };

} // namespace effectsizes

#endif // __EFFECTSIZES_STATISTICS_EXCEPTION_H
