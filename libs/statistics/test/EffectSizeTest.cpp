// EffectSizeTest.cpp
//
// Tests for Cohen's d, Hedge's g and Glass's delta, their pooled spreads,
// the small-sample correction, and the combined estimate + interval API.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <random>
#include <sstream>
#include <string>

#include "EffectSize.h"
#include "StatisticsException.h"
#include "randutils.hpp"

using Catch::Approx;
using namespace effectsizes::analysis;
using effectsizes::InvalidCoverageException;
using effectsizes::InvalidResampleCountException;
using effectsizes::DegenerateSampleException;

namespace
{
  const std::vector<double> kXs{1.0, 2.0, 3.0, 4.0, 5.0};
  const std::vector<double> kYs{2.0, 3.0, 4.0, 5.0, 6.0};

  double correction10()
  {
    return (7.0 / 7.75) * std::sqrt(8.0 / 10.0);
  }

  std::vector<double> normalSample(std::size_t n, double mu, double sigma, std::uint64_t seed)
  {
    std::mt19937_64 gen(seed);
    std::normal_distribution<double> dist(mu, sigma);
    std::vector<double> v(n);
    for (auto& x : v)
      x = dist(gen);
    return v;
  }
}

TEST_CASE("smallSampleCorrection: closed form and domain", "[EffectSize][correction]")
{
  REQUIRE(smallSampleCorrection(10) == Approx(correction10()).epsilon(1e-12));
  REQUIRE(smallSampleCorrection(4) == Approx((1.0 / 1.75) * std::sqrt(0.5)).epsilon(1e-12));

  // Tends to one for large samples
  REQUIRE(smallSampleCorrection(100000) == Approx(1.0).margin(1e-4));
  REQUIRE(smallSampleCorrection(50) < 1.0);

  REQUIRE_THROWS_AS(smallSampleCorrection(1), DegenerateSampleException);
  REQUIRE_THROWS_AS(smallSampleCorrection(0), DegenerateSampleException);
}

TEST_CASE("Pooled standard deviations", "[EffectSize][pooled]")
{
  REQUIRE(pooledStdDevCohen(kXs, kYs) == Approx(std::sqrt(2.5)));
  REQUIRE(pooledStdDevHedge(kXs, kYs) == Approx(std::sqrt(2.0)));

  const std::vector<double> one{1.0};
  REQUIRE_THROWS_AS(pooledStdDevCohen(one, kYs), DegenerateSampleException);
  REQUIRE_THROWS_AS(pooledStdDevHedge(kXs, one), DegenerateSampleException);
}

TEST_CASE("Point estimates on a worked example", "[EffectSize][estimate]")
{
  SECTION("Cohen's d")
  {
    const double expected = (-1.0 / std::sqrt(2.5)) * correction10();
    REQUIRE(cohenD(kXs, kYs) == Approx(expected).epsilon(1e-12));
    REQUIRE(cohenD(kXs, kYs) == Approx(-0.5109).margin(1e-3));
  }

  SECTION("Hedge's g")
  {
    const double expected = (-1.0 / std::sqrt(2.0)) * correction10();
    REQUIRE(hedgeG(kXs, kYs) == Approx(expected).epsilon(1e-12));
  }

  SECTION("Glass's delta uses only the control spread")
  {
    const std::vector<double> treatment{4.0, 5.0, 6.0};
    const std::vector<double> control{1.0, 2.0, 3.0};
    REQUIRE(glassDelta(treatment, control) == Approx(3.0));

    // Treatment spread is irrelevant
    const std::vector<double> wide{0.0, 5.0, 10.0};
    REQUIRE(glassDelta(wide, control) == Approx(3.0));

    // A single treatment observation is enough
    REQUIRE(glassDelta(std::vector<double>{2.0}, control) == Approx(0.0).margin(1e-12));
  }
}

TEST_CASE("Effect sizes change sign when the samples swap", "[EffectSize][sign]")
{
  // Means 5 and 3, equal variances
  const std::vector<double> five{4.0, 5.0, 6.0};
  const std::vector<double> three{2.0, 3.0, 4.0};

  REQUIRE(cohenD(five, three) > 0.0);
  REQUIRE(cohenD(three, five) == Approx(-cohenD(five, three)));

  const std::vector<double> hi{4.0, 5.0, 6.0, 7.5};
  const std::vector<double> lo{2.0, 3.0, 4.0, 2.5};

  REQUIRE(cohenD(hi, lo) > 0.0);
  REQUIRE(cohenD(lo, hi) < 0.0);
  REQUIRE(cohenD(lo, hi) == Approx(-cohenD(hi, lo)));
  REQUIRE(hedgeG(lo, hi) == Approx(-hedgeG(hi, lo)));

  // Hedge's pooled SD divides by n, so its magnitude exceeds Cohen's
  REQUIRE(std::fabs(hedgeG(hi, lo)) > std::fabs(cohenD(hi, lo)));
}

TEST_CASE("Effect sizes reject samples that are too small", "[EffectSize][errors]")
{
  const std::vector<double> empty;
  const std::vector<double> one{1.0};
  const std::vector<double> two{1.0, 2.0};

  REQUIRE_THROWS_AS(cohenD(one, two), DegenerateSampleException);
  REQUIRE_THROWS_AS(hedgeG(two, empty), DegenerateSampleException);
  REQUIRE_THROWS_AS(glassDelta(empty, two), DegenerateSampleException);
  REQUIRE_THROWS_AS(glassDelta(two, one), DegenerateSampleException);
}

TEST_CASE("Large samples recover the population effect", "[EffectSize][estimate]")
{
  const auto xs = normalSample(2000, 0.0, 1.0, 101u);
  const auto ys = normalSample(2000, 0.5, 1.0, 202u);

  REQUIRE(cohenD(xs, ys) == Approx(-0.5).margin(0.1));
  REQUIRE(hedgeG(xs, ys) == Approx(-0.5).margin(0.1));
  REQUIRE(glassDelta(xs, ys) == Approx(-0.5).margin(0.1));
}

TEST_CASE("reducerFor and kind names", "[EffectSize][kind]")
{
  REQUIRE(reducerFor<double>(EffectSizeKind::COHEN_D)(kXs, kYs) == cohenD(kXs, kYs));
  REQUIRE(reducerFor<double>(EffectSizeKind::HEDGE_G)(kXs, kYs) == hedgeG(kXs, kYs));
  REQUIRE(reducerFor<double>(EffectSizeKind::GLASS_DELTA)(kXs, kYs) == glassDelta(kXs, kYs));

  REQUIRE(std::strcmp(kindName(EffectSizeKind::COHEN_D), "Cohen's d") == 0);
  REQUIRE(std::strcmp(kindName(EffectSizeKind::HEDGE_G), "Hedge's g") == 0);
  REQUIRE(std::strcmp(kindName(EffectSizeKind::GLASS_DELTA), "Glass's delta") == 0);
}

TEST_CASE("magnitudeLabel thresholds", "[EffectSize][magnitude]")
{
  REQUIRE(std::strcmp(magnitudeLabel(0.1), "negligible") == 0);
  REQUIRE(std::strcmp(magnitudeLabel(-0.3), "small") == 0);
  REQUIRE(std::strcmp(magnitudeLabel(0.2), "small") == 0);
  REQUIRE(std::strcmp(magnitudeLabel(0.6), "medium") == 0);
  REQUIRE(std::strcmp(magnitudeLabel(0.8), "large") == 0);
  REQUIRE(std::strcmp(magnitudeLabel(-1.2), "large") == 0);
}

TEST_CASE("computeEffectSize: normal-approximation interval", "[EffectSize][normal]")
{
  const auto r = computeEffectSize(EffectSizeKind::COHEN_D, kXs, kYs);

  REQUIRE(r.getKind() == EffectSizeKind::COHEN_D);
  REQUIRE(effectSize(r) == cohenD(kXs, kYs));
  REQUIRE(r.getCoverage() == 0.95);
  REQUIRE_FALSE(confint(r).isBootstrap());

  // Interval is es ± 1.96 sqrt(10/25 + es²/20)
  const double es = cohenD(kXs, kYs);
  const double margin = 1.959963984540054 * std::sqrt(0.4 + es * es / 20.0);
  REQUIRE(confint(r).getLowerBound() == Approx(es - margin).margin(1e-8));
  REQUIRE(confint(r).getUpperBound() == Approx(es + margin).margin(1e-8));

  // The raw mean difference over the pooled SD lies inside
  REQUIRE(confint(r).contains(-0.632));
  REQUIRE(std::strcmp(r.getMagnitude(), "medium") == 0);
}

TEST_CASE("computeEffectSize: lower coverage gives a narrower interval", "[EffectSize][normal]")
{
  const auto wide   = makeHedgeG(kXs, kYs, 0.95);
  const auto narrow = makeHedgeG(kXs, kYs, 0.8);

  REQUIRE(narrow.getConfidenceInterval().getLowerBound() > wide.getConfidenceInterval().getLowerBound());
  REQUIRE(narrow.getConfidenceInterval().getUpperBound() < wide.getConfidenceInterval().getUpperBound());
  REQUIRE(narrow.getEffectSize() == wide.getEffectSize());
}

TEST_CASE("computeEffectSize: convenience constructors and equality", "[EffectSize][normal]")
{
  const std::vector<double> treatment{4.0, 5.0, 6.0};
  const std::vector<double> control{1.0, 2.0, 3.0};

  const auto g1 = makeGlassDelta(treatment, control);
  const auto g2 = computeEffectSize(EffectSizeKind::GLASS_DELTA, treatment, control, 0.95);
  REQUIRE(g1 == g2);
  REQUIRE(g1.getEffectSize() == Approx(3.0));

  const auto d = makeCohenD(kXs, kYs);
  REQUIRE(d != makeCohenD(kXs, kYs, 0.9));
  REQUIRE(d == computeEffectSize(EffectSizeKind::COHEN_D, kXs, kYs));
}

TEST_CASE("computeEffectSize: validation order and diagnostics", "[EffectSize][errors]")
{
  const std::vector<double> one{1.0};

  // Coverage is rejected before the samples are inspected
  REQUIRE_THROWS_AS(computeEffectSize(EffectSizeKind::COHEN_D, one, one, 1.1), InvalidCoverageException);
  REQUIRE_THROWS_AS(computeEffectSize(EffectSizeKind::COHEN_D, one, kYs, 0.95), DegenerateSampleException);

  std::ostringstream log;
  (void)computeEffectSize(EffectSizeKind::HEDGE_G, kXs, kYs, 0.9, &log);
  REQUIRE(log.str().find("[NormalInterval]") != std::string::npos);
}

TEST_CASE("computeEffectSize: bootstrap interval", "[EffectSize][bootstrap]")
{
  const auto xs = normalSample(30, 0.5, 1.0, 301u);
  const auto ys = normalSample(30, 0.0, 1.0, 302u);

  SECTION("Estimate is the reducer on the original samples")
  {
    randutils::seed_seq_fe128 seed{1u, 9u, 8u, 4u};
    randutils::mt19937_rng rng(seed);

    const auto r = makeCohenD(xs, ys, rng, 300, 0.9);
    REQUIRE(r.getEffectSize() == cohenD(xs, ys));
    REQUIRE(r.getConfidenceInterval().isBootstrap());
    REQUIRE(r.getConfidenceInterval().getResampleCount() == 300);
    REQUIRE(r.getCoverage() == 0.9);
    REQUIRE(r.getConfidenceInterval().getLowerBound() <= r.getConfidenceInterval().getUpperBound());
  }

  SECTION("Seeded engines reproduce the result")
  {
    randutils::seed_seq_fe128 s1{4u, 4u, 2u, 2u};
    randutils::seed_seq_fe128 s2{4u, 4u, 2u, 2u};
    randutils::mt19937_rng rng1(s1);
    randutils::mt19937_rng rng2(s2);

    REQUIRE(makeHedgeG(xs, ys, rng1, 200) == makeHedgeG(xs, ys, rng2, 200));
  }

  SECTION("Glass's delta with a standard engine")
  {
    std::mt19937_64 rng(55u);
    const auto r = makeGlassDelta(xs, ys, rng, 250, 0.95);
    REQUIRE(r.getKind() == EffectSizeKind::GLASS_DELTA);
    REQUIRE(r.getEffectSize() == glassDelta(xs, ys));
    REQUIRE(r.getConfidenceInterval().getResampleCount() == 250);
  }

  SECTION("Glass's delta keeps infinite replicates from a constant control resample")
  {
    const std::vector<double> treatment{5.0, 6.0, 7.0};
    const std::vector<double> control{1.0, 1.0, 2.0};

    randutils::seed_seq_fe128 seed{3u, 3u, 1u, 2u};
    randutils::mt19937_rng rng(seed);

    // A third of control resamples are constant, so the upper tail is +inf
    const auto r = makeGlassDelta(treatment, control, rng, 1000, 0.95);
    REQUIRE(std::isfinite(r.getEffectSize()));
    REQUIRE(r.getConfidenceInterval().getUpperBound() == std::numeric_limits<double>::infinity());
    REQUIRE(std::isfinite(r.getConfidenceInterval().getLowerBound()));
  }

  SECTION("Minimum-size control sample never fails the bootstrap")
  {
    const std::vector<double> treatment{5.0, 6.0, 7.0};
    const std::vector<double> control{1.0, 2.0};

    for (std::uint32_t s = 0; s < 50; ++s)
      {
	randutils::seed_seq_fe128 seed{s, 11u, 22u, 33u};
	randutils::mt19937_rng rng(seed);

	REQUIRE_NOTHROW(makeGlassDelta(treatment, control, rng, 1000, 0.95));
      }
  }

  SECTION("Invalid parameters")
  {
    randutils::mt19937_rng rng;
    const std::vector<double> empty;

    REQUIRE_THROWS_AS(makeCohenD(xs, ys, rng, 1), InvalidResampleCountException);
    REQUIRE_THROWS_AS(makeCohenD(xs, ys, rng, 0), InvalidResampleCountException);
    REQUIRE_THROWS_AS(makeCohenD(empty, ys, rng, 100, 1.5), InvalidCoverageException);
    REQUIRE_THROWS_AS(makeCohenD(empty, ys, rng, 100), DegenerateSampleException);
  }

  SECTION("Diagnostic stream")
  {
    randutils::mt19937_rng rng;
    std::ostringstream log;
    (void)computeEffectSize(EffectSizeKind::COHEN_D, xs, ys, rng, 100, 0.95, &log);
    REQUIRE(log.str().find("[TwoSampleBootstrap]") != std::string::npos);
  }
}
