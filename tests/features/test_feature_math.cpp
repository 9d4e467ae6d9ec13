#include <catch2/catch.hpp>

#include "starclass/features/feature_math.hpp"

#include <cmath>
#include <vector>

using Catch::Detail::Approx;
using namespace starclass::features;

TEST_CASE("Stats cache memoizes moments", "[features][math]") {
	const Series series {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
	StatsCache cache(series);
	REQUIRE(ComputeMean(series, cache) == Approx(5.0));
	REQUIRE(ComputeVariance(series, cache) == Approx(4.0));
	REQUIRE(ComputeStdDev(series, cache) == Approx(2.0));
	REQUIRE(cache.mean.has_value());
	REQUIRE(cache.stddev.has_value());
	REQUIRE(ComputeMedian(series, cache) == Approx(4.5));
}

TEST_CASE("Median of odd and even series", "[features][math]") {
	const Series odd {3.0, 1.0, 2.0};
	StatsCache odd_cache(odd);
	REQUIRE(ComputeMedian(odd, odd_cache) == 2.0);

	const Series even {4.0, 1.0, 3.0, 2.0};
	StatsCache even_cache(even);
	REQUIRE(ComputeMedian(even, even_cache) == 2.5);
	REQUIRE(ComputeSorted(even, even_cache) == std::vector<double> {1.0, 2.0, 3.0, 4.0});
}

TEST_CASE("Percentile interpolates linearly", "[features][math]") {
	const Series series {4.0, 1.0, 3.0, 2.0};
	StatsCache cache(series);
	REQUIRE(ComputePercentile(series, 0.0, cache) == 1.0);
	REQUIRE(ComputePercentile(series, 25.0, cache) == Approx(1.75));
	REQUIRE(ComputePercentile(series, 50.0, cache) == Approx(2.5));
	REQUIRE(ComputePercentile(series, 100.0, cache) == 4.0);
}

TEST_CASE("Diffs of consecutive values", "[features][math]") {
	const Series series {0.0, 1.0, 3.0, 6.0};
	StatsCache cache(series);
	REQUIRE(ComputeDiffs(series, cache) == std::vector<double> {1.0, 2.0, 3.0});
}

TEST_CASE("Skewness and kurtosis use population moments", "[features][math]") {
	const Series symmetric {1.0, 2.0, 3.0};
	StatsCache symmetric_cache(symmetric);
	REQUIRE(ComputeSkewness(symmetric, symmetric_cache) == Approx(0.0).margin(1e-12));

	const Series uniform {1.0, 2.0, 3.0, 4.0};
	StatsCache uniform_cache(uniform);
	REQUIRE(ComputeKurtosis(uniform, uniform_cache) == Approx(-1.36));

	const Series flat {5.0, 5.0, 5.0};
	StatsCache flat_cache(flat);
	REQUIRE(ComputeSkewness(flat, flat_cache) == 0.0);
	REQUIRE(ComputeKurtosis(flat, flat_cache) == 0.0);
}

TEST_CASE("Moment guards are relative to the series scale", "[features][math]") {
	const Series faint {1e-13, 2e-13, 3e-13, 4e-13};
	StatsCache faint_cache(faint);
	REQUIRE(ComputeKurtosis(faint, faint_cache) == Approx(-1.36));

	const Series skewed {1e-13, 1e-13, 4e-13};
	StatsCache skewed_cache(skewed);
	REQUIRE(ComputeSkewness(skewed, skewed_cache) == Approx(0.7071067812));

	const Series flat_offset {1e6, 1e6, 1e6};
	StatsCache flat_offset_cache(flat_offset);
	REQUIRE(ComputeSkewness(flat_offset, flat_offset_cache) == 0.0);

	REQUIRE(IsNegligible(1e-25, 1e-13));
	REQUIRE_FALSE(IsNegligible(1e-20, 1e-13));
	REQUIRE(IsNegligible(0.0, 0.0));
	REQUIRE_FALSE(IsNegligible(1e-300, 0.0));

	const std::vector<double> x {1e-13, 2e-13, 3e-13};
	const auto fit = ComputeLinearRegression(x, Series {1.0, 3.0, 5.0});
	REQUIRE(fit.valid);
	REQUIRE(fit.slope == Approx(2e13));
}

TEST_CASE("Linear regression fits slope and intercept", "[features][math]") {
	const auto fit = ComputeLinearRegression({0.0, 1.0, 2.0, 3.0}, {1.0, 3.0, 5.0, 7.0});
	REQUIRE(fit.valid);
	REQUIRE(fit.slope == Approx(2.0));
	REQUIRE(fit.intercept == Approx(1.0));

	const auto degenerate = ComputeLinearRegression({2.0, 2.0, 2.0}, {1.0, 2.0, 3.0});
	REQUIRE_FALSE(degenerate.valid);
	REQUIRE(std::isnan(degenerate.slope));
}
