#pragma once

#include "starclass/features/feature_types.hpp"
#include <optional>

namespace starclass::features {

struct StatsCache {
	const Series *series = nullptr;
	mutable std::optional<double> mean;
	mutable std::optional<double> variance;
	mutable std::optional<double> stddev;
	mutable std::optional<double> median;
	mutable std::optional<std::vector<double>> sorted_values;
	mutable std::optional<std::vector<double>> diffs;

	explicit StatsCache(const Series &series_ref) : series(&series_ref) {
	}
};

struct LinRegResult {
	double slope;
	double intercept;
	bool valid = false;
};

// Relative tolerance below which a spread or denominator counts as zero.
constexpr double kRelativeTolerance = 1e-12;

// True when |value| is negligible next to |scale|, both in the same units.
// A zero scale only accepts an exact zero.
bool IsNegligible(double value, double scale);

double ComputeMean(const Series &series, StatsCache &cache);
// Population variance (ddof = 0).
double ComputeVariance(const Series &series, StatsCache &cache);
double ComputeStdDev(const Series &series, StatsCache &cache);
double ComputeMedian(const Series &series, StatsCache &cache);
const std::vector<double> &ComputeSorted(const Series &series, StatsCache &cache);
const std::vector<double> &ComputeDiffs(const Series &series, StatsCache &cache);

// Percentile in [0, 100] with linear interpolation between order statistics.
double ComputePercentile(const Series &series, double percent, StatsCache &cache);

// Biased Fisher-Pearson coefficient g1 = m3 / m2^1.5. Zero for a constant series.
double ComputeSkewness(const Series &series, StatsCache &cache);
// Biased excess kurtosis g2 = m4 / m2^2 - 3. Zero for a constant series.
double ComputeKurtosis(const Series &series, StatsCache &cache);

LinRegResult ComputeLinearRegression(const std::vector<double> &x, const Series &y);

} // namespace starclass::features
