#include "starclass/features/feature_math.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <utility>

namespace starclass::features {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

template <typename T, typename Fn>
const T &Memoize(std::optional<T> &slot, Fn &&compute) {
	if (!slot) {
		slot = compute();
	}
	return *slot;
}

// Second to fourth central moments about the cached mean, population-normalized,
// plus the raw second moment the spread is judged against.
struct CentralMoments {
	double m2 = 0.0;
	double m3 = 0.0;
	double m4 = 0.0;
	double raw2 = 0.0;
};

CentralMoments ComputeMoments(const Series &series, StatsCache &cache) {
	CentralMoments moments;
	const double mean = ComputeMean(series, cache);
	for (double value : series) {
		const double d = value - mean;
		const double d2 = d * d;
		moments.m2 += d2;
		moments.m3 += d2 * d;
		moments.m4 += d2 * d2;
		moments.raw2 += value * value;
	}
	const auto n = static_cast<double>(series.size());
	moments.m2 /= n;
	moments.m3 /= n;
	moments.m4 /= n;
	moments.raw2 /= n;
	return moments;
}

bool IsFlat(const CentralMoments &moments) {
	return IsNegligible(std::sqrt(moments.m2), std::sqrt(moments.raw2));
}

} // namespace

bool IsNegligible(double value, double scale) {
	return std::fabs(value) <= kRelativeTolerance * std::fabs(scale);
}

double ComputeMean(const Series &series, StatsCache &cache) {
	return Memoize(cache.mean, [&] {
		if (series.empty()) {
			return kNaN;
		}
		return std::accumulate(series.begin(), series.end(), 0.0) / static_cast<double>(series.size());
	});
}

double ComputeVariance(const Series &series, StatsCache &cache) {
	return Memoize(cache.variance, [&] {
		if (series.empty()) {
			return kNaN;
		}
		const double mean = ComputeMean(series, cache);
		const double sum_sq = std::accumulate(series.begin(), series.end(), 0.0, [mean](double acc, double value) {
			return acc + (value - mean) * (value - mean);
		});
		return sum_sq / static_cast<double>(series.size());
	});
}

double ComputeStdDev(const Series &series, StatsCache &cache) {
	return Memoize(cache.stddev, [&] {
		const double variance = ComputeVariance(series, cache);
		return variance < 0.0 ? kNaN : std::sqrt(variance);
	});
}

const std::vector<double> &ComputeSorted(const Series &series, StatsCache &cache) {
	return Memoize(cache.sorted_values, [&] {
		std::vector<double> sorted(series.begin(), series.end());
		std::sort(sorted.begin(), sorted.end());
		return sorted;
	});
}

double ComputeMedian(const Series &series, StatsCache &cache) {
	return Memoize(cache.median, [&] {
		if (series.empty()) {
			return kNaN;
		}
		const auto &sorted = ComputeSorted(series, cache);
		const std::size_t mid = sorted.size() / 2;
		return sorted.size() % 2 == 1 ? sorted[mid] : 0.5 * (sorted[mid - 1] + sorted[mid]);
	});
}

const std::vector<double> &ComputeDiffs(const Series &series, StatsCache &cache) {
	return Memoize(cache.diffs, [&] {
		std::vector<double> diffs;
		if (series.size() >= 2) {
			diffs.resize(series.size() - 1);
			std::transform(series.begin() + 1, series.end(), series.begin(), diffs.begin(),
			               [](double next, double prev) { return next - prev; });
		}
		return diffs;
	});
}

double ComputePercentile(const Series &series, double percent, StatsCache &cache) {
	if (series.empty()) {
		return kNaN;
	}
	const auto &sorted = ComputeSorted(series, cache);
	const double rank = std::clamp(percent, 0.0, 100.0) / 100.0 * static_cast<double>(sorted.size() - 1);
	const auto lower = static_cast<std::size_t>(std::floor(rank));
	if (lower + 1 >= sorted.size()) {
		return sorted.back();
	}
	const double weight = rank - static_cast<double>(lower);
	return sorted[lower] + weight * (sorted[lower + 1] - sorted[lower]);
}

double ComputeSkewness(const Series &series, StatsCache &cache) {
	if (series.empty()) {
		return kNaN;
	}
	const auto moments = ComputeMoments(series, cache);
	if (IsFlat(moments)) {
		return 0.0;
	}
	return moments.m3 / std::pow(moments.m2, 1.5);
}

double ComputeKurtosis(const Series &series, StatsCache &cache) {
	if (series.empty()) {
		return kNaN;
	}
	const auto moments = ComputeMoments(series, cache);
	if (IsFlat(moments)) {
		return 0.0;
	}
	return moments.m4 / (moments.m2 * moments.m2) - 3.0;
}

LinRegResult ComputeLinearRegression(const std::vector<double> &x, const Series &y) {
	LinRegResult fit {kNaN, kNaN};
	if (x.size() != y.size() || x.size() < 2) {
		return fit;
	}
	const auto n = static_cast<double>(x.size());
	const double mean_x = std::accumulate(x.begin(), x.end(), 0.0) / n;
	const double mean_y = std::accumulate(y.begin(), y.end(), 0.0) / n;

	double sxx = 0.0;
	double sxy = 0.0;
	double raw_xx = 0.0;
	for (std::size_t i = 0; i < x.size(); ++i) {
		const double dx = x[i] - mean_x;
		sxx += dx * dx;
		sxy += dx * (y[i] - mean_y);
		raw_xx += x[i] * x[i];
	}
	if (IsNegligible(std::sqrt(sxx), std::sqrt(raw_xx))) {
		return fit;
	}
	fit.slope = sxy / sxx;
	fit.intercept = mean_y - fit.slope * mean_x;
	fit.valid = true;
	return fit;
}

} // namespace starclass::features
