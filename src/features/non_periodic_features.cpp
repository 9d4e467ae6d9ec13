#include "starclass/features/non_periodic_features.hpp"
#include "starclass/core/errors.hpp"
#include "starclass/utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace starclass::features {

namespace {

// Quotient that reports 0 when the denominator vanishes next to the magnitude scale.
double GuardedRatio(double numerator, double denominator, double scale, const char *feature) {
	if (IsNegligible(denominator, scale)) {
		STARCLASS_DEBUG("{} has a degenerate denominator, reporting 0.", feature);
		return 0.0;
	}
	return numerator / denominator;
}

} // namespace

NonPeriodicFeatures::NonPeriodicFeatures(std::vector<double> magnitudes, std::vector<double> times)
    : magnitudes_(std::move(magnitudes)), times_(std::move(times)), mag_cache_(magnitudes_),
      magnitude_scale_(0.0), max_regular_step_(0.0) {
	if (magnitudes_.size() != times_.size()) {
		throw core::InvalidInputError("Non-periodic features require magnitudes (" +
		                              std::to_string(magnitudes_.size()) + ") and times (" +
		                              std::to_string(times_.size()) + ") of equal length.");
	}
	if (magnitudes_.size() < 2) {
		throw core::InvalidInputError("Non-periodic features require at least two observations.");
	}
	for (double value : magnitudes_) {
		magnitude_scale_ = std::max(magnitude_scale_, std::fabs(value));
	}

	StatsCache step_cache(times_);
	Series steps = ComputeDiffs(times_, step_cache);
	StatsCache steps_stats(steps);
	max_regular_step_ = ComputeMean(steps, steps_stats) + ComputeStdDev(steps, steps_stats);
}

double NonPeriodicFeatures::percentile(double percent) const {
	return ComputePercentile(magnitudes_, percent, mag_cache_);
}

bool NonPeriodicFeatures::isRegularStep(std::size_t i) const {
	const double step = times_[i + 1] - times_[i];
	return step < max_regular_step_ && step != 0.0;
}

double NonPeriodicFeatures::pairSlope(std::size_t i) const {
	return (magnitudes_[i + 1] - magnitudes_[i]) / (times_[i + 1] - times_[i]);
}

FeatureResult NonPeriodicFeatures::amplitudeDif() const {
	const auto &sorted = ComputeSorted(magnitudes_, mag_cache_);
	return MakeFeature(names::kAmplitudeDif, (sorted.back() - sorted.front()) / 2.0);
}

FeatureResult NonPeriodicFeatures::beyond1st() const {
	const double mean = ComputeMean(magnitudes_, mag_cache_);
	const double stddev = ComputeStdDev(magnitudes_, mag_cache_);
	const auto count = std::count_if(magnitudes_.begin(), magnitudes_.end(),
	                                 [&](double value) { return std::fabs(value - mean) > stddev; });
	return MakeFeature(names::kBeyond1st, static_cast<double>(count) * 100.0 / static_cast<double>(magnitudes_.size()));
}

FeatureResult NonPeriodicFeatures::linearTrend() const {
	const auto lin = ComputeLinearRegression(times_, magnitudes_);
	if (!lin.valid) {
		STARCLASS_DEBUG("{} has no time spread, reporting 0.", names::kLinearTrend);
		return MakeFeature(names::kLinearTrend, 0.0);
	}
	return MakeFeature(names::kLinearTrend, lin.slope);
}

FeatureResult NonPeriodicFeatures::maxSlope() const {
	double max_slope = 0.0;
	for (std::size_t i = 0; i + 1 < times_.size(); ++i) {
		if (isRegularStep(i)) {
			max_slope = std::max(max_slope, std::fabs(pairSlope(i)));
		}
	}
	return MakeFeature(names::kMaxSlope, max_slope);
}

FeatureResult NonPeriodicFeatures::medianAbsoluteDeviation() const {
	const double median = ComputeMedian(magnitudes_, mag_cache_);
	Series deviations(magnitudes_.size());
	std::transform(magnitudes_.begin(), magnitudes_.end(), deviations.begin(),
	               [median](double value) { return std::fabs(value - median); });
	StatsCache deviation_cache(deviations);
	return MakeFeature(names::kMedianAbsoluteDeviation, ComputeMedian(deviations, deviation_cache));
}

FeatureResult NonPeriodicFeatures::medianBufferRangePercentage() const {
	const double median = ComputeMedian(magnitudes_, mag_cache_);
	const double buffer = kMedianBufferFraction * std::fabs(median);
	const auto count = std::count_if(magnitudes_.begin(), magnitudes_.end(),
	                                 [&](double value) { return std::fabs(value - median) <= buffer; });
	return MakeFeature(names::kMedianBufferRangePercentage,
	                   static_cast<double>(count) * 100.0 / static_cast<double>(magnitudes_.size()));
}

FeatureResult NonPeriodicFeatures::pairSlopeTrend() const {
	const std::size_t n = times_.size();
	const std::size_t window = std::min(kPairSlopeWindow, n);

	std::size_t positive = 0;
	for (std::size_t i = n - window; i + 1 < n; ++i) {
		if (isRegularStep(i) && pairSlope(i) > 0.0) {
			++positive;
		}
	}
	return MakeFeature(names::kPairSlopeTrend, static_cast<double>(positive) * 100.0 / static_cast<double>(window - 1));
}

FeatureResult NonPeriodicFeatures::percentAmplitude() const {
	const auto &sorted = ComputeSorted(magnitudes_, mag_cache_);
	const double median = ComputeMedian(magnitudes_, mag_cache_);
	const double max_mag = sorted.back();
	const double min_mag = sorted.front();
	const double max_dif = std::max(std::fabs(max_mag - median), std::fabs(median - min_mag));
	return MakeFeature(names::kPercentAmplitude,
	                   GuardedRatio(max_dif * 100.0, max_mag - min_mag, magnitude_scale_, names::kPercentAmplitude));
}

FeatureResult NonPeriodicFeatures::percentDifferenceFluxPercentile() const {
	const double median = ComputeMedian(magnitudes_, mag_cache_);
	const double spread = percentile(95.0) - percentile(5.0);
	return MakeFeature(names::kPercentDifferenceFluxPercentile,
	                   GuardedRatio(median * 100.0, spread, magnitude_scale_, names::kPercentDifferenceFluxPercentile));
}

FeatureResult NonPeriodicFeatures::skew() const {
	return MakeFeature(names::kSkew, ComputeSkewness(magnitudes_, mag_cache_));
}

FeatureResult NonPeriodicFeatures::kurtosis() const {
	return MakeFeature(names::kKurtosis, ComputeKurtosis(magnitudes_, mag_cache_));
}

FeatureResult NonPeriodicFeatures::stdDev() const {
	return MakeFeature(names::kStdDev, ComputeStdDev(magnitudes_, mag_cache_));
}

double NonPeriodicFeatures::fluxPercentileRatio(double lower, double upper) const {
	return GuardedRatio(percentile(upper) - percentile(lower), percentile(95.0) - percentile(5.0), magnitude_scale_,
	                    "Flux_Percentile_Ratio");
}

FeatureResult NonPeriodicFeatures::fluxPercentileRatioMid20() const {
	return MakeFeature(names::kFluxPercentileRatioMid20, fluxPercentileRatio(40.0, 60.0));
}

FeatureResult NonPeriodicFeatures::fluxPercentileRatioMid35() const {
	return MakeFeature(names::kFluxPercentileRatioMid35, fluxPercentileRatio(32.5, 67.5));
}

FeatureResult NonPeriodicFeatures::fluxPercentileRatioMid50() const {
	return MakeFeature(names::kFluxPercentileRatioMid50, fluxPercentileRatio(25.0, 75.0));
}

FeatureResult NonPeriodicFeatures::fluxPercentileRatioMid65() const {
	return MakeFeature(names::kFluxPercentileRatioMid65, fluxPercentileRatio(17.5, 82.5));
}

FeatureResult NonPeriodicFeatures::fluxPercentileRatioMid80() const {
	return MakeFeature(names::kFluxPercentileRatioMid80, fluxPercentileRatio(10.0, 90.0));
}

std::vector<FeatureResult> NonPeriodicFeatures::all() const {
	return {amplitudeDif(),
	        beyond1st(),
	        linearTrend(),
	        maxSlope(),
	        medianAbsoluteDeviation(),
	        medianBufferRangePercentage(),
	        pairSlopeTrend(),
	        percentAmplitude(),
	        percentDifferenceFluxPercentile(),
	        skew(),
	        kurtosis(),
	        stdDev(),
	        fluxPercentileRatioMid20(),
	        fluxPercentileRatioMid35(),
	        fluxPercentileRatioMid50(),
	        fluxPercentileRatioMid65(),
	        fluxPercentileRatioMid80()};
}

} // namespace starclass::features
