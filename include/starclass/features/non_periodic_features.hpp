#pragma once

#include "starclass/features/feature_math.hpp"
#include "starclass/features/feature_types.hpp"
#include <cstddef>
#include <vector>

namespace starclass::features {

/**
 * @class NonPeriodicFeatures
 * @brief Statistical descriptors of a cleaned light curve.
 *
 * Works on the cleaned magnitudes and their re-based times. Statistics shared
 * between features (mean, median, sorted values, gap threshold) are computed
 * once. Percentages are reported in [0, 100].
 *
 * Divisions by a degenerate range (constant curves, zero percentile spread)
 * report 0 instead of NaN or Inf, so that a constant light curve produces
 * finite features.
 */
class NonPeriodicFeatures {
public:
	// Number of trailing observations considered by pairSlopeTrend.
	static constexpr std::size_t kPairSlopeWindow = 30;
	static constexpr double kMedianBufferFraction = 0.1;

	/**
	 * @throws InvalidInputError unless both series have the same length of at
	 *         least two.
	 */
	NonPeriodicFeatures(std::vector<double> magnitudes, std::vector<double> times);

	NonPeriodicFeatures(const NonPeriodicFeatures &) = delete;
	NonPeriodicFeatures &operator=(const NonPeriodicFeatures &) = delete;

	FeatureResult amplitudeDif() const;
	FeatureResult beyond1st() const;
	FeatureResult linearTrend() const;
	FeatureResult maxSlope() const;
	FeatureResult medianAbsoluteDeviation() const;
	FeatureResult medianBufferRangePercentage() const;
	FeatureResult pairSlopeTrend() const;
	FeatureResult percentAmplitude() const;
	FeatureResult percentDifferenceFluxPercentile() const;
	FeatureResult skew() const;
	FeatureResult kurtosis() const;
	FeatureResult stdDev() const;
	FeatureResult fluxPercentileRatioMid20() const;
	FeatureResult fluxPercentileRatioMid35() const;
	FeatureResult fluxPercentileRatioMid50() const;
	FeatureResult fluxPercentileRatioMid65() const;
	FeatureResult fluxPercentileRatioMid80() const;

	// All seventeen features in column order.
	std::vector<FeatureResult> all() const;

	const std::vector<double> &magnitudes() const {
		return magnitudes_;
	}
	const std::vector<double> &times() const {
		return times_;
	}

private:
	double percentile(double percent) const;
	double fluxPercentileRatio(double lower, double upper) const;
	// Consecutive pairs with a time step below mean + std of all steps.
	bool isRegularStep(std::size_t i) const;
	double pairSlope(std::size_t i) const;

	std::vector<double> magnitudes_;
	std::vector<double> times_;
	mutable StatsCache mag_cache_;
	// Largest absolute magnitude; degenerate ranges are judged against it.
	double magnitude_scale_;
	double max_regular_step_;
};

} // namespace starclass::features
