#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace starclass::features {

using Series = std::vector<double>;

struct FeatureResult {
	std::string name;
	double value;
	bool is_nan = false;
};

FeatureResult MakeFeature(std::string name, double value);

// Canonical column names. Persisted feature files and trained models depend
// on these strings.
namespace names {

constexpr const char *kFundamentalFrequencyPrefix = "Fund_Freq_";
constexpr const char *kFundamentalAmplitudePrefix = "Fund_Amp_";
constexpr const char *kHarmonicAmplitudePrefix = "Amp_Harm_";
constexpr const char *kFrequencyOffset = "Freq_Offset";

constexpr const char *kAmplitudeDif = "Amp_diff";
constexpr const char *kBeyond1st = "Beyond1st";
constexpr const char *kLinearTrend = "Linear_Tren";
constexpr const char *kMaxSlope = "Max_Slope";
constexpr const char *kMedianAbsoluteDeviation = "Median_Abs_Dev";
constexpr const char *kMedianBufferRangePercentage = "Median_Buff_Range_Percent";
constexpr const char *kPairSlopeTrend = "Pair_Slope_Trend";
constexpr const char *kPercentAmplitude = "Percent_Amplitude";
constexpr const char *kPercentDifferenceFluxPercentile = "Percent_Diff_flux_Percentile";
constexpr const char *kSkew = "Skew";
constexpr const char *kKurtosis = "Kurtosis";
constexpr const char *kStdDev = "Stand_Dev";
constexpr const char *kFluxPercentileRatioMid20 = "Flux_Percentile_Ratio_Mid20";
constexpr const char *kFluxPercentileRatioMid35 = "Flux_Percentile_Ratio_Mid35";
constexpr const char *kFluxPercentileRatioMid50 = "Flux_Percentile_Ratio_Mid50";
constexpr const char *kFluxPercentileRatioMid65 = "Flux_Percentile_Ratio_Mid65";
constexpr const char *kFluxPercentileRatioMid80 = "Flux_Percentile_Ratio_Mid80";

std::string FundamentalFrequency(std::size_t n);
std::string FundamentalAmplitude(std::size_t n);
std::string HarmonicAmplitude(std::size_t n, std::size_t harmonic);

} // namespace names

} // namespace starclass::features
