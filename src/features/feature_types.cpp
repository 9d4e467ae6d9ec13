#include "starclass/features/feature_types.hpp"
#include <cmath>
#include <utility>

namespace starclass::features {

FeatureResult MakeFeature(std::string name, double value) {
	FeatureResult result;
	result.name = std::move(name);
	result.value = value;
	result.is_nan = std::isnan(value);
	return result;
}

namespace names {

std::string FundamentalFrequency(std::size_t n) {
	return kFundamentalFrequencyPrefix + std::to_string(n);
}

std::string FundamentalAmplitude(std::size_t n) {
	return kFundamentalAmplitudePrefix + std::to_string(n);
}

std::string HarmonicAmplitude(std::size_t n, std::size_t harmonic) {
	return kHarmonicAmplitudePrefix + std::to_string(n) + "_" + std::to_string(harmonic);
}

} // namespace names

} // namespace starclass::features
