#include "starclass/features/feature_vector.hpp"
#include "starclass/core/errors.hpp"
#include "starclass/features/non_periodic_features.hpp"
#include "starclass/features/periodic_features.hpp"
#include <string>
#include <utility>

namespace starclass::features {

FeatureVector::FeatureVector(std::vector<FeatureResult> entries) : entries_(std::move(entries)) {
}

std::vector<double> FeatureVector::values() const {
	std::vector<double> output;
	output.reserve(entries_.size());
	for (const auto &entry : entries_) {
		output.push_back(entry.value);
	}
	return output;
}

std::vector<std::string> FeatureVector::names() const {
	std::vector<std::string> output;
	output.reserve(entries_.size());
	for (const auto &entry : entries_) {
		output.push_back(entry.name);
	}
	return output;
}

const std::vector<std::string> &FeatureVector::ColumnNames() {
	static const std::vector<std::string> columns = [] {
		std::vector<std::string> result;
		result.reserve(kSize);
		for (std::size_t n = 0; n < kFundamentalCount; ++n) {
			result.push_back(names::FundamentalFrequency(n));
			result.push_back(names::FundamentalAmplitude(n));
			for (std::size_t h = 0; h < PeriodicFeatures::kHarmonicCount; ++h) {
				result.push_back(names::HarmonicAmplitude(n, h));
			}
		}
		result.emplace_back(names::kFrequencyOffset);
		for (const char *name : {names::kAmplitudeDif,
		                         names::kBeyond1st,
		                         names::kLinearTrend,
		                         names::kMaxSlope,
		                         names::kMedianAbsoluteDeviation,
		                         names::kMedianBufferRangePercentage,
		                         names::kPairSlopeTrend,
		                         names::kPercentAmplitude,
		                         names::kPercentDifferenceFluxPercentile,
		                         names::kSkew,
		                         names::kKurtosis,
		                         names::kStdDev,
		                         names::kFluxPercentileRatioMid20,
		                         names::kFluxPercentileRatioMid35,
		                         names::kFluxPercentileRatioMid50,
		                         names::kFluxPercentileRatioMid65,
		                         names::kFluxPercentileRatioMid80}) {
			result.emplace_back(name);
		}
		return result;
	}();
	return columns;
}

FeatureVector Assemble(const PeriodicFeatures &periodic, const NonPeriodicFeatures &non_periodic) {
	std::vector<FeatureResult> entries;
	entries.reserve(FeatureVector::kSize);

	for (std::size_t n = 0; n < FeatureVector::kFundamentalCount; ++n) {
		entries.push_back(periodic.fundamentalFrequency(n));
		entries.push_back(periodic.amplitude(n));
		for (auto &harmonic : periodic.harmonicAmplitudes(n)) {
			entries.push_back(std::move(harmonic));
		}
	}
	entries.push_back(periodic.spectrumFloorOffset());

	for (auto &feature : non_periodic.all()) {
		entries.push_back(std::move(feature));
	}

	if (entries.size() != FeatureVector::kSize) {
		throw core::IndexOutOfRangeError("Assembled " + std::to_string(entries.size()) + " features, expected " +
		                                 std::to_string(FeatureVector::kSize) + ".");
	}
	return FeatureVector(std::move(entries));
}

} // namespace starclass::features
