#include "starclass/features/periodic_features.hpp"
#include "starclass/core/errors.hpp"
#include <algorithm>
#include <string>
#include <utility>

namespace starclass::features {

PeriodicFeatures::PeriodicFeatures(const periodogram::PeriodogramResult &result)
    : PeriodicFeatures(result, periodogram::FindPeaks(result.spectrum, result.config.numPeaks())) {
}

PeriodicFeatures::PeriodicFeatures(const periodogram::PeriodogramResult &result, periodogram::PeakSet peaks)
    : result_(result), peaks_(std::move(peaks)) {
}

double PeriodicFeatures::frequencyAt(std::size_t index) const {
	if (index >= result_.spectrum.size()) {
		throw core::IndexOutOfRangeError("Index " + std::to_string(index) + " is out of range of periodogram[0:" +
		                                 std::to_string(result_.spectrum.size()) + ").");
	}
	const auto &config = result_.config;
	const double interval = (result_.max_frequency_calculated - config.firstFrequency()) /
	                        static_cast<double>(config.frequencySampleCount());
	return config.firstFrequency() + static_cast<double>(index) * interval;
}

std::size_t PeriodicFeatures::peakIndex(std::size_t n) const {
	if (n >= result_.config.numPeaks()) {
		throw core::IndexOutOfRangeError("Fundamental frequency requested " + std::to_string(n) +
		                                 " is out of range (0-" + std::to_string(result_.config.numPeaks()) + ").");
	}
	if (n >= peaks_.size()) {
		throw core::IndexOutOfRangeError("Peak " + std::to_string(n) + " was not computed, only " +
		                                 std::to_string(peaks_.size()) + " peaks available.");
	}
	return peaks_[n];
}

FeatureResult PeriodicFeatures::fundamentalFrequency(std::size_t n) const {
	return MakeFeature(names::FundamentalFrequency(n), frequencyAt(peakIndex(n)));
}

FeatureResult PeriodicFeatures::amplitude(std::size_t n) const {
	const std::size_t index = peakIndex(n);
	if (index >= result_.spectrum.size()) {
		throw core::IndexOutOfRangeError("Peak index " + std::to_string(index) + " is outside the spectrum.");
	}
	return MakeFeature(names::FundamentalAmplitude(n), result_.spectrum[index]);
}

std::array<FeatureResult, PeriodicFeatures::kHarmonicCount> PeriodicFeatures::harmonicAmplitudes(std::size_t n) const {
	const std::size_t index = peakIndex(n);
	const auto &spectrum = result_.spectrum;

	std::array<FeatureResult, kHarmonicCount> harmonics;
	for (std::size_t h = 0; h < kHarmonicCount; ++h) {
		const std::size_t harmonic_index = index * (h + 1);
		const double power = harmonic_index < spectrum.size() ? spectrum[harmonic_index] : 0.0;
		harmonics[h] = MakeFeature(names::HarmonicAmplitude(n, h), power);
	}
	return harmonics;
}

FeatureResult PeriodicFeatures::spectrumFloorOffset() const {
	const auto &spectrum = result_.spectrum;
	if (spectrum.empty()) {
		throw core::IndexOutOfRangeError("Spectrum floor requested for an empty spectrum.");
	}
	return MakeFeature(names::kFrequencyOffset, *std::min_element(spectrum.begin(), spectrum.end()));
}

} // namespace starclass::features
