#pragma once

#include "starclass/features/feature_types.hpp"
#include "starclass/periodogram/periodogram.hpp"
#include <array>
#include <cstddef>

namespace starclass::features {

/**
 * @class PeriodicFeatures
 * @brief Features derived from the peaks of a periodogram.
 *
 * Holds a reference to the periodogram result, which must outlive this
 * object. Peaks are located once at construction with FindPeaks using the
 * number of peaks of the result's config, unless supplied explicitly.
 */
class PeriodicFeatures {
public:
	static constexpr std::size_t kHarmonicCount = 4;

	explicit PeriodicFeatures(const periodogram::PeriodogramResult &result);
	PeriodicFeatures(const periodogram::PeriodogramResult &result, periodogram::PeakSet peaks);

	// The result is referenced, not copied; it must outlive this object.
	PeriodicFeatures(periodogram::PeriodogramResult &&) = delete;
	PeriodicFeatures(periodogram::PeriodogramResult &&, periodogram::PeakSet) = delete;

	/**
	 * @brief Frequency represented by a spectrum index.
	 *
	 * first_freq + index * (max_freq_calculated - first_freq) / freq_sample_count.
	 * @throws IndexOutOfRangeError when index is not a spectrum index.
	 */
	double frequencyAt(std::size_t index) const;

	FeatureResult fundamentalFrequency(std::size_t n) const;

	// Raw spectral power at the n-th peak.
	FeatureResult amplitude(std::size_t n) const;

	/**
	 * @brief Power at the harmonic positions of the n-th peak.
	 *
	 * Harmonic h (0..3) reads spectrum[peak * (h + 1)], scaling the peak's bin
	 * index rather than its frequency. Positions past the end of the spectrum
	 * report 0.
	 */
	std::array<FeatureResult, kHarmonicCount> harmonicAmplitudes(std::size_t n) const;

	// Minimum power over the whole spectrum.
	FeatureResult spectrumFloorOffset() const;

	const periodogram::PeakSet &peaks() const {
		return peaks_;
	}

private:
	std::size_t peakIndex(std::size_t n) const;

	const periodogram::PeriodogramResult &result_;
	periodogram::PeakSet peaks_;
};

} // namespace starclass::features
