#pragma once

#include "starclass/core/light_curve.hpp"
#include "starclass/periodogram/periodogram_config.hpp"
#include <cstddef>
#include <vector>

namespace starclass::periodogram {

using Spectrum = std::vector<double>;

// Spectrum indices of the selected peaks, strongest first.
using PeakSet = std::vector<std::size_t>;

struct CleanedSeries {
    std::vector<double> times;      // re-based, times.front() == 0
    std::vector<double> magnitudes;
};

/**
 * @brief Result of one periodogram computation.
 *
 * Carries everything the feature extractors need to translate spectrum
 * indices back into frequencies. The config is a copy of the engine's and is
 * never modified after the computation.
 */
struct PeriodogramResult {
    PeriodogramConfig config;
    std::size_t first_valid_index = 0;
    double max_frequency_calculated = 0.0;
    std::vector<double> frequencies;
    Spectrum spectrum;
    CleanedSeries cleaned;
};

class PeriodogramEngine {
public:
    // Fewest observations left after rejection that still support a search.
    static constexpr std::size_t kMinCleanedObservations = 4;
    // Lower end of the sampled frequency grid.
    static constexpr double kGridStartFrequency = 0.01;

    explicit PeriodogramEngine(PeriodogramConfig config = PeriodogramConfig());

    const PeriodogramConfig& config() const { return config_; }

    /**
     * @brief Index of the first observation after anomalous leading gaps.
     *
     * The mean of all gaps is compared with the mean of the gap suffix
     * starting at i = 1, 2, ...; when the running mean lies within ±10% of
     * the suffix mean, i - 1 is returned. Otherwise the suffix mean becomes
     * the running mean and i advances. Returns 0 when the gaps never settle.
     *
     * @throws InvalidInputError for fewer than two times.
     */
    static std::size_t rejectLeadingOutliers(const std::vector<double>& times);

    /**
     * @brief Computes the Lomb-Scargle spectrum of a light curve.
     *
     * @throws InvalidInputError when the inputs are malformed.
     * @throws InsufficientDataError when fewer than kMinCleanedObservations
     *         observations remain after leading-outlier rejection.
     * @throws DegenerateTimeSpanError when the retained observations span no time.
     */
    PeriodogramResult compute(const std::vector<double>& times,
                              const std::vector<double>& magnitudes) const;

    PeriodogramResult compute(const core::LightCurve& curve) const;

private:
    PeriodogramConfig config_;
};

/**
 * @brief Greedy arg-max peak search.
 *
 * Takes the index of the global maximum (lowest index on ties), zeroes that
 * single bin in a working copy and repeats. Neighbouring bins are not
 * suppressed, so adjacent bins of one line may both be selected.
 * Returns min(num_peaks, spectrum.size()) indices.
 */
PeakSet FindPeaks(const Spectrum& spectrum, std::size_t num_peaks);

} // namespace starclass::periodogram
