#include "starclass/periodogram/periodogram.hpp"
#include "starclass/core/errors.hpp"
#include "starclass/periodogram/lomb_scargle.hpp"
#include "starclass/utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <numeric>
#include <string>
#include <utility>

namespace {

constexpr double kGapTolerance = 0.1;

double meanOfRange(std::vector<double>::const_iterator first, std::vector<double>::const_iterator last) {
    const auto count = std::distance(first, last);
    return std::accumulate(first, last, 0.0) / static_cast<double>(count);
}

} // namespace

namespace starclass::periodogram {

PeriodogramEngine::PeriodogramEngine(PeriodogramConfig config) : config_(std::move(config)) {}

std::size_t PeriodogramEngine::rejectLeadingOutliers(const std::vector<double>& times) {
    if (times.size() < 2) {
        throw core::InvalidInputError("Leading outlier rejection requires at least two time points, got " +
                                      std::to_string(times.size()) + ".");
    }

    std::vector<double> gaps(times.size() - 1);
    for (std::size_t i = 1; i < times.size(); ++i) {
        gaps[i - 1] = times[i] - times[i - 1];
    }

    double running_mean = meanOfRange(gaps.begin(), gaps.end());
    for (std::size_t i = 1; i < gaps.size(); ++i) {
        const double suffix_mean = meanOfRange(gaps.begin() + static_cast<std::ptrdiff_t>(i), gaps.end());
        const double tolerance = kGapTolerance * std::fabs(suffix_mean);
        if (running_mean < suffix_mean + tolerance && running_mean > suffix_mean - tolerance) {
            return i - 1;
        }
        running_mean = suffix_mean;
    }
    return 0;
}

PeriodogramResult PeriodogramEngine::compute(const std::vector<double>& times,
                                             const std::vector<double>& magnitudes) const {
    if (times.size() != magnitudes.size()) {
        throw core::InvalidInputError("Periodogram requires times and magnitudes of equal length.");
    }

    const std::size_t first = rejectLeadingOutliers(times);
    const std::size_t n = times.size();
    if (first > 0) {
        STARCLASS_DEBUG("Periodogram discarded {} leading observations with anomalous gaps.", first);
    }

    const std::size_t retained = n - first;
    if (retained < kMinCleanedObservations) {
        throw core::InsufficientDataError("Periodogram requires at least " +
                                          std::to_string(kMinCleanedObservations) +
                                          " observations after cleaning, got " +
                                          std::to_string(retained) + ".");
    }

    const double span = times.back() - times[first];
    if (span == 0.0 || !std::isfinite(span)) {
        throw core::DegenerateTimeSpanError("Periodogram time span is degenerate: first retained time " +
                                            std::to_string(times[first]) + " equals last time.");
    }

    PeriodogramResult result;
    result.config = config_;
    result.first_valid_index = first;

    result.cleaned.times.reserve(retained);
    result.cleaned.magnitudes.reserve(retained);
    const double origin = times[first];
    for (std::size_t i = first; i < n; ++i) {
        result.cleaned.times.push_back(times[i] - origin);
        result.cleaned.magnitudes.push_back(magnitudes[i]);
    }

    // Nyquist-style estimate; the configured maximum only ever widens it.
    const double sample_freq = static_cast<double>(n - 1 - first) / span;
    const double max_freq_seek = sample_freq / 2.0;
    result.max_frequency_calculated = std::max(max_freq_seek, config_.maxFrequencyToSeek());

    // Half-open grid so that sample i sits at start + i * (max - start) / count.
    result.frequencies = Linspace(kGridStartFrequency, result.max_frequency_calculated,
                                  config_.frequencySampleCount(), false);
    result.spectrum = LombScargle(result.cleaned.times, result.cleaned.magnitudes, result.frequencies);

    STARCLASS_TRACE("Periodogram computed over [{}, {}] with {} samples from {} observations.",
                    kGridStartFrequency, result.max_frequency_calculated, result.frequencies.size(), retained);
    return result;
}

PeriodogramResult PeriodogramEngine::compute(const core::LightCurve& curve) const {
    return compute(curve.times(), curve.magnitudes());
}

PeakSet FindPeaks(const Spectrum& spectrum, std::size_t num_peaks) {
    PeakSet peaks;
    if (spectrum.empty()) {
        return peaks;
    }

    Spectrum working = spectrum;
    const std::size_t count = std::min(num_peaks, working.size());
    peaks.reserve(count);
    for (std::size_t k = 0; k < count; ++k) {
        const auto it = std::max_element(working.begin(), working.end());
        const auto index = static_cast<std::size_t>(std::distance(working.begin(), it));
        peaks.push_back(index);
        working[index] = 0.0;
    }
    return peaks;
}

} // namespace starclass::periodogram
