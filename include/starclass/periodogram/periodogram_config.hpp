#pragma once

#include <cstddef>
#include <string>

namespace starclass::periodogram {

/**
 * @brief Parameters of the frequency search, fixed for a whole run.
 *
 * The configured maximum frequency is a floor for the upper bound of the
 * search: the engine widens it to the Nyquist-style estimate of the series
 * when that estimate is larger.
 */
class PeriodogramConfig {
public:
    static constexpr double kDefaultFirstFrequency = 1.0;
    static constexpr double kDefaultMaxFrequencyToSeek = 10000.0;
    static constexpr std::size_t kDefaultFrequencySampleCount = 200;
    static constexpr std::size_t kDefaultNumPeaks = 3;

    class Builder {
    public:
        Builder& firstFrequency(double value);
        Builder& maxFrequencyToSeek(double value);
        Builder& frequencySampleCount(std::size_t value);
        Builder& numPeaks(std::size_t value);
        PeriodogramConfig build() const;

    private:
        double first_frequency_ = kDefaultFirstFrequency;
        double max_frequency_to_seek_ = kDefaultMaxFrequencyToSeek;
        std::size_t frequency_sample_count_ = kDefaultFrequencySampleCount;
        std::size_t num_peaks_ = kDefaultNumPeaks;
    };

    static Builder builder();

    PeriodogramConfig();

    double firstFrequency() const { return first_frequency_; }
    double maxFrequencyToSeek() const { return max_frequency_to_seek_; }
    std::size_t frequencySampleCount() const { return frequency_sample_count_; }
    std::size_t numPeaks() const { return num_peaks_; }

    std::string toString() const;

private:
    PeriodogramConfig(double first_frequency,
                      double max_frequency_to_seek,
                      std::size_t frequency_sample_count,
                      std::size_t num_peaks);

    double first_frequency_;
    double max_frequency_to_seek_;
    std::size_t frequency_sample_count_;
    std::size_t num_peaks_;
};

} // namespace starclass::periodogram
