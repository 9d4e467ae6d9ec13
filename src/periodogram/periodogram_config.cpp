#include "starclass/periodogram/periodogram_config.hpp"
#include "starclass/core/errors.hpp"
#include <cmath>
#include <sstream>

namespace starclass::periodogram {

PeriodogramConfig::PeriodogramConfig()
    : PeriodogramConfig(kDefaultFirstFrequency, kDefaultMaxFrequencyToSeek,
                        kDefaultFrequencySampleCount, kDefaultNumPeaks) {}

PeriodogramConfig::PeriodogramConfig(double first_frequency,
                                     double max_frequency_to_seek,
                                     std::size_t frequency_sample_count,
                                     std::size_t num_peaks)
    : first_frequency_(first_frequency),
      max_frequency_to_seek_(max_frequency_to_seek),
      frequency_sample_count_(frequency_sample_count),
      num_peaks_(num_peaks) {}

PeriodogramConfig::Builder& PeriodogramConfig::Builder::firstFrequency(double value) {
    first_frequency_ = value;
    return *this;
}

PeriodogramConfig::Builder& PeriodogramConfig::Builder::maxFrequencyToSeek(double value) {
    max_frequency_to_seek_ = value;
    return *this;
}

PeriodogramConfig::Builder& PeriodogramConfig::Builder::frequencySampleCount(std::size_t value) {
    frequency_sample_count_ = value;
    return *this;
}

PeriodogramConfig::Builder& PeriodogramConfig::Builder::numPeaks(std::size_t value) {
    num_peaks_ = value;
    return *this;
}

PeriodogramConfig PeriodogramConfig::Builder::build() const {
    if (!std::isfinite(first_frequency_) || first_frequency_ <= 0.0) {
        throw core::InvalidInputError("First frequency must be positive and finite.");
    }
    if (!std::isfinite(max_frequency_to_seek_) || max_frequency_to_seek_ <= 0.0) {
        throw core::InvalidInputError("Maximum frequency to seek must be positive and finite.");
    }
    if (frequency_sample_count_ < 2) {
        throw core::InvalidInputError("Frequency sample count must be at least 2.");
    }
    if (num_peaks_ == 0) {
        throw core::InvalidInputError("Number of peaks must be at least 1.");
    }
    return PeriodogramConfig(first_frequency_, max_frequency_to_seek_, frequency_sample_count_, num_peaks_);
}

PeriodogramConfig::Builder PeriodogramConfig::builder() {
    return Builder();
}

std::string PeriodogramConfig::toString() const {
    std::ostringstream oss;
    oss << "PeriodogramConfig(first freq = " << first_frequency_
        << ", max freq to seek = " << max_frequency_to_seek_
        << ", freq samples = " << frequency_sample_count_
        << ", peaks = " << num_peaks_ << ")";
    return oss.str();
}

} // namespace starclass::periodogram
