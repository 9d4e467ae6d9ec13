#include "starclass/core/light_curve.hpp"
#include "starclass/core/errors.hpp"
#include <limits>
#include <string>
#include <utility>

namespace starclass::core {

LightCurve::LightCurve(std::vector<double> times, std::vector<double> magnitudes, std::vector<double> snrs)
    : times_(std::move(times)), magnitudes_(std::move(magnitudes)), snrs_(std::move(snrs)) {
	if (times_.size() != magnitudes_.size()) {
		throw InvalidInputError("Light curve times (" + std::to_string(times_.size()) +
		                        ") and magnitudes (" + std::to_string(magnitudes_.size()) +
		                        ") must have the same length.");
	}
	if (snrs_.empty()) {
		snrs_.assign(times_.size(), std::numeric_limits<double>::quiet_NaN());
	} else if (snrs_.size() != times_.size()) {
		throw InvalidInputError("Light curve signal-to-noise column must match the number of observations.");
	}
}

void LightCurve::addObservation(double time, double magnitude, double snr) {
	times_.push_back(time);
	magnitudes_.push_back(magnitude);
	snrs_.push_back(snr);
}

} // namespace starclass::core
