#pragma once

#include <cstddef>
#include <vector>

namespace starclass::core {

/**
 * @class LightCurve
 * @brief Observations of one star in one photometric filter.
 *
 * Stores parallel columns of observation times, magnitudes and
 * signal-to-noise ratios. The sequence is kept in the order supplied; it is
 * not sorted and strictly increasing times are not required.
 */
class LightCurve {
public:
	LightCurve() = default;

	/**
	 * @brief Builds a light curve from parallel columns.
	 * @param times Observation times.
	 * @param magnitudes Magnitude or flux per observation.
	 * @param snrs Signal-to-noise per observation. May be empty, in which case
	 *             every observation gets a NaN signal-to-noise.
	 * @throws InvalidInputError when the column lengths differ.
	 */
	LightCurve(std::vector<double> times, std::vector<double> magnitudes, std::vector<double> snrs = {});

	void addObservation(double time, double magnitude, double snr);

	std::size_t size() const {
		return times_.size();
	}

	bool empty() const {
		return times_.empty();
	}

	const std::vector<double> &times() const {
		return times_;
	}

	const std::vector<double> &magnitudes() const {
		return magnitudes_;
	}

	const std::vector<double> &snrs() const {
		return snrs_;
	}

private:
	std::vector<double> times_;
	std::vector<double> magnitudes_;
	std::vector<double> snrs_;
};

} // namespace starclass::core
