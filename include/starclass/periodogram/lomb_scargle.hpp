#pragma once

#include <cstddef>
#include <vector>

namespace starclass::periodogram {

/**
 * @brief Normalized Lomb-Scargle power of an unevenly sampled series.
 *
 * For each frequency f (cycles per time unit, ω = 2πf) the time shift τ with
 * tan(2ωτ) = Σ sin(2ωt) / Σ cos(2ωt) is computed, and the power is
 *
 *   P(ω) = 1/(2σ²) [ (Σ y cos ω(t-τ))² / Σ cos² ω(t-τ)
 *                  + (Σ y sin ω(t-τ))² / Σ sin² ω(t-τ) ]
 *
 * where y is the mean-subtracted series and σ² its sample variance.
 * A zero-variance series yields an all-zero spectrum.
 *
 * @throws InvalidInputError when times and values differ in length or hold
 *         fewer than two points.
 */
std::vector<double> LombScargle(const std::vector<double>& times,
                                const std::vector<double>& values,
                                const std::vector<double>& frequencies);

// Evenly spaced values over [start, stop], or over [start, stop) with a step of
// (stop - start) / count when endpoint is false.
std::vector<double> Linspace(double start, double stop, std::size_t count, bool endpoint = true);

} // namespace starclass::periodogram
