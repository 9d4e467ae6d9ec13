#include "starclass/periodogram/lomb_scargle.hpp"
#include "starclass/core/errors.hpp"
#include "starclass/utils/logging.hpp"
#include <Eigen/Dense>
#include <cmath>

namespace {

constexpr double kEpsilon = 1e-12;
// Variance below this fraction of mean(y^2), a 1e-12 relative amplitude, is
// rounding residue of a constant series.
constexpr double kRelativeEpsilon = 1e-24;
constexpr double kTwoPi = 6.28318530717958647692;

} // namespace

namespace starclass::periodogram {

std::vector<double> LombScargle(const std::vector<double>& times,
                                const std::vector<double>& values,
                                const std::vector<double>& frequencies) {
    if (times.size() != values.size()) {
        throw core::InvalidInputError("Lomb-Scargle requires times and values of equal length.");
    }
    const auto n = static_cast<Eigen::Index>(times.size());
    if (n < 2) {
        throw core::InvalidInputError("Lomb-Scargle requires at least two observations.");
    }

    std::vector<double> power(frequencies.size(), 0.0);

    const Eigen::Map<const Eigen::ArrayXd> t(times.data(), n);
    Eigen::ArrayXd y = Eigen::Map<const Eigen::ArrayXd>(values.data(), n);
    const double scale = y.square().mean();
    y -= y.mean();

    const double variance = y.square().sum() / static_cast<double>(n - 1);
    if (variance <= kRelativeEpsilon * scale) {
        STARCLASS_WARN("Lomb-Scargle skipped: variance of {} observations is zero.", n);
        return power;
    }

    Eigen::ArrayXd phase(n);
    Eigen::ArrayXd c(n);
    Eigen::ArrayXd s(n);

    for (std::size_t k = 0; k < frequencies.size(); ++k) {
        const double omega = kTwoPi * frequencies[k];
        if (std::fabs(omega) < kEpsilon) {
            continue;
        }

        phase = 2.0 * omega * t;
        const double tau = std::atan2(phase.sin().sum(), phase.cos().sum()) / (2.0 * omega);

        phase = omega * (t - tau);
        c = phase.cos();
        s = phase.sin();

        const double cc = c.square().sum();
        const double ss = s.square().sum();
        const double yc = (y * c).sum();
        const double ys = (y * s).sum();

        double accum = 0.0;
        if (cc > kEpsilon) {
            accum += yc * yc / cc;
        }
        if (ss > kEpsilon) {
            accum += ys * ys / ss;
        }
        power[k] = accum / (2.0 * variance);
    }

    return power;
}

std::vector<double> Linspace(double start, double stop, std::size_t count, bool endpoint) {
    std::vector<double> result;
    if (count == 0) {
        return result;
    }
    result.reserve(count);
    if (count == 1) {
        result.push_back(start);
        return result;
    }
    const std::size_t divisions = endpoint ? count - 1 : count;
    const double step = (stop - start) / static_cast<double>(divisions);
    for (std::size_t i = 0; i < count; ++i) {
        result.push_back(start + step * static_cast<double>(i));
    }
    if (endpoint) {
        result.back() = stop;
    }
    return result;
}

} // namespace starclass::periodogram
