#pragma once

#include "starclass/core/light_curve.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace starclass::io {

/**
 * @brief Source of light curves, one per (star, filter).
 *
 * Implementations throw when a curve is missing or malformed; the pipeline
 * disables the star in that case.
 */
class LightCurveProvider {
public:
	virtual ~LightCurveProvider() = default;

	virtual std::vector<std::string> filters() const = 0;
	virtual core::LightCurve getLightCurve(std::int64_t star_id, const std::string &filter) const = 0;
};

/**
 * @brief Reads a light curve from `time,magnitude[,snr]` rows.
 *
 * A leading non-numeric row is taken as a header. Blank lines and lines
 * starting with '#' are skipped.
 *
 * @throws std::runtime_error when the file cannot be read or a row is malformed.
 */
core::LightCurve ReadLightCurveCsv(const std::string &path);

// Curves stored as `<directory>/<star_id>_<filter>.csv`.
class CsvLightCurveProvider : public LightCurveProvider {
public:
	CsvLightCurveProvider(std::string directory, std::vector<std::string> filters);

	std::vector<std::string> filters() const override {
		return filters_;
	}
	core::LightCurve getLightCurve(std::int64_t star_id, const std::string &filter) const override;

	std::string curvePath(std::int64_t star_id, const std::string &filter) const;

private:
	std::string directory_;
	std::vector<std::string> filters_;
};

class InMemoryLightCurveProvider : public LightCurveProvider {
public:
	void add(std::int64_t star_id, const std::string &filter, core::LightCurve curve);

	std::vector<std::string> filters() const override {
		return filters_;
	}
	core::LightCurve getLightCurve(std::int64_t star_id, const std::string &filter) const override;

private:
	std::vector<std::string> filters_;
	std::map<std::pair<std::int64_t, std::string>, core::LightCurve> curves_;
};

} // namespace starclass::io
