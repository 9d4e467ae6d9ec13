#include "starclass/io/light_curve_provider.hpp"
#include "starclass/utils/csv.hpp"
#include "starclass/utils/logging.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <utility>

namespace starclass::io {

core::LightCurve ReadLightCurveCsv(const std::string &path) {
	std::ifstream input(path);
	if (!input) {
		throw std::runtime_error("Cannot open light curve file '" + path + "'.");
	}

	core::LightCurve curve;
	std::string line;
	std::size_t line_number = 0;
	bool first_row = true;
	while (std::getline(input, line)) {
		++line_number;
		if (utils::IsSkippableLine(line)) {
			continue;
		}
		const auto fields = utils::SplitCsvLine(line);
		if (first_row) {
			first_row = false;
			if (!utils::LooksNumeric(fields.front())) {
				continue;
			}
		}
		if (fields.size() < 2) {
			throw std::runtime_error(path + ":" + std::to_string(line_number) +
			                         ": expected at least time and magnitude columns.");
		}
		const double time = utils::ParseDouble(fields[0], path, line_number);
		const double magnitude = utils::ParseDouble(fields[1], path, line_number);
		const double snr = fields.size() > 2 ? utils::ParseDouble(fields[2], path, line_number)
		                                     : std::numeric_limits<double>::quiet_NaN();
		curve.addObservation(time, magnitude, snr);
	}

	STARCLASS_TRACE("Read {} observations from '{}'.", curve.size(), path);
	return curve;
}

CsvLightCurveProvider::CsvLightCurveProvider(std::string directory, std::vector<std::string> filters)
    : directory_(std::move(directory)), filters_(std::move(filters)) {
}

std::string CsvLightCurveProvider::curvePath(std::int64_t star_id, const std::string &filter) const {
	return (std::filesystem::path(directory_) / (std::to_string(star_id) + "_" + filter + ".csv")).string();
}

core::LightCurve CsvLightCurveProvider::getLightCurve(std::int64_t star_id, const std::string &filter) const {
	return ReadLightCurveCsv(curvePath(star_id, filter));
}

void InMemoryLightCurveProvider::add(std::int64_t star_id, const std::string &filter, core::LightCurve curve) {
	if (std::find(filters_.begin(), filters_.end(), filter) == filters_.end()) {
		filters_.push_back(filter);
	}
	curves_[{star_id, filter}] = std::move(curve);
}

core::LightCurve InMemoryLightCurveProvider::getLightCurve(std::int64_t star_id, const std::string &filter) const {
	auto it = curves_.find({star_id, filter});
	if (it == curves_.end()) {
		throw std::runtime_error("No light curve for star " + std::to_string(star_id) + " in filter '" + filter +
		                         "'.");
	}
	return it->second;
}

} // namespace starclass::io
