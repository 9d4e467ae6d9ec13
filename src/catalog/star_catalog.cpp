#include "starclass/catalog/star_catalog.hpp"
#include "starclass/core/errors.hpp"
#include "starclass/utils/csv.hpp"
#include "starclass/utils/logging.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace starclass::catalog {

StarCatalog StarCatalog::FromCsv(const std::string &path) {
	std::ifstream input(path);
	if (!input) {
		throw std::runtime_error("Cannot open star classes file '" + path + "'.");
	}

	StarCatalog catalog;
	std::string line;
	std::size_t line_number = 0;
	bool first_row = true;
	while (std::getline(input, line)) {
		++line_number;
		if (utils::IsSkippableLine(line)) {
			continue;
		}
		auto fields = utils::SplitCsvLine(line);
		if (first_row) {
			first_row = false;
			if (!utils::LooksNumeric(fields.front())) {
				continue;
			}
		}
		if (fields.size() < 2) {
			throw std::runtime_error(path + ":" + std::to_string(line_number) + ": expected 'id,class'.");
		}
		const std::string &id_text = fields[0];
		std::string class_name = std::move(fields[1]);
		const std::int64_t id = utils::ParseInt64(id_text, path, line_number);
		catalog.addStar(id, std::move(class_name));
	}

	STARCLASS_INFO("Read {} stars of {} classes from '{}'.", catalog.size(), catalog.uniqueClassNames().size(), path);
	return catalog;
}

std::size_t StarCatalog::addStar(std::int64_t id, std::string class_name) {
	if (std::find(unique_classes_.begin(), unique_classes_.end(), class_name) == unique_classes_.end()) {
		unique_classes_.push_back(class_name);
	}
	StarEntry entry;
	entry.id = id;
	entry.class_name = std::move(class_name);
	stars_.push_back(std::move(entry));
	for (auto &filter_rows : features_) {
		filter_rows.emplace_back();
	}
	return stars_.size() - 1;
}

void StarCatalog::checkStar(std::size_t index) const {
	if (index >= stars_.size()) {
		throw core::IndexOutOfRangeError("Star index " + std::to_string(index) + " is out of range (" +
		                                 std::to_string(stars_.size()) + " stars).");
	}
}

void StarCatalog::checkFilter(std::size_t index) const {
	if (index >= filters_.size()) {
		throw core::IndexOutOfRangeError("Filter index " + std::to_string(index) + " is out of range (" +
		                                 std::to_string(filters_.size()) + " filters).");
	}
}

const StarEntry &StarCatalog::star(std::size_t index) const {
	checkStar(index);
	return stars_[index];
}

std::int64_t StarCatalog::starId(std::size_t index) const {
	return star(index).id;
}

const std::string &StarCatalog::className(std::size_t index) const {
	return star(index).class_name;
}

std::optional<std::size_t> StarCatalog::indexOf(std::int64_t id) const {
	for (std::size_t i = 0; i < stars_.size(); ++i) {
		if (stars_[i].id == id) {
			return i;
		}
	}
	return std::nullopt;
}

bool StarCatalog::isEnabled(std::size_t index) const {
	return star(index).enabled;
}

void StarCatalog::disable(std::size_t index) {
	checkStar(index);
	stars_[index].enabled = false;
}

bool StarCatalog::disableStar(std::int64_t id) {
	auto index = indexOf(id);
	if (!index) {
		return false;
	}
	if (stars_[*index].enabled) {
		STARCLASS_DEBUG("Disabling star {} at index {}.", id, *index);
	}
	stars_[*index].enabled = false;
	return true;
}

std::size_t StarCatalog::enabledCount() const {
	return static_cast<std::size_t>(
	    std::count_if(stars_.begin(), stars_.end(), [](const StarEntry &entry) { return entry.enabled; }));
}

std::optional<std::size_t> StarCatalog::classId(const std::string &class_name) const {
	auto it = std::find(unique_classes_.begin(), unique_classes_.end(), class_name);
	if (it == unique_classes_.end()) {
		return std::nullopt;
	}
	return static_cast<std::size_t>(std::distance(unique_classes_.begin(), it));
}

std::size_t StarCatalog::addFilter(const std::string &name) {
	if (auto existing = filterIndex(name)) {
		return *existing;
	}
	filters_.push_back(name);
	features_.emplace_back(stars_.size());
	return filters_.size() - 1;
}

const std::string &StarCatalog::filterName(std::size_t index) const {
	checkFilter(index);
	return filters_[index];
}

std::optional<std::size_t> StarCatalog::filterIndex(const std::string &name) const {
	auto it = std::find(filters_.begin(), filters_.end(), name);
	if (it == filters_.end()) {
		return std::nullopt;
	}
	return static_cast<std::size_t>(std::distance(filters_.begin(), it));
}

void StarCatalog::setFeatures(std::size_t filter_index, std::size_t star_index, std::vector<double> values) {
	checkFilter(filter_index);
	checkStar(star_index);
	features_[filter_index][star_index] = std::move(values);
}

const std::vector<double> &StarCatalog::features(std::size_t filter_index, std::size_t star_index) const {
	checkFilter(filter_index);
	checkStar(star_index);
	return features_[filter_index][star_index];
}

LabeledFeatures StarCatalog::labeledFeatures(std::size_t filter_index) const {
	checkFilter(filter_index);
	const auto &rows = features_[filter_index];

	std::vector<std::size_t> usable;
	std::size_t width = 0;
	for (std::size_t i = 0; i < stars_.size(); ++i) {
		if (!stars_[i].enabled || rows[i].empty()) {
			continue;
		}
		if (usable.empty()) {
			width = rows[i].size();
		} else if (rows[i].size() != width) {
			throw std::runtime_error("Star " + std::to_string(stars_[i].id) + " has " +
			                         std::to_string(rows[i].size()) + " features in filter '" +
			                         filters_[filter_index] + "', expected " + std::to_string(width) + ".");
		}
		usable.push_back(i);
	}

	LabeledFeatures result;
	result.matrix.resize(static_cast<Eigen::Index>(usable.size()), static_cast<Eigen::Index>(width));
	result.labels.reserve(usable.size());
	result.star_ids.reserve(usable.size());
	for (std::size_t r = 0; r < usable.size(); ++r) {
		const auto &row = rows[usable[r]];
		for (std::size_t c = 0; c < width; ++c) {
			result.matrix(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = row[c];
		}
		result.labels.push_back(static_cast<int>(*classId(stars_[usable[r]].class_name)));
		result.star_ids.push_back(stars_[usable[r]].id);
	}
	return result;
}

} // namespace starclass::catalog
