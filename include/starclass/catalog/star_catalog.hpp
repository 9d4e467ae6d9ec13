#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace starclass::catalog {

struct StarEntry {
	std::int64_t id = 0;
	std::string class_name;
	bool enabled = true;
};

// Classifier input for one filter: one row per usable star.
struct LabeledFeatures {
	Eigen::MatrixXd matrix;
	std::vector<int> labels;
	std::vector<std::int64_t> star_ids;
};

/**
 * @class StarCatalog
 * @brief Stars of known or unknown class together with their feature rows.
 *
 * Stars are addressed by their insertion index. Feature rows are stored per
 * filter and per star; an empty row marks a star with no usable features in
 * that filter. A star disabled after a data-quality failure keeps its slot so
 * indices stay stable, but is excluded from labeledFeatures and from feature
 * files.
 */
class StarCatalog {
public:
	StarCatalog() = default;

	/**
	 * @brief Reads `id,class` rows.
	 * @throws std::runtime_error when the file cannot be opened or a row is malformed.
	 */
	static StarCatalog FromCsv(const std::string &path);

	std::size_t addStar(std::int64_t id, std::string class_name);

	std::size_t size() const {
		return stars_.size();
	}
	bool empty() const {
		return stars_.empty();
	}

	const StarEntry &star(std::size_t index) const;
	std::int64_t starId(std::size_t index) const;
	const std::string &className(std::size_t index) const;
	std::optional<std::size_t> indexOf(std::int64_t id) const;

	bool isEnabled(std::size_t index) const;
	void disable(std::size_t index);
	// Returns false when no star has this id.
	bool disableStar(std::int64_t id);
	std::size_t enabledCount() const;

	// Class names in order of first appearance.
	const std::vector<std::string> &uniqueClassNames() const {
		return unique_classes_;
	}
	std::optional<std::size_t> classId(const std::string &class_name) const;

	// Registers a filter; returns the existing index when already known.
	std::size_t addFilter(const std::string &name);
	std::size_t filterCount() const {
		return filters_.size();
	}
	const std::string &filterName(std::size_t index) const;
	std::optional<std::size_t> filterIndex(const std::string &name) const;

	void setFeatures(std::size_t filter_index, std::size_t star_index, std::vector<double> values);
	const std::vector<double> &features(std::size_t filter_index, std::size_t star_index) const;

	/**
	 * @brief Feature matrix and class labels of the enabled stars that have
	 *        features in the filter, in star order.
	 * @throws std::runtime_error when the usable rows differ in width.
	 */
	LabeledFeatures labeledFeatures(std::size_t filter_index) const;

private:
	void checkStar(std::size_t index) const;
	void checkFilter(std::size_t index) const;

	std::vector<StarEntry> stars_;
	std::vector<std::string> unique_classes_;
	std::vector<std::string> filters_;
	// features_[filter][star]
	std::vector<std::vector<std::vector<double>>> features_;
};

} // namespace starclass::catalog
