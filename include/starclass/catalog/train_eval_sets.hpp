#pragma once

#include "starclass/catalog/star_catalog.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace starclass::catalog {

// Catalog star indexes paired with the label of the class each one trains.
struct IndexedLabels {
	std::vector<std::size_t> indexes;
	std::vector<int> labels;
};

/**
 * @class TrainEvalSets
 * @brief Per-class random split of the enabled stars into training and
 *        evaluation sets.
 *
 * A class takes part only when it has at least min_cardinality enabled stars.
 * Labels number the participating classes from 0 in catalog class order. For
 * each class, training_percent * count / 100 (rounded down) stars are drawn at
 * random for training and the rest go to evaluation in catalog order. The
 * split is reproducible for a given seed.
 */
class TrainEvalSets {
public:
	static constexpr std::size_t kDefaultMinCardinality = 15;
	static constexpr std::size_t kDefaultTrainingPercent = 65;
	static constexpr std::uint32_t kDefaultSeed = 5489u;

	/**
	 * @throws InvalidInputError when training_percent exceeds 100.
	 */
	explicit TrainEvalSets(const StarCatalog &catalog, std::size_t min_cardinality = kDefaultMinCardinality,
	                       std::size_t training_percent = kDefaultTrainingPercent,
	                       std::uint32_t seed = kDefaultSeed);

	std::size_t minCardinality() const {
		return min_cardinality_;
	}
	std::size_t trainingPercent() const {
		return training_percent_;
	}

	// Participating class names; position is the label.
	const std::vector<std::string> &classNames() const {
		return class_names_;
	}
	std::size_t classCount() const {
		return class_names_.size();
	}

	// Grouped class by class, in label order.
	IndexedLabels trainingIndexes() const;
	IndexedLabels evaluationIndexes() const;

	std::string toString() const;

private:
	IndexedLabels collect(const std::vector<std::vector<std::size_t>> &sets) const;

	std::size_t min_cardinality_;
	std::size_t training_percent_;
	std::vector<std::string> class_names_;
	// Catalog star indexes per class, split in two.
	std::vector<std::vector<std::size_t>> training_;
	std::vector<std::vector<std::size_t>> evaluation_;
};

/**
 * @brief Feature matrix of the selected stars in one filter, rows in the order
 *        of the selection and labelled with its labels.
 * @throws IndexOutOfRangeError for an unknown filter or star index.
 * @throws std::runtime_error when a selected star has no features in the
 *         filter or the rows differ in width.
 */
LabeledFeatures SelectFeatures(const StarCatalog &catalog, std::size_t filter_index, const IndexedLabels &selection);

} // namespace starclass::catalog
