#include "starclass/catalog/train_eval_sets.hpp"
#include "starclass/core/errors.hpp"
#include "starclass/utils/logging.hpp"
#include <algorithm>
#include <numeric>
#include <random>
#include <sstream>
#include <stdexcept>

namespace starclass::catalog {

TrainEvalSets::TrainEvalSets(const StarCatalog &catalog, std::size_t min_cardinality, std::size_t training_percent,
                             std::uint32_t seed)
    : min_cardinality_(min_cardinality), training_percent_(training_percent) {
	if (training_percent_ > 100) {
		throw core::InvalidInputError("Training set percent must be within [0, 100], got " +
		                              std::to_string(training_percent_) + ".");
	}

	const auto &all_classes = catalog.uniqueClassNames();
	std::vector<std::vector<std::size_t>> members(all_classes.size());
	for (std::size_t i = 0; i < catalog.size(); ++i) {
		if (!catalog.isEnabled(i)) {
			STARCLASS_DEBUG("Star {} is disabled and left out of training.", catalog.starId(i));
			continue;
		}
		members[*catalog.classId(catalog.className(i))].push_back(i);
	}

	std::mt19937 rng(seed);
	for (std::size_t c = 0; c < all_classes.size(); ++c) {
		auto &instances = members[c];
		if (instances.empty() || instances.size() < min_cardinality_) {
			STARCLASS_INFO("Class {} ignored for training, {} enabled stars is below {}.", all_classes[c],
			               instances.size(), min_cardinality_);
			continue;
		}

		const std::size_t training_count = instances.size() * training_percent_ / 100;
		std::vector<std::size_t> positions(instances.size());
		std::iota(positions.begin(), positions.end(), 0);
		std::shuffle(positions.begin(), positions.end(), rng);
		std::sort(positions.begin() + static_cast<std::ptrdiff_t>(training_count), positions.end());

		std::vector<std::size_t> training;
		std::vector<std::size_t> evaluation;
		for (std::size_t p = 0; p < positions.size(); ++p) {
			(p < training_count ? training : evaluation).push_back(instances[positions[p]]);
		}

		STARCLASS_INFO("Class {} used for training, {} stars: {} for training and {} for evaluation.",
		               all_classes[c], instances.size(), training.size(), evaluation.size());
		class_names_.push_back(all_classes[c]);
		training_.push_back(std::move(training));
		evaluation_.push_back(std::move(evaluation));
	}
}

IndexedLabels TrainEvalSets::collect(const std::vector<std::vector<std::size_t>> &sets) const {
	IndexedLabels result;
	for (std::size_t label = 0; label < sets.size(); ++label) {
		for (std::size_t index : sets[label]) {
			result.indexes.push_back(index);
			result.labels.push_back(static_cast<int>(label));
		}
	}
	return result;
}

IndexedLabels TrainEvalSets::trainingIndexes() const {
	return collect(training_);
}

IndexedLabels TrainEvalSets::evaluationIndexes() const {
	return collect(evaluation_);
}

std::string TrainEvalSets::toString() const {
	std::ostringstream oss;
	oss << "TrainEvalSets(classes = " << class_names_.size() << ", min cardinality = " << min_cardinality_
	    << ", training percent = " << training_percent_ << ")";
	return oss.str();
}

LabeledFeatures SelectFeatures(const StarCatalog &catalog, std::size_t filter_index, const IndexedLabels &selection) {
	if (selection.indexes.size() != selection.labels.size()) {
		throw core::InvalidInputError("Selection holds " + std::to_string(selection.indexes.size()) +
		                              " stars but " + std::to_string(selection.labels.size()) + " labels.");
	}

	const std::size_t count = selection.indexes.size();
	std::size_t width = 0;
	for (std::size_t r = 0; r < count; ++r) {
		const auto &row = catalog.features(filter_index, selection.indexes[r]);
		if (row.empty()) {
			throw std::runtime_error("Star " + std::to_string(catalog.starId(selection.indexes[r])) +
			                         " has no features in filter '" + catalog.filterName(filter_index) + "'.");
		}
		if (r == 0) {
			width = row.size();
		} else if (row.size() != width) {
			throw std::runtime_error("Star " + std::to_string(catalog.starId(selection.indexes[r])) + " has " +
			                         std::to_string(row.size()) + " features in filter '" +
			                         catalog.filterName(filter_index) + "', expected " + std::to_string(width) +
			                         ".");
		}
	}

	LabeledFeatures result;
	result.matrix.resize(static_cast<Eigen::Index>(count), static_cast<Eigen::Index>(width));
	result.labels = selection.labels;
	result.star_ids.reserve(count);
	for (std::size_t r = 0; r < count; ++r) {
		const auto &row = catalog.features(filter_index, selection.indexes[r]);
		for (std::size_t c = 0; c < width; ++c) {
			result.matrix(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = row[c];
		}
		result.star_ids.push_back(catalog.starId(selection.indexes[r]));
	}
	return result;
}

} // namespace starclass::catalog
