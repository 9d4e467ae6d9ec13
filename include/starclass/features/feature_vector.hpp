#pragma once

#include "starclass/features/feature_types.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace starclass::features {

class PeriodicFeatures;
class NonPeriodicFeatures;

/**
 * @class FeatureVector
 * @brief The fixed, named feature row of one star in one filter.
 *
 * Column order: for each of the first three peaks, its frequency, its
 * amplitude and four harmonic amplitudes; then the spectrum floor; then the
 * seventeen non-periodic features. Saved feature files and trained models
 * rely on this order.
 */
class FeatureVector {
public:
	static constexpr std::size_t kFundamentalCount = 3;
	static constexpr std::size_t kPeriodicSize = kFundamentalCount * 6 + 1;
	static constexpr std::size_t kNonPeriodicSize = 17;
	static constexpr std::size_t kSize = kPeriodicSize + kNonPeriodicSize;

	FeatureVector() = default;

	std::size_t size() const {
		return entries_.size();
	}
	bool empty() const {
		return entries_.empty();
	}
	const FeatureResult &operator[](std::size_t index) const {
		return entries_[index];
	}
	const std::vector<FeatureResult> &entries() const {
		return entries_;
	}

	std::vector<double> values() const;
	std::vector<std::string> names() const;

	// Column names in the fixed order, independent of any star.
	static const std::vector<std::string> &ColumnNames();

private:
	friend FeatureVector Assemble(const PeriodicFeatures &periodic, const NonPeriodicFeatures &non_periodic);

	explicit FeatureVector(std::vector<FeatureResult> entries);

	std::vector<FeatureResult> entries_;
};

/**
 * @brief Concatenates periodic and non-periodic features in column order.
 * @throws IndexOutOfRangeError when fewer than three peaks are configured.
 */
FeatureVector Assemble(const PeriodicFeatures &periodic, const NonPeriodicFeatures &non_periodic);

} // namespace starclass::features
