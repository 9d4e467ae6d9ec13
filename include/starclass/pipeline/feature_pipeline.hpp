#pragma once

#include "starclass/catalog/star_catalog.hpp"
#include "starclass/core/light_curve.hpp"
#include "starclass/features/feature_vector.hpp"
#include "starclass/io/light_curve_provider.hpp"
#include "starclass/periodogram/periodogram.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace starclass::pipeline {

struct PipelineSummary {
	std::size_t processed = 0;
	std::size_t failed = 0;
	std::vector<std::int64_t> disabled_star_ids;
};

/**
 * @class FeaturePipeline
 * @brief Computes the feature rows of every star in every filter.
 *
 * Stars are processed one at a time; the periodogram config is shared
 * read-only and nothing computed for one star is reused for another.
 */
class FeaturePipeline {
public:
	explicit FeaturePipeline(periodogram::PeriodogramConfig config = periodogram::PeriodogramConfig());

	const periodogram::PeriodogramConfig &config() const {
		return engine_.config();
	}

	/**
	 * @brief Periodogram, peaks, both extractors and assembly for one curve.
	 * @throws InvalidInputError, InsufficientDataError or DegenerateTimeSpanError
	 *         for unusable curves.
	 */
	features::FeatureVector computeFeatures(const core::LightCurve &curve) const;

	/**
	 * @brief Fills the catalog with the features of every star.
	 *
	 * Every provider filter is registered in the catalog. A star whose curve
	 * cannot be read or processed in some filter is disabled and gets an
	 * empty row in that filter; the remaining stars are still processed.
	 * IndexOutOfRangeError is not caught.
	 */
	PipelineSummary run(catalog::StarCatalog &catalog, const io::LightCurveProvider &provider) const;

private:
	periodogram::PeriodogramEngine engine_;
};

} // namespace starclass::pipeline
