#include "starclass/pipeline/feature_pipeline.hpp"
#include "starclass/core/errors.hpp"
#include "starclass/features/non_periodic_features.hpp"
#include "starclass/features/periodic_features.hpp"
#include "starclass/utils/logging.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace starclass::pipeline {

FeaturePipeline::FeaturePipeline(periodogram::PeriodogramConfig config) : engine_(std::move(config)) {
}

features::FeatureVector FeaturePipeline::computeFeatures(const core::LightCurve &curve) const {
	const auto result = engine_.compute(curve);
	const features::PeriodicFeatures periodic(result);
	const features::NonPeriodicFeatures non_periodic(result.cleaned.magnitudes, result.cleaned.times);
	return features::Assemble(periodic, non_periodic);
}

PipelineSummary FeaturePipeline::run(catalog::StarCatalog &catalog, const io::LightCurveProvider &provider) const {
	PipelineSummary summary;

	std::vector<std::size_t> filter_indices;
	std::string filter_list;
	const auto filters = provider.filters();
	for (const auto &filter : filters) {
		filter_indices.push_back(catalog.addFilter(filter));
		filter_list += filter_list.empty() ? filter : ", " + filter;
	}

	STARCLASS_INFO("Calculating features of {} stars in filters [{}] with {}.", catalog.size(), filter_list,
	               engine_.config().toString());

	const std::size_t star_count = catalog.size();
	std::size_t last_reported = 0;
	for (std::size_t s = 0; s < star_count; ++s) {
		const std::int64_t star_id = catalog.starId(s);
		for (std::size_t f = 0; f < filters.size(); ++f) {
			std::string failure;
			try {
				auto vector = computeFeatures(provider.getLightCurve(star_id, filters[f]));
				catalog.setFeatures(filter_indices[f], s, vector.values());
				++summary.processed;
				continue;
			} catch (const core::IndexOutOfRangeError &) {
				throw;
			} catch (const core::DataQualityError &e) {
				failure = e.what();
			} catch (const core::InvalidInputError &e) {
				failure = e.what();
			} catch (const std::runtime_error &e) {
				failure = e.what();
			}

			STARCLASS_WARN("Star {} in filter '{}' disabled: {}", star_id, filters[f], failure);
			++summary.failed;
			if (catalog.isEnabled(s)) {
				summary.disabled_star_ids.push_back(star_id);
			}
			catalog.disable(s);
			catalog.setFeatures(filter_indices[f], s, {});
		}

		const std::size_t percent = (s + 1) * 100 / star_count;
		if (percent / 10 > last_reported / 10) {
			STARCLASS_INFO("Calculating features for stars: {}% done.", percent);
			last_reported = percent;
		}
	}

	STARCLASS_INFO("Finished calculating features: {} rows computed, {} failures, {} stars disabled.",
	               summary.processed, summary.failed, summary.disabled_star_ids.size());
	return summary;
}

} // namespace starclass::pipeline
