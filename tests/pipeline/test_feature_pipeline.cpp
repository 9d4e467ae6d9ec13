#include <catch2/catch.hpp>

#include "common/light_curve_helpers.hpp"
#include "starclass/core/errors.hpp"
#include "starclass/features/feature_types.hpp"
#include "starclass/io/feature_file.hpp"
#include "starclass/io/light_curve_provider.hpp"
#include "starclass/pipeline/feature_pipeline.hpp"

#include <algorithm>
#include <cmath>
#include <string>

using Catch::Detail::Approx;
using starclass::catalog::StarCatalog;
using starclass::core::InsufficientDataError;
using starclass::core::IndexOutOfRangeError;
using starclass::core::LightCurve;
using starclass::features::FeatureVector;
namespace names = starclass::features::names;
using starclass::io::FeatureFile;
using starclass::io::InMemoryLightCurveProvider;
using starclass::periodogram::PeriodogramConfig;
using starclass::pipeline::FeaturePipeline;

namespace {

PeriodogramConfig narrowConfig() {
	return PeriodogramConfig::builder().firstFrequency(0.01).maxFrequencyToSeek(0.1).frequencySampleCount(400).build();
}

double valueOf(const FeatureVector &vector, const std::string &name) {
	const auto &entries = vector.entries();
	const auto it =
	    std::find_if(entries.begin(), entries.end(), [&](const auto &entry) { return entry.name == name; });
	REQUIRE(it != entries.end());
	return it->value;
}

} // namespace

TEST_CASE("Pipeline computes a full feature vector", "[pipeline]") {
	const FeaturePipeline pipeline(narrowConfig());
	const auto curve = tests::helpers::makeSinusoidCurve(200, 40.0, 0.25);
	const auto vector = pipeline.computeFeatures(curve);

	REQUIRE(vector.size() == FeatureVector::kSize);
	REQUIRE(vector.names() == FeatureVector::ColumnNames());
	REQUIRE(vector[0].value == Approx(0.25).margin(0.02));
	REQUIRE(vector[19].name == "Amp_diff");
	REQUIRE(vector[19].value == Approx(0.5).margin(0.01));
}

TEST_CASE("Pipeline propagates data quality errors from a single curve", "[pipeline]") {
	const FeaturePipeline pipeline;
	REQUIRE_THROWS_AS(pipeline.computeFeatures(LightCurve({0.0, 1.0, 2.0}, {1.0, 2.0, 1.0})), InsufficientDataError);
}

TEST_CASE("Pipeline disables stars whose curves fail", "[pipeline]") {
	StarCatalog catalog;
	catalog.addStar(1, "RRLYR");
	catalog.addStar(2, "CEPH");
	catalog.addStar(3, "MIRA");

	InMemoryLightCurveProvider provider;
	provider.add(1, "V", tests::helpers::makeSinusoidCurve(120, 30.0, 0.3));
	provider.add(1, "B", tests::helpers::makeSinusoidCurve(120, 30.0, 0.3, 11.0));
	provider.add(2, "V", LightCurve({0.0, 1.0, 2.0}, {10.0, 10.5, 10.2}));
	provider.add(2, "B", tests::helpers::makeSinusoidCurve(80, 20.0, 0.5));
	provider.add(3, "V", tests::helpers::makeSinusoidCurve(90, 25.0, 0.2));

	const FeaturePipeline pipeline(narrowConfig());
	const auto summary = pipeline.run(catalog, provider);

	REQUIRE(summary.processed == 4);
	REQUIRE(summary.failed == 2);
	REQUIRE(summary.disabled_star_ids == std::vector<std::int64_t> {2, 3});

	REQUIRE(catalog.filterCount() == 2);
	REQUIRE(catalog.isEnabled(0));
	REQUIRE_FALSE(catalog.isEnabled(1));
	REQUIRE_FALSE(catalog.isEnabled(2));
	REQUIRE(catalog.features(0, 0).size() == FeatureVector::kSize);
	REQUIRE(catalog.features(0, 1).empty());
	REQUIRE(catalog.features(1, 2).empty());

	const auto labeled = catalog.labeledFeatures(*catalog.filterIndex("V"));
	REQUIRE(labeled.matrix.rows() == 1);
	REQUIRE(labeled.matrix.cols() == static_cast<Eigen::Index>(FeatureVector::kSize));
	REQUIRE(labeled.star_ids == std::vector<std::int64_t> {1});
}

TEST_CASE("Pipeline stops on feature layout errors", "[pipeline]") {
	StarCatalog catalog;
	catalog.addStar(1, "RRLYR");
	InMemoryLightCurveProvider provider;
	provider.add(1, "V", tests::helpers::makeSinusoidCurve(60, 20.0, 0.3));

	const FeaturePipeline pipeline(PeriodogramConfig::builder().numPeaks(2).build());
	REQUIRE_THROWS_AS(pipeline.run(catalog, provider), IndexOutOfRangeError);
}

TEST_CASE("Pipeline output round-trips through feature files", "[pipeline][io]") {
	tests::helpers::TempDirectory dir("pipeline");
	StarCatalog catalog;
	catalog.addStar(10, "RRLYR");
	catalog.addStar(11, "CEPH");
	InMemoryLightCurveProvider provider;
	provider.add(10, "V", tests::helpers::makeSinusoidCurve(100, 30.0, 0.4));
	provider.add(11, "V", tests::helpers::makeSinusoidCurve(100, 30.0, 0.15, 9.0));

	const FeaturePipeline pipeline(narrowConfig());
	pipeline.run(catalog, provider);
	const auto base = dir.file("features.csv");
	FeatureFile::Write(base, catalog, FeatureVector::ColumnNames());

	StarCatalog loaded;
	REQUIRE(FeatureFile::Read(base, loaded));
	REQUIRE(loaded.size() == 2);
	const auto &original = catalog.features(0, 1);
	const auto &restored = loaded.features(0, 1);
	REQUIRE(restored.size() == original.size());
	for (std::size_t i = 0; i < original.size(); ++i) {
		REQUIRE(restored[i] == original[i]);
	}
	REQUIRE(FeatureFile::ReadColumnNames(dir.file("features_V.csv")) == FeatureVector::ColumnNames());
}

TEST_CASE("Pipeline features hold at flux scale", "[pipeline]") {
	const auto times = tests::helpers::makeEvenTimes(500, 100.0);
	const auto magnitudes = tests::helpers::makeSinusoid(times, 0.5, 1.0, 3.0);
	std::vector<double> fluxes(magnitudes.size());
	std::transform(magnitudes.begin(), magnitudes.end(), fluxes.begin(), [](double m) { return m * 1e-13; });

	const auto config =
	    PeriodogramConfig::builder().firstFrequency(0.01).maxFrequencyToSeek(0.1).frequencySampleCount(1000).build();
	const FeaturePipeline pipeline(config);
	const auto bright = pipeline.computeFeatures(LightCurve(times, magnitudes));
	const auto faint = pipeline.computeFeatures(LightCurve(times, fluxes));

	REQUIRE(valueOf(faint, names::FundamentalAmplitude(0)) > 0.0);
	REQUIRE(valueOf(faint, names::FundamentalFrequency(0)) == valueOf(bright, names::FundamentalFrequency(0)));
	REQUIRE(valueOf(faint, names::FundamentalAmplitude(0)) ==
	        Approx(valueOf(bright, names::FundamentalAmplitude(0))).epsilon(1e-6));

	REQUIRE(valueOf(faint, names::kSkew) == Approx(valueOf(bright, names::kSkew)).margin(1e-6));
	REQUIRE(valueOf(faint, names::kKurtosis) == Approx(valueOf(bright, names::kKurtosis)));
	REQUIRE(valueOf(bright, names::kKurtosis) == Approx(-1.5).margin(0.01));
	for (const char *name : {names::kPercentAmplitude, names::kPercentDifferenceFluxPercentile,
	                         names::kFluxPercentileRatioMid20, names::kFluxPercentileRatioMid50,
	                         names::kFluxPercentileRatioMid80}) {
		REQUIRE(valueOf(bright, name) != 0.0);
		REQUIRE(valueOf(faint, name) == Approx(valueOf(bright, name)));
	}

	REQUIRE(valueOf(faint, names::kStdDev) == Approx(valueOf(bright, names::kStdDev) * 1e-13));
	REQUIRE(valueOf(faint, names::kAmplitudeDif) == Approx(valueOf(bright, names::kAmplitudeDif) * 1e-13));
}
