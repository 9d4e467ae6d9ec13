#include <catch2/catch.hpp>

#include "common/light_curve_helpers.hpp"
#include "starclass/core/errors.hpp"
#include "starclass/features/feature_vector.hpp"
#include "starclass/features/non_periodic_features.hpp"
#include "starclass/features/periodic_features.hpp"
#include "starclass/periodogram/periodogram.hpp"

using Catch::Detail::Approx;
using starclass::core::IndexOutOfRangeError;
using starclass::features::Assemble;
using starclass::features::FeatureVector;
using starclass::features::NonPeriodicFeatures;
using starclass::features::PeriodicFeatures;
using starclass::periodogram::PeriodogramConfig;
using starclass::periodogram::PeriodogramEngine;

TEST_CASE("Feature vector column layout", "[features][vector]") {
	const auto &columns = FeatureVector::ColumnNames();
	REQUIRE(columns.size() == 36);
	REQUIRE(columns[0] == "Fund_Freq_0");
	REQUIRE(columns[1] == "Fund_Amp_0");
	REQUIRE(columns[2] == "Amp_Harm_0_0");
	REQUIRE(columns[5] == "Amp_Harm_0_3");
	REQUIRE(columns[6] == "Fund_Freq_1");
	REQUIRE(columns[12] == "Fund_Freq_2");
	REQUIRE(columns[18] == "Freq_Offset");
	REQUIRE(columns[19] == "Amp_diff");
	REQUIRE(columns[21] == "Linear_Tren");
	REQUIRE(columns[27] == "Percent_Diff_flux_Percentile");
	REQUIRE(columns[35] == "Flux_Percentile_Ratio_Mid80");
}

TEST_CASE("Assemble concatenates periodic and non-periodic features", "[features][vector]") {
	const auto curve = tests::helpers::makeSinusoidCurve(120, 30.0, 0.4);
	const auto config = PeriodogramConfig::builder().firstFrequency(0.01).maxFrequencyToSeek(0.1).build();
	const auto result = PeriodogramEngine(config).compute(curve);
	const PeriodicFeatures periodic(result);
	const NonPeriodicFeatures non_periodic(result.cleaned.magnitudes, result.cleaned.times);

	const auto vector = Assemble(periodic, non_periodic);
	REQUIRE(vector.size() == FeatureVector::kSize);
	REQUIRE(vector.names() == FeatureVector::ColumnNames());

	const auto values = vector.values();
	REQUIRE(values.size() == 36);
	REQUIRE(values[0] == Approx(periodic.fundamentalFrequency(0).value));
	REQUIRE(values[18] == Approx(periodic.spectrumFloorOffset().value));
	REQUIRE(values[30] == Approx(non_periodic.stdDev().value));
	for (const auto &entry : vector.entries()) {
		REQUIRE_FALSE(entry.is_nan);
	}
}

TEST_CASE("Assemble needs three fundamentals", "[features][vector]") {
	const auto curve = tests::helpers::makeSinusoidCurve(60, 20.0, 0.3);
	const auto config = PeriodogramConfig::builder().numPeaks(2).build();
	const auto result = PeriodogramEngine(config).compute(curve);
	const PeriodicFeatures periodic(result);
	const NonPeriodicFeatures non_periodic(result.cleaned.magnitudes, result.cleaned.times);
	REQUIRE_THROWS_AS(Assemble(periodic, non_periodic), IndexOutOfRangeError);
}
