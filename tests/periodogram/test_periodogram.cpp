#include <catch2/catch.hpp>

#include "common/light_curve_helpers.hpp"
#include "starclass/core/errors.hpp"
#include "starclass/features/periodic_features.hpp"
#include "starclass/periodogram/periodogram.hpp"

#include <vector>

using Catch::Detail::Approx;
using starclass::core::DegenerateTimeSpanError;
using starclass::core::InsufficientDataError;
using starclass::core::InvalidInputError;
using starclass::features::PeriodicFeatures;
using starclass::periodogram::FindPeaks;
using starclass::periodogram::PeakSet;
using starclass::periodogram::PeriodogramConfig;
using starclass::periodogram::PeriodogramEngine;

namespace {

std::vector<double> makeRange(std::size_t count, double start = 0.0) {
	std::vector<double> values(count);
	for (std::size_t i = 0; i < count; ++i) {
		values[i] = start + static_cast<double>(i);
	}
	return values;
}

} // namespace

TEST_CASE("Leading outlier rejection skips an isolated first point", "[periodogram][outliers]") {
	std::vector<double> times {0.0};
	for (int i = 0; i <= 20; ++i) {
		times.push_back(1000.0 + i);
	}
	REQUIRE(PeriodogramEngine::rejectLeadingOutliers(times) == 1);
}

TEST_CASE("Leading outlier rejection keeps regular sampling", "[periodogram][outliers]") {
	REQUIRE(PeriodogramEngine::rejectLeadingOutliers(makeRange(50)) == 0);
}

TEST_CASE("Leading outlier rejection falls back to zero", "[periodogram][outliers]") {
	REQUIRE(PeriodogramEngine::rejectLeadingOutliers({0.0, 1.0, 3.0, 7.0, 15.0, 31.0}) == 0);
	REQUIRE_THROWS_AS(PeriodogramEngine::rejectLeadingOutliers({1.0}), InvalidInputError);
}

TEST_CASE("Periodogram result carries cleaned series and grid", "[periodogram][engine]") {
	std::vector<double> times {0.0};
	for (int i = 0; i <= 20; ++i) {
		times.push_back(1000.0 + i);
	}
	const auto magnitudes = tests::helpers::makeSinusoid(times, 0.2, 1.0, 10.0);

	const PeriodogramEngine engine;
	const auto result = engine.compute(times, magnitudes);

	REQUIRE(result.first_valid_index == 1);
	REQUIRE(result.cleaned.times.size() == 21);
	REQUIRE(result.cleaned.times.front() == 0.0);
	REQUIRE(result.cleaned.times.back() == 20.0);
	REQUIRE(result.cleaned.magnitudes.front() == magnitudes[1]);
	REQUIRE(result.frequencies.size() == PeriodogramConfig::kDefaultFrequencySampleCount);
	REQUIRE(result.spectrum.size() == result.frequencies.size());
	REQUIRE(result.frequencies.front() == PeriodogramEngine::kGridStartFrequency);
	REQUIRE(result.frequencies.back() < result.max_frequency_calculated);
	const double step = (result.max_frequency_calculated - PeriodogramEngine::kGridStartFrequency) /
	                    static_cast<double>(PeriodogramConfig::kDefaultFrequencySampleCount);
	REQUIRE(result.frequencies[1] - result.frequencies[0] == Approx(step));
	REQUIRE(result.frequencies.back() + step == Approx(result.max_frequency_calculated));
}

TEST_CASE("Periodogram maximum frequency never drops below the configured ceiling", "[periodogram][engine]") {
	const auto times = makeRange(100);
	const auto magnitudes = tests::helpers::makeSinusoid(times, 0.1, 1.0, 10.0);

	const auto wide = PeriodogramEngine().compute(times, magnitudes);
	REQUIRE(wide.max_frequency_calculated == 10000.0);

	const auto config = PeriodogramConfig::builder().maxFrequencyToSeek(0.1).build();
	const auto narrow = PeriodogramEngine(config).compute(times, magnitudes);
	REQUIRE(narrow.max_frequency_calculated == Approx(0.5));
}

TEST_CASE("Periodogram rejects unusable curves", "[periodogram][engine]") {
	const PeriodogramEngine engine;
	REQUIRE_THROWS_AS(engine.compute({0.0, 1.0, 2.0}, {1.0, 2.0, 1.5}), InsufficientDataError);
	REQUIRE_THROWS_AS(engine.compute({5.0, 5.0, 5.0, 5.0, 5.0}, {1.0, 2.0, 3.0, 2.0, 1.0}), DegenerateTimeSpanError);
	REQUIRE_THROWS_AS(engine.compute({0.0, 1.0, 2.0, 3.0}, {1.0, 2.0}), InvalidInputError);
}

TEST_CASE("Periodogram recovers a sinusoid frequency within one grid step", "[periodogram][engine]") {
	const auto config =
	    PeriodogramConfig::builder().firstFrequency(0.01).maxFrequencyToSeek(0.1).frequencySampleCount(1000).build();

	for (double frequency : {0.5, 1.7, 2.3}) {
		const auto curve = tests::helpers::makeSinusoidCurve(500, 100.0, frequency);
		const auto result = PeriodogramEngine(config).compute(curve);
		const double step = (result.max_frequency_calculated - config.firstFrequency()) /
		                    static_cast<double>(config.frequencySampleCount());

		const PeriodicFeatures features(result);
		REQUIRE(features.fundamentalFrequency(0).value == Approx(frequency).margin(step));
	}
}

TEST_CASE("Grid samples match the reported peak frequencies", "[periodogram][engine]") {
	const auto config =
	    PeriodogramConfig::builder().firstFrequency(0.01).maxFrequencyToSeek(0.1).frequencySampleCount(1000).build();
	const auto curve = tests::helpers::makeSinusoidCurve(500, 100.0, 1.7);
	const auto result = PeriodogramEngine(config).compute(curve);

	const PeriodicFeatures features(result);
	for (std::size_t i = 0; i < result.frequencies.size(); i += 37) {
		REQUIRE(features.frequencyAt(i) == result.frequencies[i]);
	}
	REQUIRE(features.frequencyAt(result.frequencies.size() - 1) == result.frequencies.back());
}

TEST_CASE("FindPeaks returns distinct maxima in descending order", "[periodogram][peaks]") {
	REQUIRE(FindPeaks({1.0, 5.0, 3.0, 5.0, 2.0}, 3) == PeakSet {1, 3, 2});
	REQUIRE(FindPeaks({0.5, 4.0, 1.0, 3.0, 2.0, 0.1}, 4) == PeakSet {1, 3, 4, 2});
}

TEST_CASE("FindPeaks handles short and flat spectra", "[periodogram][peaks]") {
	REQUIRE(FindPeaks({2.0, 1.0}, 3) == PeakSet {0, 1});
	REQUIRE(FindPeaks({}, 3).empty());
	REQUIRE(FindPeaks({0.0, 0.0, 0.0}, 2) == PeakSet {0, 0});
}
