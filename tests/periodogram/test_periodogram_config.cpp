#include <catch2/catch.hpp>

#include "starclass/core/errors.hpp"
#include "starclass/periodogram/periodogram_config.hpp"

#include <limits>

using starclass::core::InvalidInputError;
using starclass::periodogram::PeriodogramConfig;

TEST_CASE("Periodogram config defaults", "[periodogram][config]") {
	const PeriodogramConfig config;
	REQUIRE(config.firstFrequency() == 1.0);
	REQUIRE(config.maxFrequencyToSeek() == 10000.0);
	REQUIRE(config.frequencySampleCount() == 200);
	REQUIRE(config.numPeaks() == 3);
}

TEST_CASE("Periodogram config builder overrides fields", "[periodogram][config]") {
	const auto config = PeriodogramConfig::builder()
	                        .firstFrequency(0.05)
	                        .maxFrequencyToSeek(20.0)
	                        .frequencySampleCount(512)
	                        .numPeaks(5)
	                        .build();
	REQUIRE(config.firstFrequency() == 0.05);
	REQUIRE(config.maxFrequencyToSeek() == 20.0);
	REQUIRE(config.frequencySampleCount() == 512);
	REQUIRE(config.numPeaks() == 5);
	REQUIRE_FALSE(config.toString().empty());
}

TEST_CASE("Periodogram config builder validates", "[periodogram][config]") {
	REQUIRE_THROWS_AS(PeriodogramConfig::builder().firstFrequency(0.0).build(), InvalidInputError);
	REQUIRE_THROWS_AS(PeriodogramConfig::builder().firstFrequency(-1.0).build(), InvalidInputError);
	REQUIRE_THROWS_AS(PeriodogramConfig::builder().maxFrequencyToSeek(0.0).build(), InvalidInputError);
	REQUIRE_THROWS_AS(
	    PeriodogramConfig::builder().maxFrequencyToSeek(std::numeric_limits<double>::infinity()).build(),
	    InvalidInputError);
	REQUIRE_THROWS_AS(PeriodogramConfig::builder().frequencySampleCount(1).build(), InvalidInputError);
	REQUIRE_THROWS_AS(PeriodogramConfig::builder().numPeaks(0).build(), InvalidInputError);
}
