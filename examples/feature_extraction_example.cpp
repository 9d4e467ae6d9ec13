#include "starclass/catalog/star_catalog.hpp"
#include "starclass/catalog/train_eval_sets.hpp"
#include "starclass/io/feature_file.hpp"
#include "starclass/io/light_curve_provider.hpp"
#include "starclass/pipeline/feature_pipeline.hpp"
#include "starclass/utils/logging.hpp"

#include <cmath>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <random>
#include <vector>

using namespace starclass;

namespace {

// Irregularly sampled curve with a handful of seasons and one stray early epoch.
core::LightCurve synthesizeCurve(double frequency, double amplitude, double mean_mag, unsigned seed) {
	std::mt19937 rng(seed);
	std::uniform_real_distribution<double> jitter(0.0, 0.4);
	std::normal_distribution<double> noise(0.0, 0.02);

	core::LightCurve curve;
	curve.addObservation(0.0, mean_mag + noise(rng), 15.0);
	double t = 400.0;
	for (int season = 0; season < 4; ++season) {
		for (int night = 0; night < 45; ++night) {
			t += 0.8 + jitter(rng);
			const double phase = 2.0 * M_PI * frequency * t;
			const double mag = mean_mag + amplitude * std::sin(phase) + 0.3 * amplitude * std::sin(2.0 * phase);
			curve.addObservation(t, mag + noise(rng), 40.0 + 5.0 * jitter(rng));
		}
		t += 20.0;
	}
	return curve;
}

void printVector(std::int64_t star_id, const features::FeatureVector &vector) {
	std::cout << "Star " << star_id << '\n';
	for (const auto &entry : vector.entries()) {
		std::cout << "  " << std::setw(30) << std::left << entry.name << std::right << std::setprecision(6)
		          << entry.value << '\n';
	}
}

} // namespace

int main() {
	utils::Logging::init();

	catalog::StarCatalog catalog;
	catalog.addStar(1001, "RRLYR");
	catalog.addStar(1002, "CEPH");
	catalog.addStar(1003, "ECL");

	io::InMemoryLightCurveProvider provider;
	provider.add(1001, "V", synthesizeCurve(1.8, 0.45, 15.2, 1));
	provider.add(1002, "V", synthesizeCurve(0.18, 0.30, 12.7, 2));
	provider.add(1003, "V", core::LightCurve({10.0, 11.0, 12.0}, {14.1, 14.6, 14.2}));

	const auto config = periodogram::PeriodogramConfig::builder()
	                        .firstFrequency(0.01)
	                        .maxFrequencyToSeek(5.0)
	                        .frequencySampleCount(2000)
	                        .numPeaks(3)
	                        .build();
	const pipeline::FeaturePipeline pipeline(config);

	std::cout << "=== Light Curve Feature Extraction ===\n";
	printVector(1001, pipeline.computeFeatures(provider.getLightCurve(1001, "V")));

	const auto summary = pipeline.run(catalog, provider);
	std::cout << "\nProcessed " << summary.processed << " curves, " << summary.failed << " failed, "
	          << catalog.enabledCount() << " of " << catalog.size() << " stars enabled.\n";

	const auto output = std::filesystem::temp_directory_path() / "starclass_example_features.csv";
	const auto written = io::FeatureFile::Write(output.string(), catalog, features::FeatureVector::ColumnNames());
	for (const auto &path : written) {
		std::cout << "Wrote " << path << '\n';
	}

	const auto labeled = catalog.labeledFeatures(*catalog.filterIndex("V"));
	std::cout << "Training matrix: " << labeled.matrix.rows() << " x " << labeled.matrix.cols() << '\n';

	const catalog::TrainEvalSets sets(catalog, 1, 100);
	const auto training = catalog::SelectFeatures(catalog, *catalog.filterIndex("V"), sets.trainingIndexes());
	std::cout << sets.toString() << ": " << training.matrix.rows() << " training rows, "
	          << sets.evaluationIndexes().indexes.size() << " evaluation stars.\n";
	return 0;
}
