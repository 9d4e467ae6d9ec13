#include "starclass/io/feature_file.hpp"
#include "starclass/utils/csv.hpp"
#include "starclass/utils/logging.hpp"
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace starclass::io {

namespace {

std::string StemOf(const std::string &base_name) {
	const std::string file_name = fs::path(base_name).filename().string();
	return file_name.substr(0, file_name.find('.'));
}

fs::path ParentOf(const std::string &base_name) {
	auto parent = fs::path(base_name).parent_path();
	return parent.empty() ? fs::path(".") : parent;
}

struct ColumnLayout {
	std::size_t id_column = 0;
	std::size_t class_column = 0;
	std::vector<std::size_t> param_columns;
	std::vector<std::string> names;
};

ColumnLayout ParseHeader(const std::vector<std::string> &kinds, const std::vector<std::string> &names,
                         const std::string &path) {
	if (kinds.size() != names.size()) {
		throw std::runtime_error(path + ": column-kind and column-name rows differ in width.");
	}
	ColumnLayout layout;
	std::optional<std::size_t> id_column;
	std::optional<std::size_t> class_column;
	for (std::size_t i = 0; i < kinds.size(); ++i) {
		if (names[i] == FeatureFile::kId) {
			id_column = i;
		} else if (names[i] == FeatureFile::kClass) {
			class_column = i;
		} else if (kinds[i] == FeatureFile::kParam) {
			layout.param_columns.push_back(i);
			layout.names.push_back(names[i]);
		}
	}
	if (!id_column) {
		throw std::runtime_error(path + ": there is no column with the star identification.");
	}
	if (!class_column) {
		throw std::runtime_error(path + ": there is no column with CLASS type.");
	}
	if (layout.param_columns.empty()) {
		throw std::runtime_error(path + ": there are no feature columns.");
	}
	layout.id_column = *id_column;
	layout.class_column = *class_column;
	return layout;
}

bool NextRow(std::ifstream &input, std::vector<std::string> &fields, std::size_t &line_number) {
	std::string line;
	while (std::getline(input, line)) {
		++line_number;
		if (utils::IsSkippableLine(line)) {
			continue;
		}
		fields = utils::SplitCsvLine(line);
		return true;
	}
	return false;
}

ColumnLayout ReadLayout(std::ifstream &input, const std::string &path, std::size_t &line_number) {
	std::vector<std::string> kinds;
	std::vector<std::string> names;
	if (!NextRow(input, kinds, line_number) || kinds.empty() || kinds.front() != FeatureFile::kMeta) {
		throw std::runtime_error(path + ": missing " + std::string(FeatureFile::kMeta) + " row.");
	}
	if (!NextRow(input, names, line_number)) {
		throw std::runtime_error(path + ": missing column-name row.");
	}
	return ParseHeader(kinds, names, path);
}

} // namespace

std::string FeatureFile::FilterFileName(const std::string &base_name, const std::string &filter_name) {
	return (ParentOf(base_name) / (StemOf(base_name) + "_" + filter_name + kExtension)).string();
}

std::vector<std::string> FeatureFile::Write(const std::string &base_name, const catalog::StarCatalog &catalog,
                                            const std::vector<std::string> &feature_names) {
	std::vector<std::string> written;
	for (std::size_t f = 0; f < catalog.filterCount(); ++f) {
		const std::string path = FilterFileName(base_name, catalog.filterName(f));
		std::ofstream output(path);
		if (!output) {
			throw std::runtime_error("Cannot write features file '" + path + "'.");
		}

		output << kMeta << ',' << kClass;
		for (std::size_t i = 0; i < feature_names.size(); ++i) {
			output << ',' << kParam;
		}
		output << '\n' << kId << ',' << kClass;
		for (const auto &name : feature_names) {
			output << ',' << name;
		}
		output << '\n';

		std::size_t rows = 0;
		for (std::size_t s = 0; s < catalog.size(); ++s) {
			const auto &values = catalog.features(f, s);
			if (!catalog.isEnabled(s) || values.empty()) {
				continue;
			}
			if (values.size() != feature_names.size()) {
				throw std::runtime_error("Star " + std::to_string(catalog.starId(s)) + " has " +
				                         std::to_string(values.size()) + " features, expected " +
				                         std::to_string(feature_names.size()) + ".");
			}
			output << catalog.starId(s) << ',' << '"' << catalog.className(s) << '"';
			for (double value : values) {
				output << ',' << utils::FormatDouble(value);
			}
			output << '\n';
			++rows;
		}
		if (!output) {
			throw std::runtime_error("Failed writing features file '" + path + "'.");
		}
		STARCLASS_INFO("Wrote features of {} stars to '{}'.", rows, path);
		written.push_back(path);
	}
	return written;
}

bool FeatureFile::Read(const std::string &base_name, catalog::StarCatalog &catalog) {
	const fs::path directory = ParentOf(base_name);
	const std::string prefix = StemOf(base_name) + "_";

	std::vector<fs::path> files;
	if (fs::is_directory(directory)) {
		for (const auto &entry : fs::directory_iterator(directory)) {
			const std::string file_name = entry.path().filename().string();
			if (entry.is_regular_file() && file_name.size() > prefix.size() &&
			    file_name.compare(0, prefix.size(), prefix) == 0 && entry.path().extension() == kExtension) {
				files.push_back(entry.path());
			}
		}
	}
	if (files.empty()) {
		STARCLASS_WARN("No features files match '{}'.", base_name);
		return false;
	}
	std::sort(files.begin(), files.end());

	for (const auto &file : files) {
		const std::string path = file.string();
		const std::string file_name = file.filename().string();
		const auto underscore = file_name.rfind('_');
		const auto dot = file_name.rfind('.');
		const std::string filter_name = file_name.substr(underscore + 1, dot - underscore - 1);

		std::ifstream input(path);
		if (!input) {
			throw std::runtime_error("Cannot open features file '" + path + "'.");
		}
		std::size_t line_number = 0;
		const auto layout = ReadLayout(input, path, line_number);
		const std::size_t filter_index = catalog.addFilter(filter_name);

		std::vector<std::string> fields;
		std::size_t rows = 0;
		while (NextRow(input, fields, line_number)) {
			const std::size_t needed =
			    std::max({layout.id_column, layout.class_column, layout.param_columns.back()}) + 1;
			if (fields.size() < needed) {
				throw std::runtime_error(path + ":" + std::to_string(line_number) + ": expected " +
				                         std::to_string(needed) + " columns, got " +
				                         std::to_string(fields.size()) + ".");
			}
			const auto id = utils::ParseInt64(fields[layout.id_column], path, line_number);
			auto star_index = catalog.indexOf(id);
			if (!star_index) {
				star_index = catalog.addStar(id, fields[layout.class_column]);
			}

			std::vector<double> values;
			values.reserve(layout.param_columns.size());
			for (auto column : layout.param_columns) {
				values.push_back(utils::ParseDouble(fields[column], path, line_number));
			}
			catalog.setFeatures(filter_index, *star_index, std::move(values));
			++rows;
		}
		STARCLASS_INFO("Read features of {} stars for filter '{}' from '{}'.", rows, filter_name, path);
	}
	return true;
}

std::vector<std::string> FeatureFile::ReadColumnNames(const std::string &path) {
	std::ifstream input(path);
	if (!input) {
		throw std::runtime_error("Cannot open features file '" + path + "'.");
	}
	std::size_t line_number = 0;
	return ReadLayout(input, path, line_number).names;
}

} // namespace starclass::io
