#pragma once

#include "starclass/catalog/star_catalog.hpp"
#include <string>
#include <vector>

namespace starclass::io {

/**
 * @brief Per-filter CSV files of star features.
 *
 * One file per filter, named `<stem>_<filter>.csv` next to the base file name
 * (`stem` is the base name up to its first dot). Each file starts with a
 * column-kind row (`META,CLASS,PAR,...`) and a column-name row
 * (`ID,CLASS,<feature names>`), followed by one row per enabled star that
 * has features in the filter.
 */
class FeatureFile {
public:
	static constexpr const char *kMeta = "META";
	static constexpr const char *kClass = "CLASS";
	static constexpr const char *kParam = "PAR";
	static constexpr const char *kId = "ID";
	static constexpr const char *kExtension = ".csv";

	static std::string FilterFileName(const std::string &base_name, const std::string &filter_name);

	/**
	 * @brief Writes one file per catalog filter.
	 * @return The paths written, in filter order.
	 * @throws std::runtime_error when a file cannot be written or a feature row
	 *         does not match the number of names.
	 */
	static std::vector<std::string> Write(const std::string &base_name, const catalog::StarCatalog &catalog,
	                                      const std::vector<std::string> &feature_names);

	/**
	 * @brief Reads every `<stem>_*.csv` file next to the base name.
	 *
	 * Files are processed in file-name order and each adds a filter to the
	 * catalog. Stars unknown to the catalog are added.
	 *
	 * @return false when no matching file exists.
	 * @throws std::runtime_error on malformed files.
	 */
	static bool Read(const std::string &base_name, catalog::StarCatalog &catalog);

	// Feature column names of one file.
	static std::vector<std::string> ReadColumnNames(const std::string &path);
};

} // namespace starclass::io
