#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace starclass::utils {

std::string Trim(const std::string &text);

// Splits one line on commas, trimming each field. Double quotes around a
// field are removed; quoted fields may contain commas.
std::vector<std::string> SplitCsvLine(const std::string &line);

// True for blank lines and '#' comments.
bool IsSkippableLine(const std::string &line);

/**
 * @brief Parses a whole field as a double.
 * @throws std::runtime_error naming the source and line on failure.
 */
double ParseDouble(const std::string &field, const std::string &source, std::size_t line_number);

// As ParseDouble, for integer identifiers.
std::int64_t ParseInt64(const std::string &field, const std::string &source, std::size_t line_number);

bool LooksNumeric(const std::string &field);

// Shortest text that reads back to the same double.
std::string FormatDouble(double value);

} // namespace starclass::utils
