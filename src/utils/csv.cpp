#include "starclass/utils/csv.hpp"
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace starclass::utils {

std::string Trim(const std::string &text) {
	const auto first = text.find_first_not_of(" \t\r\n");
	if (first == std::string::npos) {
		return "";
	}
	const auto last = text.find_last_not_of(" \t\r\n");
	return text.substr(first, last - first + 1);
}

std::vector<std::string> SplitCsvLine(const std::string &line) {
	std::vector<std::string> fields;
	std::string current;
	bool quoted = false;
	for (char ch : line) {
		if (ch == '"') {
			quoted = !quoted;
		} else if (ch == ',' && !quoted) {
			fields.push_back(Trim(current));
			current.clear();
		} else {
			current.push_back(ch);
		}
	}
	fields.push_back(Trim(current));
	return fields;
}

bool IsSkippableLine(const std::string &line) {
	const auto trimmed = Trim(line);
	return trimmed.empty() || trimmed.front() == '#';
}

bool LooksNumeric(const std::string &field) {
	if (field.empty()) {
		return false;
	}
	try {
		std::size_t consumed = 0;
		std::stod(field, &consumed);
		return consumed == field.size();
	} catch (const std::exception &) {
		return false;
	}
}

double ParseDouble(const std::string &field, const std::string &source, std::size_t line_number) {
	try {
		std::size_t consumed = 0;
		double value = std::stod(field, &consumed);
		if (consumed == field.size()) {
			return value;
		}
	} catch (const std::out_of_range &) {
		throw std::runtime_error(source + ":" + std::to_string(line_number) + ": value '" + field +
		                         "' is out of range.");
	} catch (const std::invalid_argument &) {
		// reported below
	}
	throw std::runtime_error(source + ":" + std::to_string(line_number) + ": '" + field + "' is not a number.");
}

std::int64_t ParseInt64(const std::string &field, const std::string &source, std::size_t line_number) {
	try {
		std::size_t consumed = 0;
		long long value = std::stoll(field, &consumed);
		if (consumed == field.size()) {
			return static_cast<std::int64_t>(value);
		}
	} catch (const std::exception &) {
		// reported below
	}
	throw std::runtime_error(source + ":" + std::to_string(line_number) + ": '" + field +
	                         "' is not an integer identifier.");
}

std::string FormatDouble(double value) {
	if (std::isnan(value)) {
		return "nan";
	}
	if (std::isinf(value)) {
		return value > 0 ? "inf" : "-inf";
	}
	std::ostringstream oss;
	oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
	return oss.str();
}

} // namespace starclass::utils
