#pragma once

#include <stdexcept>
#include <string>

namespace starclass::core {

// Malformed or too-short input series.
class InvalidInputError : public std::invalid_argument {
public:
	explicit InvalidInputError(const std::string &message) : std::invalid_argument(message) {
	}
};

// Permanent data-quality failure for one light curve. The pipeline disables
// the star when one of these reaches it.
class DataQualityError : public std::runtime_error {
public:
	explicit DataQualityError(const std::string &message) : std::runtime_error(message) {
	}
};

class InsufficientDataError : public DataQualityError {
public:
	explicit InsufficientDataError(const std::string &message) : DataQualityError(message) {
	}
};

class DegenerateTimeSpanError : public DataQualityError {
public:
	explicit DegenerateTimeSpanError(const std::string &message) : DataQualityError(message) {
	}
};

// A feature was requested for a peak or spectrum bin that was never computed.
class IndexOutOfRangeError : public std::out_of_range {
public:
	explicit IndexOutOfRangeError(const std::string &message) : std::out_of_range(message) {
	}
};

} // namespace starclass::core
