#pragma once

#include <stdexcept>
#include <string>

// Thrown when a historical draw record is malformed. The message identifies the record.
class DataFormatError : public std::invalid_argument {
 public:
  explicit DataFormatError(const std::string& what) : std::invalid_argument(what) {}
};

// Thrown when no usable historical draw records remain.
class EmptyDatasetError : public std::invalid_argument {
 public:
  explicit EmptyDatasetError(const std::string& what) : std::invalid_argument(what) {}
};

// Thrown when the competitive selection is invoked on an empty candidate pool. This indicates a
// defect in the caller rather than a problem with the input data.
class InvalidPoolError : public std::logic_error {
 public:
  explicit InvalidPoolError(const std::string& what) : std::logic_error(what) {}
};
