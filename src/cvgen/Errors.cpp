#include "cvgen/Errors.hpp"

namespace cvgen {

SchemaError::SchemaError(const std::string& path, const std::string& detail)
    : std::runtime_error(path + ": " + detail), path_(path), detail_(detail) {}

IOError::IOError(const std::string& path, const std::string& detail)
    : std::runtime_error(detail + ": " + path), path_(path) {}

}  // namespace cvgen
