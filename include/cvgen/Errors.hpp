#pragma once

#include <stdexcept>
#include <string>

namespace cvgen {

// Input record failed a shape or type check. path() is the JSON location,
// e.g. "root.experience[2].bullet_points".
class SchemaError : public std::runtime_error {
    std::string path_;
    std::string detail_;

public:
    SchemaError(const std::string& path, const std::string& detail);

    const std::string& path() const { return path_; }
    const std::string& detail() const { return detail_; }
};

// Reading or writing a file failed. path() is the file involved.
class IOError : public std::runtime_error {
    std::string path_;

public:
    IOError(const std::string& path, const std::string& detail);

    const std::string& path() const { return path_; }
};

// Render config file is malformed.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

}  // namespace cvgen
