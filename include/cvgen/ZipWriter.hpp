#pragma once

#include <string>
#include <utility>
#include <vector>

namespace cvgen {

// In-memory ZIP archive writer on top of miniz. Entries are deflated and all
// carry the same fixed timestamp, so equal inputs give equal archive bytes.
class ZipWriter {
    std::vector<std::pair<std::string, std::string>> entries_;
    bool finished_ = false;

public:
    // Throws std::runtime_error on an empty or duplicate name, or after finish().
    void add(const std::string& name, const std::string& data);

    // Writes every entry in insertion order and returns the archive.
    // Throws std::runtime_error if miniz reports a failure.
    std::string finish();

    size_t entry_count() const { return entries_.size(); }
};

}  // namespace cvgen
