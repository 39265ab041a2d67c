#include "cvgen/ZipWriter.hpp"

#include "miniz.h"

#include <cstring>
#include <stdexcept>

namespace cvgen {

// 1980-01-02 12:00 UTC. Stays inside the DOS date range in every timezone.
static constexpr MZ_TIME_T kEntryTime = 315662400;

static std::string zip_error(mz_zip_archive& zip, const std::string& what) {
    return what + ": " + mz_zip_get_error_string(mz_zip_get_last_error(&zip));
}

void ZipWriter::add(const std::string& name, const std::string& data) {
    if (finished_) throw std::runtime_error("zip archive already finished");
    if (name.empty()) throw std::runtime_error("zip entry name must not be empty");
    for (const auto& e : entries_) {
        if (e.first == name) throw std::runtime_error("duplicate zip entry: " + name);
    }
    entries_.emplace_back(name, data);
}

std::string ZipWriter::finish() {
    if (finished_) throw std::runtime_error("zip archive already finished");
    finished_ = true;

    mz_zip_archive zip;
    std::memset(&zip, 0, sizeof(zip));
    if (!mz_zip_writer_init_heap(&zip, 0, 0)) {
        throw std::runtime_error(zip_error(zip, "failed to start zip archive"));
    }

    for (const auto& e : entries_) {
        MZ_TIME_T modified = kEntryTime;
        if (!mz_zip_writer_add_mem_ex_v2(&zip, e.first.c_str(), e.second.data(), e.second.size(),
                                         nullptr, 0, MZ_DEFAULT_LEVEL, 0, 0, &modified,
                                         nullptr, 0, nullptr, 0)) {
            const std::string msg = zip_error(zip, "failed to add zip entry " + e.first);
            mz_zip_writer_end(&zip);
            throw std::runtime_error(msg);
        }
    }

    void* buf = nullptr;
    size_t size = 0;
    if (!mz_zip_writer_finalize_heap_archive(&zip, &buf, &size)) {
        const std::string msg = zip_error(zip, "failed to finalize zip archive");
        mz_zip_writer_end(&zip);
        throw std::runtime_error(msg);
    }

    std::string out(static_cast<const char*>(buf), size);
    mz_free(buf);
    mz_zip_writer_end(&zip);
    return out;
}

}  // namespace cvgen
