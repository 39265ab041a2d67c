#pragma once

#include <filesystem>
#include <optional>

#include "cvgen/Converter.hpp"
#include "cvgen/Models.hpp"
#include "cvgen/RenderConfig.hpp"

namespace cvgen {

struct GenerateResult {
    std::filesystem::path document_path;
    std::optional<ConversionResult> conversion;  // set only when a converter was given
};

// One full render pass: assemble, serialize (IOError propagates), then convert
// if a converter is supplied. A failed conversion is reported in the result;
// the document at document_path stays valid.
GenerateResult generate_document(const ResumeRecord& record,
                                 const RenderConfig& cfg,
                                 const std::filesystem::path& out_path,
                                 DocumentConverter* converter = nullptr);

}  // namespace cvgen
