#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "cvgen/RenderConfig.hpp"

namespace cvgen {

// Outcome of the fixed-layout conversion. Failure never invalidates the
// source document.
struct ConversionResult {
    bool ok = false;
    std::filesystem::path output_path;
    std::string error;  // ConversionError description when !ok
};

// Same directory and stem as the input, extension replaced by the format.
std::filesystem::path derived_output_path(const std::filesystem::path& input, const std::string& format);

class DocumentConverter {
public:
    virtual ~DocumentConverter() = default;

    virtual ConversionResult convert(const std::filesystem::path& input, const std::string& target_format) = 0;
};

// Runs an external program (LibreOffice by default) from an argv template.
class CommandConverter final : public DocumentConverter {
    ConverterConfig cfg_;

public:
    explicit CommandConverter(ConverterConfig cfg);

    ConversionResult convert(const std::filesystem::path& input, const std::string& target_format) override;

    // argv with {input}, {outdir}, {output} and {format} substituted.
    std::vector<std::string> command_for(const std::filesystem::path& input, const std::string& target_format) const;
};

}  // namespace cvgen
