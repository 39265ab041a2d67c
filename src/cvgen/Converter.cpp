#include "cvgen/Converter.hpp"

#include "cvgen/ProcUtil.hpp"

#include <chrono>
#include <system_error>

namespace fs = std::filesystem;

namespace cvgen {

static void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

// True when both paths name the same file, or would once the output exists.
static bool same_file(const fs::path& a, const fs::path& b) {
    std::error_code ec;
    if (fs::equivalent(a, b, ec)) return true;
    const fs::path na = fs::absolute(a, ec).lexically_normal();
    if (ec) return a.lexically_normal() == b.lexically_normal();
    const fs::path nb = fs::absolute(b, ec).lexically_normal();
    if (ec) return a.lexically_normal() == b.lexically_normal();
    return na == nb;
}

static std::string tail(const std::string& s, size_t max_len) {
    if (s.size() <= max_len) return s;
    return "..." + s.substr(s.size() - max_len);
}

fs::path derived_output_path(const fs::path& input, const std::string& format) {
    fs::path out = input;
    out.replace_extension("." + format);
    return out;
}

CommandConverter::CommandConverter(ConverterConfig cfg) : cfg_(std::move(cfg)) {}

std::vector<std::string> CommandConverter::command_for(const fs::path& input, const std::string& target_format) const {
    const fs::path output = derived_output_path(input, target_format);
    fs::path outdir = output.parent_path();
    if (outdir.empty()) outdir = ".";

    std::vector<std::string> argv;
    argv.reserve(cfg_.command.size());
    for (std::string a : cfg_.command) {
        replace_all(a, "{input}", input.string());
        replace_all(a, "{outdir}", outdir.string());
        replace_all(a, "{output}", output.string());
        replace_all(a, "{format}", target_format);
        argv.push_back(std::move(a));
    }
    return argv;
}

ConversionResult CommandConverter::convert(const fs::path& input, const std::string& target_format) {
    ConversionResult res;
    res.output_path = derived_output_path(input, target_format);

    std::error_code ec;
    if (!fs::is_regular_file(input, ec)) {
        res.error = "input document does not exist: " + input.string();
        return res;
    }

    if (same_file(input, res.output_path)) {
        res.error = "conversion output would overwrite the input document: " + input.string();
        return res;
    }

    // A stale file from an earlier run must not pass for fresh output.
    fs::remove(res.output_path, ec);
    if (ec) {
        res.error = "failed to remove stale output " + res.output_path.string() + ": " + ec.message();
        return res;
    }

    const std::vector<std::string> argv = command_for(input, target_format);
    const auto proc = procutil::run_capture_output(argv, std::chrono::seconds(cfg_.timeout_seconds));

    if (!proc.started) {
        res.error = proc.error;
        return res;
    }
    if (proc.timed_out) {
        res.error = "converter timed out after " + std::to_string(cfg_.timeout_seconds) + "s";
        return res;
    }
    if (proc.exit_code != 0) {
        res.error = "converter exited with status " + std::to_string(proc.exit_code);
        if (!proc.output.empty()) res.error += ": " + tail(proc.output, 512);
        return res;
    }
    if (!fs::is_regular_file(res.output_path, ec)) {
        res.error = "converter produced no output at " + res.output_path.string();
        return res;
    }

    res.ok = true;
    return res;
}

}  // namespace cvgen
