#pragma once

#include "payslip_pdf/errors.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <nlohmann/json.hpp>

namespace payslip_pdf {

struct ConvertOptions {
    std::string background_path;
    std::string output_dir;   // empty: write next to the input
    bool verify = false;      // reopen each PDF and compare page count
    bool verbose = false;
    bool quiet = false;
};

struct FileResult {
    std::string input_path;
    std::string output_path;
    size_t record_count = 0;
    int page_count = 0;
    bool success = false;
    std::string error;
    ErrorKind error_kind = ErrorKind::FileRead;
    long long elapsed_ms = 0;
};

using ProgressCallback = std::function<void(size_t current, size_t total)>;

class BatchConverter {
public:
    // Loads the shared background image. Throws RenderError (fatal) when it
    // is unavailable, before any file is touched.
    explicit BatchConverter(const ConvertOptions& options);
    ~BatchConverter();

    // read -> sanitize -> segment -> render for a single file. Conversion
    // errors are reported through the returned FileResult, never thrown.
    FileResult convert_file(const std::string& input_path);

    // Files are converted one after another, in the order given.
    std::vector<FileResult> convert_batch(const std::vector<std::string>& input_paths,
                                          ProgressCallback progress = nullptr);

    std::string output_path_for(const std::string& input_path) const;

    nlohmann::json get_stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Locates the background image: explicit path, then the
// PAYSLIP_PDF_BACKGROUND environment variable, then the installed resources.
std::string resolve_background_path(const std::string& explicit_path);

} // namespace payslip_pdf
