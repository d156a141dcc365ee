#include "payslip_pdf/batch_converter.h"
#include "payslip_pdf/document_inspector.h"
#include "payslip_pdf/pdf_renderer.h"
#include "payslip_pdf/raw_document.h"
#include "payslip_pdf/sanitizer.h"
#include "payslip_pdf/segmenter.h"
#include "payslip_pdf/version.h"
#include <filesystem>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <set>

namespace payslip_pdf {

namespace fs = std::filesystem;

std::string resolve_background_path(const std::string& explicit_path) {
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    if (const char* env = std::getenv("PAYSLIP_PDF_BACKGROUND")) {
        if (*env) {
            return env;
        }
    }
    return (fs::path(PAYSLIP_PDF_RESOURCE_DIR) / PAYSLIP_PDF_BACKGROUND_FILE).string();
}

class BatchConverter::Impl {
public:
    Impl(const ConvertOptions& options)
        : options_(options),
          renderer_(make_render_options(options)) {
        stats_["documents_attempted"] = 0;
        stats_["documents_succeeded"] = 0;
        stats_["documents_failed"] = 0;
        stats_["records_found"] = 0;
        stats_["pages_rendered"] = 0;
        stats_["total_processing_time_ms"] = 0;
    }

    FileResult convert_file(const std::string& input_path) {
        auto start_time = std::chrono::high_resolution_clock::now();

        FileResult result;
        result.input_path = input_path;
        result.output_path = output_path_for(input_path);

        try {
            narrate("Attempting to read file... " + input_path);
            RawDocument raw = read_raw_document(input_path);
            trace("[BatchConverter::convert_file] Read " + std::to_string(raw.text.size()) + " bytes");

            std::string text = Sanitizer::sanitize(raw.text);

            narrate_inline("Extracting individual payslips... ");
            RecordSet records;
            try {
                records = Segmenter::segment(text);
            } catch (const NoRecordsFoundError&) {
                narrate("0 payslips found.");
                throw;
            }
            result.record_count = records.size();
            narrate(std::to_string(records.size()) + " payslips found.");

            narrate_inline("Generating PDF... ");
            claim_output(result);
            ensure_output_dir(result.output_path);
            result.page_count = renderer_.render(records, result.output_path);
            narrate(result.output_path);

            if (options_.verify) {
                verify_output(result);
            }

            result.success = true;
            written_outputs_.insert(output_key(result.output_path));
            narrate("OPERATION SUCCESSFULLY COMPLETED");
            narrate("");
        } catch (const ConversionError& e) {
            result.success = false;
            result.error = e.what();
            result.error_kind = e.kind();
            if (!options_.quiet) {
                std::cerr << "ERROR... " << error_kind_name(e.kind()) << ": " << e.what() << std::endl;
                std::cout << std::endl;
            }
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        result.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();

        if (options_.quiet) {
            print_quiet_line(result);
        }
        record_stats(result);
        return result;
    }

    std::vector<FileResult> convert_batch(const std::vector<std::string>& input_paths,
                                          ProgressCallback progress) {
        std::vector<FileResult> results;
        results.reserve(input_paths.size());

        for (size_t i = 0; i < input_paths.size(); ++i) {
            results.push_back(convert_file(input_paths[i]));
            if (progress) {
                progress(i + 1, input_paths.size());
            }
        }

        return results;
    }

    std::string output_path_for(const std::string& input_path) const {
        if (options_.output_dir.empty()) {
            return input_path + ".pdf";
        }
        auto name = fs::path(input_path).filename().string();
        return (fs::path(options_.output_dir) / (name + ".pdf")).string();
    }

    nlohmann::json get_stats() const {
        nlohmann::json stats = stats_;

        if (stats["documents_attempted"] > 0) {
            double avg_time = static_cast<double>(stats["total_processing_time_ms"]) /
                              static_cast<double>(stats["documents_attempted"]);
            stats["average_processing_time_ms"] = avg_time;
        }

        if (stats["total_processing_time_ms"] > 0) {
            double pages_per_second = static_cast<double>(stats["pages_rendered"]) /
                                      (static_cast<double>(stats["total_processing_time_ms"]) / 1000.0);
            stats["pages_per_second"] = pages_per_second;
        }

        return stats;
    }

private:
    static RenderOptions make_render_options(const ConvertOptions& options) {
        RenderOptions render_options;
        render_options.background_path = resolve_background_path(options.background_path);
        render_options.verbose = options.verbose;
        return render_options;
    }

    static std::string output_key(const std::string& output_path) {
        std::error_code ec;
        fs::path absolute = fs::absolute(output_path, ec);
        return (ec ? fs::path(output_path) : absolute).lexically_normal().string();
    }

    // Inputs with the same file name map to the same PDF under --output-dir;
    // the later one fails instead of replacing a PDF written earlier in the run.
    void claim_output(const FileResult& result) const {
        if (written_outputs_.count(output_key(result.output_path)) > 0) {
            throw RenderError("Output " + result.output_path +
                              " was already written by an earlier input in this run");
        }
    }

    void ensure_output_dir(const std::string& output_path) {
        fs::path dir = fs::path(output_path).parent_path();
        if (dir.empty()) {
            return;
        }
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw RenderError("Cannot create output directory " + dir.string() + ": " + ec.message());
        }
    }

    void verify_output(FileResult& result) {
        int pages = 0;
        try {
            pages = inspector_.page_count(result.output_path);
        } catch (const std::runtime_error& e) {
            throw RenderError(std::string("Verification failed: ") + e.what());
        }

        trace("[BatchConverter::verify_output] " + result.output_path + " has " +
              std::to_string(pages) + " pages");
        if (pages != static_cast<int>(result.record_count)) {
            throw RenderError("Verification failed: " + result.output_path + " has " +
                              std::to_string(pages) + " pages, expected " +
                              std::to_string(result.record_count));
        }
        result.page_count = pages;
    }

    void record_stats(const FileResult& result) {
        stats_["documents_attempted"] = stats_["documents_attempted"].get<int>() + 1;
        if (result.success) {
            stats_["documents_succeeded"] = stats_["documents_succeeded"].get<int>() + 1;
        } else {
            stats_["documents_failed"] = stats_["documents_failed"].get<int>() + 1;
        }
        stats_["records_found"] = stats_["records_found"].get<int>() + static_cast<int>(result.record_count);
        stats_["pages_rendered"] = stats_["pages_rendered"].get<int>() + result.page_count;
        stats_["total_processing_time_ms"] =
            stats_["total_processing_time_ms"].get<long long>() + result.elapsed_ms;
    }

    void print_quiet_line(const FileResult& result) const {
        if (result.success) {
            std::cout << "SUCCESS|" << result.input_path << "|" << result.output_path << "|"
                      << result.record_count << "|" << result.elapsed_ms << "\n";
        } else {
            std::cout << "FAILED|" << result.input_path << "|" << error_kind_name(result.error_kind)
                      << "|" << result.error << "\n";
        }
    }

    void narrate(const std::string& line) const {
        if (!options_.quiet) {
            std::cout << line << std::endl;
        }
    }

    void narrate_inline(const std::string& text) const {
        if (!options_.quiet) {
            std::cout << text << std::flush;
        }
    }

    void trace(const std::string& line) const {
        if (options_.verbose) {
            std::cout << line << std::endl;
        }
    }

    ConvertOptions options_;
    PdfRenderer renderer_;
    DocumentInspector inspector_;
    nlohmann::json stats_;
    std::set<std::string> written_outputs_;
};

BatchConverter::BatchConverter(const ConvertOptions& options)
    : pImpl(std::make_unique<Impl>(options)) {}

BatchConverter::~BatchConverter() = default;

FileResult BatchConverter::convert_file(const std::string& input_path) {
    return pImpl->convert_file(input_path);
}

std::vector<FileResult> BatchConverter::convert_batch(const std::vector<std::string>& input_paths,
                                                      ProgressCallback progress) {
    return pImpl->convert_batch(input_paths, progress);
}

std::string BatchConverter::output_path_for(const std::string& input_path) const {
    return pImpl->output_path_for(input_path);
}

nlohmann::json BatchConverter::get_stats() const {
    return pImpl->get_stats();
}

} // namespace payslip_pdf
