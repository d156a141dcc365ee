#include "payslip_pdf/cli.h"
#include "payslip_pdf/batch_converter.h"
#include "payslip_pdf/run_report.h"
#include "payslip_pdf/version.h"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <getopt.h>

namespace payslip_pdf {

namespace {

bool equals_ignore_case(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

void print_summary(std::ostream& out, const std::vector<FileResult>& results,
                   const BatchConverter& converter, bool verbose) {
    size_t success_count = std::count_if(results.begin(), results.end(),
                                         [](const FileResult& r) { return r.success; });

    out << "=== Conversion Complete ===\n";
    for (const auto& result : results) {
        if (result.success) {
            out << "  OK      " << result.input_path << " -> " << result.output_path
                << " (" << result.page_count << " pages)\n";
        } else {
            out << "  FAILED  " << result.input_path << ": " << result.error << "\n";
        }
    }
    out << "Successfully converted: " << success_count << "/" << results.size() << " files\n";

    if (verbose) {
        auto stats = converter.get_stats();
        out << "Pages rendered: " << stats["pages_rendered"] << "\n";
        out << "Total time: " << stats["total_processing_time_ms"] << " ms\n";
    }
}

} // namespace

void print_usage(std::ostream& out, const char* program_name) {
    out << "Enables the conversion of PCL formatted payslip print files to PDF documents.\n";
    out << "Usage: " << program_name << " [OPTIONS] <PCL_FILE>...\n";
    out << "       " << program_name << " help | version\n";
    out << "\nOptions:\n";
    out << "  -o, --output-dir DIR       Write PDFs into DIR (default: next to each input)\n";
    out << "  -b, --background FILE      Background image for every page\n";
    out << "                             (default: $PAYSLIP_PDF_BACKGROUND, then the installed template)\n";
    out << "  --report FILE              Write a JSON summary of the run to FILE\n";
    out << "  --verify                   Reopen each PDF and check its page count\n";
    out << "  -v, --verbose              Verbose output\n";
    out << "  -q, --quiet                One result line per file\n";
    out << "  -h, --help                 Show this help message\n";
    out << "  --version                  Show version information\n";
    out << "\nExample:\n";
    out << "  " << program_name << " PSEAL075.001\n";
    out << "  " << program_name << " -o out --report out/run.json PSEAL075.001 PSEAL075.002\n";
}

void print_version(std::ostream& out) {
    out << "payslip_pdf version " << PAYSLIP_PDF_VERSION << "\n";
    out << "PCL payslip to PDF converter, built with C++17 and MuPDF\n";
}

CLIOptions parse_arguments(int argc, char* argv[]) {
    CLIOptions options;

    const char* short_opts = "o:b:vqh";
    const struct option long_opts[] = {
        {"output-dir", required_argument, nullptr, 'o'},
        {"background", required_argument, nullptr, 'b'},
        {"report", required_argument, nullptr, 1001},
        {"verify", no_argument, nullptr, 1002},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 1003},
        {nullptr, 0, nullptr, 0}
    };

    // glibc rescans from the start, including its internal state, when optind is 0.
    optind = 0;

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, &option_index)) != -1) {
        switch (opt) {
            case 'o':
                options.output_dir = optarg;
                break;
            case 'b':
                options.background = optarg;
                break;
            case 1001:  // report
                options.report_file = optarg;
                break;
            case 1002:  // verify
                options.verify = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'h':
                options.help = true;
                return options;
            case 1003:  // version
                options.version = true;
                return options;
            default:
                throw std::invalid_argument("Unknown option");
        }
    }

    for (int i = optind; i < argc; ++i) {
        options.input_files.push_back(argv[i]);
    }

    // "help" and "version" are reserved when they come first.
    if (options.input_files.empty() || equals_ignore_case(options.input_files.front(), "help")) {
        options.help = true;
        return options;
    }
    if (equals_ignore_case(options.input_files.front(), "version")) {
        options.version = true;
        return options;
    }

    if (options.verbose && options.quiet) {
        throw std::invalid_argument("Cannot use both --verbose and --quiet");
    }

    return options;
}

int run_cli(int argc, char* argv[], std::ostream& out, std::ostream& err) {
    CLIOptions options;
    try {
        options = parse_arguments(argc, argv);
    } catch (const std::invalid_argument& e) {
        err << "Error: Invalid argument - " << e.what() << "\n";
        err << "Use --help for usage information\n";
        return 1;
    }

    const char* program_name = argc > 0 ? argv[0] : "payslip_pdf";

    if (options.help) {
        print_usage(out, program_name);
        return 0;
    }

    if (options.version) {
        print_version(out);
        return 0;
    }

    ConvertOptions convert_opts;
    convert_opts.background_path = options.background;
    convert_opts.output_dir = options.output_dir;
    convert_opts.verify = options.verify;
    convert_opts.verbose = options.verbose;
    convert_opts.quiet = options.quiet;

    std::unique_ptr<BatchConverter> converter;
    try {
        converter = std::make_unique<BatchConverter>(convert_opts);
    } catch (const RenderError& e) {
        err << "Error: " << e.what() << "\n";
        err << "No files were processed.\n";
        return 1;
    } catch (const std::runtime_error& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    }

    auto results = converter->convert_batch(options.input_files);

    if (!options.quiet) {
        print_summary(out, results, *converter, options.verbose);
    }

    if (!options.report_file.empty()) {
        try {
            RunReport::write(options.report_file, results, converter->get_stats());
        } catch (const std::runtime_error& e) {
            err << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    return 0;
}

} // namespace payslip_pdf
