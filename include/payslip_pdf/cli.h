#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace payslip_pdf {

struct CLIOptions {
    std::vector<std::string> input_files;
    std::string output_dir;
    std::string background;
    std::string report_file;
    bool verify = false;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
    bool version = false;
};

// Throws std::invalid_argument for unknown options and for --verbose with
// --quiet. No arguments, or a leading "help"/"version" word in any case,
// selects help or version output. Safe to call more than once per process.
CLIOptions parse_arguments(int argc, char* argv[]);

void print_usage(std::ostream& out, const char* program_name);
void print_version(std::ostream& out);

// Full command line run. Returns the process exit code: 0 once the batch has
// run, even when some files failed; 1 for invalid options, an unusable
// background image, or a report file that cannot be written.
int run_cli(int argc, char* argv[], std::ostream& out, std::ostream& err);

} // namespace payslip_pdf
