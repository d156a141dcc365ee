#pragma once

#include <string>

namespace payslip_pdf {

struct RawDocument {
    std::string source;  // path the text was read from
    std::string text;
};

// Reads the whole file into memory. Line terminators are normalized so that
// every line, the last one included, ends with a single '\n'.
// Throws FileReadError if the file is missing, a directory, or unreadable.
RawDocument read_raw_document(const std::string& path);

// Exposed for tests: the same normalization applied to an in-memory buffer.
std::string normalize_line_endings(const std::string& bytes);

} // namespace payslip_pdf
