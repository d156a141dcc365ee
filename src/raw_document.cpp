#include "payslip_pdf/raw_document.h"
#include "payslip_pdf/errors.h"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace payslip_pdf {

namespace fs = std::filesystem;

std::string normalize_line_endings(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size() + 1);

    for (size_t i = 0; i < bytes.size(); ++i) {
        char c = bytes[i];
        if (c == '\r') {
            // "\r\n" and a lone '\r' both end a line
            if (i + 1 < bytes.size() && bytes[i + 1] == '\n') {
                ++i;
            }
            out += '\n';
        } else {
            out += c;
        }
    }

    if (!out.empty() && out.back() != '\n') {
        out += '\n';
    }
    return out;
}

RawDocument read_raw_document(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw FileReadError(path + " (No such file or directory)");
    }
    if (fs::is_directory(path, ec)) {
        throw FileReadError(path + " (Is a directory)");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileReadError(path + " (Permission denied or unreadable)");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw FileReadError(path + " (I/O error while reading)");
    }

    RawDocument doc;
    doc.source = path;
    doc.text = normalize_line_endings(buffer.str());
    return doc;
}

} // namespace payslip_pdf
