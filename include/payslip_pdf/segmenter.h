#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace payslip_pdf {

struct Record {
    size_t index;      // 0-based position in the input
    std::string text;
};

using RecordSet = std::vector<Record>;

class Segmenter {
public:
    // Three line feeds then the page-eject digit.
    static constexpr const char* kRecordDelimiter = "\n\n\n1";

    // Literal split of sanitized text on kRecordDelimiter. Empty pieces are
    // kept, and the piece after the last delimiter is always dropped, so N
    // delimiter occurrences give N records in input order.
    // Throws NoRecordsFoundError when the delimiter never occurs.
    static RecordSet segment(const std::string& text);

    static size_t count_delimiters(const std::string& text);
};

} // namespace payslip_pdf
