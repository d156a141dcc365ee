#include "payslip_pdf/segmenter.h"
#include "payslip_pdf/errors.h"
#include <cstring>

namespace payslip_pdf {

size_t Segmenter::count_delimiters(const std::string& text) {
    const size_t delim_len = std::strlen(kRecordDelimiter);
    size_t count = 0;
    size_t pos = text.find(kRecordDelimiter);
    while (pos != std::string::npos) {
        ++count;
        pos = text.find(kRecordDelimiter, pos + delim_len);
    }
    return count;
}

RecordSet Segmenter::segment(const std::string& text) {
    const size_t delim_len = std::strlen(kRecordDelimiter);

    RecordSet records;
    size_t start = 0;
    size_t pos = text.find(kRecordDelimiter);
    while (pos != std::string::npos) {
        records.push_back(Record{records.size(), text.substr(start, pos - start)});
        start = pos + delim_len;
        pos = text.find(kRecordDelimiter, start);
    }
    // Whatever follows the last delimiter is not a record and is dropped.

    if (records.empty()) {
        throw NoRecordsFoundError("record delimiter not found, no payslips extracted");
    }
    return records;
}

} // namespace payslip_pdf
