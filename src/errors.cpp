#include "payslip_pdf/errors.h"

namespace payslip_pdf {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::FileRead:
            return "FileReadError";
        case ErrorKind::MalformedInput:
            return "MalformedInput";
        case ErrorKind::NoRecordsFound:
            return "NoRecordsFound";
        case ErrorKind::Render:
            return "RenderError";
    }
    return "Unknown";
}

} // namespace payslip_pdf
