#include "payslip_pdf/sanitizer.h"
#include "payslip_pdf/errors.h"
#include <cstring>
#include <regex>

namespace payslip_pdf {

namespace {

// The character right after the preamble marker belongs to the preamble too.
constexpr size_t kPreambleSkip = 3;

// ECMAScript '.' does not match line terminators, so a control code never
// swallows the end of its line.
const std::regex& control_code_regex() {
    static const std::regex re("H\\.RATE=.{8}");
    return re;
}

} // namespace

std::string Sanitizer::blank_control_codes(const std::string& text) {
    const size_t code_len = std::strlen(kControlCodeMarker) + kControlCodeArgLength;
    return std::regex_replace(text, control_code_regex(), std::string(code_len, ' '));
}

std::string Sanitizer::strip_preamble(const std::string& text) {
    size_t marker = text.find(kPreambleMarker);
    if (marker == std::string::npos) {
        throw MalformedInputError("preamble boundary marker not found");
    }

    size_t body = marker + kPreambleSkip;
    if (body >= text.size()) {
        return std::string();
    }
    return text.substr(body);
}

std::string Sanitizer::sanitize(const std::string& raw) {
    std::string text = blank_control_codes(raw);
    return "\n" + strip_preamble(text);
}

} // namespace payslip_pdf
