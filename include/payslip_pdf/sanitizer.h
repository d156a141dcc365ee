#pragma once

#include <cstddef>
#include <string>

namespace payslip_pdf {

class Sanitizer {
public:
    // Marker of the rate control code emitted by the print stream. It is
    // always followed by exactly kControlCodeArgLength characters.
    static constexpr const char* kControlCodeMarker = "H.RATE=";
    static constexpr size_t kControlCodeArgLength = 8;

    // First line of the print job body starts with "\n1".
    static constexpr const char* kPreambleMarker = "\n1";

    // Produces text ready for Segmenter::segment:
    //   1. every control code is blanked (see blank_control_codes)
    //   2. everything before the first preamble marker, the marker itself
    //      and the character following it are removed
    //   3. a single '\n' is prepended
    //
    // The result always starts with '\n'. That leading newline is what lets
    // a record boundary at the very start of the body match the segment
    // delimiter "\n\n\n1" exactly like every later boundary does.
    //
    // Throws MalformedInputError when the preamble marker does not occur.
    static std::string sanitize(const std::string& raw);

    // Replaces each control code (marker + 8 characters, none of them a
    // newline) with the same number of spaces. Idempotent.
    static std::string blank_control_codes(const std::string& text);

    // Step 2 of sanitize() on its own, without the leading newline.
    static std::string strip_preamble(const std::string& text);
};

} // namespace payslip_pdf
