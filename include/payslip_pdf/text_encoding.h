#pragma once

#include <string>

namespace payslip_pdf {

// Print spool files are single-byte Windows-1252 text.
// Returns the Unicode code point for one byte; the five bytes cp1252 leaves
// undefined (0x81, 0x8D, 0x8F, 0x90, 0x9D) decode to U+FFFD.
int cp1252_to_rune(unsigned char byte);

// Transcodes a whole cp1252 string to UTF-8, the encoding MuPDF's text
// functions expect.
std::string cp1252_to_utf8(const std::string& text);

} // namespace payslip_pdf
