#include "payslip_pdf/text_encoding.h"
#include <mupdf/fitz.h>

namespace payslip_pdf {

namespace {

// 0x80..0x9F; everything else maps to the same code point as Latin-1.
constexpr int kHighControlRange[32] = {
    0x20AC, 0xFFFD, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0xFFFD, 0x017D, 0xFFFD,
    0xFFFD, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0xFFFD, 0x017E, 0x0178
};

} // namespace

int cp1252_to_rune(unsigned char byte) {
    if (byte >= 0x80 && byte <= 0x9F) {
        return kHighControlRange[byte - 0x80];
    }
    return byte;
}

std::string cp1252_to_utf8(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    for (char c : text) {
        unsigned char byte = static_cast<unsigned char>(c);
        if (byte < 0x80) {
            out += c;
            continue;
        }
        char utf8[FZ_UTFMAX + 1] = {0};
        int len = fz_runetochar(utf8, cp1252_to_rune(byte));
        out.append(utf8, len);
    }
    return out;
}

} // namespace payslip_pdf
