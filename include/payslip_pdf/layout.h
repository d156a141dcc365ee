#pragma once

#include <string>

namespace payslip_pdf {

// Page geometry in PDF units (1/72 inch). A4 portrait.
struct LayoutConfig {
    static constexpr float kPageWidth = 595.0f;
    static constexpr float kPageHeight = 842.0f;

    // Default document margins of the original layout engine.
    static constexpr float kMarginLeft = 36.0f;
    static constexpr float kMarginTop = 36.0f;

    static constexpr float kIndentLeft = 55.0f;
    static constexpr int kBlankLinesAbove = 4;

    static constexpr const char* kFontName = "Courier";
    static constexpr float kFontSize = 8.0f;
    static constexpr float kLineHeight = 10.2f;

    // Where body line `line` (0-based) is drawn, page coordinates with the
    // origin at the top left corner.
    static constexpr float text_x() { return kMarginLeft + kIndentLeft; }
    static constexpr float baseline_y(int line) {
        return kMarginTop + (kBlankLinesAbove + line + 1) * kLineHeight;
    }
};

struct DocumentMetadata {
    std::string title = "PayslipGenerator";
    std::string keywords = "payslips";
    std::string creator = "NGA Dublin PCL to PDF converter";
    std::string author = "NorthgateArinso";
};

} // namespace payslip_pdf
