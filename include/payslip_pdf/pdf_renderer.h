#pragma once

#include "payslip_pdf/layout.h"
#include "payslip_pdf/segmenter.h"
#include <memory>
#include <string>

namespace payslip_pdf {

enum class RenderState {
    Unopened,
    Open,
    BackgroundDrawn,
    TextDrawn,
    PageAdvanced,
    Closed,
    Aborted
};

const char* render_state_name(RenderState state);

struct RenderOptions {
    std::string background_path;
    DocumentMetadata metadata;
    bool compress = true;
    bool verbose = false;
};

// Lays records onto A4 pages over a fixed background image, one page per
// record. The background and the font are loaded once by the constructor
// and shared by every document rendered afterwards.
class PdfRenderer {
public:
    // Throws RenderError with fatal() set if the background image or the
    // font cannot be loaded.
    explicit PdfRenderer(const RenderOptions& options);
    ~PdfRenderer();

    PdfRenderer(const PdfRenderer&) = delete;
    PdfRenderer& operator=(const PdfRenderer&) = delete;

    // Writes one page per record to output_path. The document goes to a
    // temporary sibling file first and is renamed into place once saved, so
    // on failure output_path is left untouched and RenderError is thrown.
    // Returns the number of pages written.
    int render(const RecordSet& records, const std::string& output_path);

    RenderState state() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace payslip_pdf
