#include "payslip_pdf/pdf_renderer.h"
#include "payslip_pdf/errors.h"
#include "payslip_pdf/text_encoding.h"
#include <mupdf/fitz.h>
#include <mupdf/pdf.h>
#include <filesystem>
#include <iostream>
#include <vector>

namespace payslip_pdf {

namespace fs = std::filesystem;

const char* render_state_name(RenderState state) {
    switch (state) {
        case RenderState::Unopened: return "Unopened";
        case RenderState::Open: return "Open";
        case RenderState::BackgroundDrawn: return "BackgroundDrawn";
        case RenderState::TextDrawn: return "TextDrawn";
        case RenderState::PageAdvanced: return "PageAdvanced";
        case RenderState::Closed: return "Closed";
        case RenderState::Aborted: return "Aborted";
    }
    return "Unknown";
}

namespace {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    size_t pos = text.find('\n');
    while (pos != std::string::npos) {
        lines.push_back(text.substr(start, pos - start));
        start = pos + 1;
        pos = text.find('\n', start);
    }
    lines.push_back(text.substr(start));
    return lines;
}

} // namespace

class PdfRenderer::Impl {
public:
    Impl(const RenderOptions& options) : options_(options) {
        if (!fs::exists(options_.background_path)) {
            throw RenderError("Background image not found: " + options_.background_path, true);
        }

        ctx = fz_new_context(NULL, NULL, FZ_STORE_UNLIMITED);
        if (!ctx) {
            throw RenderError("Failed to create MuPDF context", true);
        }

        load_resource("background image " + options_.background_path, [this]() {
            background = fz_new_image_from_file(ctx, options_.background_path.c_str());
        });
        load_resource(std::string("font ") + LayoutConfig::kFontName, [this]() {
            font = fz_new_base14_font(ctx, LayoutConfig::kFontName);
        });

        if (options_.verbose) {
            std::cout << "[PdfRenderer] Background loaded from " << options_.background_path
                      << " (" << background->w << "x" << background->h << " px)" << std::endl;
        }
    }

    ~Impl() {
        release();
    }

    int render(const RecordSet& records, const std::string& output_path) {
        state_ = RenderState::Unopened;

        if (records.empty()) {
            state_ = RenderState::Aborted;
            throw RenderError("No records to render into " + output_path);
        }

        // Everything that allocates on the C++ side happens before fz_try.
        std::vector<std::vector<std::string>> pages;
        pages.reserve(records.size());
        for (const auto& record : records) {
            pages.push_back(split_lines(cp1252_to_utf8(record.text)));
        }

        fs::path temp_path(output_path);
        temp_path += ".part";
        const std::string temp = temp_path.string();

        const fz_rect mediabox = fz_make_rect(0, 0, LayoutConfig::kPageWidth, LayoutConfig::kPageHeight);

        pdf_document *doc = nullptr;
        pdf_obj *info = nullptr;
        pdf_obj *resources = nullptr;
        pdf_obj *page = nullptr;
        fz_buffer *contents = nullptr;
        fz_device *dev = nullptr;
        fz_text *text = nullptr;

        fz_var(doc);
        fz_var(info);
        fz_var(resources);
        fz_var(page);
        fz_var(contents);
        fz_var(dev);
        fz_var(text);

        bool failed = false;
        std::string message;

        if (options_.verbose) {
            std::cout << "[PdfRenderer::render] Writing " << pages.size() << " pages to " << temp << std::endl;
        }

        fz_try(ctx) {
            doc = pdf_create_document(ctx);
            info = pdf_add_new_dict(ctx, doc, 4);
            pdf_dict_put(ctx, pdf_trailer(ctx, doc), PDF_NAME(Info), info);
            pdf_dict_put_text_string(ctx, info, PDF_NAME(Title), options_.metadata.title.c_str());
            pdf_dict_put_text_string(ctx, info, PDF_NAME(Keywords), options_.metadata.keywords.c_str());
            pdf_dict_put_text_string(ctx, info, PDF_NAME(Creator), options_.metadata.creator.c_str());
            pdf_dict_put_text_string(ctx, info, PDF_NAME(Author), options_.metadata.author.c_str());
            state_ = RenderState::Open;

            for (size_t i = 0; i < pages.size(); ++i) {
                dev = pdf_page_write(ctx, doc, mediabox, &resources, &contents);

                // Underlay: stretched over the whole page, drawn first.
                fz_fill_image(ctx, dev, background,
                              fz_scale(LayoutConfig::kPageWidth, LayoutConfig::kPageHeight),
                              1.0f, fz_default_color_params);
                state_ = RenderState::BackgroundDrawn;

                text = layout_text(pages[i]);
                fz_fill_text(ctx, dev, text, fz_identity, fz_device_gray(ctx), kBlack, 1.0f,
                             fz_default_color_params);
                state_ = RenderState::TextDrawn;

                fz_close_device(ctx, dev);
                fz_drop_device(ctx, dev);
                dev = nullptr;
                fz_drop_text(ctx, text);
                text = nullptr;

                page = pdf_add_page(ctx, doc, mediabox, 0, resources, contents);
                pdf_insert_page(ctx, doc, -1, page);
                pdf_drop_obj(ctx, page);
                page = nullptr;
                pdf_drop_obj(ctx, resources);
                resources = nullptr;
                fz_drop_buffer(ctx, contents);
                contents = nullptr;
                state_ = RenderState::PageAdvanced;
            }

            pdf_write_options opts = pdf_default_write_options;
            opts.do_compress = options_.compress ? 1 : 0;
            pdf_save_document(ctx, doc, temp.c_str(), &opts);
        }
        fz_always(ctx) {
            fz_drop_text(ctx, text);
            fz_drop_device(ctx, dev);
            pdf_drop_obj(ctx, page);
            pdf_drop_obj(ctx, resources);
            fz_drop_buffer(ctx, contents);
            pdf_drop_obj(ctx, info);
            pdf_drop_document(ctx, doc);
        }
        fz_catch(ctx) {
            failed = true;
            message = fz_caught_message(ctx);
        }

        if (failed) {
            abort_output(temp);
            throw RenderError("Error generating PDF " + output_path + ": " + message);
        }

        std::error_code ec;
        fs::rename(temp_path, output_path, ec);
        if (ec) {
            abort_output(temp);
            throw RenderError("Error generating PDF " + output_path + ": " + ec.message());
        }

        state_ = RenderState::Closed;
        if (options_.verbose) {
            std::cout << "[PdfRenderer::render] Saved " << output_path << std::endl;
        }
        return static_cast<int>(pages.size());
    }

    RenderState state() const { return state_; }

private:
    static constexpr float kBlack[1] = { 0.0f };

    // One fz_text for the whole record body. Blank lines advance the
    // baseline without emitting glyphs.
    fz_text *layout_text(const std::vector<std::string>& lines) {
        fz_text *text = fz_new_text(ctx);
        fz_try(ctx) {
            for (size_t line = 0; line < lines.size(); ++line) {
                if (lines[line].empty()) {
                    continue;
                }
                fz_matrix trm = fz_make_matrix(LayoutConfig::kFontSize, 0, 0, -LayoutConfig::kFontSize,
                                               LayoutConfig::text_x(),
                                               LayoutConfig::baseline_y(static_cast<int>(line)));
                fz_show_string(ctx, text, font, trm, lines[line].c_str(), 0, 0, FZ_BIDI_LTR, FZ_LANG_UNSET);
            }
        }
        fz_catch(ctx) {
            fz_drop_text(ctx, text);
            fz_rethrow(ctx);
        }
        return text;
    }

    // Runs one MuPDF loader; on failure releases everything loaded so far
    // and raises a fatal RenderError naming the resource.
    template <typename Loader>
    void load_resource(const std::string& what, Loader load) {
        bool failed = false;
        std::string message;
        fz_try(ctx) {
            load();
        }
        fz_catch(ctx) {
            failed = true;
            message = fz_caught_message(ctx);
        }

        if (failed) {
            release();
            throw RenderError("Failed to load " + what + ": " + message, true);
        }
    }

    void abort_output(const std::string& temp) {
        if (options_.verbose) {
            std::cerr << "[PdfRenderer::render] Aborted in state " << render_state_name(state_)
                      << ", removing " << temp << std::endl;
        }
        state_ = RenderState::Aborted;
        std::error_code ec;
        fs::remove(temp, ec);
        if (ec && options_.verbose) {
            std::cerr << "[PdfRenderer::render] Could not remove " << temp << ": " << ec.message() << std::endl;
        }
    }

    void release() {
        if (ctx) {
            fz_drop_font(ctx, font);
            fz_drop_image(ctx, background);
            fz_drop_context(ctx);
        }
        font = nullptr;
        background = nullptr;
        ctx = nullptr;
    }

    RenderOptions options_;
    RenderState state_ = RenderState::Unopened;

    fz_context *ctx = nullptr;
    fz_image *background = nullptr;
    fz_font *font = nullptr;
};

PdfRenderer::PdfRenderer(const RenderOptions& options)
    : pImpl(std::make_unique<Impl>(options)) {}

PdfRenderer::~PdfRenderer() = default;

int PdfRenderer::render(const RecordSet& records, const std::string& output_path) {
    return pImpl->render(records, output_path);
}

RenderState PdfRenderer::state() const {
    return pImpl->state();
}

} // namespace payslip_pdf
