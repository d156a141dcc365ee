#include "payslip_pdf/document_inspector.h"
#include <mupdf/fitz.h>
#include <mupdf/pdf.h>
#include <stdexcept>

namespace payslip_pdf {

class DocumentInspector::Impl {
public:
    Impl() {
        ctx = fz_new_context(NULL, NULL, FZ_STORE_UNLIMITED);
        if (!ctx) {
            throw std::runtime_error("Failed to create MuPDF context");
        }
        fz_register_document_handlers(ctx);
    }

    ~Impl() {
        if (ctx) {
            fz_drop_context(ctx);
        }
    }

    nlohmann::json inspect(const std::string& pdf_path) {
        fz_document *doc = nullptr;
        fz_page *page = nullptr;
        fz_stext_page *stext = nullptr;

        fz_var(doc);
        fz_var(page);
        fz_var(stext);

        nlohmann::json result;
        result["pages"] = nlohmann::json::array();
        bool failed = false;

        fz_try(ctx) {
            doc = fz_open_document(ctx, pdf_path.c_str());

            result["metadata"] = {
                {"title", lookup_metadata(doc, "info:Title")},
                {"keywords", lookup_metadata(doc, "info:Keywords")},
                {"creator", lookup_metadata(doc, "info:Creator")},
                {"author", lookup_metadata(doc, "info:Author")}
            };

            int count = fz_count_pages(ctx, doc);
            result["page_count"] = count;

            for (int i = 0; i < count; ++i) {
                page = fz_load_page(ctx, doc, i);
                fz_rect bounds = fz_bound_page(ctx, page);

                fz_stext_options opts = { 0 };
                opts.flags = FZ_STEXT_PRESERVE_WHITESPACE;
                stext = fz_new_stext_page_from_page(ctx, page, &opts);

                nlohmann::json page_json;
                page_json["page_number"] = i;
                page_json["width"] = bounds.x1 - bounds.x0;
                page_json["height"] = bounds.y1 - bounds.y0;
                page_json["lines"] = stext_lines(stext);
                result["pages"].push_back(page_json);

                fz_drop_stext_page(ctx, stext);
                stext = nullptr;
                fz_drop_page(ctx, page);
                page = nullptr;
            }
        }
        fz_always(ctx) {
            fz_drop_stext_page(ctx, stext);
            fz_drop_page(ctx, page);
            fz_drop_document(ctx, doc);
        }
        fz_catch(ctx) {
            failed = true;
        }

        if (failed) {
            throw std::runtime_error("MuPDF error while inspecting " + pdf_path);
        }
        return result;
    }

    int page_count(const std::string& pdf_path) {
        fz_document *doc = nullptr;
        fz_var(doc);

        int count = 0;
        bool failed = false;

        fz_try(ctx) {
            doc = fz_open_document(ctx, pdf_path.c_str());
            count = fz_count_pages(ctx, doc);
        }
        fz_always(ctx) {
            fz_drop_document(ctx, doc);
        }
        fz_catch(ctx) {
            failed = true;
        }

        if (failed) {
            throw std::runtime_error("MuPDF error getting page count for " + pdf_path);
        }
        return count;
    }

private:
    std::string lookup_metadata(fz_document *doc, const char *key) {
        char buf[256] = { 0 };
        if (fz_lookup_metadata(ctx, doc, key, buf, sizeof(buf)) < 0) {
            return std::string();
        }
        return std::string(buf);
    }

    // One entry per stext line: its text and the origin of the first glyph.
    nlohmann::json stext_lines(fz_stext_page *stext) {
        nlohmann::json lines = nlohmann::json::array();

        for (fz_stext_block *block = stext->first_block; block; block = block->next) {
            if (block->type != FZ_STEXT_BLOCK_TEXT) {
                continue;
            }
            for (fz_stext_line *line = block->u.t.first_line; line; line = line->next) {
                if (!line->first_char) {
                    continue;
                }

                std::string line_text;
                for (fz_stext_char *ch = line->first_char; ch; ch = ch->next) {
                    char utf8[5] = {0};
                    int len = fz_runetochar(utf8, ch->c);
                    utf8[len] = 0;
                    line_text += utf8;
                }

                lines.push_back({
                    {"text", line_text},
                    {"x", line->first_char->origin.x},
                    {"y", line->first_char->origin.y},
                    {"size", line->first_char->size}
                });
            }
        }

        return lines;
    }

    fz_context *ctx;
};

DocumentInspector::DocumentInspector() : pImpl(std::make_unique<Impl>()) {}
DocumentInspector::~DocumentInspector() = default;

nlohmann::json DocumentInspector::inspect(const std::string& pdf_path) {
    return pImpl->inspect(pdf_path);
}

int DocumentInspector::page_count(const std::string& pdf_path) {
    return pImpl->page_count(pdf_path);
}

} // namespace payslip_pdf
