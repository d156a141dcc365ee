#include "test_support.h"
#include <payslip_pdf/pdf_renderer.h>
#include <payslip_pdf/document_inspector.h>
#include <payslip_pdf/errors.h>
#include <payslip_pdf/layout.h>

namespace fs = payslip_pdf_test::fs;
using payslip_pdf::LayoutConfig;
using payslip_pdf::PdfRenderer;
using payslip_pdf::RecordSet;
using payslip_pdf::RenderOptions;
using payslip_pdf::RenderState;

namespace {

nlohmann::json find_line(const nlohmann::json& page, const std::string& prefix) {
    for (const auto& line : page["lines"]) {
        if (line["text"].get<std::string>().rfind(prefix, 0) == 0) {
            return line;
        }
    }
    return nullptr;
}

} // namespace

class PdfRendererTest : public payslip_pdf_test::TempDirTest {
protected:
    RenderOptions options() const {
        RenderOptions opts;
        opts.background_path = write_background();
        return opts;
    }

    RecordSet sample_records() const {
        return {
            {0, "EMPLOYEE 1001\nSHORT"},
            {1, "EMPLOYEE 1002\nA MUCH LONGER LINE WITH MANY MORE CHARACTERS ON IT 1234567890\n\nTAIL"},
            {2, "EMPLOYEE 1003"}
        };
    }
};

TEST_F(PdfRendererTest, OnePagePerRecord) {
    PdfRenderer renderer(options());
    auto out = path("payslips.pdf");

    EXPECT_EQ(renderer.render(sample_records(), out), 3);
    EXPECT_EQ(renderer.state(), RenderState::Closed);
    ASSERT_TRUE(fs::exists(out));
    EXPECT_FALSE(fs::exists(out + ".part"));

    payslip_pdf::DocumentInspector inspector;
    EXPECT_EQ(inspector.page_count(out), 3);
}

TEST_F(PdfRendererTest, PagesAreA4) {
    PdfRenderer renderer(options());
    auto out = path("a4.pdf");
    renderer.render(sample_records(), out);

    payslip_pdf::DocumentInspector inspector;
    auto doc = inspector.inspect(out);
    for (const auto& page : doc["pages"]) {
        EXPECT_NEAR(page["width"].get<double>(), 595.0, 0.01);
        EXPECT_NEAR(page["height"].get<double>(), 842.0, 0.01);
    }
}

TEST_F(PdfRendererTest, StampsFixedMetadata) {
    PdfRenderer renderer(options());
    auto out = path("meta.pdf");
    renderer.render(sample_records(), out);

    payslip_pdf::DocumentInspector inspector;
    auto meta = inspector.inspect(out)["metadata"];
    EXPECT_EQ(meta["title"], "PayslipGenerator");
    EXPECT_EQ(meta["keywords"], "payslips");
    EXPECT_EQ(meta["creator"], "NGA Dublin PCL to PDF converter");
    EXPECT_EQ(meta["author"], "NorthgateArinso");
}

TEST_F(PdfRendererTest, TextPositionIndependentOfRecordLength) {
    PdfRenderer renderer(options());
    auto out = path("layout.pdf");
    renderer.render(sample_records(), out);

    payslip_pdf::DocumentInspector inspector;
    auto doc = inspector.inspect(out);
    ASSERT_EQ(doc["pages"].size(), 3u);

    for (const auto& page : doc["pages"]) {
        auto first = find_line(page, "EMPLOYEE");
        ASSERT_FALSE(first.is_null()) << page.dump();
        EXPECT_NEAR(first["x"].get<double>(), LayoutConfig::text_x(), 0.5);
        EXPECT_NEAR(first["y"].get<double>(), LayoutConfig::baseline_y(0), 0.5);
        EXPECT_NEAR(first["size"].get<double>(), LayoutConfig::kFontSize, 0.01);
    }

    auto second_line = find_line(doc["pages"][0], "SHORT");
    ASSERT_FALSE(second_line.is_null());
    EXPECT_NEAR(second_line["y"].get<double>(), LayoutConfig::baseline_y(1), 0.5);

    // the blank line still takes its slot
    auto tail = find_line(doc["pages"][1], "TAIL");
    ASSERT_FALSE(tail.is_null());
    EXPECT_NEAR(tail["y"].get<double>(), LayoutConfig::baseline_y(3), 0.5);
}

TEST_F(PdfRendererTest, LayoutConstants) {
    EXPECT_FLOAT_EQ(LayoutConfig::text_x(), 91.0f);
    EXPECT_FLOAT_EQ(LayoutConfig::baseline_y(0), 36.0f + 5 * 10.2f);
    EXPECT_FLOAT_EQ(LayoutConfig::baseline_y(2) - LayoutConfig::baseline_y(1), 10.2f);
}

TEST_F(PdfRendererTest, WriteFailureLeavesNoFile) {
    PdfRenderer renderer(options());
    auto out = path("no_such_dir/payslips.pdf");

    try {
        renderer.render(sample_records(), out);
        FAIL() << "expected RenderError";
    } catch (const payslip_pdf::RenderError& e) {
        EXPECT_FALSE(e.fatal());
    }
    EXPECT_EQ(renderer.state(), RenderState::Aborted);
    EXPECT_FALSE(fs::exists(out));
    EXPECT_FALSE(fs::exists(out + ".part"));
}

TEST_F(PdfRendererTest, RendererIsReusableAfterFailure) {
    PdfRenderer renderer(options());
    EXPECT_THROW(renderer.render(sample_records(), path("missing/a.pdf")), payslip_pdf::RenderError);

    auto out = path("b.pdf");
    EXPECT_EQ(renderer.render(sample_records(), out), 3);
    EXPECT_TRUE(fs::exists(out));
}

TEST_F(PdfRendererTest, ReplacesExistingOutput) {
    auto out = write_file("old.pdf", "stale content");
    PdfRenderer renderer(options());
    renderer.render(sample_records(), out);

    payslip_pdf::DocumentInspector inspector;
    EXPECT_EQ(inspector.page_count(out), 3);
}

TEST_F(PdfRendererTest, EmptyRecordSetIsRejected) {
    PdfRenderer renderer(options());
    auto out = path("empty.pdf");
    EXPECT_THROW(renderer.render({}, out), payslip_pdf::RenderError);
    EXPECT_FALSE(fs::exists(out));
}

TEST_F(PdfRendererTest, MissingBackgroundIsFatal) {
    RenderOptions opts;
    opts.background_path = path("nope.png");
    try {
        PdfRenderer renderer(opts);
        FAIL() << "expected RenderError";
    } catch (const payslip_pdf::RenderError& e) {
        EXPECT_TRUE(e.fatal());
    }
}

TEST_F(PdfRendererTest, UndecodableBackgroundIsFatal) {
    RenderOptions opts;
    opts.background_path = write_file("broken.png", "this is not an image");
    try {
        PdfRenderer renderer(opts);
        FAIL() << "expected RenderError";
    } catch (const payslip_pdf::RenderError& e) {
        EXPECT_TRUE(e.fatal());
        std::string message = e.what();
        EXPECT_NE(message.find("Failed to load background image " + opts.background_path), std::string::npos)
            << message;
        EXPECT_EQ(message.find("font"), std::string::npos) << message;
    }
}

TEST_F(PdfRendererTest, Cp1252TextIsDrawnAsUnicode) {
    PdfRenderer renderer(options());
    auto out = path("accents.pdf");
    RecordSet records = {
        {0, "EMPLOYEE Se\xE1n Caf\xE9\nBONUS \x80 100.00"}
    };
    renderer.render(records, out);

    payslip_pdf::DocumentInspector inspector;
    auto page = inspector.inspect(out)["pages"][0];

    auto name = find_line(page, "EMPLOYEE");
    ASSERT_FALSE(name.is_null()) << page.dump();
    EXPECT_EQ(name["text"], "EMPLOYEE Se\xC3\xA1n Caf\xC3\xA9");

    auto bonus = find_line(page, "BONUS");
    ASSERT_FALSE(bonus.is_null()) << page.dump();
    EXPECT_EQ(bonus["text"], "BONUS \xE2\x82\xAC 100.00");
    EXPECT_EQ(bonus["text"].get<std::string>().find("\xEF\xBF\xBD"), std::string::npos);
}

TEST_F(PdfRendererTest, VerboseAbortNamesState) {
    auto opts = options();
    opts.verbose = true;
    PdfRenderer renderer(opts);

    testing::internal::CaptureStderr();
    EXPECT_THROW(renderer.render(sample_records(), path("missing/a.pdf")), payslip_pdf::RenderError);
    std::string trace = testing::internal::GetCapturedStderr();

    EXPECT_NE(trace.find("Aborted in state PageAdvanced"), std::string::npos) << trace;
    EXPECT_EQ(renderer.state(), RenderState::Aborted);
}

TEST(RenderStateTest, Names) {
    EXPECT_STREQ(payslip_pdf::render_state_name(RenderState::Unopened), "Unopened");
    EXPECT_STREQ(payslip_pdf::render_state_name(RenderState::BackgroundDrawn), "BackgroundDrawn");
    EXPECT_STREQ(payslip_pdf::render_state_name(RenderState::PageAdvanced), "PageAdvanced");
    EXPECT_STREQ(payslip_pdf::render_state_name(RenderState::Aborted), "Aborted");
}

#ifdef PAYSLIP_PDF_SOURCE_DIR
TEST_F(PdfRendererTest, BundledBackgroundLoads) {
    RenderOptions opts;
    opts.background_path = std::string(PAYSLIP_PDF_SOURCE_DIR) + "/resources/templates/payslip_background.png";
    PdfRenderer renderer(opts);

    auto out = path("bundled.pdf");
    EXPECT_EQ(renderer.render(sample_records(), out), 3);
}
#endif
