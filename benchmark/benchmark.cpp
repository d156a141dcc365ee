#include <benchmark/benchmark.h>
#include <payslip_pdf/pdf_renderer.h>
#include <payslip_pdf/sanitizer.h>
#include <payslip_pdf/segmenter.h>
#include <payslip_pdf/version.h>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

// Synthetic spool file with `count` payslips of roughly 60 lines each.
std::string make_stream(int count) {
    std::string stream = "@PJL ENTER LANGUAGE=PCL\n1 ";
    for (int i = 0; i < count; ++i) {
        stream += "EMPLOYEE " + std::to_string(10000 + i) + "\n";
        for (int line = 0; line < 60; ++line) {
            stream += "  ITEM " + std::to_string(line) + "   H.RATE=00001250   " +
                      std::to_string(line * 17) + ".00\n";
        }
        stream += "\n\n1";
    }
    stream += "\n";
    return stream;
}

} // namespace

static void BM_Sanitize(benchmark::State& state) {
    std::string raw = make_stream(static_cast<int>(state.range(0)));

    for (auto _ : state) {
        auto text = payslip_pdf::Sanitizer::sanitize(raw);
        benchmark::DoNotOptimize(text);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * raw.size());
}
BENCHMARK(BM_Sanitize)->Range(8, 4096);

static void BM_Segment(benchmark::State& state) {
    std::string text = payslip_pdf::Sanitizer::sanitize(make_stream(static_cast<int>(state.range(0))));

    for (auto _ : state) {
        auto records = payslip_pdf::Segmenter::segment(text);
        benchmark::DoNotOptimize(records);
    }
    state.counters["records"] = static_cast<double>(payslip_pdf::Segmenter::count_delimiters(text));
}
BENCHMARK(BM_Segment)->Range(8, 4096);

static void BM_Render(benchmark::State& state) {
    auto background = fs::path(PAYSLIP_PDF_RESOURCE_DIR) / PAYSLIP_PDF_BACKGROUND_FILE;
    if (!fs::exists(background)) {
        state.SkipWithError("Background template not found");
        return;
    }

    payslip_pdf::RenderOptions options;
    options.background_path = background.string();
    payslip_pdf::PdfRenderer renderer(options);

    auto records = payslip_pdf::Segmenter::segment(
        payslip_pdf::Sanitizer::sanitize(make_stream(static_cast<int>(state.range(0)))));
    auto output = (fs::temp_directory_path() / "payslip_pdf_bench.pdf").string();

    for (auto _ : state) {
        int pages = renderer.render(records, output);
        benchmark::DoNotOptimize(pages);
    }
    state.counters["pages_per_second"] = benchmark::Counter(
        static_cast<double>(state.iterations() * records.size()), benchmark::Counter::kIsRate);

    fs::remove(output);
}
BENCHMARK(BM_Render)->Range(1, 256)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
