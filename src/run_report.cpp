#include "payslip_pdf/run_report.h"
#include "payslip_pdf/version.h"
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace payslip_pdf {

namespace {

template <typename Writer>
void write_string(Writer& writer, const std::string& value) {
    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

// Copies the converter's statistics, written by nlohmann::json, into the report.
template <typename Writer>
void write_stats_value(Writer& writer, const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::object:
            writer.StartObject();
            for (auto it = value.begin(); it != value.end(); ++it) {
                write_string(writer, it.key());
                write_stats_value(writer, it.value());
            }
            writer.EndObject();
            break;
        case nlohmann::json::value_t::array:
            writer.StartArray();
            for (const auto& item : value) {
                write_stats_value(writer, item);
            }
            writer.EndArray();
            break;
        case nlohmann::json::value_t::string:
            write_string(writer, value.get<std::string>());
            break;
        case nlohmann::json::value_t::boolean:
            writer.Bool(value.get<bool>());
            break;
        case nlohmann::json::value_t::number_integer:
            writer.Int64(value.get<int64_t>());
            break;
        case nlohmann::json::value_t::number_unsigned:
            writer.Uint64(value.get<uint64_t>());
            break;
        case nlohmann::json::value_t::number_float:
            writer.Double(value.get<double>());
            break;
        default:
            writer.Null();
            break;
    }
}

// Failed files carry no output; their error fields are null on success.
template <typename Writer>
void write_file_entry(Writer& writer, const FileResult& result) {
    writer.StartObject();
    writer.Key("input");
    write_string(writer, result.input_path);
    writer.Key("output");
    if (result.success) {
        write_string(writer, result.output_path);
    } else {
        writer.Null();
    }
    writer.Key("records");
    writer.Uint64(static_cast<uint64_t>(result.record_count));
    writer.Key("pages");
    writer.Int(result.page_count);
    writer.Key("success");
    writer.Bool(result.success);
    writer.Key("error");
    if (result.success) {
        writer.Null();
    } else {
        write_string(writer, result.error);
    }
    writer.Key("error_kind");
    if (result.success) {
        writer.Null();
    } else {
        writer.String(error_kind_name(result.error_kind));
    }
    writer.Key("elapsed_ms");
    writer.Int64(static_cast<int64_t>(result.elapsed_ms));
    writer.EndObject();
}

template <typename Writer>
void write_report(Writer& writer, const std::vector<FileResult>& results,
                  const nlohmann::json& stats, const std::string& generated_at) {
    writer.StartObject();
    writer.Key("tool");
    writer.String("payslip_pdf");
    writer.Key("version");
    writer.String(PAYSLIP_PDF_VERSION);
    writer.Key("generated_at");
    write_string(writer, generated_at);

    writer.Key("files");
    writer.StartArray();
    for (const auto& result : results) {
        write_file_entry(writer, result);
    }
    writer.EndArray();

    writer.Key("stats");
    write_stats_value(writer, stats.is_object() ? stats : nlohmann::json::object());
    writer.EndObject();
}

} // namespace

std::string RunReport::timestamp_utc() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);

    std::ostringstream out;
    out << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

std::string RunReport::serialize(const std::vector<FileResult>& results,
                                 const nlohmann::json& stats,
                                 bool pretty) {
    rapidjson::StringBuffer buffer;
    const std::string generated_at = timestamp_utc();

    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        write_report(writer, results, stats, generated_at);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        write_report(writer, results, stats, generated_at);
    }

    return std::string(buffer.GetString(), buffer.GetSize());
}

void RunReport::write(const std::string& path,
                      const std::vector<FileResult>& results,
                      const nlohmann::json& stats) {
    std::string content = serialize(results, stats);

    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open report file for writing: " + path);
    }
    out << content << '\n';
    out.close();
    if (!out) {
        throw std::runtime_error("Failed to write report file: " + path);
    }
}

} // namespace payslip_pdf
