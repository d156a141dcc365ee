#pragma once

#include <string>
#include <memory>
#include <nlohmann/json.hpp>

namespace payslip_pdf {

// Reads back a generated PDF: metadata, page sizes and the text lines of
// each page with their baseline origin.
class DocumentInspector {
public:
    DocumentInspector();
    ~DocumentInspector();

    nlohmann::json inspect(const std::string& pdf_path);

    int page_count(const std::string& pdf_path);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace payslip_pdf
