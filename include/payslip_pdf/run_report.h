#pragma once

#include "payslip_pdf/batch_converter.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace payslip_pdf {

// Machine readable summary of one batch run.
class RunReport {
public:
    static std::string serialize(const std::vector<FileResult>& results,
                                 const nlohmann::json& stats,
                                 bool pretty = true);

    // Throws std::runtime_error if the report cannot be written.
    static void write(const std::string& path,
                      const std::vector<FileResult>& results,
                      const nlohmann::json& stats);

private:
    static std::string timestamp_utc();
};

} // namespace payslip_pdf
