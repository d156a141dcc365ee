#pragma once

#define PAYSLIP_PDF_VERSION "1.0.0"

// Set by the build to the installed resources directory.
#ifndef PAYSLIP_PDF_RESOURCE_DIR
#define PAYSLIP_PDF_RESOURCE_DIR "resources"
#endif

#define PAYSLIP_PDF_BACKGROUND_FILE "templates/payslip_background.png"
