#include <payslip_pdf/cli.h>
#include <iostream>

int main(int argc, char* argv[]) {
    return payslip_pdf::run_cli(argc, argv, std::cout, std::cerr);
}
