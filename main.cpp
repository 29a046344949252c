#include "batch_import.hpp"
#include "pdf_pages.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
  ImportOptions options;
  try {
    options = parseArguments(std::vector<std::string>(argv + 1, argv + argc),
                             std::getenv("LOHNJOURNAL_PDF_PASSWORD"));
  } catch (const UsageError& ex) {
    std::cerr << ex.what() << "\n" << usageText(argv[0]);
    return 2;
  }

  try {
    return runImport(options, loadPdfPages, std::cout, std::cerr);
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
