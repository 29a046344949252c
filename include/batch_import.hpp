#pragma once

#include "payroll_record.hpp"

#include <functional>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

// Bad command line; main prints the usage text and exits with 2.
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ImportOptions {
  std::vector<std::string> inputs;
  std::string password;
  std::string dbPath = "lohnjournal.db";
  std::string csvOutDir = "lohnjournal_export";
  std::string layoutPath;
  bool strict = false;
  bool verbose = false;
};

// Parses `--key=value` flags and positional PDF files or folders, which must
// exist. The password defaults to `envPassword` (LOHNJOURNAL_PDF_PASSWORD in
// main) and --password= overrides it. Throws UsageError.
ImportOptions parseArguments(const std::vector<std::string>& args, const char* envPassword = nullptr);

std::string usageText(const std::string& program);

// Folders contribute their *.pdf files in name order; files are kept as given.
std::vector<std::string> collectPdfFiles(const std::vector<std::string>& inputs);

using PageLoader = std::function<std::vector<Page>(const std::string& path, const std::string& password)>;

// Extracts every document, then saves all rows and exports the CSV files.
// Returns 0 when every document was imported, 1 when any document failed or
// nothing was extracted. Configuration and store failures propagate.
int runImport(const ImportOptions& options, const PageLoader& loadPages, std::ostream& out, std::ostream& err);
