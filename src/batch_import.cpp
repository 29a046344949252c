#include "batch_import.hpp"

#include "number_decoder.hpp"
#include "payroll_export.hpp"
#include "payroll_layout.hpp"
#include "payroll_store.hpp"
#include "pdf_pages.hpp"
#include "record_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iterator>
#include <ostream>

namespace {

bool hasPdfExtension(const std::filesystem::path& p) {
  std::string ext = p.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
  return ext == ".pdf";
}

void logRejection(std::ostream& err, const RowRejected& r) {
  err << "Warning: page " << r.pageNumber << " row " << (r.rowIndex + 1) << " rejected";
  if (!r.field.empty()) err << " (" << r.field << " '" << r.rawText << "')";
  else if (!r.rawText.empty()) err << " ('" << r.rawText << "')";
  err << ": " << r.reason << "\n";
}

void printEmployee(std::ostream& out, const EmployeeRow& row) {
  auto show = [&](const char* field) {
    auto it = row.fields.find(field);
    return it == row.fields.end() || isEmpty(it->second) ? std::string("-") : formatValue(it->second);
  };
  out << "    " << show("Pers.-Nr.") << " " << show("Name")
      << ": Steuerbrutto " << show("Steuerbrutto")
      << ", Lohnsteuer " << show("Lohnsteuer")
      << ", Netto " << show("Netto-Bezüge")
      << ", Auszahlung " << show("Auszahlungsbetrag") << "\n";
}

} // namespace

std::string usageText(const std::string& program) {
  return "Usage: " + program +
         " [--password=pw] [--db=file.db] [--csv-out=dir] [--layout=file] [--strict] [--verbose]"
         " <pdf|folder>...\n"
         "The PDF password may also be set in LOHNJOURNAL_PDF_PASSWORD. Either way it is handed to\n"
         "pdftotext as a command-line argument and is visible in the process list while it runs.\n";
}

ImportOptions parseArguments(const std::vector<std::string>& args, const char* envPassword) {
  ImportOptions options;
  if (envPassword) options.password = envPassword;

  for (const std::string& arg : args) {
    if (arg.rfind("--password=", 0) == 0) {
      options.password = arg.substr(std::string("--password=").size());
    } else if (arg.rfind("--db=", 0) == 0) {
      options.dbPath = arg.substr(std::string("--db=").size());
    } else if (arg.rfind("--csv-out=", 0) == 0) {
      options.csvOutDir = arg.substr(std::string("--csv-out=").size());
    } else if (arg.rfind("--layout=", 0) == 0) {
      options.layoutPath = arg.substr(std::string("--layout=").size());
    } else if (arg == "--strict") {
      options.strict = true;
    } else if (arg == "--verbose") {
      options.verbose = true;
    } else if (arg.rfind("--", 0) == 0) {
      throw UsageError("Unknown option: " + arg);
    } else {
      options.inputs.push_back(arg);
    }
  }

  if (options.inputs.empty()) throw UsageError("No PDF file or folder given");
  for (const std::string& input : options.inputs) {
    if (!std::filesystem::exists(input)) throw UsageError("PDF not found: " + input);
  }
  return options;
}

std::vector<std::string> collectPdfFiles(const std::vector<std::string>& inputs) {
  std::vector<std::string> files;
  for (const std::string& input : inputs) {
    if (std::filesystem::is_directory(input)) {
      std::vector<std::string> found;
      for (const auto& entry : std::filesystem::directory_iterator(input)) {
        if (entry.is_regular_file() && hasPdfExtension(entry.path())) found.push_back(entry.path().string());
      }
      std::sort(found.begin(), found.end());
      files.insert(files.end(), found.begin(), found.end());
    } else {
      files.push_back(input);
    }
  }
  return files;
}

int runImport(const ImportOptions& options, const PageLoader& loadPages, std::ostream& out, std::ostream& err) {
  PayrollLayout layout = options.layoutPath.empty() ? loa313Layout() : loadLayoutFile(options.layoutPath);
  for (const LineLayout& line : layout.lines) {
    for (const BandOverlap& o : line.fields.overlaps()) {
      err << "Warning: layout " << layout.version << ", line '" << line.name << "': bands of '"
          << o.first << "' and '" << o.second << "' overlap\n";
    }
  }
  RecordExtractor extractor(layout);

  std::vector<std::string> pdfs = collectPdfFiles(options.inputs);
  out << "Found " << pdfs.size() << " PDF file(s), layout " << layout.version << "\n";

  std::vector<EmployeeRow> allRows;
  size_t failed = 0;
  for (const std::string& pdf : pdfs) {
    out << "\nProcessing: " << pdf << "\n";
    try {
      DocumentExtraction doc = extractor.extractDocument(loadPages(pdf, options.password));

      for (const HeaderParseError& e : doc.headerErrors) {
        err << "Warning: " << e.what() << "; page rows rejected\n";
      }
      for (const RowRejected& r : doc.rejections) logRejection(err, r);
      if (options.verbose) {
        out << "  Berater: " << doc.info.berater << ", Mandant: " << doc.info.mandant
            << ", Datum: " << doc.info.datum << ", Monat: " << doc.info.period << "\n";
        if (!doc.skippedPages.empty()) {
          out << "  Skipped " << doc.skippedPages.size() << " non-journal page(s)\n";
        }
        for (const EmployeeRow& row : doc.rows) printEmployee(out, row);
      }

      if (options.strict && (!doc.rejections.empty() || !doc.headerErrors.empty())) {
        err << "Error: " << pdf << ": " << doc.rejections.size() << " rejected row(s), "
            << doc.headerErrors.size() << " unreadable page header(s); document skipped (--strict)\n";
        failed++;
        continue;
      }

      out << "  Extracted: " << doc.rows.size() << " employees";
      if (!doc.rejections.empty()) out << ", " << doc.rejections.size() << " rejected";
      out << "\n";
      std::move(doc.rows.begin(), doc.rows.end(), std::back_inserter(allRows));
    } catch (const DocumentError& ex) {
      err << "Error: " << ex.what() << "\n";
      failed++;
    }
  }

  if (allRows.empty()) {
    err << "No employee records extracted\n";
    return 1;
  }

  PayrollStore store(options.dbPath, layout);
  size_t saved = store.saveRows(allRows);
  out << "\nDatabase saved: " << options.dbPath << " (" << saved << " rows)\n";

  int files = exportCsv(allRows, layout, options.csvOutDir);
  out << "CSV exported: " << files << " file(s) to '" << options.csvOutDir << "'\n";

  out << "\nComplete! " << (pdfs.size() - failed) << " document(s), " << allRows.size()
      << " total records\n";
  return failed > 0 ? 1 : 0;
}
