#include "pdf_pages.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <regex>
#include <string>
#include <sys/wait.h>

namespace {

bool commandExists(const std::string& command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  return std::system(test.c_str()) == 0;
}

// Single-quoted for /bin/sh.
std::string shellQuote(const std::string& s) {
  std::string out = "'";
  for (char ch : s) {
    if (ch == '\'') out += "'\\''";
    else out.push_back(ch);
  }
  out += "'";
  return out;
}

void appendUtf8(std::string& out, unsigned long code) {
  if (code < 0x80) {
    out.push_back(static_cast<char>(code));
  } else if (code < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code >> 6)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else if (code < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  }
}

// Numeric character reference body ("#228", "#xE4"); false if malformed.
bool decodeCharRef(const std::string& ent, std::string& out) {
  bool hex = ent.size() > 1 && (ent[1] == 'x' || ent[1] == 'X');
  std::string digits = ent.substr(hex ? 2 : 1);
  if (digits.empty()) return false;
  char* end = nullptr;
  errno = 0;
  unsigned long code = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
  if (errno != 0 || *end != '\0' || code == 0 || code > 0x10FFFF) return false;
  appendUtf8(out, code);
  return true;
}

std::string decodeEntities(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '&') {
      size_t j = in.find(';', i + 1);
      if (j != std::string::npos) {
        std::string ent = in.substr(i + 1, j - (i + 1));
        std::string rep;
        if (ent == "amp") rep = "&";
        else if (ent == "lt") rep = "<";
        else if (ent == "gt") rep = ">";
        else if (ent == "quot") rep = "\"";
        else if (ent == "apos") rep = "'";
        else if (!ent.empty() && ent[0] == '#' && !decodeCharRef(ent, rep)) rep.clear();
        if (!rep.empty()) {
          out += rep; i = j; continue;
        }
      }
    }
    out.push_back(in[i]);
  }
  return out;
}

std::string runPdftotextBboxLayout(const std::string& pdfPath, const std::string& password) {
  if (!commandExists("pdftotext")) {
    throw DocumentError("pdftotext not found; install poppler-utils (e.g., apt-get install -y poppler-utils)");
  }
  std::string cmd = "pdftotext -bbox-layout";
  if (!password.empty()) {
    cmd += " -opw " + shellQuote(password) + " -upw " + shellQuote(password);
  }
  cmd += " -q " + shellQuote(pdfPath) + " - 2>/dev/null";

  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) throw DocumentError("failed to run pdftotext -bbox-layout");
  std::string out;
  char buf[8192];
  while (true) {
    size_t n = std::fread(buf, 1, sizeof(buf), pipe);
    if (n > 0) out.append(buf, n);
    if (n < sizeof(buf)) break;
  }
  int status = pclose(pipe);
  if (status != 0) {
    int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    throw DocumentError("pdftotext failed with exit code " + std::to_string(code) + " for " + pdfPath +
                        " (wrong password or unreadable file)");
  }
  return out;
}

} // namespace

std::vector<Page> parseBboxPages(const std::string& bboxXml) {
  static const std::regex tokenRe(
    "(<page\\b[^>]*>)"
    "|<word\\s+xMin=\"(-?[0-9]+(?:\\.[0-9]+)?)\"\\s+yMin=\"(-?[0-9]+(?:\\.[0-9]+)?)\"\\s+xMax=\"(-?[0-9]+(?:\\.[0-9]+)?)\"\\s+yMax=\"(-?[0-9]+(?:\\.[0-9]+)?)\"\\s*>"
    "([^<]*)</word>");

  std::vector<Page> pages;
  for (std::sregex_iterator it(bboxXml.begin(), bboxXml.end(), tokenRe), end; it != end; ++it) {
    const std::smatch& m = *it;
    if (m[1].matched) {
      pages.push_back(Page{static_cast<int>(pages.size()) + 1, {}});
      continue;
    }
    if (pages.empty()) pages.push_back(Page{1, {}});

    PositionedFragment f;
    f.x0 = std::stod(m[2].str());
    f.y0 = std::stod(m[3].str());
    f.x1 = std::stod(m[4].str());
    f.text = decodeEntities(m[6].str());
    pages.back().fragments.push_back(std::move(f));
  }
  return pages;
}

std::vector<Page> loadPdfPages(const std::string& pdfPath, const std::string& password) {
  std::string xml = runPdftotextBboxLayout(pdfPath, password);
  return parseBboxPages(xml);
}
