#include "row_assembler.hpp"

#include <algorithm>
#include <cmath>

std::vector<TextLine> clusterLines(std::vector<PositionedFragment> fragments, double tolerance) {
  std::vector<TextLine> lines;
  if (fragments.empty()) return lines;

  std::stable_sort(fragments.begin(), fragments.end(), [](const PositionedFragment& a, const PositionedFragment& b) {
    if (a.y0 == b.y0) return a.x0 < b.x0;
    return a.y0 < b.y0; // top to bottom
  });

  for (auto& f : fragments) {
    if (lines.empty() || std::abs(f.y0 - lines.back().y) > tolerance) {
      lines.push_back(TextLine{f.y0, {}});
    }
    TextLine& line = lines.back();
    line.fragments.push_back(std::move(f));
    // running mean of the line's y
    line.y = (line.y * (line.fragments.size() - 1) + line.fragments.back().y0) / line.fragments.size();
  }

  for (auto& line : lines) {
    std::stable_sort(line.fragments.begin(), line.fragments.end(), [](const PositionedFragment& a, const PositionedFragment& b) {
      return a.x0 < b.x0;
    });
  }
  return lines;
}

std::string lineText(const TextLine& line) {
  std::string out;
  for (const auto& f : line.fragments) {
    if (!out.empty()) out += ' ';
    out += f.text;
  }
  return out;
}

std::string pageText(const Page& page, double tolerance) {
  std::string out;
  for (const TextLine& line : clusterLines(page.fragments, tolerance)) {
    out += lineText(line);
    out += '\n';
  }
  return out;
}

std::string pageHeaderText(const Page& page, const PayrollLayout& layout) {
  std::vector<PositionedFragment> header;
  for (const auto& f : page.fragments) {
    if (f.y0 < layout.headerBottom) header.push_back(f);
  }
  std::string out;
  for (const TextLine& line : clusterLines(std::move(header), layout.rowTolerance)) {
    out += lineText(line);
    out += '\n';
  }
  return out;
}

RowAssembler::RowAssembler(PayrollLayout layout)
  : layout_(std::move(layout)), identifier_(layout_.identifierPattern) {}

bool RowAssembler::opensRecord(const TextLine& line) const {
  int record = layout_.recordLineIndex();
  if (record < 0) return false;
  const FieldLayout& fields = layout_.lines[record].fields;
  for (const auto& f : line.fragments) {
    const FieldSpec* spec = fields.assign(f);
    if (spec && spec->name == layout_.identifierField && std::regex_match(f.text, identifier_)) {
      return true;
    }
  }
  return false;
}

std::vector<RowGroup> RowAssembler::group(const std::vector<PositionedFragment>& fragments,
                                          std::vector<AssembledLine>* orphans) const {
  std::vector<PositionedFragment> body;
  body.reserve(fragments.size());
  for (const auto& f : fragments) {
    if (f.y0 >= layout_.headerBottom && f.y0 < layout_.footerTop) body.push_back(f);
  }

  std::vector<RowGroup> groups;
  for (TextLine& line : clusterLines(std::move(body), layout_.rowTolerance)) {
    const PositionedFragment& first = line.fragments.front();

    int sub = layout_.lineIndexForCode(first.text);
    if (sub >= 0 && (first.x0 + first.x1) * 0.5 < layout_.lines[sub].codeEnd) {
      std::string code = first.text;
      if (!groups.empty()) {
        groups.back().lines.push_back(AssembledLine{sub, code, std::move(line)});
      } else if (orphans) {
        // continuation of a block that started on the previous page
        orphans->push_back(AssembledLine{sub, code, std::move(line)});
      }
      continue;
    }

    if (opensRecord(line)) {
      groups.push_back(RowGroup{{AssembledLine{layout_.recordLineIndex(), "", std::move(line)}}});
      continue;
    }

    if (!groups.empty()) {
      groups.back().lines.push_back(AssembledLine{-1, "", std::move(line)});
    }
  }
  return groups;
}
