#pragma once

#include "payroll_record.hpp"

#include <stdexcept>
#include <string>
#include <vector>

// Raised for an unusable layout configuration.
class LayoutError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct BandOverlap {
  std::string first;
  std::string second;
};

// One band table: maps a fragment to the field whose [xMin, xMax) band
// contains the fragment's horizontal midpoint.
class FieldLayout {
public:
  FieldLayout() = default;
  explicit FieldLayout(std::vector<FieldSpec> fields);

  // nullptr when no band contains the midpoint. Overlapping bands resolve to
  // the narrowest one, then the smaller xMin, then declaration order.
  const FieldSpec* assign(const PositionedFragment& fragment) const;

  const FieldSpec* find(const std::string& name) const;

  // Declaration order.
  const std::vector<FieldSpec>& fields() const { return fields_; }

  // Pairs of overlapping bands; empty for a well-formed table.
  const std::vector<BandOverlap>& overlaps() const { return overlaps_; }

private:
  std::vector<FieldSpec> fields_;
  std::vector<size_t> byXMin_;
  std::vector<BandOverlap> overlaps_;
};
