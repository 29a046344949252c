#include "field_layout.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_set>

FieldLayout::FieldLayout(std::vector<FieldSpec> fields) : fields_(std::move(fields)) {
  std::unordered_set<std::string> names;
  for (const FieldSpec& f : fields_) {
    if (!(f.xMin < f.xMax)) {
      throw LayoutError("field '" + f.name + "' has an empty band");
    }
    if (!names.insert(f.name).second) {
      throw LayoutError("field '" + f.name + "' declared twice in one line");
    }
  }

  byXMin_.resize(fields_.size());
  std::iota(byXMin_.begin(), byXMin_.end(), size_t{0});
  std::stable_sort(byXMin_.begin(), byXMin_.end(), [this](size_t a, size_t b) {
    return fields_[a].xMin < fields_[b].xMin;
  });

  for (size_t i = 0; i < byXMin_.size(); ++i) {
    const FieldSpec& a = fields_[byXMin_[i]];
    for (size_t j = i + 1; j < byXMin_.size(); ++j) {
      const FieldSpec& b = fields_[byXMin_[j]];
      if (b.xMin >= a.xMax) break;
      overlaps_.push_back(BandOverlap{a.name, b.name});
    }
  }
}

const FieldSpec* FieldLayout::assign(const PositionedFragment& fragment) const {
  double mid = (fragment.x0 + fragment.x1) * 0.5;
  if (std::isnan(mid)) return nullptr;

  // Bands starting at or left of the midpoint.
  auto end = std::upper_bound(byXMin_.begin(), byXMin_.end(), mid, [this](double x, size_t i) {
    return x < fields_[i].xMin;
  });

  if (overlaps_.empty()) {
    if (end == byXMin_.begin()) return nullptr;
    const FieldSpec& candidate = fields_[*(end - 1)];
    return mid < candidate.xMax ? &candidate : nullptr;
  }

  const FieldSpec* best = nullptr;
  for (auto it = byXMin_.begin(); it != end; ++it) {
    const FieldSpec& f = fields_[*it];
    if (mid >= f.xMax) continue;
    if (!best || (f.xMax - f.xMin) < (best->xMax - best->xMin)) best = &f;
  }
  return best;
}

const FieldSpec* FieldLayout::find(const std::string& name) const {
  for (const FieldSpec& f : fields_) {
    if (f.name == name) return &f;
  }
  return nullptr;
}
