#pragma once

#include "payroll_record.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

// Raised when text in a numeric column is not a DATEV-encoded number.
class DecodeError : public std::runtime_error {
public:
  DecodeError(const std::string& raw, const std::string& reason);

  const std::string& raw() const { return raw_; }

private:
  std::string raw_;
};

// Decodes DATEV numeric text: '.' separates groups, a trailing '-' negates,
// and for Currency the last two digits are cents ("2.43000" -> 2430.00).
// Empty or blank input yields the empty sentinel. Throws DecodeError on any
// other non-digit character.
FieldValue decodeNumber(const std::string& raw, FieldKind kind);

// True for text decodeNumber would accept as a value: digits, '.' groups
// and an optional trailing '-'.
bool isDatevNumber(const std::string& raw);

// Trimmed text, or the empty sentinel for blank input.
FieldValue decodeText(const std::string& raw);

// Inverse of decodeNumber: "2.43000", "18041", "5000-".
std::string encodeDatev(Amount amount);
std::string encodeDatev(std::int64_t value);

// Plain decimal rendering for export: "2430.00", "-180.41".
std::string formatAmount(Amount amount);

// Export rendering of any field value; the empty sentinel renders as "".
std::string formatValue(const FieldValue& value);

std::string trimText(const std::string& s);
