#include "number_decoder.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace {

std::uint64_t magnitude(std::int64_t value) {
  return value < 0 ? 0 - static_cast<std::uint64_t>(value) : static_cast<std::uint64_t>(value);
}

// Major units with '.' between groups of three digits.
std::string groupThousands(std::uint64_t value) {
  std::string digits = std::to_string(value);
  std::string out;
  out.reserve(digits.size() + digits.size() / 3);
  for (size_t i = 0; i < digits.size(); ++i) {
    if (i > 0 && (digits.size() - i) % 3 == 0) out.push_back('.');
    out.push_back(digits[i]);
  }
  return out;
}

std::string twoDigits(std::uint64_t value) {
  std::string out = std::to_string(value);
  if (out.size() < 2) out.insert(0, 2 - out.size(), '0');
  return out;
}

} // namespace

DecodeError::DecodeError(const std::string& raw, const std::string& reason)
  : std::runtime_error("cannot decode '" + raw + "': " + reason), raw_(raw) {}

std::string trimText(const std::string& s) {
  size_t a = 0, b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) b--;
  return s.substr(a, b - a);
}

FieldValue decodeNumber(const std::string& raw, FieldKind kind) {
  if (kind == FieldKind::Text) {
    throw std::invalid_argument("decodeNumber called for a text field");
  }

  std::string s = trimText(raw);
  if (s.empty()) return std::monostate{};

  bool negative = false;
  if (s.back() == '-') {
    negative = true;
    s.pop_back();
  }

  std::int64_t value = 0;
  bool sawDigit = false;
  for (char ch : s) {
    if (ch == '.') continue;
    if (!std::isdigit(static_cast<unsigned char>(ch))) {
      throw DecodeError(raw, std::string("unexpected character '") + ch + "'");
    }
    int digit = ch - '0';
    if (value > (std::numeric_limits<std::int64_t>::max() - digit) / 10) {
      throw DecodeError(raw, "value out of range");
    }
    value = value * 10 + digit;
    sawDigit = true;
  }
  if (!sawDigit) throw DecodeError(raw, "no digits");

  if (negative) value = -value;
  if (kind == FieldKind::Currency) return Amount{value};
  return value;
}

bool isDatevNumber(const std::string& raw) {
  std::string s = trimText(raw);
  if (!s.empty() && s.back() == '-') s.pop_back();
  bool sawDigit = false;
  for (char ch : s) {
    if (ch == '.') continue;
    if (!std::isdigit(static_cast<unsigned char>(ch))) return false;
    sawDigit = true;
  }
  return sawDigit;
}

FieldValue decodeText(const std::string& raw) {
  std::string s = trimText(raw);
  if (s.empty()) return std::monostate{};
  return s;
}

std::string encodeDatev(Amount amount) {
  std::uint64_t abs = magnitude(amount.cents);
  std::string out = groupThousands(abs / 100) + twoDigits(abs % 100);
  if (amount.cents < 0) out.push_back('-');
  return out;
}

std::string encodeDatev(std::int64_t value) {
  std::string out = std::to_string(magnitude(value));
  if (value < 0) out.push_back('-');
  return out;
}

std::string formatAmount(Amount amount) {
  std::uint64_t abs = magnitude(amount.cents);
  std::string out = amount.cents < 0 ? "-" : "";
  out += std::to_string(abs / 100) + "." + twoDigits(abs % 100);
  return out;
}

std::string formatValue(const FieldValue& value) {
  return std::visit([](const auto& v) -> std::string {
    using T = std::decay_t<decltype(v)>;
    if constexpr (std::is_same_v<T, std::monostate>) {
      return "";
    } else if constexpr (std::is_same_v<T, std::string>) {
      return v;
    } else if constexpr (std::is_same_v<T, Amount>) {
      return formatAmount(v);
    } else {
      return std::to_string(v);
    }
  }, value);
}
