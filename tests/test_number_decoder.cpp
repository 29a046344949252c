#include <catch2/catch_all.hpp>

#include "number_decoder.hpp"

#include <string>
#include <vector>

TEST_CASE("decodeNumber reads DATEV currency as minor units", "[decode]") {
  REQUIRE(std::get<Amount>(decodeNumber("2.43000", FieldKind::Currency)).cents == 243000);
  REQUIRE(std::get<Amount>(decodeNumber("18041", FieldKind::Currency)).cents == 18041);
  REQUIRE(std::get<Amount>(decodeNumber("1.234.56789", FieldKind::Currency)).cents == 123456789);
  REQUIRE(std::get<Amount>(decodeNumber("7", FieldKind::Currency)).cents == 7);
  REQUIRE(std::get<Amount>(decodeNumber(" 2.43000 ", FieldKind::Currency)).cents == 243000);
}

TEST_CASE("decodeNumber applies a trailing minus", "[decode]") {
  REQUIRE(std::get<Amount>(decodeNumber("5.00000-", FieldKind::Currency)).cents == -500000);
  REQUIRE(std::get<std::int64_t>(decodeNumber("2-", FieldKind::Integer)) == -2);
}

TEST_CASE("decodeNumber reads integer fields without a cent split", "[decode]") {
  REQUIRE(std::get<std::int64_t>(decodeNumber("30", FieldKind::Integer)) == 30);
  REQUIRE(std::get<std::int64_t>(decodeNumber("1.234", FieldKind::Integer)) == 1234);
}

TEST_CASE("a genuine zero is not the empty sentinel", "[decode]") {
  FieldValue zero = decodeNumber("000", FieldKind::Currency);
  REQUIRE_FALSE(isEmpty(zero));
  REQUIRE(std::get<Amount>(zero).cents == 0);
}

TEST_CASE("blank input decodes to the empty sentinel", "[decode]") {
  for (const char* raw : {"", "   ", "\t"}) {
    REQUIRE(isEmpty(decodeNumber(raw, FieldKind::Currency)));
    REQUIRE(isEmpty(decodeNumber(raw, FieldKind::Integer)));
  }
  REQUIRE(isEmpty(decodeNumber("", FieldKind::Currency)));
  REQUIRE(isEmpty(decodeText("  ")));
}

TEST_CASE("decodeNumber rejects text that is not DATEV encoded", "[decode]") {
  REQUIRE_THROWS_AS(decodeNumber("1.234,56-", FieldKind::Currency), DecodeError);
  REQUIRE_THROWS_AS(decodeNumber("12a", FieldKind::Currency), DecodeError);
  REQUIRE_THROWS_AS(decodeNumber("-12", FieldKind::Integer), DecodeError);
  REQUIRE_THROWS_AS(decodeNumber("-", FieldKind::Currency), DecodeError);
  REQUIRE_THROWS_AS(decodeNumber(".", FieldKind::Currency), DecodeError);
  REQUIRE_THROWS_AS(decodeNumber("99999999999999999999", FieldKind::Currency), DecodeError);

  try {
    decodeNumber("1.234,56", FieldKind::Currency);
    FAIL("expected DecodeError");
  } catch (const DecodeError& ex) {
    REQUIRE(ex.raw() == "1.234,56");
  }
}

TEST_CASE("decodeNumber refuses text fields", "[decode]") {
  REQUIRE_THROWS_AS(decodeNumber("12", FieldKind::Text), std::invalid_argument);
}

TEST_CASE("encodeDatev writes the DATEV form", "[encode]") {
  REQUIRE(encodeDatev(Amount{243000}) == "2.43000");
  REQUIRE(encodeDatev(Amount{18041}) == "18041");
  REQUIRE(encodeDatev(Amount{-500000}) == "5.00000-");
  REQUIRE(encodeDatev(Amount{0}) == "000");
  REQUIRE(encodeDatev(std::int64_t{-3}) == "3-");
}

TEST_CASE("encoded amounts decode to the same value", "[encode][decode]") {
  std::vector<std::int64_t> samples = {0, 5, 18041, 243000, 1000000, 123456789012, -1, -500000};
  for (std::int64_t cents : samples) {
    FieldValue back = decodeNumber(encodeDatev(Amount{cents}), FieldKind::Currency);
    REQUIRE(std::get<Amount>(back).cents == cents);
  }
  REQUIRE(std::get<std::int64_t>(decodeNumber(encodeDatev(std::int64_t{-31}), FieldKind::Integer)) == -31);
}

TEST_CASE("formatValue renders plain decimals", "[format]") {
  REQUIRE(formatAmount(Amount{243000}) == "2430.00");
  REQUIRE(formatAmount(Amount{-18041}) == "-180.41");
  REQUIRE(formatAmount(Amount{5}) == "0.05");
  REQUIRE(formatValue(FieldValue{}) == "");
  REQUIRE(formatValue(FieldValue{std::int64_t{30}}) == "30");
  REQUIRE(formatValue(FieldValue{std::string("Muster")}) == "Muster");
}

TEST_CASE("isDatevNumber recognises values decodeNumber accepts", "[decode]") {
  REQUIRE(isDatevNumber("3.10000"));
  REQUIRE(isDatevNumber("18041"));
  REQUIRE(isDatevNumber(" 5.000- "));
  REQUIRE_FALSE(isDatevNumber(""));
  REQUIRE_FALSE(isDatevNumber("-"));
  REQUIRE_FALSE(isDatevNumber("."));
  REQUIRE_FALSE(isDatevNumber("1.234,56"));
  REQUIRE_FALSE(isDatevNumber("Muster,"));
}
