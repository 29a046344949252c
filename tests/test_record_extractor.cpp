#include <catch2/catch_all.hpp>

#include "fixtures.hpp"
#include "number_decoder.hpp"
#include "record_extractor.hpp"

#include <string>
#include <vector>

namespace {

Page singleLinePage(int number, std::vector<PositionedFragment> body, const std::string& month = "Januar") {
  Page page{number, std::move(body)};
  page.fragments.push_back(frag(month, 300, 340, 20));
  page.fragments.push_back(frag("2025", 345, 370, 20));
  return page;
}

} // namespace

TEST_CASE("one row with identifier, tax and a blank church tax", "[extract]") {
  RecordExtractor extractor(singleLineLayout());
  Page page = singleLinePage(1, {
    frag("12345", 10, 40, 100),
    frag("2.43000", 220, 260, 100),
    frag("", 320, 330, 100),
  });

  PageExtraction result = extractor.extract(page);
  REQUIRE_FALSE(result.headerError.has_value());
  REQUIRE(result.rejections.empty());
  REQUIRE(result.rows.size() == 1);

  const EmployeeRow& row = result.rows.front();
  REQUIRE(std::get<std::string>(row.fields.at("Pers.-Nr.")) == "12345");
  REQUIRE(std::get<Amount>(row.fields.at("Lohnsteuer")).cents == 243000);
  REQUIRE(isEmpty(row.fields.at("Kirchensteuer")));
  REQUIRE(row.month == "Januar");
  REQUIRE(row.year == 2025);
  REQUIRE(row.monthNumber == 1);
  REQUIRE(row.pageNumber == 1);
}

TEST_CASE("every schema field is present on an emitted row", "[extract]") {
  RecordExtractor extractor(singleLineLayout());
  PageExtraction result = extractor.extract(singleLinePage(1, {frag("12345", 10, 40, 100)}));
  REQUIRE(result.rows.size() == 1);
  const EmployeeRow& row = result.rows.front();
  REQUIRE(row.fields.size() == 5);
  REQUIRE(isEmpty(row.fields.at("Name")));
  REQUIRE(isEmpty(row.fields.at("St.-Tage")));
}

TEST_CASE("a page without a period yields no rows and one header error", "[extract]") {
  RecordExtractor extractor(singleLineLayout());
  Page page{4, {
    frag("Lohnjournal", 300, 360, 20),
    frag("10001", 10, 40, 100),
    frag("10002", 10, 40, 120),
  }};

  PageExtraction result = extractor.extract(page);
  REQUIRE(result.rows.empty());
  REQUIRE(result.rejections.empty());
  REQUIRE(result.headerError.has_value());
  REQUIRE(result.headerError->pageNumber() == 4);
}

TEST_CASE("a decode failure rejects only its row", "[extract]") {
  RecordExtractor extractor(singleLineLayout());
  PageExtraction result = extractor.extract(singleLinePage(2, {
    frag("10001", 10, 40, 100),
    frag("12000", 220, 260, 100),
    frag("10002", 10, 40, 120),
    frag("1.234,56", 220, 260, 120),
    frag("10003", 10, 40, 140),
    frag("36000", 220, 260, 140),
  }));

  REQUIRE(result.rows.size() == 2);
  REQUIRE(std::get<std::string>(result.rows[0].fields.at("Pers.-Nr.")) == "10001");
  REQUIRE(std::get<std::string>(result.rows[1].fields.at("Pers.-Nr.")) == "10003");

  REQUIRE(result.rejections.size() == 1);
  const RowRejected& r = result.rejections.front();
  REQUIRE(r.pageNumber == 2);
  REQUIRE(r.rowIndex == 1);
  REQUIRE(r.field == "Lohnsteuer");
  REQUIRE(r.rawText == "1.234,56");
}

TEST_CASE("two values in one numeric field reject the row", "[extract]") {
  RecordExtractor extractor(singleLineLayout());
  PageExtraction result = extractor.extract(singleLinePage(1, {
    frag("10001", 10, 40, 100),
    frag("12000", 205, 240, 100),
    frag("500", 260, 290, 100),
  }));
  REQUIRE(result.rows.empty());
  REQUIRE(result.rejections.size() == 1);
  REQUIRE(result.rejections.front().field == "Lohnsteuer");
  REQUIRE(result.rejections.front().rawText == "500");
}

TEST_CASE("text fields join their fragments", "[extract]") {
  RecordExtractor extractor(singleLineLayout());
  PageExtraction result = extractor.extract(singleLinePage(1, {
    frag("10001", 10, 40, 100),
    frag("Muster,", 70, 100, 100),
    frag("Max", 104, 120, 100),
  }));
  REQUIRE(result.rows.size() == 1);
  REQUIRE(std::get<std::string>(result.rows.front().fields.at("Name")) == "Muster, Max");
}

TEST_CASE("an LOA313 employee block spans several lines", "[extract]") {
  RecordExtractor extractor(loa313Layout());
  std::vector<PositionedFragment> fragments = loa313Header("Februar");
  std::vector<PositionedFragment> block = {
    frag("12345", 20, 45, 120),
    frag("1", 62, 66, 120),
    frag("Muster,", 150, 180, 120),
    frag("Erika", 183, 205, 120),
    frag("NB", 208, 220, 120),
    frag("3.10000", 470, 505, 120),
    frag("3.10000", 775, 810, 120),
    frag("1", 120, 124, 130),
    frag("30", 135, 145, 130),
    frag("3.10000", 180, 215, 130),
    frag("41233", 255, 285, 130),
    frag("Z", 330, 335, 130),
    frag("2.10000-", 775, 815, 130),
    frag("01111", 20, 45, 140),
    frag("30", 135, 145, 140),
    frag("2.01599", 770, 805, 140),
  };
  fragments.insert(fragments.end(), block.begin(), block.end());

  PageExtraction result = extractor.extract(Page{1, fragments});
  REQUIRE(result.rejections.empty());
  REQUIRE(result.rows.size() == 1);

  const EmployeeRow& row = result.rows.front();
  REQUIRE(row.fields.size() == 33);
  REQUIRE(std::get<std::string>(row.fields.at("Pers.-Nr.")) == "12345");
  REQUIRE(std::get<std::string>(row.fields.at("StKl")) == "1");
  REQUIRE(std::get<std::string>(row.fields.at("Name")) == "Muster, Erika");
  REQUIRE(std::get<Amount>(row.fields.at("KV-Brutto")).cents == 310000);
  REQUIRE(std::get<Amount>(row.fields.at("Gesamtbrutto")).cents == 310000);
  REQUIRE(std::get<std::int64_t>(row.fields.at("St.-Tage")) == 30);
  REQUIRE(std::get<Amount>(row.fields.at("Steuerbrutto")).cents == 310000);
  REQUIRE(std::get<Amount>(row.fields.at("Lohnsteuer")).cents == 41233);
  REQUIRE(isEmpty(row.fields.at("Kirchensteuer")));
  REQUIRE(std::get<Amount>(row.fields.at("Netto-Bezüge")).cents == -210000);
  REQUIRE(std::get<std::int64_t>(row.fields.at("SV-Tage")) == 30);
  REQUIRE(std::get<Amount>(row.fields.at("Auszahlungsbetrag")).cents == 201599);
  REQUIRE(row.month == "Februar");
  REQUIRE(row.lineCodes == std::vector<std::string>{"1", "01111"});
  REQUIRE(row.rawLines.size() == 3);
}

TEST_CASE("a sub-line continuing the previous page is reported", "[extract]") {
  RecordExtractor extractor(loa313Layout());
  std::vector<PositionedFragment> fragments = loa313Header("Januar");
  std::vector<PositionedFragment> body = {
    frag("1", 120, 124, 100),
    frag("41233", 255, 285, 100),
    frag("23456", 20, 45, 120),
  };
  fragments.insert(fragments.end(), body.begin(), body.end());

  PageExtraction result = extractor.extract(Page{3, fragments});
  REQUIRE(result.rows.size() == 1);
  REQUIRE(std::get<std::string>(result.rows.front().fields.at("Pers.-Nr.")) == "23456");
  REQUIRE(isEmpty(result.rows.front().fields.at("Lohnsteuer")));

  REQUIRE(result.rejections.size() == 1);
  const RowRejected& r = result.rejections.front();
  REQUIRE(r.pageNumber == 3);
  REQUIRE(r.field.empty());
  REQUIRE(r.rawText == "1 41233");
  REQUIRE(r.reason == "sub-line without employee block");
}

TEST_CASE("an amount drifting into the name band rejects the row", "[extract]") {
  RecordExtractor extractor(loa313Layout());
  std::vector<PositionedFragment> fragments = loa313Header("Januar");
  std::vector<PositionedFragment> body = {
    frag("12345", 20, 45, 120),
    frag("Muster,", 150, 180, 120),
    frag("3.10000", 420, 450, 120),
    frag("23456", 20, 45, 140),
    frag("Beispiel,", 150, 185, 140),
    frag("Erika", 188, 210, 140),
  };
  fragments.insert(fragments.end(), body.begin(), body.end());

  PageExtraction result = extractor.extract(Page{1, fragments});
  REQUIRE(result.rows.size() == 1);
  REQUIRE(std::get<std::string>(result.rows.front().fields.at("Name")) == "Beispiel, Erika");

  REQUIRE(result.rejections.size() == 1);
  REQUIRE(result.rejections.front().rowIndex == 0);
  REQUIRE(result.rejections.front().field == "Name");
  REQUIRE(result.rejections.front().rawText == "3.10000");
}

TEST_CASE("digits in other text fields are kept", "[extract]") {
  RecordExtractor extractor(loa313Layout());
  std::vector<PositionedFragment> fragments = loa313Header("Januar");
  fragments.push_back(frag("12345", 20, 45, 120));
  fragments.push_back(frag("3", 62, 66, 120));
  fragments.push_back(frag("0.5", 110, 125, 120));

  PageExtraction result = extractor.extract(Page{1, fragments});
  REQUIRE(result.rejections.empty());
  REQUIRE(result.rows.size() == 1);
  REQUIRE(std::get<std::string>(result.rows.front().fields.at("StKl")) == "3");
  REQUIRE(std::get<std::string>(result.rows.front().fields.at("Kinderfreibetrag")) == "0.5");
}

TEST_CASE("extractDocument keeps page order and skips non-journal pages", "[extract]") {
  RecordExtractor extractor(loa313Layout());

  Page cover{1, {frag("Deckblatt", 300, 360, 30), frag("10001", 20, 45, 120)}};

  std::vector<PositionedFragment> second = loa313Header("Januar");
  second.push_back(frag("10001", 20, 45, 120));
  second.push_back(frag("10002", 20, 45, 140));

  std::vector<PositionedFragment> third = loa313Header("Januar");
  third.push_back(frag("10003", 20, 45, 120));

  std::vector<PositionedFragment> fourth = {
    frag("Lohnjournal", 300, 360, 30),
    frag("Form.-Nr.LOA313", 700, 790, 30),
    frag("10004", 20, 45, 120),
  };

  DocumentExtraction doc = extractor.extractDocument({cover, Page{2, second}, Page{3, third}, Page{4, fourth}});

  REQUIRE(doc.skippedPages == std::vector<int>{1});
  REQUIRE(doc.rows.size() == 3);
  REQUIRE(std::get<std::string>(doc.rows[0].fields.at("Pers.-Nr.")) == "10001");
  REQUIRE(std::get<std::string>(doc.rows[1].fields.at("Pers.-Nr.")) == "10002");
  REQUIRE(std::get<std::string>(doc.rows[2].fields.at("Pers.-Nr.")) == "10003");
  REQUIRE(doc.rows[2].pageNumber == 3);
  REQUIRE(doc.headerErrors.size() == 1);
  REQUIRE(doc.headerErrors.front().pageNumber() == 4);
  REQUIRE(doc.info.berater == "4711");
  REQUIRE(doc.info.period == "Januar 2025");
}

TEST_CASE("the layout can be swapped without touching the extractor", "[extract]") {
  PayrollLayout narrow = parseLayout(
    "version NARROW\n"
    "header_bottom 50\n"
    "line main\n"
    "field pers_nr text 0 30 Pers.-Nr.\n"
    "field name text 30 100 Name\n"
    "field lohnsteuer currency 100 150 Lohnsteuer\n");
  RecordExtractor extractor(narrow);

  PageExtraction result = extractor.extract(singleLinePage(1, {
    frag("12345", 2, 28, 100),
    frag("18041", 110, 140, 100),
  }));
  REQUIRE(result.rows.size() == 1);
  REQUIRE(std::get<Amount>(result.rows.front().fields.at("Lohnsteuer")).cents == 18041);
}

TEST_CASE("an invalid layout is refused at construction", "[extract]") {
  PayrollLayout layout = singleLineLayout();
  layout.identifierField = "Personalnummer";
  REQUIRE_THROWS_AS(RecordExtractor(layout), LayoutError);
}
