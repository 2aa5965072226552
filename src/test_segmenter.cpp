#include "cusplit/Segmenter.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>

using namespace cusplit;

namespace {

std::vector<PageText> makePages(const std::vector<std::string> &texts) {
  std::vector<PageText> pages;
  for (size_t i = 0; i < texts.size(); i++) {
    pages.push_back({static_cast<int>(i), texts[i]});
  }
  return pages;
}

} // namespace

TEST_CASE("One marker on the first page spans the whole document",
          "[segmenter]") {
  Segmenter segmenter;
  auto result = segmenter.segment(makePages(
      {"CERTIFICAZIONE UNICA 2025\nDati anagrafici", "Redditi", "Firma"}));

  REQUIRE(result.success);
  REQUIRE(result.records.size() == 1);
  REQUIRE(result.records[0].startPage == 0);
  REQUIRE(result.records[0].endPage == 2);
  REQUIRE(result.records[0].markerYear == 2025);
  REQUIRE(result.records[0].rawText.find("Redditi") != std::string::npos);
  REQUIRE(result.records[0].rawText.find("Firma") != std::string::npos);
  REQUIRE(result.droppedPages == 0);
  REQUIRE(result.warnings.empty());
}

TEST_CASE("Records partition the pages after the first marker",
          "[segmenter]") {
  Segmenter segmenter;
  auto pages = makePages({"Lettera di accompagnamento",
                          "CERTIFICAZIONE UNICA 2025 - ROSSI", "seguito",
                          "CERTIFICAZIONE UNICA 2025 - BIANCHI",
                          "Certificazione   unica 2025 - VERDI", "seguito",
                          "seguito", ""});
  auto result = segmenter.segment(pages);

  REQUIRE(result.success);
  REQUIRE(result.records.size() == 3);
  REQUIRE(result.droppedPages == 1);
  REQUIRE(result.warnings.size() == 1);

  SECTION("ranges are contiguous, ordered and non-overlapping") {
    int expectedStart = 1;
    for (const auto &record : result.records) {
      REQUIRE(record.startPage == expectedStart);
      REQUIRE(record.endPage >= record.startPage);
      expectedStart = record.endPage + 1;
    }
    REQUIRE(expectedStart == static_cast<int>(pages.size()));
  }

  SECTION("individual ranges") {
    REQUIRE(result.records[0].id() == "p1-2");
    REQUIRE(result.records[1].id() == "p3-3");
    REQUIRE(result.records[2].id() == "p4-7");
    REQUIRE(result.records[2].pageCount() == 4);
  }
}

TEST_CASE("A marker below the previous record's tail starts a new record",
          "[segmenter]") {
  Segmenter segmenter;
  auto result = segmenter.segment(
      makePages({"CERTIFICAZIONE UNICA 2025\nROSSI",
                 "tail of rossi\nCERTIFICAZIONE UNICA 2025\nBIANCHI"}));

  REQUIRE(result.success);
  REQUIRE(result.records.size() == 2);
  REQUIRE(result.records[0].startPage == 0);
  REQUIRE(result.records[0].endPage == 0);
  REQUIRE(result.records[1].startPage == 1);
  REQUIRE(result.records[1].endPage == 1);
  REQUIRE(result.records[1].rawText.find("tail of rossi") != std::string::npos);
}

TEST_CASE("A document without markers yields no records", "[segmenter]") {
  Segmenter segmenter;
  auto result = segmenter.segment(makePages({"Fattura 12", "Totale"}));

  REQUIRE(result.success);
  REQUIRE(result.records.empty());
  REQUIRE(result.droppedPages == 2);
  REQUIRE(result.warnings.size() == 1);
  REQUIRE(result.warnings[0].find("No certificate start marker") !=
          std::string::npos);
}

TEST_CASE("An empty document is not an error", "[segmenter]") {
  Segmenter segmenter;
  auto result = segmenter.segment({});
  REQUIRE(result.success);
  REQUIRE(result.records.empty());
  REQUIRE(result.pageCount == 0);
}

TEST_CASE("Page indices must be sequential", "[segmenter]") {
  Segmenter segmenter;
  std::vector<PageText> pages = {{0, "CERTIFICAZIONE UNICA 2025"},
                                 {2, "seguito"}};
  auto result = segmenter.segment(pages);
  REQUIRE_FALSE(result.success);
  REQUIRE_FALSE(result.errorMessage.empty());
}

TEST_CASE("Header zone limits where a marker counts", "[segmenter]") {
  SegmenterConfig config;
  config.headerZoneFraction = 0.2;
  Segmenter segmenter(config);

  int year = 0;
  REQUIRE(segmenter.isStartPage("CERTIFICAZIONE UNICA 2024\n" +
                                    std::string(200, 'x'),
                                year));
  REQUIRE(year == 2024);

  REQUIRE_FALSE(segmenter.isStartPage(
      std::string(200, 'x') + "\nvedi istruzioni Certificazione Unica 2024",
      year));
  REQUIRE(year == 0);
}

TEST_CASE("Custom marker patterns", "[segmenter]") {
  SECTION("pattern without a year group") {
    SegmenterConfig config;
    config.markerPatterns = {"MODELLO\\s+CU\\b"};
    Segmenter segmenter(config);

    int year = -1;
    REQUIRE(segmenter.isStartPage("Modello CU - sintetico", year));
    REQUIRE(year == 0);
    REQUIRE_FALSE(segmenter.isStartPage("CERTIFICAZIONE UNICA 2025", year));
  }

  SECTION("patterns are tried in order") {
    SegmenterConfig config;
    config.markerPatterns = {"CERTIFICAZIONE\\s+UNICA\\s+(\\d{4})",
                             "CERTIFICAZIONE\\s+LAVORO\\s+AUTONOMO"};
    Segmenter segmenter(config);
    auto result = segmenter.segment(makePages(
        {"CERTIFICAZIONE UNICA 2025", "CERTIFICAZIONE LAVORO AUTONOMO"}));
    REQUIRE(result.records.size() == 2);
    REQUIRE(result.records[1].markerYear == 0);
  }
}

TEST_CASE("Invalid segmenter configuration is rejected", "[segmenter]") {
  SegmenterConfig zero;
  zero.headerZoneFraction = 0.0;
  REQUIRE_THROWS_AS(Segmenter(zero), std::invalid_argument);

  SegmenterConfig tooLarge;
  tooLarge.headerZoneFraction = 1.5;
  REQUIRE_THROWS_AS(Segmenter(tooLarge), std::invalid_argument);

  SegmenterConfig badRegex;
  badRegex.markerPatterns = {"CERTIFICAZIONE("};
  REQUIRE_THROWS_AS(Segmenter(badRegex), std::invalid_argument);
}
