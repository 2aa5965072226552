#include "cusplit/Dispatcher.hpp"
#include "cusplit/Pipeline.hpp"

#include <catch2/catch.hpp>

#include <mutex>
#include <stdexcept>

using namespace cusplit;

namespace {

/// Page source whose page `brokenPage` cannot be read
class BrokenPageSource : public PageTextSource {
public:
  explicit BrokenPageSource(int brokenPage) : m_brokenPage(brokenPage) {}

  int pageCount() const override { return 3; }

  std::string pageText(int index) override {
    if (index == m_brokenPage) {
      throw std::runtime_error("corrupt content stream");
    }
    return "CERTIFICAZIONE UNICA 2025";
  }

private:
  int m_brokenPage;
};

class CountingTransport : public Transport {
public:
  SendResult send(const std::string &recipient, const std::string &,
                  const std::string &, const std::vector<unsigned char> &,
                  const std::string &filename) override {
    std::lock_guard<std::mutex> lock(m_mutex);
    sent.push_back(recipient + " " + filename);
    SendResult result;
    result.success = true;
    return result;
  }

  std::vector<std::string> sent;

private:
  std::mutex m_mutex;
};

class BlankAttachments : public AttachmentProvider {
public:
  std::vector<unsigned char> attachmentFor(const CertificateRecord &) override {
    return {'%', 'P', 'D', 'F'};
  }
};

MemoryPageSource sampleDocument() {
  MemoryPageSource source;
  source.addPage("Elenco certificazioni trasmesse");
  source.addPage("CERTIFICAZIONE UNICA 2025\n"
                 "DATI RELATIVI AL DIPENDENTE\n"
                 "Codice fiscale RSSMRA80A01H501Z\n"
                 "Cognome ROSSI Nome MARIO\n");
  source.addPage("Redditi di lavoro dipendente 32.000,00");
  source.addPage("CERTIFICAZIONE UNICA 2025\n"
                 "DATI RELATIVI AL DIPENDENTE\n"
                 "Cognome BIANCHI Nome LUIGIA\n");
  source.addPage("CERTIFICAZIONE UNICA 2025\n"
                 "DATI RELATIVI AL DIPENDENTE\n"
                 "pagina senza dati leggibili\n");
  return source;
}

ExtractorConfig fixedYearConfig() {
  ExtractorConfig config;
  config.referenceYear = 2025;
  return config;
}

} // namespace

TEST_CASE("Extraction runs page source, segmenter and extractor",
          "[pipeline]") {
  MemoryPageSource source = sampleDocument();
  auto result = runExtraction(source, SegmenterConfig(), fixedYearConfig());

  REQUIRE(result.success);
  REQUIRE(result.pageCount == 5);
  REQUIRE(result.droppedPages == 1);
  REQUIRE(result.records.size() == 3);

  REQUIRE(result.records[0].id() == "p1-2");
  REQUIRE(result.records[0].fiscalCode == "RSSMRA80A01H501Z");
  REQUIRE(result.records[0].fullName() == "ROSSI MARIO");

  REQUIRE(result.records[1].eligibleStrategies() == MatchStrategy::FuzzyOnly);
  REQUIRE(result.records[2].eligibleStrategies() == MatchStrategy::None);

  // Dropped cover page, plus one per degraded record
  REQUIRE(result.warnings.size() == 3);
}

TEST_CASE("An unreadable page fails the whole document", "[pipeline]") {
  BrokenPageSource source(1);
  auto result = runExtraction(source);

  REQUIRE_FALSE(result.success);
  REQUIRE(result.records.empty());
  REQUIRE(result.errorMessage.find("page 2") != std::string::npos);
  REQUIRE(result.errorMessage.find("corrupt content stream") !=
          std::string::npos);
}

TEST_CASE("Invalid configuration is reported, not thrown", "[pipeline]") {
  MemoryPageSource source(std::vector<std::string>{"CERTIFICAZIONE UNICA 2025"});
  SegmenterConfig config;
  config.headerZoneFraction = 2.0;

  auto result = runExtraction(source, config);
  REQUIRE_FALSE(result.success);
  REQUIRE(result.errorMessage.find("headerZoneFraction") != std::string::npos);
}

TEST_CASE("Memory page source bounds", "[pipeline]") {
  MemoryPageSource source(std::vector<std::string>{"one", "two"});
  REQUIRE(source.pageCount() == 2);
  REQUIRE(source.pageText(1) == "two");
  REQUIRE_THROWS_AS(source.pageText(2), std::out_of_range);
  REQUIRE_THROWS_AS(source.pageText(-1), std::out_of_range);
}

TEST_CASE("Document to delivery", "[pipeline]") {
  MemoryPageSource source = sampleDocument();
  auto extraction = runExtraction(source, SegmenterConfig(), fixedYearConfig());
  REQUIRE(extraction.success);

  RosterLoadResult loaded = Roster::build(
      {{"Rossi", "Mario", "RSSMRA80A01H501Z", "mario.rossi@email.it"},
       {"Bianchi", "Luigia", "", "luigia.bianchi@email.it"},
       {"Verdi", "Giuseppe", "VRDGPP75C15L219H", "giuseppe@email.it"}});
  REQUIRE(loaded.success);

  auto reconciliation = reconcile(extraction.records, loaded.roster);
  auto summary = reconciliation.summary();
  REQUIRE(summary.exact == 1);
  REQUIRE(summary.fuzzy == 1);
  REQUIRE(summary.unmatched == 1);
  REQUIRE(summary.orphanRoster == 1);

  auto items =
      deliveryItemsFrom(reconciliation, extraction.records, loaded.roster);
  REQUIRE(items.size() == 2);

  CountingTransport transport;
  BlankAttachments attachments;
  auto delivery = Dispatcher().dispatch(items, transport, attachments);

  REQUIRE(countStatus(delivery.log, DeliveryStatus::Sent) == 2);
  REQUIRE(transport.sent.size() == 2);

  auto rerun = Dispatcher().dispatch(items, transport, attachments, delivery.log);
  REQUIRE(transport.sent.size() == 2);
  REQUIRE(rerun.alreadySent == 2);
}
