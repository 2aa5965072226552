#include "cusplit/Reconciler.hpp"

#include <catch2/catch.hpp>

using namespace cusplit;

namespace {

CertificateRecord makeRecord(int page, const std::string &surname,
                             const std::string &givenName,
                             const std::string &fiscalCode) {
  CertificateRecord record;
  record.startPage = page;
  record.endPage = page + 1;
  record.surname = surname;
  record.givenName = givenName;
  record.fiscalCode = fiscalCode;
  record.taxYear = 2025;
  return record;
}

Roster sampleRoster() {
  RosterLoadResult loaded = Roster::build(
      {{"ROSSI", "MARIO", "RSSMRA80A01H501Z", "mario.rossi@email.it"},
       {"BIANCHI", "LUIGIA", "BNCLGU85M41F205D", ""},
       {"VERDI", "GIUSEPPE", "VRDGPP75C15L219H", "giuseppe@email.it"},
       {"NERI", "ANNA", "", "anna@email.it"}});
  REQUIRE(loaded.success);
  return loaded.roster;
}

} // namespace

TEST_CASE("Every record and every unclaimed roster entry gets a decision",
          "[reconciler]") {
  Roster roster = sampleRoster();
  std::vector<CertificateRecord> records = {
      makeRecord(0, "ROSSI", "MARIO", "RSSMRA80A01H501Z"),
      makeRecord(2, "BIANCHI", "LUIGIA", ""),
      makeRecord(4, "ESPOSITO", "CIRO", "")};

  auto result = reconcile(records, roster);

  REQUIRE(result.entries.size() == 5);

  SECTION("records first, in document order") {
    REQUIRE(result.entries[0].decision == MatchDecision::Exact);
    REQUIRE(result.entries[0].recordIndex == 0);
    REQUIRE(result.entries[0].rosterIndex == 0);
    REQUIRE(result.entries[1].decision == MatchDecision::Fuzzy);
    REQUIRE(result.entries[1].rosterIndex == 1);
    REQUIRE(result.entries[2].decision == MatchDecision::Unmatched);
    REQUIRE(result.entries[2].rosterIndex == -1);
  }

  SECTION("then orphans, in roster order") {
    REQUIRE(result.entries[3].decision == MatchDecision::OrphanRoster);
    REQUIRE(result.entries[3].recordIndex == -1);
    REQUIRE(result.entries[3].rosterIndex == 2);
    REQUIRE(result.entries[4].decision == MatchDecision::OrphanRoster);
    REQUIRE(result.entries[4].rosterIndex == 3);
  }

  SECTION("summary") {
    auto summary = result.summary();
    REQUIRE(summary.exact == 1);
    REQUIRE(summary.fuzzy == 1);
    REQUIRE(summary.ambiguous == 0);
    REQUIRE(summary.unmatched == 1);
    REQUIRE(summary.orphanRoster == 2);
  }

  SECTION("review categories") {
    REQUIRE(reviewCategory(result.entries[0], roster) ==
            ReviewCategory::Matched);
    // Matched by name, but the roster has no email for her
    REQUIRE(reviewCategory(result.entries[1], roster) ==
            ReviewCategory::NeedsEmail);
    REQUIRE(reviewCategory(result.entries[2], roster) ==
            ReviewCategory::NeedsEmail);
    REQUIRE(reviewCategory(result.entries[3], roster) ==
            ReviewCategory::NoCertificate);
  }

  SECTION("match table") {
    std::string table = formatMatchTable(result, records, roster);
    REQUIRE(table.find("category\tdecision\tpages") == 0);
    REQUIRE(table.find("matched\tExact\t1-2\tROSSI MARIO\tRSSMRA80A01H501Z\t"
                       "ROSSI MARIO\tRSSMRA80A01H501Z\tmario.rossi@email.it\t"
                       "1.00") != std::string::npos);
    REQUIRE(table.find("no-certificate\tOrphanRoster\t-\t") !=
            std::string::npos);
  }
}

TEST_CASE("Reconciliation is deterministic", "[reconciler]") {
  Roster roster = sampleRoster();
  std::vector<CertificateRecord> records = {
      makeRecord(0, "VERDI", "GIUSEPPE", ""),
      makeRecord(2, "ROSSI", "MARIO", "RSSMRA80A01H501Z")};

  auto first = reconcile(records, roster);
  auto second = reconcile(records, roster);

  REQUIRE(first.entries.size() == second.entries.size());
  for (size_t i = 0; i < first.entries.size(); i++) {
    REQUIRE(first.entries[i].decision == second.entries[i].decision);
    REQUIRE(first.entries[i].recordIndex == second.entries[i].recordIndex);
    REQUIRE(first.entries[i].rosterIndex == second.entries[i].rosterIndex);
  }
}

TEST_CASE("Ambiguous candidates are not claimed", "[reconciler]") {
  RosterLoadResult loaded =
      Roster::build({{"ROSSI", "MARIA", "", "maria@email.it"},
                     {"ROSSI", "MARIE", "", "marie@email.it"}});
  REQUIRE(loaded.success);

  auto result =
      reconcile({makeRecord(0, "ROSSI", "MARIO", "")}, loaded.roster);

  REQUIRE(result.entries.size() == 3);
  REQUIRE(result.entries[0].decision == MatchDecision::Ambiguous);
  REQUIRE(result.entries[0].ambiguousCandidates.size() == 2);
  REQUIRE(result.entries[1].decision == MatchDecision::OrphanRoster);
  REQUIRE(result.entries[2].decision == MatchDecision::OrphanRoster);
  REQUIRE(reviewCategory(result.entries[0], loaded.roster) ==
          ReviewCategory::NeedsEmail);

  std::string table =
      formatMatchTable(result, {makeRecord(0, "ROSSI", "MARIO", "")},
                       loaded.roster);
  REQUIRE(table.find("ROSSI MARIA | ROSSI MARIE") != std::string::npos);
}

TEST_CASE("Two records claiming one roster entry are reported",
          "[reconciler]") {
  Roster roster = sampleRoster();
  std::vector<CertificateRecord> records = {
      makeRecord(0, "ROSSI", "MARIO", "RSSMRA80A01H501Z"),
      makeRecord(2, "ROSSI", "MARIO", "")};

  auto result = reconcile(records, roster);

  REQUIRE(result.entries[0].decision == MatchDecision::Exact);
  REQUIRE(result.entries[1].decision == MatchDecision::Fuzzy);
  REQUIRE(result.entries[1].rosterIndex == 0);
  REQUIRE(result.warnings.size() == 1);
  REQUIRE(result.warnings[0].find("p0-1") != std::string::npos);
  REQUIRE(result.warnings[0].find("p2-3") != std::string::npos);
  REQUIRE(result.summary().orphanRoster == 3);
}

TEST_CASE("An empty roster leaves every record unmatched", "[reconciler]") {
  Roster roster;
  auto result =
      reconcile({makeRecord(0, "ROSSI", "MARIO", "RSSMRA80A01H501Z")}, roster);
  REQUIRE(result.entries.size() == 1);
  REQUIRE(result.entries[0].decision == MatchDecision::Unmatched);
}
