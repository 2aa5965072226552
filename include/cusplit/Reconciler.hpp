#ifndef CUSPLIT_RECONCILER_HPP
#define CUSPLIT_RECONCILER_HPP

#include "cusplit/Matcher.hpp"
#include "cusplit/Records.hpp"
#include "cusplit/Roster.hpp"

#include <string>
#include <vector>

namespace cusplit {

/**
 * @brief One row of the reconciliation: a record with its decision, or a
 * roster entry no record claimed
 */
struct ReconciliationEntry {
  MatchDecision decision = MatchDecision::Unmatched;
  int recordIndex = -1; ///< Position in the record list, -1 for OrphanRoster
  int rosterIndex = -1; ///< Chosen roster entry (Exact, Fuzzy, OrphanRoster)
  std::vector<int> ambiguousCandidates; ///< Roster positions for Ambiguous
  double score = 0.0;
  std::string method;
};

/**
 * @brief Count of entries per decision
 */
struct ReconciliationSummary {
  int exact = 0;
  int fuzzy = 0;
  int ambiguous = 0;
  int unmatched = 0;
  int orphanRoster = 0;
};

/**
 * @brief Review groups shown to the operator
 */
enum class ReviewCategory {
  Matched,      ///< Exact or Fuzzy with a recipient email
  NeedsEmail,   ///< Needs operator action before it can be sent
  NoCertificate ///< Roster entry without a certificate in this document
};

const char *toString(ReviewCategory category);

/**
 * @brief Full decision set for one document and one roster
 *
 * Entries for records come first, in document order, followed by one
 * OrphanRoster entry per unclaimed roster entry, in roster order.
 */
struct ReconciliationResult {
  std::vector<ReconciliationEntry> entries;
  std::vector<std::string> warnings;
  double processingTimeMs = 0;

  ReconciliationSummary summary() const;
};

/**
 * @brief Match every record and list the roster entries left unclaimed
 *
 * Deterministic: records are visited in document order and roster lookups
 * depend only on the roster's content and order.
 */
ReconciliationResult reconcile(const std::vector<CertificateRecord> &records,
                               const Roster &roster,
                               const MatcherConfig &config = MatcherConfig());

ReviewCategory reviewCategory(const ReconciliationEntry &entry,
                              const Roster &roster);

/**
 * @brief Tab-separated review table, one line per entry plus a header
 *
 * Columns: category, decision, pages (1-based), record name, record fiscal
 * code, roster name, roster fiscal code, email, score.
 */
std::string formatMatchTable(const ReconciliationResult &result,
                             const std::vector<CertificateRecord> &records,
                             const Roster &roster);

} // namespace cusplit

#endif // CUSPLIT_RECONCILER_HPP
