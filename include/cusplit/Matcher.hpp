#ifndef CUSPLIT_MATCHER_HPP
#define CUSPLIT_MATCHER_HPP

#include "cusplit/Records.hpp"
#include "cusplit/Roster.hpp"

#include <string>
#include <vector>

namespace cusplit {

/**
 * @brief Outcome of matching one record (or classifying one roster entry)
 */
enum class MatchDecision {
  Exact,       ///< Fiscal code found in the roster
  Fuzzy,       ///< Name similarity above threshold with a clear winner
  Ambiguous,   ///< Near-tie between roster entries, needs an operator
  Unmatched,   ///< No roster entry qualifies
  OrphanRoster ///< Roster entry not claimed by any record
};

const char *toString(MatchDecision decision);

/**
 * @brief Configuration options for the matcher
 */
struct MatcherConfig {
  double threshold = 0.85; ///< Minimum fuzzy score (T)
  double margin = 0.05;    ///< Minimum lead of the best score over the next (M)
  bool sameInitialPrefilter = false; ///< Only score entries whose surname
                                     ///< starts with the record's initial
};

/**
 * @brief Decision for one record with the roster entries behind it
 */
struct MatchResult {
  MatchDecision decision = MatchDecision::Unmatched;
  int candidate = -1;                  ///< Roster position of the pick, or -1
  std::vector<int> ambiguousCandidates; ///< Near-tied roster positions
  double score = 0.0;                  ///< Score of the best candidate
  std::string method;                  ///< "fiscal-code", "name" or empty
};

/**
 * @brief Matches an extracted record against the roster
 *
 * Step 1: a present, structurally valid fiscal code found in the roster is an
 * Exact match whatever the names say.
 * Step 2: otherwise every roster name is scored with tokenSortRatio(). With
 * s1 the best score (entry e1) and s2 the runner-up: s1 < T is Unmatched,
 * s1 - s2 < M is Ambiguous, anything else is Fuzzy on e1. Equal scores keep
 * roster order.
 */
class Matcher {
public:
  Matcher();

  /**
   * @throws std::invalid_argument if threshold or margin is outside [0, 1]
   */
  explicit Matcher(const MatcherConfig &config);

  MatchResult match(const CertificateRecord &record, const Roster &roster) const;

  /// Score of a record name against one roster entry, in [0, 1]
  static double nameScore(const CertificateRecord &record,
                          const RosterEntry &entry);

  const MatcherConfig &getConfig() const;

private:
  MatcherConfig m_config;
};

} // namespace cusplit

#endif // CUSPLIT_MATCHER_HPP
