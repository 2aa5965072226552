#include "cusplit/Matcher.hpp"

#include "cusplit/FiscalCode.hpp"
#include "cusplit/Similarity.hpp"
#include "cusplit/TextNormalizer.hpp"

#include <stdexcept>

namespace cusplit {

namespace {

// Scores are ratios of small integers; keep 0.95 - 0.90 from reading as
// slightly below a 0.05 margin.
const double kScoreEpsilon = 1e-9;

} // namespace

const char *toString(MatchDecision decision) {
  switch (decision) {
  case MatchDecision::Exact:
    return "Exact";
  case MatchDecision::Fuzzy:
    return "Fuzzy";
  case MatchDecision::Ambiguous:
    return "Ambiguous";
  case MatchDecision::Unmatched:
    return "Unmatched";
  case MatchDecision::OrphanRoster:
    return "OrphanRoster";
  }
  return "Unknown";
}

Matcher::Matcher() : Matcher(MatcherConfig()) {}

Matcher::Matcher(const MatcherConfig &config) : m_config(config) {
  if (m_config.threshold < 0.0 || m_config.threshold > 1.0) {
    throw std::invalid_argument("Match threshold must be in [0, 1], got " +
                                std::to_string(m_config.threshold));
  }
  if (m_config.margin < 0.0 || m_config.margin > 1.0) {
    throw std::invalid_argument("Match margin must be in [0, 1], got " +
                                std::to_string(m_config.margin));
  }
}

const MatcherConfig &Matcher::getConfig() const { return m_config; }

double Matcher::nameScore(const CertificateRecord &record,
                          const RosterEntry &entry) {
  std::string recordName = normalizeName(record.fullName());
  std::string entryName = normalizeName(entry.fullName());
  if (recordName.empty() || entryName.empty()) {
    return 0.0;
  }
  return tokenSortRatio(recordName, entryName);
}

MatchResult Matcher::match(const CertificateRecord &record,
                           const Roster &roster) const {
  MatchResult result;

  // Step 1: fiscal code is the authoritative key
  if (record.hasFiscalCode() &&
      fiscal_code::isStructurallyValid(record.fiscalCode)) {
    int hit = roster.findByFiscalCode(record.fiscalCode);
    if (hit >= 0) {
      result.decision = MatchDecision::Exact;
      result.candidate = hit;
      result.score = 1.0;
      result.method = "fiscal-code";
      return result;
    }
  }

  // Step 2: fuzzy name fallback
  if (!record.hasName()) {
    return result;
  }

  std::vector<size_t> pool;
  if (m_config.sameInitialPrefilter) {
    pool = roster.sameInitial(normalizeName(record.surname));
  } else {
    pool.reserve(roster.size());
    for (size_t i = 0; i < roster.size(); i++) {
      pool.push_back(i);
    }
  }

  std::vector<double> scores(roster.size(), -1.0);
  int best = -1;
  double s1 = -1.0;
  double s2 = -1.0;

  for (size_t position : pool) {
    double score = nameScore(record, roster.at(position));
    scores[position] = score;

    if (score > s1) {
      s2 = s1;
      s1 = score;
      best = static_cast<int>(position);
    } else if (score > s2) {
      s2 = score;
    }
  }

  if (best < 0 || s1 + kScoreEpsilon < m_config.threshold) {
    result.score = s1 < 0.0 ? 0.0 : s1;
    return result;
  }

  result.score = s1;
  result.method = "name";

  if (s2 >= 0.0 && s1 - s2 + kScoreEpsilon < m_config.margin) {
    result.decision = MatchDecision::Ambiguous;
    for (size_t position : pool) {
      if (s1 - scores[position] + kScoreEpsilon < m_config.margin) {
        result.ambiguousCandidates.push_back(static_cast<int>(position));
      }
    }
    return result;
  }

  result.decision = MatchDecision::Fuzzy;
  result.candidate = best;
  return result;
}

} // namespace cusplit
