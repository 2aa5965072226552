#include "cusplit/Reconciler.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace cusplit {

const char *toString(ReviewCategory category) {
  switch (category) {
  case ReviewCategory::Matched:
    return "matched";
  case ReviewCategory::NeedsEmail:
    return "needs-email";
  case ReviewCategory::NoCertificate:
    return "no-certificate";
  }
  return "unknown";
}

ReconciliationSummary ReconciliationResult::summary() const {
  ReconciliationSummary counts;
  for (const auto &entry : entries) {
    switch (entry.decision) {
    case MatchDecision::Exact:
      counts.exact++;
      break;
    case MatchDecision::Fuzzy:
      counts.fuzzy++;
      break;
    case MatchDecision::Ambiguous:
      counts.ambiguous++;
      break;
    case MatchDecision::Unmatched:
      counts.unmatched++;
      break;
    case MatchDecision::OrphanRoster:
      counts.orphanRoster++;
      break;
    }
  }
  return counts;
}

ReconciliationResult reconcile(const std::vector<CertificateRecord> &records,
                               const Roster &roster,
                               const MatcherConfig &config) {
  ReconciliationResult result;
  auto startTime = std::chrono::high_resolution_clock::now();

  Matcher matcher(config);
  std::vector<int> claimedBy(roster.size(), -1);

  for (size_t i = 0; i < records.size(); i++) {
    MatchResult match = matcher.match(records[i], roster);

    ReconciliationEntry entry;
    entry.decision = match.decision;
    entry.recordIndex = static_cast<int>(i);
    entry.rosterIndex = match.candidate;
    entry.ambiguousCandidates = match.ambiguousCandidates;
    entry.score = match.score;
    entry.method = match.method;

    if (match.candidate >= 0) {
      int &owner = claimedBy[static_cast<size_t>(match.candidate)];
      if (owner >= 0) {
        std::string warning =
            "Records " + records[static_cast<size_t>(owner)].id() + " and " +
            records[i].id() + " both matched roster entry " +
            std::to_string(match.candidate + 1) + " (" +
            roster.at(static_cast<size_t>(match.candidate)).fullName() + ")";
        std::cerr << "WARNING: " << warning << std::endl;
        result.warnings.push_back(warning);
      } else {
        owner = static_cast<int>(i);
      }
    }

    result.entries.push_back(entry);
  }

  for (size_t r = 0; r < roster.size(); r++) {
    if (claimedBy[r] >= 0) {
      continue;
    }
    ReconciliationEntry orphan;
    orphan.decision = MatchDecision::OrphanRoster;
    orphan.rosterIndex = static_cast<int>(r);
    result.entries.push_back(orphan);
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

ReviewCategory reviewCategory(const ReconciliationEntry &entry,
                              const Roster &roster) {
  switch (entry.decision) {
  case MatchDecision::OrphanRoster:
    return ReviewCategory::NoCertificate;
  case MatchDecision::Exact:
  case MatchDecision::Fuzzy:
    if (entry.rosterIndex >= 0 &&
        !roster.at(static_cast<size_t>(entry.rosterIndex)).email.empty()) {
      return ReviewCategory::Matched;
    }
    return ReviewCategory::NeedsEmail;
  case MatchDecision::Ambiguous:
  case MatchDecision::Unmatched:
    break;
  }
  return ReviewCategory::NeedsEmail;
}

std::string formatMatchTable(const ReconciliationResult &result,
                             const std::vector<CertificateRecord> &records,
                             const Roster &roster) {
  std::ostringstream out;
  out << "category\tdecision\tpages\trecord_name\trecord_cf\troster_name\t"
         "roster_cf\temail\tscore\n";

  for (const auto &entry : result.entries) {
    const CertificateRecord *record =
        entry.recordIndex >= 0 ? &records.at(static_cast<size_t>(entry.recordIndex))
                               : nullptr;
    const RosterEntry *rosterEntry =
        entry.rosterIndex >= 0 ? &roster.at(static_cast<size_t>(entry.rosterIndex))
                               : nullptr;

    std::string rosterName;
    std::string rosterCode;
    if (rosterEntry) {
      rosterName = rosterEntry->fullName();
      rosterCode = rosterEntry->fiscalCode;
    } else if (!entry.ambiguousCandidates.empty()) {
      for (int candidate : entry.ambiguousCandidates) {
        if (!rosterName.empty()) {
          rosterName += " | ";
        }
        rosterName += roster.at(static_cast<size_t>(candidate)).fullName();
      }
    }

    out << toString(reviewCategory(entry, roster)) << "\t"
        << toString(entry.decision) << "\t";
    if (record) {
      out << (record->startPage + 1) << "-" << (record->endPage + 1) << "\t"
          << record->fullName() << "\t" << record->fiscalCode << "\t";
    } else {
      out << "-\t\t\t";
    }
    out << rosterName << "\t" << rosterCode << "\t"
        << (rosterEntry ? rosterEntry->email : "") << "\t" << std::fixed
        << std::setprecision(2) << entry.score << "\n";
  }

  return out.str();
}

} // namespace cusplit
