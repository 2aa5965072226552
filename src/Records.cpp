#include "cusplit/Records.hpp"

namespace cusplit {

namespace {

std::string joinName(const std::string &surname, const std::string &givenName) {
  if (surname.empty()) {
    return givenName;
  }
  if (givenName.empty()) {
    return surname;
  }
  return surname + " " + givenName;
}

} // namespace

std::string CertificateRecord::id() const {
  return "p" + std::to_string(startPage) + "-" + std::to_string(endPage);
}

std::string CertificateRecord::fullName() const {
  return joinName(surname, givenName);
}

MatchStrategy CertificateRecord::eligibleStrategies() const {
  if (hasFiscalCode() && hasName()) {
    return MatchStrategy::ExactAndFuzzy;
  }
  if (hasFiscalCode()) {
    return MatchStrategy::ExactOnly;
  }
  if (hasName()) {
    return MatchStrategy::FuzzyOnly;
  }
  return MatchStrategy::None;
}

std::string RosterEntry::fullName() const {
  return joinName(surname, givenName);
}

const char *toString(MatchStrategy strategy) {
  switch (strategy) {
  case MatchStrategy::None:
    return "none";
  case MatchStrategy::ExactOnly:
    return "exact-only";
  case MatchStrategy::FuzzyOnly:
    return "fuzzy-only";
  case MatchStrategy::ExactAndFuzzy:
    return "exact+fuzzy";
  }
  return "unknown";
}

} // namespace cusplit
