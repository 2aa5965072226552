#include "cusplit/Roster.hpp"

#include "cusplit/FiscalCode.hpp"
#include "cusplit/TextNormalizer.hpp"

#include <iostream>
#include <utility>

namespace cusplit {

RosterLoadResult Roster::build(const std::vector<RosterEntry> &entries) {
  RosterLoadResult result;

  auto warn = [&](const std::string &message) {
    std::cerr << "WARNING: " << message << std::endl;
    result.warnings.push_back(message);
  };

  std::vector<RosterEntry> normalized;
  std::map<std::string, std::vector<size_t>> byCode;

  for (size_t i = 0; i < entries.size(); i++) {
    RosterEntry entry;
    entry.surname = normalizeName(entries[i].surname);
    entry.givenName = normalizeName(entries[i].givenName);
    entry.fiscalCode = toUpperAscii(trim(entries[i].fiscalCode));
    entry.email = trim(entries[i].email);

    if (entry.fullName().empty() && entry.fiscalCode.empty()) {
      warn("Roster entry " + std::to_string(i + 1) +
           " has neither name nor fiscal code, ignored");
      continue;
    }

    if (!entry.fiscalCode.empty()) {
      if (!fiscal_code::isStructurallyValid(entry.fiscalCode)) {
        warn("Roster entry " + std::to_string(i + 1) + " (" +
             entry.fullName() + ") has a malformed fiscal code '" +
             entry.fiscalCode + "'");
      }
      byCode[entry.fiscalCode].push_back(i);
    }

    if (entry.email.empty()) {
      warn("Roster entry " + std::to_string(i + 1) + " (" + entry.fullName() +
           ") has no email address");
    }

    normalized.push_back(entry);
  }

  for (const auto &code : byCode) {
    if (code.second.size() > 1) {
      result.duplicates.push_back({code.first, code.second});
    }
  }

  if (!result.duplicates.empty()) {
    std::string message = "Duplicate fiscal codes in roster:";
    for (const auto &duplicate : result.duplicates) {
      message += " " + duplicate.fiscalCode + " (entries";
      for (size_t position : duplicate.positions) {
        message += " " + std::to_string(position + 1);
      }
      message += ")";
    }
    std::cerr << "ERROR: " << message << std::endl;
    result.errorMessage = message;
    return result;
  }

  Roster &roster = result.roster;
  roster.m_entries = std::move(normalized);
  for (size_t i = 0; i < roster.m_entries.size(); i++) {
    const RosterEntry &entry = roster.m_entries[i];
    if (!entry.fiscalCode.empty()) {
      roster.m_fiscalIndex.emplace(entry.fiscalCode, i);
    }
    char initial = entry.surname.empty() ? '\0' : entry.surname[0];
    roster.m_initialIndex[initial].push_back(i);
  }

  result.success = true;
  return result;
}

size_t Roster::size() const { return m_entries.size(); }

bool Roster::empty() const { return m_entries.empty(); }

const std::vector<RosterEntry> &Roster::entries() const { return m_entries; }

const RosterEntry &Roster::at(size_t index) const { return m_entries.at(index); }

int Roster::findByFiscalCode(const std::string &fiscalCode) const {
  auto it = m_fiscalIndex.find(toUpperAscii(fiscalCode));
  if (it == m_fiscalIndex.end()) {
    return -1;
  }
  return static_cast<int>(it->second);
}

const std::vector<size_t> &Roster::sameInitial(const std::string &surname) const {
  static const std::vector<size_t> none;
  char initial = surname.empty() ? '\0' : surname[0];
  auto it = m_initialIndex.find(initial);
  return it == m_initialIndex.end() ? none : it->second;
}

} // namespace cusplit
