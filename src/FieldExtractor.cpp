#include "cusplit/FieldExtractor.hpp"

#include "cusplit/FiscalCode.hpp"
#include "cusplit/TextNormalizer.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iostream>
#include <regex>

namespace cusplit {

namespace {

const size_t kNameContextLines = 5;

std::string escapeRegex(const std::string &word) {
  static const std::string special = "\\^$.|?*+()[]{}";
  std::string escaped;
  for (char c : word) {
    if (special.find(c) != std::string::npos) {
      escaped += '\\';
    }
    escaped += c;
  }
  return escaped;
}

/// "Cognome o Denominazione" -> \bCognome\s+o\s+Denominazione\b
std::string labelPattern(const std::string &label) {
  std::string pattern;
  for (const auto &word : splitWords(label)) {
    if (!pattern.empty()) {
      pattern += "\\s+";
    }
    pattern += escapeRegex(word);
  }
  return "\\b" + pattern + "\\b";
}

std::regex labelRegex(const std::string &label) {
  return std::regex(labelPattern(label),
                    std::regex::ECMAScript | std::regex::icase);
}

/// One alternation of every label of the profile, used to cut values short
std::regex stopRegex(const LabelProfile &profile) {
  std::string alternation;
  auto add = [&](const std::vector<std::string> &labels) {
    for (const auto &label : labels) {
      if (!alternation.empty()) {
        alternation += "|";
      }
      alternation += "(?:" + labelPattern(label) + ")";
    }
  };
  add(profile.surnameLabels);
  add(profile.givenNameLabels);
  add(profile.yearLabels);
  add(profile.stopLabels);
  if (alternation.empty()) {
    alternation = "(?!)";
  }
  return std::regex(alternation, std::regex::ECMAScript | std::regex::icase);
}

/**
 * Value written after a label on the same line, cut at the next label or the
 * first digit. Tries every occurrence of every variant, in variant order.
 */
std::string findLabeledValue(const std::string &text,
                             const std::vector<std::string> &labels,
                             const std::regex &stop) {
  for (const auto &label : labels) {
    std::regex re = labelRegex(label);
    auto begin = std::sregex_iterator(text.begin(), text.end(), re);
    auto end = std::sregex_iterator();

    for (auto it = begin; it != end; ++it) {
      size_t pos = static_cast<size_t>(it->position(0) + it->length(0));
      while (pos < text.size() &&
             (text[pos] == ' ' || text[pos] == '\t' || text[pos] == ':' ||
              text[pos] == '.' || text[pos] == '-')) {
        pos++;
      }

      size_t lineEnd = text.find('\n', pos);
      std::string value = text.substr(
          pos, lineEnd == std::string::npos ? std::string::npos : lineEnd - pos);

      std::smatch next;
      if (std::regex_search(value, next, stop)) {
        value = value.substr(0, static_cast<size_t>(next.position(0)));
      }

      auto digit = std::find_if(value.begin(), value.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c));
      });
      value.erase(digit, value.end());

      std::string normalized = normalizeName(value);
      if (normalized.size() >= 2) {
        return normalized;
      }
    }
  }

  return "";
}

/// Standalone runs of exactly four digits, with their offsets
std::vector<std::pair<int, size_t>> fourDigitTokens(const std::string &text) {
  std::vector<std::pair<int, size_t>> tokens;
  size_t pos = 0;
  while (pos < text.size()) {
    if (!std::isdigit(static_cast<unsigned char>(text[pos]))) {
      pos++;
      continue;
    }
    size_t start = pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      pos++;
    }
    if (pos - start == 4) {
      tokens.emplace_back(std::stoi(text.substr(start, 4)), start);
    }
  }
  return tokens;
}

/// A line made only of uppercase letters, spaces and apostrophes
bool looksLikeNameLine(const std::string &line) {
  if (line.size() <= 2) {
    return false;
  }
  for (char c : line) {
    unsigned char uc = static_cast<unsigned char>(c);
    bool upper = uc >= 'A' && uc <= 'Z';
    bool accented = uc >= 0x80; // UTF-8 bytes of accented capitals
    if (!upper && !accented && c != ' ' && c != '\'') {
      return false;
    }
  }
  return true;
}

std::string pagesLabel(const CertificateRecord &record) {
  return "Record " + record.id() + " (pages " +
         std::to_string(record.startPage + 1) + "-" +
         std::to_string(record.endPage + 1) + ")";
}

} // namespace

LabelProfile italianCuProfile() {
  LabelProfile profile;
  profile.name = "it-cu";
  profile.surnameLabels = {"Cognome o Denominazione", "Cognome"};
  profile.givenNameLabels = {"Nome"};
  profile.yearLabels = {"Certificazione Unica", "Periodo d'imposta", "Anno"};
  profile.stopLabels = {"Codice fiscale", "Sesso",     "Data di nascita",
                        "Comune",         "Provincia", "Denominazione"};
  return profile;
}

FieldExtractor::FieldExtractor() : FieldExtractor(ExtractorConfig()) {}

FieldExtractor::FieldExtractor(const ExtractorConfig &config)
    : m_config(config) {}

const ExtractorConfig &FieldExtractor::getConfig() const { return m_config; }

int FieldExtractor::latestYear() const {
  int reference = m_config.referenceYear;
  if (reference <= 0) {
    std::time_t now = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    reference = local.tm_year + 1900;
  }
  return reference + 1;
}

size_t FieldExtractor::subjectSectionStart(const std::string &text) const {
  for (const auto &anchor : m_config.subjectSectionAnchors) {
    std::smatch match;
    if (std::regex_search(text, match, labelRegex(anchor))) {
      return static_cast<size_t>(match.position(0) + match.length(0));
    }
  }
  return 0;
}

std::string FieldExtractor::extractFiscalCode(const std::string &text) const {
  size_t section = subjectSectionStart(text);

  if (section > 0) {
    auto inSection = fiscal_code::findAll(text.substr(section),
                                          m_config.requireCheckCharacter);
    if (!inSection.empty()) {
      return inSection.front().code;
    }
  }

  auto anywhere = fiscal_code::findAll(text, m_config.requireCheckCharacter);
  if (!anywhere.empty()) {
    return anywhere.front().code;
  }
  return "";
}

bool FieldExtractor::extractLabeledName(const std::string &text,
                                        std::string &surname,
                                        std::string &givenName) const {
  surname.clear();
  givenName.clear();

  size_t section = subjectSectionStart(text);
  std::vector<std::string> scopes;
  if (section > 0) {
    scopes.push_back(text.substr(section));
  }
  scopes.push_back(text);

  for (const auto &scope : scopes) {
    for (const auto &profile : m_config.profiles) {
      std::regex stop = stopRegex(profile);
      surname = findLabeledValue(scope, profile.surnameLabels, stop);
      givenName = findLabeledValue(scope, profile.givenNameLabels, stop);

      if (!surname.empty() || !givenName.empty()) {
        if (m_config.verbose) {
          std::cerr << "DEBUG: Name found with profile '" << profile.name
                    << "': " << surname << " / " << givenName << std::endl;
        }
        return true;
      }
    }
  }

  return false;
}

bool FieldExtractor::extractNameNearCode(const std::string &text,
                                         const std::string &fiscalCode,
                                         std::string &surname,
                                         std::string &givenName) const {
  surname.clear();
  givenName.clear();

  if (fiscalCode.empty()) {
    return false;
  }

  size_t codePos = toUpperAscii(text).find(fiscalCode);
  if (codePos == std::string::npos || codePos == 0) {
    return false;
  }

  std::vector<std::string> lines;
  for (const auto &line : splitLines(text.substr(0, codePos))) {
    std::string trimmed = trim(line);
    if (!trimmed.empty()) {
      lines.push_back(trimmed);
    }
  }

  size_t first = lines.size() > kNameContextLines ? lines.size() - kNameContextLines : 0;
  for (size_t i = lines.size(); i > first; i--) {
    const std::string &line = lines[i - 1];
    if (!looksLikeNameLine(line)) {
      continue;
    }

    bool heading = std::any_of(
        m_config.subjectSectionAnchors.begin(),
        m_config.subjectSectionAnchors.end(), [&](const std::string &anchor) {
          return std::regex_search(line, labelRegex(anchor));
        });
    if (heading) {
      continue;
    }

    std::vector<std::string> words = splitWords(normalizeName(line));
    if (words.size() < 2) {
      continue;
    }

    surname = words[0];
    for (size_t w = 1; w < words.size(); w++) {
      givenName += (w > 1 ? " " : "") + words[w];
    }
    return true;
  }

  return false;
}

int FieldExtractor::extractTaxYear(const std::string &text,
                                   bool &fromAnchor) const {
  fromAnchor = false;
  const int maxYear = latestYear();
  auto plausible = [&](int year) { return year >= 2000 && year <= maxYear; };

  for (const auto &profile : m_config.profiles) {
    for (const auto &label : profile.yearLabels) {
      std::regex re = labelRegex(label);
      auto begin = std::sregex_iterator(text.begin(), text.end(), re);
      for (auto it = begin; it != std::sregex_iterator(); ++it) {
        size_t after = static_cast<size_t>(it->position(0) + it->length(0));
        std::string window =
            text.substr(after, static_cast<size_t>(m_config.yearWindow));
        for (const auto &token : fourDigitTokens(window)) {
          if (plausible(token.first)) {
            fromAnchor = true;
            return token.first;
          }
        }
      }
    }
  }

  int latest = 0;
  for (const auto &token : fourDigitTokens(text)) {
    if (plausible(token.first)) {
      latest = std::max(latest, token.first);
    }
  }
  return latest;
}

CertificateRecord FieldExtractor::extract(const CertificateRecord &shell,
                                          std::vector<std::string> *warnings) const {
  CertificateRecord record = shell;
  const std::string &text = record.rawText;

  auto warn = [&](const std::string &message) {
    std::string warning = pagesLabel(record) + ": " + message;
    std::cerr << "WARNING: " << warning << std::endl;
    if (warnings) {
      warnings->push_back(warning);
    }
  };

  record.fiscalCode = extractFiscalCode(text);

  record.nameFromLabel =
      extractLabeledName(text, record.surname, record.givenName);
  if (!record.nameFromLabel) {
    extractNameNearCode(text, record.fiscalCode, record.surname,
                        record.givenName);
  }

  if (shell.markerYear >= 2000 && shell.markerYear <= latestYear()) {
    record.taxYear = shell.markerYear;
    record.yearFromAnchor = true;
  } else {
    record.taxYear = extractTaxYear(text, record.yearFromAnchor);
  }

  if (!record.hasFiscalCode() && !record.hasName()) {
    warn("neither fiscal code nor name found, record cannot be matched");
  } else if (!record.hasFiscalCode()) {
    warn("fiscal code not found, only name matching is possible");
  } else if (!record.hasName()) {
    warn("subject name not found, only fiscal code matching is possible");
  }
  if (!record.hasTaxYear()) {
    warn("tax year not found");
  }

  if (m_config.verbose) {
    std::cerr << "DEBUG: " << pagesLabel(record) << ": '" << record.surname
              << "' '" << record.givenName << "' " << record.fiscalCode << " "
              << record.taxYear << " [" << toString(record.eligibleStrategies())
              << "]" << std::endl;
  }

  return record;
}

} // namespace cusplit
