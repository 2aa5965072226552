#include "cusplit/FiscalCode.hpp"

#include <cctype>
#include <cstring>

namespace cusplit {
namespace fiscal_code {

namespace {

const char kOmocodiaLetters[] = "LMNPQRSTUV";
const char kMonthLetters[] = "ABCDEHLMPRST";

// Values of characters in odd (1st, 3rd, ...) positions, indexed by digit
// then by letter.
const int kOddDigitValues[10] = {1, 0, 5, 7, 9, 13, 15, 17, 19, 21};
const int kOddLetterValues[26] = {1,  0,  5,  7,  9,  13, 15, 17, 19,
                                  21, 2,  4,  18, 20, 11, 3,  6,  8,
                                  12, 14, 16, 10, 22, 25, 24, 23};

bool isUpperLetter(char c) { return c >= 'A' && c <= 'Z'; }

bool isDigitOrOmocodia(char c) {
  return (c >= '0' && c <= '9') || (c != '\0' && std::strchr(kOmocodiaLetters, c));
}

int digitValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  const char *found = std::strchr(kOmocodiaLetters, c);
  return found ? static_cast<int>(found - kOmocodiaLetters) : -1;
}

} // namespace

bool isStructurallyValid(const std::string &code) {
  if (code.size() != kLength) {
    return false;
  }

  for (int i = 0; i < 6; i++) {
    if (!isUpperLetter(code[i])) {
      return false;
    }
  }

  const int digitPositions[] = {6, 7, 9, 10, 12, 13, 14};
  for (int pos : digitPositions) {
    if (!isDigitOrOmocodia(code[pos])) {
      return false;
    }
  }

  if (code[8] == '\0' || !std::strchr(kMonthLetters, code[8])) {
    return false;
  }

  if (!isUpperLetter(code[11]) || !isUpperLetter(code[15])) {
    return false;
  }

  int day = digitValue(code[9]) * 10 + digitValue(code[10]);
  bool maleDay = day >= 1 && day <= 31;
  bool femaleDay = day >= 41 && day <= 71;
  return maleDay || femaleDay;
}

char computeCheckCharacter(const std::string &first15) {
  if (first15.size() < kLength - 1) {
    return '\0';
  }

  int sum = 0;
  for (size_t i = 0; i < kLength - 1; i++) {
    char c = first15[i];
    bool odd = (i % 2) == 0; // positions are 1-based in the scheme
    if (c >= '0' && c <= '9') {
      sum += odd ? kOddDigitValues[c - '0'] : (c - '0');
    } else if (isUpperLetter(c)) {
      sum += odd ? kOddLetterValues[c - 'A'] : (c - 'A');
    } else {
      return '\0';
    }
  }

  return static_cast<char>('A' + sum % 26);
}

bool hasValidCheckCharacter(const std::string &code) {
  if (code.size() != kLength) {
    return false;
  }
  char expected = computeCheckCharacter(code.substr(0, kLength - 1));
  return expected != '\0' && expected == code[kLength - 1];
}

std::vector<Occurrence> findAll(const std::string &text,
                                bool requireCheckCharacter) {
  std::vector<Occurrence> found;

  size_t pos = 0;
  while (pos < text.size()) {
    if (!std::isalnum(static_cast<unsigned char>(text[pos]))) {
      pos++;
      continue;
    }

    size_t start = pos;
    while (pos < text.size() &&
           std::isalnum(static_cast<unsigned char>(text[pos]))) {
      pos++;
    }

    if (pos - start != kLength) {
      continue;
    }

    std::string candidate;
    candidate.reserve(kLength);
    for (size_t i = start; i < pos; i++) {
      candidate += static_cast<char>(
          std::toupper(static_cast<unsigned char>(text[i])));
    }

    if (!isStructurallyValid(candidate)) {
      continue;
    }
    if (requireCheckCharacter && !hasValidCheckCharacter(candidate)) {
      continue;
    }

    found.push_back({candidate, start});
  }

  return found;
}

} // namespace fiscal_code
} // namespace cusplit
