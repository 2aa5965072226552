#include "cusplit/TextNormalizer.hpp"

#include <cctype>
#include <cstdint>

namespace cusplit {

namespace {

// Base letters for U+0100..U+017F (Latin Extended-A). '?' marks the ligatures
// handled separately in foldCodePoint.
const char kLatinExtendedA[] = "AAAAAA"
                               "CCCCCCCC"
                               "DDDD"
                               "EEEEEEEEEE"
                               "GGGGGGGG"
                               "HHHH"
                               "IIIIIIIIII"
                               "??"
                               "JJ"
                               "KKK"
                               "LLLLLLLLLL"
                               "NNNNNNNNN"
                               "OOOOOO"
                               "??"
                               "RRRRRR"
                               "SSSSSSSS"
                               "TTTTTT"
                               "UUUUUUUUUUUU"
                               "WW"
                               "YYY"
                               "ZZZZZZ"
                               "S";

// Base letters for U+00C0..U+00FF. ' ' is a separator, '?' a special case.
const char kLatin1Supplement[] = "AAAAAA?CEEEEIIII"
                                 "DNOOOOO OUUUUYT?"
                                 "AAAAAA?CEEEEIIII"
                                 "DNOOOOO OUUUUYTY";

/**
 * Decode one code point starting at text[pos] and advance pos. Malformed
 * sequences decode their first byte as Latin-1.
 */
std::uint32_t nextCodePoint(const std::string &text, size_t &pos) {
  auto byte = [&](size_t i) {
    return static_cast<unsigned char>(text[i]);
  };

  unsigned char lead = byte(pos);
  if (lead < 0x80) {
    pos += 1;
    return lead;
  }

  size_t length = 0;
  std::uint32_t cp = 0;
  if ((lead & 0xE0) == 0xC0) {
    length = 2;
    cp = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    length = 3;
    cp = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    length = 4;
    cp = lead & 0x07;
  }

  if (length == 0 || pos + length > text.size()) {
    pos += 1;
    return lead;
  }

  for (size_t i = 1; i < length; i++) {
    unsigned char cont = byte(pos + i);
    if ((cont & 0xC0) != 0x80) {
      pos += 1;
      return lead;
    }
    cp = (cp << 6) | (cont & 0x3F);
  }

  pos += length;
  return cp;
}

/**
 * Fold a code point to uppercase ASCII. Returns an empty string for
 * characters that should vanish (combining marks), " " for separators.
 */
std::string foldCodePoint(std::uint32_t cp) {
  if (cp < 0x80) {
    if (std::isalnum(static_cast<int>(cp))) {
      return std::string(
          1, static_cast<char>(std::toupper(static_cast<int>(cp))));
    }
    return " ";
  }

  // Combining diacritical marks (decomposed input)
  if (cp >= 0x0300 && cp <= 0x036F) {
    return "";
  }

  if (cp >= 0x00C0 && cp <= 0x00FF) {
    switch (cp) {
    case 0x00C6:
    case 0x00E6:
      return "AE";
    case 0x00DF:
      return "SS";
    default:
      break;
    }
    char base = kLatin1Supplement[cp - 0x00C0];
    return std::string(1, base);
  }

  if (cp >= 0x0100 && cp <= 0x017F) {
    if (cp == 0x0132 || cp == 0x0133) {
      return "IJ";
    }
    if (cp == 0x0152 || cp == 0x0153) {
      return "OE";
    }
    return std::string(1, kLatinExtendedA[cp - 0x0100]);
  }

  // Everything else (typographic apostrophes, dashes, symbols, other
  // scripts) separates words.
  return " ";
}

} // namespace

std::string normalizeName(const std::string &text) {
  std::string folded;
  folded.reserve(text.size());

  size_t pos = 0;
  while (pos < text.size()) {
    folded += foldCodePoint(nextCodePoint(text, pos));
  }

  return collapseWhitespace(folded);
}

std::string toUpperAscii(const std::string &text) {
  std::string result = text;
  for (char &c : result) {
    if (c >= 'a' && c <= 'z') {
      c = static_cast<char>(c - 'a' + 'A');
    }
  }
  return result;
}

std::string collapseWhitespace(const std::string &text) {
  std::string result;
  result.reserve(text.size());

  bool pendingSpace = false;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      pendingSpace = !result.empty();
      continue;
    }
    if (pendingSpace) {
      result += ' ';
      pendingSpace = false;
    }
    result += c;
  }

  return result;
}

std::string trim(const std::string &text) {
  size_t start = 0;
  while (start < text.size() &&
         std::isspace(static_cast<unsigned char>(text[start]))) {
    start++;
  }
  size_t end = text.size();
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    end--;
  }
  return text.substr(start, end - start);
}

std::string titleCase(const std::string &text) {
  std::string result = text;
  bool wordStart = true;
  for (char &c : result) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (std::isalpha(uc) && uc < 0x80) {
      c = static_cast<char>(wordStart ? std::toupper(uc) : std::tolower(uc));
      wordStart = false;
    } else {
      wordStart = (uc < 0x80) && !std::isalnum(uc);
    }
  }
  return result;
}

std::vector<std::string> splitWords(const std::string &text) {
  std::vector<std::string> words;
  std::string current;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!current.empty()) {
        words.push_back(current);
        current.clear();
      }
    } else {
      current += c;
    }
  }
  if (!current.empty()) {
    words.push_back(current);
  }
  return words;
}

std::vector<std::string> splitLines(const std::string &text) {
  std::vector<std::string> lines;
  std::string current;
  for (char c : text) {
    if (c == '\n') {
      lines.push_back(current);
      current.clear();
    } else if (c != '\r') {
      current += c;
    }
  }
  if (!current.empty()) {
    lines.push_back(current);
  }
  return lines;
}

} // namespace cusplit
