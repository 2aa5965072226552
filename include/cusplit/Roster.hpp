#ifndef CUSPLIT_ROSTER_HPP
#define CUSPLIT_ROSTER_HPP

#include "cusplit/Records.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace cusplit {

/**
 * @brief A fiscal code carried by more than one roster entry
 */
struct DuplicateFiscalCode {
  std::string fiscalCode;
  std::vector<size_t> positions; ///< 0-based positions in the input list
};

struct RosterLoadResult;

/**
 * @brief Normalized, indexed set of known subjects
 *
 * Entries keep their input order, which is also the tie-break order of the
 * matcher. Built only through build(), so every stored entry is normalized
 * and fiscal codes are unique.
 */
class Roster {
public:
  Roster() = default;

  /**
   * @brief Normalize entries and index them
   *
   * Names go through normalizeName(), fiscal codes are trimmed and
   * uppercased, emails trimmed. Entries with no name and no fiscal code are
   * dropped with a warning. Two entries sharing a fiscal code make the whole
   * load fail.
   */
  static RosterLoadResult build(const std::vector<RosterEntry> &entries);

  size_t size() const;
  bool empty() const;
  const std::vector<RosterEntry> &entries() const;
  const RosterEntry &at(size_t index) const;

  /// Position of the entry with this fiscal code, or -1
  int findByFiscalCode(const std::string &fiscalCode) const;

  /// Positions of entries whose surname starts with the same letter
  const std::vector<size_t> &sameInitial(const std::string &surname) const;

private:
  std::vector<RosterEntry> m_entries;
  std::unordered_map<std::string, size_t> m_fiscalIndex;
  std::map<char, std::vector<size_t>> m_initialIndex;
};

/**
 * @brief Result of building a roster from already-parsed entries
 */
struct RosterLoadResult {
  bool success = false;                       ///< Whether the roster is usable
  std::string errorMessage;                   ///< Error message if failed
  Roster roster;                              ///< The loaded roster
  std::vector<DuplicateFiscalCode> duplicates; ///< Conflicting fiscal codes
  std::vector<std::string> warnings;          ///< Non-fatal findings
};

} // namespace cusplit

#endif // CUSPLIT_ROSTER_HPP
