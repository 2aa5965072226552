#ifndef CUSPLIT_SIMILARITY_HPP
#define CUSPLIT_SIMILARITY_HPP

#include <string>

namespace cusplit {

/**
 * @brief Normalized indel similarity in [0, 1]
 *
 * rapidfuzz::fuzz::ratio scaled down from 0-100. Two empty strings score 1;
 * "ROSSI MARIO" vs "ROSSI MARIA" scores 20/22.
 */
double indelRatio(const std::string &a, const std::string &b);

/**
 * @brief indelRatio after sorting the whitespace-separated tokens of each side
 *
 * Makes "MARIO ROSSI" and "ROSSI MARIO" identical.
 */
double tokenSortRatio(const std::string &a, const std::string &b);

} // namespace cusplit

#endif // CUSPLIT_SIMILARITY_HPP
