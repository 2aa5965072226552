#include "cusplit/Similarity.hpp"

#include <rapidfuzz/fuzz.hpp>

namespace cusplit {

double indelRatio(const std::string &a, const std::string &b) {
  return rapidfuzz::fuzz::ratio(a, b) / 100.0;
}

double tokenSortRatio(const std::string &a, const std::string &b) {
  return rapidfuzz::fuzz::token_sort_ratio(a, b) / 100.0;
}

} // namespace cusplit
