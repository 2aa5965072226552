#include "cusplit/PageSource.hpp"

#include <stdexcept>
#include <utility>

namespace cusplit {

MemoryPageSource::MemoryPageSource(std::vector<std::string> pages)
    : m_pages(std::move(pages)) {}

void MemoryPageSource::addPage(const std::string &text) {
  m_pages.push_back(text);
}

int MemoryPageSource::pageCount() const {
  return static_cast<int>(m_pages.size());
}

std::string MemoryPageSource::pageText(int index) {
  if (index < 0 || index >= pageCount()) {
    throw std::out_of_range("Page index " + std::to_string(index) +
                            " out of range (document has " +
                            std::to_string(pageCount()) + " pages)");
  }
  return m_pages[static_cast<size_t>(index)];
}

} // namespace cusplit
