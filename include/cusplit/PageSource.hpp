#ifndef CUSPLIT_PAGE_SOURCE_HPP
#define CUSPLIT_PAGE_SOURCE_HPP

#include <string>
#include <vector>

namespace cusplit {

/**
 * @brief Supplier of per-page plain text for one document
 *
 * Implementations throw std::runtime_error when a page cannot be read at all.
 * A page without text is not an error and yields an empty string.
 */
class PageTextSource {
public:
  virtual ~PageTextSource() = default;

  /// Number of pages in the document
  virtual int pageCount() const = 0;

  /**
   * @brief Text content of one page
   * @param index 0-based page index, in [0, pageCount())
   */
  virtual std::string pageText(int index) = 0;
};

/**
 * @brief PageTextSource over texts already held in memory
 */
class MemoryPageSource : public PageTextSource {
public:
  MemoryPageSource() = default;
  explicit MemoryPageSource(std::vector<std::string> pages);

  void addPage(const std::string &text);

  int pageCount() const override;
  std::string pageText(int index) override;

private:
  std::vector<std::string> m_pages;
};

} // namespace cusplit

#endif // CUSPLIT_PAGE_SOURCE_HPP
