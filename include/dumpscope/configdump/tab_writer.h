#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace dumpscope {
namespace configdump {

/**
 * @brief Column-aligning text writer (elastic tabstops)
 *
 * Text is buffered until flush(). A cell is text terminated by '\t'; the
 * text after the last tab of a line is not a cell and is never padded.
 * Consecutive lines with a cell in the same column form a column block, and
 * every cell of a block is padded to the widest cell plus padding, but never
 * below min_width. Widths count UTF-8 code points.
 *
 * With pad_char '\t', cell widths are rounded up to multiples of tab_width
 * and padding is written as tabs.
 */
class TabWriter {
 public:
  TabWriter(std::ostream& out,
            size_t min_width,
            size_t tab_width,
            size_t padding,
            char pad_char);

  void write(const std::string& text);

  /**
   * @brief Write all buffered text, aligned
   * @return false if the underlying stream is bad afterwards
   */
  bool flush();

 private:
  struct Cell {
    std::string text;
    size_t width = 0;
  };
  using Line = std::vector<Cell>;

  void splitLines();
  void format(size_t line0, size_t line1);
  void writeLines(size_t line0, size_t line1);
  void writePadding(size_t text_width, size_t cell_width);

  static size_t textWidth(const std::string& text);

  std::ostream& out_;
  const size_t min_width_;
  const size_t tab_width_;
  const size_t padding_;
  const char pad_char_;

  std::string buffer_;
  std::vector<Line> lines_;
  std::vector<size_t> widths_;
};

}  // namespace configdump
}  // namespace dumpscope
