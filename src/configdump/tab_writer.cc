#include "dumpscope/configdump/tab_writer.h"

namespace dumpscope {
namespace configdump {

TabWriter::TabWriter(std::ostream& out,
                     size_t min_width,
                     size_t tab_width,
                     size_t padding,
                     char pad_char)
    : out_(out),
      min_width_(min_width),
      tab_width_(tab_width),
      padding_(padding),
      pad_char_(pad_char) {}

void TabWriter::write(const std::string& text) { buffer_ += text; }

bool TabWriter::flush() {
  splitLines();
  format(0, lines_.size());

  buffer_.clear();
  lines_.clear();
  widths_.clear();

  out_.flush();
  return !out_.bad() && !out_.fail();
}

size_t TabWriter::textWidth(const std::string& text) {
  size_t width = 0;
  for (unsigned char c : text) {
    // Count every byte that does not continue a multi-byte sequence
    if ((c & 0xC0) != 0x80) {
      ++width;
    }
  }
  return width;
}

void TabWriter::splitLines() {
  lines_.clear();
  lines_.emplace_back();

  Cell cell;
  for (char c : buffer_) {
    if (c == '\t' || c == '\n') {
      cell.width = textWidth(cell.text);
      lines_.back().push_back(std::move(cell));
      cell = Cell();
      if (c == '\n') {
        lines_.emplace_back();
      }
    } else {
      cell.text += c;
    }
  }

  // Text after the final newline
  cell.width = textWidth(cell.text);
  lines_.back().push_back(std::move(cell));
}

void TabWriter::format(size_t line0, size_t line1) {
  const size_t column = widths_.size();

  for (size_t current = line0; current < line1; ++current) {
    if (column + 1 >= lines_[current].size()) {
      continue;
    }

    // A cell exists in this column: it starts a new column block
    writeLines(line0, current);
    line0 = current;

    size_t width = min_width_;
    for (; current < line1; ++current) {
      const Line& line = lines_[current];
      if (column + 1 >= line.size()) {
        break;
      }
      const size_t w = line[column].width + padding_;
      if (w > width) {
        width = w;
      }
    }

    widths_.push_back(width);
    format(line0, current);
    widths_.pop_back();
    // The line that ended the block has no cell in this column, so the
    // loop increment may skip it
    line0 = current;
  }

  writeLines(line0, line1);
}

void TabWriter::writeLines(size_t line0, size_t line1) {
  for (size_t i = line0; i < line1; ++i) {
    const Line& line = lines_[i];
    for (size_t j = 0; j < line.size(); ++j) {
      const Cell& cell = line[j];
      out_ << cell.text;
      if (j < widths_.size() && j + 1 < line.size()) {
        writePadding(cell.width, widths_[j]);
      }
    }

    // The last buffered line has no newline of its own
    if (i + 1 < lines_.size()) {
      out_ << '\n';
    }
  }
}

void TabWriter::writePadding(size_t text_width, size_t cell_width) {
  if (pad_char_ == '\t') {
    if (tab_width_ == 0) {
      return;
    }
    cell_width = (cell_width + tab_width_ - 1) / tab_width_ * tab_width_;
    const size_t n = cell_width > text_width ? cell_width - text_width : 0;
    out_ << std::string((n + tab_width_ - 1) / tab_width_, '\t');
    return;
  }

  if (cell_width > text_width) {
    out_ << std::string(cell_width - text_width, pad_char_);
  }
}

}  // namespace configdump
}  // namespace dumpscope
