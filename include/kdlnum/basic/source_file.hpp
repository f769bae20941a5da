// kdlnum/basic/source_file.hpp - Source text, ranges and line/column lookup
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kdlnum
{

// ============================================================================
// SourceRange - Half-open byte range [begin, end)
// ============================================================================

class SourceRange
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  /// Create an invalid range
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(uint32_t begin, uint32_t end) noexcept : begin_(begin), end_(end) {}

  [[nodiscard]] constexpr uint32_t begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr uint32_t end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_ != k_invalid_offset && end_ != k_invalid_offset;
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    if (!is_valid()) return 0;
    return end_ - begin_;
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return begin_ == other.begin_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  uint32_t begin_ = k_invalid_offset;
  uint32_t end_ = k_invalid_offset;
};

/**
 * Human-readable line and column position (1-indexed).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

/**
 * Range with pre-computed line/column information for diagnostics.
 */
struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceFile - Text of one input plus its line table
// ============================================================================

class SourceFile
{
public:
  SourceFile() = default;

  explicit SourceFile(std::string content) : content_(std::move(content)) { build_line_table(); }

  SourceFile(std::filesystem::path path, std::string content)
  : path_(std::move(path)), content_(std::move(content))
  {
    build_line_table();
  }

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  /// Convert byte offset to line/column (1-indexed)
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Get the content of a specific line (0-indexed), without the line break
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::filesystem::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;
};

}  // namespace kdlnum
