// flowan/basic/source_manager.hpp - Source locations, ranges and line tables
//
// AST nodes carry byte offsets only. When the original source text of an
// analyzed unit is available, SourceManager maps offsets to lines and
// columns for diagnostics.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace flowan
{

// ============================================================================
// SourceLocation
// ============================================================================

/**
 * Byte offset into a source buffer.
 */
class SourceLocation
{
public:
  /// Invalid/unknown location sentinel
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept : offset_(k_invalid_offset) {}
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return offset_ == k_invalid_offset; }
  [[nodiscard]] constexpr uint32_t get_offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return offset_ != other.offset_;
  }
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return offset_ < other.offset_;
  }

private:
  uint32_t offset_;
};

// ============================================================================
// SourceRange
// ============================================================================

/**
 * Half-open byte range [begin, end).
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(SourceLocation start, SourceLocation end) noexcept
  : start_(start), end_(end)
  {
  }

  constexpr SourceRange(uint32_t start_offset, uint32_t end_offset) noexcept
  : start_(SourceLocation(start_offset)), end_(SourceLocation(end_offset))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return start_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start_.is_valid() && end_.is_valid();
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  /// Smallest range covering both ranges (invalid parts are ignored)
  [[nodiscard]] constexpr SourceRange cover(SourceRange other) const noexcept
  {
    if (is_invalid()) return other;
    if (other.is_invalid()) return *this;
    const SourceLocation b = other.start_ < start_ ? other.start_ : start_;
    const SourceLocation e = end_ < other.end_ ? other.end_ : end_;
    return {b, e};
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return start_ == other.start_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  SourceLocation start_;
  SourceLocation end_;
};

// ============================================================================
// LineColumn / FullSourceRange
// ============================================================================

/**
 * Human-readable position (1-indexed, 0 = invalid).
 */
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

/**
 * Range with pre-computed line/column information.
 */
struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceManager
// ============================================================================

/**
 * Owns the text of one analyzed unit and answers offset queries.
 *
 * A SourceManager without text still carries the unit's path, so
 * diagnostics can name the file even when no snippet can be shown.
 */
class SourceManager
{
public:
  SourceManager() = default;

  explicit SourceManager(std::filesystem::path file_path) : file_path_(std::move(file_path)) {}

  SourceManager(std::filesystem::path file_path, std::string source)
  : file_path_(std::move(file_path)), source_(std::move(source))
  {
    build_line_table();
  }

  void set_file_path(std::filesystem::path path) { file_path_ = std::move(path); }
  [[nodiscard]] const std::filesystem::path & get_file_path() const noexcept { return file_path_; }

  void set_source(std::string source)
  {
    source_ = std::move(source);
    build_line_table();
  }

  [[nodiscard]] std::string_view get_source() const noexcept { return source_; }
  [[nodiscard]] bool has_source() const noexcept { return !source_.empty(); }
  [[nodiscard]] size_t get_line_count() const noexcept { return line_offsets_.size(); }

  /// Convert a byte offset to line/column (1-indexed)
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Content of a line (0-indexed), without its terminator
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::filesystem::path file_path_;
  std::string source_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

}  // namespace flowan
