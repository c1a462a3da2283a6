// neko_ui/basic/source_manager.hpp - Source buffers, byte ranges and line lookup
//
// A SourceRange is a half-open byte range inside one registered buffer.
// Lines and columns are 1-based and derived on demand from the buffer's
// line table, so ranges stay cheap to copy into tokens and AST nodes.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace neko_ui
{

namespace fs = std::filesystem;

// ============================================================================
// FileId
// ============================================================================

struct FileId
{
  static constexpr uint16_t k_invalid = UINT16_MAX;

  uint16_t value = k_invalid;

  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId{}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid; }

  [[nodiscard]] constexpr bool operator==(FileId other) const noexcept
  {
    return value == other.value;
  }
  [[nodiscard]] constexpr bool operator!=(FileId other) const noexcept
  {
    return value != other.value;
  }
};

// ============================================================================
// SourceRange
// ============================================================================

class SourceRange
{
public:
  static constexpr uint32_t k_no_offset = UINT32_MAX;

  constexpr SourceRange() noexcept = default;
  constexpr SourceRange(FileId file_id, uint32_t begin, uint32_t end) noexcept
  : file_id_(file_id), begin_(begin), end_(end)
  {
  }

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_id_; }
  [[nodiscard]] constexpr uint32_t begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr uint32_t end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return file_id_.is_valid() && begin_ != k_no_offset && end_ >= begin_;
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  [[nodiscard]] constexpr uint32_t size() const noexcept { return is_valid() ? end_ - begin_ : 0; }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return file_id_ == other.file_id_ && begin_ == other.begin_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

  /// Orders by file, then start offset; invalid ranges sort first.
  [[nodiscard]] constexpr bool operator<(SourceRange other) const noexcept
  {
    if (is_valid() != other.is_valid()) {
      return !is_valid();
    }
    if (file_id_ != other.file_id_) {
      return file_id_.value < other.file_id_.value;
    }
    return begin_ < other.begin_;
  }

private:
  FileId file_id_;
  uint32_t begin_ = k_no_offset;
  uint32_t end_ = k_no_offset;
};

/// From the start of `first` to the end of `last` (either may be invalid).
[[nodiscard]] constexpr SourceRange join_ranges(SourceRange first, SourceRange last) noexcept
{
  if (first.is_invalid()) return last;
  if (last.is_invalid()) return first;
  return {first.file_id(), first.begin(), last.end()};
}

// ============================================================================
// Line/column positions
// ============================================================================

/// 1-based line and column; zero means unknown.
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceFile
// ============================================================================

class SourceFile
{
public:
  SourceFile(fs::path path, std::string text);

  [[nodiscard]] const fs::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return text_; }
  [[nodiscard]] size_t line_count() const noexcept { return line_starts_.size(); }

  /// Swap in new text (a reload of the same path) and rebuild the line table.
  void replace(std::string text);

  [[nodiscard]] LineColumn line_column(uint32_t offset) const noexcept;

  /// Text of a 0-based line, without "\n" or "\r\n"
  [[nodiscard]] std::string_view line_text(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view slice(SourceRange range) const noexcept;
  [[nodiscard]] FullSourceRange full_range(SourceRange range) const noexcept;

private:
  fs::path path_;
  std::string text_;
  std::vector<uint32_t> line_starts_;
};

// ============================================================================
// SourceRegistry
// ============================================================================

/**
 * Owns the buffers of one load and hands out FileIds.
 *
 * Buffers are keyed by normalized path. Registering a path again replaces
 * its text and keeps its FileId, which is what a reload of an open file
 * needs. Paths written in angle brackets (`<reload>.nui`, `<test>.nui`) are
 * virtual and never touch the filesystem.
 */
class SourceRegistry
{
public:
  SourceRegistry() = default;

  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;
  SourceRegistry(SourceRegistry &&) = default;
  SourceRegistry & operator=(SourceRegistry &&) = default;

  /// Returns FileId::invalid() once the id space is exhausted.
  FileId register_file(fs::path path, std::string text);

  [[nodiscard]] const SourceFile * get_file(FileId id) const noexcept;
  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

  [[nodiscard]] FullSourceRange full_range(SourceRange range) const noexcept;
  [[nodiscard]] std::string_view slice(SourceRange range) const noexcept;

  /// Path as shown in diagnostics: virtual paths verbatim, real ones
  /// relative to the working directory when possible.
  [[nodiscard]] std::string display_path(FileId id) const;

  [[nodiscard]] static bool is_virtual_path(const fs::path & path);

private:
  std::vector<std::unique_ptr<SourceFile>> files_;
  std::unordered_map<std::string, FileId> ids_by_key_;
};

}  // namespace neko_ui
