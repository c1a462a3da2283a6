// neko_ui/basic/source_manager.cpp - Source buffers and line lookup
#include "neko_ui/basic/source_manager.hpp"

#include <algorithm>
#include <system_error>

namespace neko_ui
{

namespace
{

std::vector<uint32_t> scan_line_starts(std::string_view text)
{
  std::vector<uint32_t> starts{0};
  for (size_t pos = text.find('\n'); pos != std::string_view::npos;
       pos = text.find('\n', pos + 1)) {
    starts.push_back(static_cast<uint32_t>(pos + 1));
  }
  return starts;
}

std::string registry_key(const fs::path & path)
{
  if (SourceRegistry::is_virtual_path(path)) {
    return path.generic_string();
  }
  std::error_code ec;
  const fs::path canonical = fs::weakly_canonical(path, ec);
  return ec ? path.lexically_normal().generic_string() : canonical.generic_string();
}

}  // namespace

// ============================================================================
// SourceFile
// ============================================================================

SourceFile::SourceFile(fs::path path, std::string text)
: path_(std::move(path)), text_(std::move(text)), line_starts_(scan_line_starts(text_))
{
}

void SourceFile::replace(std::string text)
{
  text_ = std::move(text);
  line_starts_ = scan_line_starts(text_);
}

LineColumn SourceFile::line_column(uint32_t offset) const noexcept
{
  offset = std::min(offset, static_cast<uint32_t>(text_.size()));
  // Last line start at or before offset
  const auto next = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  const auto line_index = static_cast<uint32_t>(next - line_starts_.begin()) - 1;
  return {line_index + 1, offset - line_starts_[line_index] + 1};
}

std::string_view SourceFile::line_text(uint32_t line_index) const noexcept
{
  if (line_index >= line_starts_.size()) {
    return {};
  }
  const std::string_view all(text_);
  const uint32_t start = line_starts_[line_index];
  std::string_view line = all.substr(start);
  if (const size_t nl = line.find('\n'); nl != std::string_view::npos) {
    line = line.substr(0, nl);
  }
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  return line;
}

std::string_view SourceFile::slice(SourceRange range) const noexcept
{
  if (range.is_invalid() || range.begin() > text_.size()) {
    return {};
  }
  const uint32_t end = std::min(range.end(), static_cast<uint32_t>(text_.size()));
  return std::string_view(text_).substr(range.begin(), end - range.begin());
}

FullSourceRange SourceFile::full_range(SourceRange range) const noexcept
{
  if (range.is_invalid()) {
    return {};
  }
  const LineColumn start = line_column(range.begin());
  const LineColumn end = line_column(range.end());
  return {start.line, start.column, end.line, end.column};
}

// ============================================================================
// SourceRegistry
// ============================================================================

bool SourceRegistry::is_virtual_path(const fs::path & path)
{
  const std::string text = path.filename().string();
  return !text.empty() && text.front() == '<';
}

FileId SourceRegistry::register_file(fs::path path, std::string text)
{
  std::string key = registry_key(path);
  if (const auto it = ids_by_key_.find(key); it != ids_by_key_.end()) {
    files_[it->second.value]->replace(std::move(text));
    return it->second;
  }
  if (files_.size() >= FileId::k_invalid) {
    return FileId::invalid();
  }

  const FileId id{static_cast<uint16_t>(files_.size())};
  files_.push_back(std::make_unique<SourceFile>(std::move(path), std::move(text)));
  ids_by_key_.emplace(std::move(key), id);
  return id;
}

const SourceFile * SourceRegistry::get_file(FileId id) const noexcept
{
  if (!id.is_valid() || id.value >= files_.size()) {
    return nullptr;
  }
  return files_[id.value].get();
}

FullSourceRange SourceRegistry::full_range(SourceRange range) const noexcept
{
  const SourceFile * file = get_file(range.file_id());
  return file != nullptr ? file->full_range(range) : FullSourceRange{};
}

std::string_view SourceRegistry::slice(SourceRange range) const noexcept
{
  const SourceFile * file = get_file(range.file_id());
  return file != nullptr ? file->slice(range) : std::string_view{};
}

std::string SourceRegistry::display_path(FileId id) const
{
  const SourceFile * file = get_file(id);
  if (file == nullptr || file->path().empty()) {
    return "<unknown>";
  }
  const fs::path & path = file->path();
  if (is_virtual_path(path) || path.is_relative()) {
    return path.string();
  }

  std::error_code ec;
  const fs::path cwd = fs::current_path(ec);
  if (ec) {
    return path.string();
  }
  const fs::path relative = path.lexically_relative(cwd);
  if (relative.empty() || *relative.begin() == "..") {
    return path.string();
  }
  return relative.string();
}

}  // namespace neko_ui
