// neko_ui/reload/document_handle.hpp - Atomically published current Document
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "neko_ui/document/document.hpp"

namespace neko_ui
{

/**
 * Holds the Document that readers should render.
 *
 * load() and store() use the atomic shared_ptr operations, so a reader on
 * any thread always gets either the old or the new Document in full, and
 * keeps it alive for as long as it holds the returned pointer.
 */
class DocumentHandle
{
public:
  DocumentHandle() = default;
  explicit DocumentHandle(DocumentPtr initial) : current_(std::move(initial)) {}

  DocumentHandle(const DocumentHandle &) = delete;
  DocumentHandle & operator=(const DocumentHandle &) = delete;

  /// Current document; nullptr until something was published
  [[nodiscard]] DocumentPtr load() const { return std::atomic_load(&current_); }

  /// Publish `document` and bump the generation.
  void store(DocumentPtr document)
  {
    std::atomic_store(&current_, std::move(document));
    generation_.fetch_add(1, std::memory_order_acq_rel);
  }

  /// Number of store() calls so far
  [[nodiscard]] uint64_t generation() const noexcept
  {
    return generation_.load(std::memory_order_acquire);
  }

private:
  DocumentPtr current_;
  std::atomic<uint64_t> generation_{0};
};

}  // namespace neko_ui
