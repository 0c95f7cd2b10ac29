#pragma once

// lectern/assembler.hpp - Turns a window's chapter range into renderable content.
//
// CONTRACT:
//   assemble_window() returns nullopt for an invalid range (negative window,
//   first < 0, last < first, last >= total_chapters) and never throws for a
//   well-formed one. It is called from the conveyor's materialization worker,
//   outside any conveyor lock, and may block on I/O.

#include <memory>
#include <optional>
#include <string>

#include "lectern/content_provider.hpp"
#include "lectern/types.hpp"

namespace lectern {

class IWindowAssembler {
 public:
  virtual ~IWindowAssembler() = default;

  virtual std::optional<WindowData> assemble_window(WindowIndex window, ChapterIndex first,
                                                    ChapterIndex last) = 0;
  virtual bool can_assemble(WindowIndex window, ChapterIndex first, ChapterIndex last) const = 0;
  virtual int total_chapters() const = 0;
};

// Builds one HTML document per window:
//   <div id="window-root" data-window-index="W">
//     <section id="chapter-C" data-chapter-index="C" class="chapter-section">...</section>
//   </div>
// A chapter the provider cannot supply becomes a visible placeholder section.
class ProviderWindowAssembler : public IWindowAssembler {
 public:
  ProviderWindowAssembler(std::shared_ptr<IChapterContentProvider> provider,
                          std::string book_path, int total_chapters);

  std::optional<WindowData> assemble_window(WindowIndex window, ChapterIndex first,
                                            ChapterIndex last) override;
  bool can_assemble(WindowIndex window, ChapterIndex first, ChapterIndex last) const override;
  int total_chapters() const override { return total_chapters_; }

 private:
  std::shared_ptr<IChapterContentProvider> provider_;
  std::string book_path_;
  int total_chapters_;
};

}  // namespace lectern
