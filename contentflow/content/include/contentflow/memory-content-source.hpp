#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include "contentflow/chunk.hpp"
#include "contentflow/content-failure.hpp"
#include "contentflow/content-source.hpp"
#include "contentflow/vector.hpp"

namespace contentflow {

// Synchronous source yielding a fixed sequence of byte pieces, the last one flagged as last.
// Chunks borrow the pieces owned by this source, they must not outlive it.
class MemoryContentSource final : public ContentSource {
 public:
  explicit MemoryContentSource(std::string_view body);

  explicit MemoryContentSource(vector<std::string> pieces);

  Chunk read() override;

  // Data is always available.
  void demand(std::function<void()> onAvailable) override { onAvailable(); }

  void fail(ContentFailure failure) override;

 private:
  vector<std::string> _pieces;
  std::size_t _pos{0};
  TerminalState _terminal;
};

}  // namespace contentflow
