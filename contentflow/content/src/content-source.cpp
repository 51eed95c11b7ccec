#include "contentflow/content-source.hpp"

#include "contentflow/chunk.hpp"
#include "contentflow/content-failure.hpp"

namespace contentflow {

void TerminalState::setFailure(ContentFailure failure) noexcept {
  if (!_reached) {
    _reached = true;
    _failure = failure;
  }
}

Chunk TerminalState::chunk() const noexcept { return _failure ? Chunk::Failure(*_failure) : Chunk::Eof(); }

}  // namespace contentflow
