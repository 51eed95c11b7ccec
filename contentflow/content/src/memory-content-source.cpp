#include "contentflow/memory-content-source.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "contentflow/chunk.hpp"
#include "contentflow/content-failure.hpp"
#include "contentflow/vector.hpp"

namespace contentflow {

MemoryContentSource::MemoryContentSource(std::string_view body) {
  if (!body.empty()) {
    _pieces.emplace_back(body);
  }
}

MemoryContentSource::MemoryContentSource(vector<std::string> pieces) : _pieces(std::move(pieces)) {}

Chunk MemoryContentSource::read() {
  if (_terminal.reached()) {
    return _terminal.chunk();
  }
  if (_pos == _pieces.size()) {
    _terminal.setEof();
    return Chunk::Eof();
  }
  const std::string_view piece = _pieces[_pos++];
  const bool last = _pos == _pieces.size();
  if (last) {
    _terminal.setEof();
  }
  return Chunk::Borrowed(piece, last, nullptr);
}

void MemoryContentSource::fail(ContentFailure failure) {
  _terminal.setFailure(failure);
  _pos = _pieces.size();
}

}  // namespace contentflow
