#include "contentflow/scripted-content-source.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <string_view>

#include "contentflow/chunk.hpp"
#include "contentflow/codec-adapter.hpp"
#include "contentflow/content-failure.hpp"
#include "contentflow/vector.hpp"

namespace contentflow::test {

vector<ScriptedContentSource::Step> ScriptedContentSource::Split(std::string_view data, std::size_t chunkSize) {
  vector<Step> steps;
  if (chunkSize == 0) {
    chunkSize = std::max<std::size_t>(data.size(), 1);
  }
  while (!data.empty()) {
    const std::size_t len = std::min(chunkSize, data.size());
    steps.push_back(Step::Data(std::string(data.substr(0, len)), len == data.size()));
    data.remove_prefix(len);
  }
  if (steps.empty()) {
    steps.push_back(Step::Data({}, true));
  }
  return steps;
}

Chunk ScriptedContentSource::read() {
  ++_nbReads;
  if (_terminal.reached()) {
    return _terminal.chunk();
  }
  if (_pos == _steps.size()) {
    // script exhausted without a last chunk: nothing more will come
    return Chunk::Empty();
  }
  const Step& step = _steps[_pos++];
  switch (step.type) {
    case Step::Type::Empty:
      return Chunk::Empty();
    case Step::Type::Failure:
      _terminal.setFailure(step.failure);
      return Chunk::Failure(step.failure);
    case Step::Type::Data:
      break;
  }
  if (step.last) {
    _terminal.setEof();
  }
  ++_nbDataChunks;
  return Chunk::Borrowed(step.bytes, step.last, [this] { ++_nbReleases; });
}

void ScriptedContentSource::demand(std::function<void()> onAvailable) {
  ++_nbDemands;
  onAvailable();
}

void ScriptedContentSource::fail(ContentFailure failure) {
  ++_nbFails;
  if (!_failure) {
    _failure = failure;
  }
  _terminal.setFailure(failure);
}

CodecAdapter::StepResult CountingCopyCodec::step(const char* in, std::size_t inSize, char* out,
                                                 std::size_t outSize) noexcept {
  StepResult res;
  const std::size_t len = std::min(inSize, outSize);
  for (; res.consumed < len; ++res.consumed) {
    const char ch = in[res.consumed];
    if (ch == '\0') {
      ++res.consumed;
      res.state = EngineState::StreamEnd;
      return res;
    }
    if (ch == '!') {
      res.state = EngineState::Error;
      res.errorMessage = "corrupted copy stream";
      return res;
    }
    out[res.produced++] = ch;
  }
  return res;
}

}  // namespace contentflow::test
