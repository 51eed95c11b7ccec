#include "contentflow/codec-adapter.hpp"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <string_view>
#include <utility>

#include "contentflow/invalid_argument_exception.hpp"
#include "contentflow/log.hpp"
#include "contentflow/raw-chars.hpp"

namespace contentflow {

CodecAdapter::CodecAdapter(std::size_t bufferSize) : _bufferSize(bufferSize) {
  if (bufferSize == 0) {
    throw invalid_argument("codec buffer size must be > 0");
  }
}

std::size_t CodecAdapter::push(std::string_view input) {
  assert(_status == CodecStatus::NeedsMoreInput);
  if (_inPos == _in.size()) {
    _in.clear();
    _inPos = 0;
  }
  _in.reserve(_bufferSize);
  const std::size_t taken = std::min(input.size(), _bufferSize - _in.size());
  _in.unchecked_append(input.substr(0, taken));
  _totalIn += taken;
  runStep();
  return taken;
}

void CodecAdapter::advance() {
  assert(_status == CodecStatus::Ready);
  runStep();
}

RawChars CodecAdapter::pull() {
  assert(_status == CodecStatus::NeedsMoreOutput);
  RawChars decoded(std::move(_out));
  if (_ended) {
    _status = CodecStatus::Done;
  } else if (_outWasFull || _inPos != _in.size()) {
    // the engine may still hold decoded bytes, or has buffered input left
    _status = CodecStatus::Ready;
  } else {
    _status = CodecStatus::NeedsMoreInput;
  }
  return decoded;
}

void CodecAdapter::finish() {
  if (_status != CodecStatus::NeedsMoreInput) {
    return;
  }
  if (_totalIn == 0) {
    _ended = true;
    _status = CodecStatus::Done;
    return;
  }
  setError("truncated compressed stream");
}

void CodecAdapter::runStep() {
  _out.reserve(_bufferSize);
  const StepResult res =
      step(_in.data() + _inPos, _in.size() - _inPos, _out.data() + _out.size(), _out.availableCapacity());
  _inPos += res.consumed;
  _out.addSize(res.produced);

  switch (res.state) {
    case EngineState::Error:
      setError(res.errorMessage);
      return;
    case EngineState::StreamEnd:
      if (_inPos != _in.size()) {
        log::debug("{} decoder - discarding {} bytes after end of stream", name(), _in.size() - _inPos);
      }
      _in.clear();
      _inPos = 0;
      _ended = true;
      _status = _out.empty() ? CodecStatus::Done : CodecStatus::NeedsMoreOutput;
      return;
    case EngineState::Progress:
      break;
  }

  const bool inputExhausted = _inPos == _in.size();
  _outWasFull = _out.availableCapacity() == 0;
  if (_outWasFull || (inputExhausted && !_out.empty())) {
    _status = CodecStatus::NeedsMoreOutput;
  } else if (inputExhausted) {
    _status = CodecStatus::NeedsMoreInput;
  } else if (res.consumed == 0 && res.produced == 0) {
    setError("decoder made no progress");
  } else {
    _status = CodecStatus::Ready;
  }
}

void CodecAdapter::setError(const char* message) {
  log::error("{} decoder - {}", name(), message);
  _errorMessage = message;
  _status = CodecStatus::Error;
  _in = RawChars();
  _out = RawChars();
  _inPos = 0;
}

bool DecompressFull(CodecAdapter& adapter, std::string_view input, std::size_t maxDecompressedBytes, RawChars& out) {
  std::size_t produced = 0;
  while (true) {
    switch (adapter.status()) {
      case CodecStatus::NeedsMoreInput:
        if (input.empty()) {
          adapter.finish();
        } else {
          input.remove_prefix(adapter.push(input));
        }
        break;
      case CodecStatus::NeedsMoreOutput: {
        const RawChars decoded = adapter.pull();
        if (maxDecompressedBytes != 0 && produced + decoded.size() > maxDecompressedBytes) {
          log::debug("DecompressFull - reached max decompressed size of {}", maxDecompressedBytes);
          return false;
        }
        produced += decoded.size();
        out.append(std::string_view(decoded));
        break;
      }
      case CodecStatus::Ready:
        adapter.advance();
        break;
      case CodecStatus::Done:
        return true;
      case CodecStatus::Error:
        return false;
    }
  }
}

}  // namespace contentflow
