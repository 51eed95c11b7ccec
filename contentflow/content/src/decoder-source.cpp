#include "contentflow/decoder-source.hpp"

#include <functional>
#include <memory>
#include <string_view>
#include <utility>

#include "contentflow/chunk.hpp"
#include "contentflow/codec-adapter.hpp"
#include "contentflow/content-failure.hpp"
#include "contentflow/invalid_argument_exception.hpp"
#include "contentflow/log.hpp"
#include "contentflow/raw-chars.hpp"

namespace contentflow {

DecoderSource::DecoderSource(ContentSourcePtr upstream, std::unique_ptr<CodecAdapter> adapter)
    : _upstream(std::move(upstream)), _adapter(std::move(adapter)) {
  if (!_upstream || !_adapter) {
    throw invalid_argument("DecoderSource requires an upstream source and a codec adapter");
  }
}

Chunk DecoderSource::read() {
  if (_terminal.reached()) {
    return _terminal.chunk();
  }

  while (true) {
    switch (_adapter->status()) {
      case CodecStatus::NeedsMoreOutput: {
        RawChars decoded = _adapter->pull();
        if (_adapter->status() == CodecStatus::Done && _upstreamLast) {
          // decoded tail coincides with the end of upstream
          return terminate(Chunk::Data(std::move(decoded), true));
        }
        return Chunk::Data(std::move(decoded));
      }
      case CodecStatus::Ready:
        _adapter->advance();
        break;
      case CodecStatus::NeedsMoreInput: {
        if (!pendingConsumed()) {
          _pendingPos += _adapter->push(_pending.bytes().substr(_pendingPos));
          if (pendingConsumed()) {
            _pending.release();
            _pendingPos = 0;
          }
          break;
        }
        if (_upstreamLast) {
          // no more input will come. Empty body, or truncated stream.
          _adapter->finish();
          break;
        }
        Chunk raw = _upstream->read();
        if (raw.isFailure()) {
          return terminate(std::move(raw));
        }
        if (raw.isEmpty()) {
          return raw;
        }
        _upstreamLast = raw.isLast();
        _pending = std::move(raw);
        _pendingPos = 0;
        break;
      }
      case CodecStatus::Done: {
        if (!pendingConsumed()) {
          log::debug("DecoderSource - discarding {} bytes after end of compressed stream",
                     _pending.size() - _pendingPos);
          _pending.release();
          _pendingPos = 0;
        }
        if (_upstreamLast) {
          return terminate(Chunk::Eof());
        }
        Chunk raw = _upstream->read();
        if (raw.isFailure()) {
          return terminate(std::move(raw));
        }
        if (raw.size() != 0) {
          log::debug("DecoderSource - discarding {} bytes after end of compressed stream", raw.size());
        }
        if (raw.isLast()) {
          return terminate(Chunk::Eof());
        }
        return Chunk::Empty();
      }
      case CodecStatus::Error: {
        const ContentFailure failure{.kind = FailureKind::CodecCorruption, .message = _adapter->errorMessage()};
        _upstream->fail(failure);
        return terminate(Chunk::Failure(failure));
      }
    }
  }
}

void DecoderSource::demand(std::function<void()> onAvailable) {
  if (!_terminal.reached() && needsUpstream()) {
    _upstream->demand(std::move(onAvailable));
  } else {
    onAvailable();
  }
}

void DecoderSource::fail(ContentFailure failure) {
  if (_terminal.reached()) {
    return;
  }
  terminate(Chunk::Failure(failure));
  _upstream->fail(failure);
}

bool DecoderSource::needsUpstream() const noexcept {
  if (_upstreamLast || !pendingConsumed()) {
    return false;
  }
  const CodecStatus status = _adapter->status();
  return status == CodecStatus::NeedsMoreInput || status == CodecStatus::Done;
}

Chunk DecoderSource::terminate(Chunk terminal) {
  if (terminal.isFailure()) {
    _terminal.setFailure(terminal.failure());
    log::debug("DecoderSource - stream failed: {}: {}", FailureKindName(terminal.failure().kind),
               terminal.failure().message);
  } else {
    _terminal.setEof();
    log::debug("DecoderSource - end of stream, {} compressed bytes decoded", _adapter->totalIn());
  }
  _pending.release();
  _pendingPos = 0;
  _adapter.reset();
  return terminal;
}

}  // namespace contentflow
