#include "contentflow/limited-source.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>

#include "contentflow/chunk.hpp"
#include "contentflow/content-failure.hpp"
#include "contentflow/invalid_argument_exception.hpp"
#include "contentflow/log.hpp"

namespace contentflow {

namespace {

constexpr const char* LimitMessage(LimitKind limit) {
  switch (limit) {
    case LimitKind::Size:
      return "content exceeds maxLength";
    case LimitKind::Count:
      return "too many fields";
    case LimitKind::CompressedSize:
      return "compressed content exceeds maxCompressedBytes";
    case LimitKind::ExpansionRatio:
      return "decompression expansion too large";
    case LimitKind::None:
      break;
  }
  return "limit exceeded";
}

}  // namespace

LimitedSource::LimitedSource(ContentSourcePtr source, std::size_t maxLength, std::size_t maxFields,
                             LimitKind lengthLimit)
    : _source(std::move(source)), _maxLength(maxLength), _maxFields(maxFields), _lengthLimit(lengthLimit) {
  if (!_source) {
    throw invalid_argument("LimitedSource requires a source");
  }
}

Chunk LimitedSource::read() {
  if (_terminal.reached()) {
    return _terminal.chunk();
  }
  Chunk chunk = _source->read();
  if (chunk.isFailure()) {
    _terminal.setFailure(chunk.failure());
    return chunk;
  }

  _length += chunk.size();
  if (_maxLength != 0 && _length > _maxLength) {
    return breach(chunk, _lengthLimit);
  }
  if (_compressedSide != nullptr && _maxExpansionRatio > 0.0 &&
      static_cast<double>(_length) > static_cast<double>(_compressedSide->length()) * _maxExpansionRatio) {
    return breach(chunk, LimitKind::ExpansionRatio);
  }

  if (chunk.isLast()) {
    _terminal.setEof();
  }
  return chunk;
}

void LimitedSource::demand(std::function<void()> onAvailable) {
  if (_terminal.reached()) {
    onAvailable();
  } else {
    _source->demand(std::move(onAvailable));
  }
}

void LimitedSource::fail(ContentFailure failure) {
  if (_terminal.reached()) {
    return;
  }
  _terminal.setFailure(failure);
  _source->fail(failure);
}

std::optional<ContentFailure> LimitedSource::addField() {
  ++_fields;
  if (_maxFields == 0 || _fields <= _maxFields) {
    return std::nullopt;
  }
  const ContentFailure failure{.kind = FailureKind::LimitExceeded, .limit = LimitKind::Count,
                               .message = LimitMessage(LimitKind::Count)};
  log::warn("LimitedSource - {} ({} > {})", failure.message, _fields, _maxFields);
  fail(failure);
  return failure;
}

Chunk LimitedSource::breach(Chunk& chunk, LimitKind limit) {
  chunk.release();
  const ContentFailure failure{.kind = FailureKind::LimitExceeded, .limit = limit, .message = LimitMessage(limit)};
  if (limit == LimitKind::ExpansionRatio) {
    log::warn("LimitedSource - {} ({} bytes from {} compressed bytes, max ratio {})", failure.message, _length,
              _compressedSide->length(), _maxExpansionRatio);
  } else {
    log::warn("LimitedSource - {} ({} > {})", failure.message, _length, _maxLength);
  }
  fail(failure);
  return Chunk::Failure(failure);
}

}  // namespace contentflow
