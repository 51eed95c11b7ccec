#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

#include "contentflow/chunk.hpp"
#include "contentflow/content-failure.hpp"
#include "contentflow/content-source.hpp"

namespace contentflow {

// Guard enforcing cumulative ceilings on the stream it wraps.
//
// Bytes are counted before a chunk is forwarded: a chunk that would make the total exceed maxLength is released
// instead of being exposed, the wrapped source is failed and a LimitExceeded failure chunk is returned.
// Fields are reported by the layer parsing the content, with addField().
// A ceiling of 0 means unbounded.
class LimitedSource final : public ContentSource {
 public:
  // 'lengthLimit' is the LimitKind reported when maxLength is crossed (Size for decoded content,
  // CompressedSize when guarding raw bytes).
  LimitedSource(ContentSourcePtr source, std::size_t maxLength, std::size_t maxFields = 0,
                LimitKind lengthLimit = LimitKind::Size);

  Chunk read() override;

  void demand(std::function<void()> onAvailable) override;

  void fail(ContentFailure failure) override;

  // Counts one more field. Returns the LimitExceeded(Count) failure if maxFields is crossed,
  // in which case the wrapped source is failed.
  [[nodiscard]] std::optional<ContentFailure> addField();

  // Also aborts the stream if the bytes returned by this source exceed maxRatio times the bytes
  // returned by 'compressedSide', which must outlive this object (typically a source below it in the chain).
  void setExpansionRatioGuard(const LimitedSource* compressedSide, double maxRatio) noexcept {
    _compressedSide = compressedSide;
    _maxExpansionRatio = maxRatio;
  }

  [[nodiscard]] std::uint64_t length() const noexcept { return _length; }

  [[nodiscard]] std::size_t fields() const noexcept { return _fields; }

 private:
  Chunk breach(Chunk& chunk, LimitKind limit);

  ContentSourcePtr _source;
  const LimitedSource* _compressedSide{nullptr};
  std::uint64_t _length{0};
  std::size_t _fields{0};
  std::size_t _maxLength;
  std::size_t _maxFields;
  double _maxExpansionRatio{0.0};
  TerminalState _terminal;
  LimitKind _lengthLimit;
};

}  // namespace contentflow
