#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "contentflow/chunk.hpp"
#include "contentflow/codec-adapter.hpp"
#include "contentflow/content-failure.hpp"
#include "contentflow/content-source.hpp"
#include "contentflow/vector.hpp"

namespace contentflow::test {

// Source replaying a script of chunks, recording how it is driven.
// Data chunks are borrowed, and their releases are counted.
class ScriptedContentSource final : public ContentSource {
 public:
  struct Step {
    enum class Type : std::uint8_t { Data, Empty, Failure };

    static Step Data(std::string bytes, bool last = false) {
      return {.type = Type::Data, .bytes = std::move(bytes), .last = last};
    }
    static Step Empty() { return {.type = Type::Empty}; }
    static Step Fail(FailureKind kind) { return {.type = Type::Failure, .failure = ContentFailure{.kind = kind}}; }

    Type type{Type::Data};
    std::string bytes;
    bool last{false};
    ContentFailure failure;
  };

  // Builds a script delivering 'data' in pieces of 'chunkSize' bytes (0 for one piece), the last one flagged last.
  static vector<Step> Split(std::string_view data, std::size_t chunkSize);

  explicit ScriptedContentSource(vector<Step> steps) : _steps(std::move(steps)) {}

  Chunk read() override;

  void demand(std::function<void()> onAvailable) override;

  void fail(ContentFailure failure) override;

  [[nodiscard]] std::size_t nbReads() const noexcept { return _nbReads; }
  [[nodiscard]] std::size_t nbDemands() const noexcept { return _nbDemands; }
  [[nodiscard]] std::size_t nbDataChunks() const noexcept { return _nbDataChunks; }
  [[nodiscard]] std::size_t nbReleases() const noexcept { return _nbReleases; }
  [[nodiscard]] std::size_t nbFails() const noexcept { return _nbFails; }
  [[nodiscard]] const std::optional<ContentFailure>& failure() const noexcept { return _failure; }

 private:
  vector<Step> _steps;
  std::size_t _pos{0};
  std::size_t _nbReads{0};
  std::size_t _nbDemands{0};
  std::size_t _nbDataChunks{0};
  std::size_t _nbReleases{0};
  std::size_t _nbFails{0};
  std::optional<ContentFailure> _failure;
  TerminalState _terminal;
};

// Trivial codec copying its input until a '\0' end marker. A '!' byte is reported as corruption.
// Counts its destructions, to check that codec resources are released exactly once.
class CountingCopyCodec final : public CodecAdapter {
 public:
  CountingCopyCodec(std::size_t bufferSize, int& nbReleases) : CodecAdapter(bufferSize), _nbReleases(nbReleases) {}

  CountingCopyCodec(const CountingCopyCodec&) = delete;
  CountingCopyCodec(CountingCopyCodec&&) noexcept = delete;
  CountingCopyCodec& operator=(const CountingCopyCodec&) = delete;
  CountingCopyCodec& operator=(CountingCopyCodec&&) noexcept = delete;

  ~CountingCopyCodec() override { ++_nbReleases; }

 private:
  StepResult step(const char* in, std::size_t inSize, char* out, std::size_t outSize) noexcept override;

  [[nodiscard]] std::string_view name() const noexcept override { return "copy"; }

  int& _nbReleases;
};

}  // namespace contentflow::test
