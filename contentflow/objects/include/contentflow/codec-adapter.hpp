#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

#include "contentflow/encoding.hpp"
#include "contentflow/raw-chars.hpp"

namespace contentflow {

enum class CodecStatus : std::uint8_t {
  NeedsMoreInput,   // push() the next compressed bytes (or finish() if there are none)
  NeedsMoreOutput,  // pull() the decoded bytes held by the adapter
  Ready,            // advance() the engine with what it already buffered
  Done,             // end of the compressed stream was decoded (terminal)
  Error,            // the input is corrupted or truncated (terminal)
};

// Wraps one stateful decompression engine behind a uniform status protocol.
// Input and output buffers are bounded by the buffer size given at construction, so a single
// step never expands more than that many bytes, whatever the compression ratio.
// Implementations own the engine handle and release it in their destructor.
// Not thread-safe.
class CodecAdapter {
 public:
  CodecAdapter(const CodecAdapter&) = delete;
  CodecAdapter(CodecAdapter&&) noexcept = delete;
  CodecAdapter& operator=(const CodecAdapter&) = delete;
  CodecAdapter& operator=(CodecAdapter&&) noexcept = delete;

  virtual ~CodecAdapter() = default;

  [[nodiscard]] CodecStatus status() const noexcept { return _status; }

  // Engine provided reason of the Error status, empty otherwise.
  [[nodiscard]] const char* errorMessage() const noexcept { return _errorMessage; }

  [[nodiscard]] std::size_t bufferSize() const noexcept { return _bufferSize; }

  // Total number of compressed bytes accepted by push().
  [[nodiscard]] std::uint64_t totalIn() const noexcept { return _totalIn; }

  // Copies as much of 'input' as fits in the input buffer and runs one decode step.
  // Precondition: status() == NeedsMoreInput. Returns the number of bytes taken from 'input'.
  std::size_t push(std::string_view input);

  // Runs one decode step over the input already buffered.
  // Precondition: status() == Ready.
  void advance();

  // Hands over the decoded bytes currently held.
  // Precondition: status() == NeedsMoreOutput.
  [[nodiscard]] RawChars pull();

  // Tells the adapter that no more input will come.
  // In NeedsMoreInput state, moves to Done if no byte was ever pushed (empty body) and to Error otherwise
  // (truncated stream). No-op in other states.
  void finish();

 protected:
  enum class EngineState : std::uint8_t { Progress, StreamEnd, Error };

  struct StepResult {
    std::size_t consumed{0};
    std::size_t produced{0};
    EngineState state{EngineState::Progress};
    const char* errorMessage = "";
  };

  explicit CodecAdapter(std::size_t bufferSize);

  // Runs the engine once from [in, in + inSize) into [out, out + outSize).
  // Implementations should not throw.
  virtual StepResult step(const char* in, std::size_t inSize, char* out, std::size_t outSize) noexcept = 0;

  // Name used in logs.
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

 private:
  void runStep();

  void setError(const char* message);

  RawChars _in;
  RawChars _out;
  std::size_t _inPos{0};
  std::size_t _bufferSize;
  std::uint64_t _totalIn{0};
  const char* _errorMessage = "";
  CodecStatus _status{CodecStatus::NeedsMoreInput};
  bool _outWasFull{false};
  bool _ended{false};
};

// Creates the adapter decoding the given encoding.
// Throws content_error(UnsupportedEncoding) if the codec is not compiled in (or for Encoding::none),
// content_error(ResourceInit) if the engine cannot be initialized.
std::unique_ptr<CodecAdapter> MakeCodecAdapter(Encoding encoding, std::size_t bufferSize);

// Convenience helper for full-buffer decompression of an already aggregated body.
// Appends decoded bytes to 'out'. Returns false on corrupted / truncated input or if more than
// maxDecompressedBytes would be produced (0 = unlimited).
bool DecompressFull(CodecAdapter& adapter, std::string_view input, std::size_t maxDecompressedBytes, RawChars& out);

}  // namespace contentflow
