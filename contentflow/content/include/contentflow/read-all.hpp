#pragma once

#include <functional>
#include <optional>
#include <string>

#include "contentflow/chunk.hpp"
#include "contentflow/content-failure.hpp"
#include "contentflow/content-source.hpp"
#include "contentflow/drain.hpp"

namespace contentflow {

struct BodyResult {
  [[nodiscard]] bool ok() const noexcept { return !failure.has_value(); }

  std::string body;
  std::optional<ContentFailure> failure;
};

// Aggregates all the bytes of a stream.
class BodyConsumer final : public ChunkConsumer<BodyResult> {
 public:
  std::optional<BodyResult> accept(Chunk chunk) override;

 private:
  std::string _body;
};

// Reads the whole content of 'source', blocking the calling thread when no data is available.
BodyResult ReadAll(ContentSource& source);

// Non-blocking version of ReadAll. 'onComplete' is invoked exactly once, unless the returned handle is cancelled.
DrainHandle ReadAllAsync(ContentSourcePtr source, std::function<void(BodyResult)> onComplete);

}  // namespace contentflow
