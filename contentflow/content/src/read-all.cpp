#include "contentflow/read-all.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <utility>

#include "contentflow/chunk.hpp"
#include "contentflow/content-source.hpp"
#include "contentflow/drain.hpp"

namespace contentflow {

std::optional<BodyResult> BodyConsumer::accept(Chunk chunk) {
  if (chunk.isFailure()) {
    return BodyResult{.failure = chunk.failure()};
  }
  _body.append(chunk.bytes());
  chunk.release();
  if (chunk.isLast()) {
    return BodyResult{.body = std::move(_body)};
  }
  return std::nullopt;
}

BodyResult ReadAll(ContentSource& source) {
  BodyConsumer consumer;
  return DrainBlocking(source, consumer);
}

DrainHandle ReadAllAsync(ContentSourcePtr source, std::function<void(BodyResult)> onComplete) {
  return DrainAsync<BodyResult>(std::move(source), std::make_unique<BodyConsumer>(), std::move(onComplete));
}

}  // namespace contentflow
