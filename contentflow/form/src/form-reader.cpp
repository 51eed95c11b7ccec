#include "contentflow/form-reader.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <utility>

#include "contentflow/chunk.hpp"
#include "contentflow/content-failure.hpp"
#include "contentflow/drain.hpp"
#include "contentflow/limited-source.hpp"

namespace contentflow {

FormConsumer::FormConsumer(LimitedSource& guard) : _parser([&guard] { return guard.addField(); }) {}

std::optional<FormResult> FormConsumer::accept(Chunk chunk) {
  if (chunk.isFailure()) {
    return FormResult{.failure = chunk.failure()};
  }
  auto failure = _parser.feed(chunk.bytes());
  chunk.release();
  if (!failure && chunk.isLast()) {
    failure = _parser.finish();
    if (!failure) {
      return FormResult{.fields = _parser.takeFields()};
    }
  }
  if (failure) {
    return FormResult{.failure = failure};
  }
  return std::nullopt;
}

FormResult ReadFormFields(LimitedSource& source) {
  FormConsumer consumer(source);
  return DrainBlocking(source, consumer);
}

DrainHandle ReadFormFieldsAsync(std::unique_ptr<LimitedSource> source, std::function<void(FormResult)> onComplete) {
  auto consumer = std::make_unique<FormConsumer>(*source);
  return DrainAsync<FormResult>(std::move(source), std::move(consumer), std::move(onComplete));
}

}  // namespace contentflow
