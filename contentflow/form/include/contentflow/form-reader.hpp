#pragma once

#include <functional>
#include <memory>
#include <optional>

#include "contentflow/chunk.hpp"
#include "contentflow/content-failure.hpp"
#include "contentflow/drain.hpp"
#include "contentflow/form-fields.hpp"
#include "contentflow/form-parser.hpp"
#include "contentflow/limited-source.hpp"

namespace contentflow {

struct FormResult {
  [[nodiscard]] bool ok() const noexcept { return !failure.has_value(); }

  FormFields fields;
  std::optional<ContentFailure> failure;
};

// Parses the chunks of a form body, reporting each parsed name to the guard of the stream.
class FormConsumer final : public ChunkConsumer<FormResult> {
 public:
  explicit FormConsumer(LimitedSource& guard);

  std::optional<FormResult> accept(Chunk chunk) override;

 private:
  FormParser _parser;
};

// Reads and parses a whole form body, blocking the calling thread when no data is available.
// Fails with LimitExceeded(Size) or LimitExceeded(Count) according to the ceilings of 'source'.
FormResult ReadFormFields(LimitedSource& source);

// Non-blocking version of ReadFormFields, applying the same limits and producing the same result.
DrainHandle ReadFormFieldsAsync(std::unique_ptr<LimitedSource> source, std::function<void(FormResult)> onComplete);

}  // namespace contentflow
