#include "contentflow/form-fields.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace contentflow {

void FormFields::add(std::string name, std::string value) {
  const auto [it, inserted] = _index.try_emplace(name, _fields.size());
  if (inserted) {
    _fields.push_back(Field{.name = std::move(name), .values = {}});
  }
  _fields[it->second].values.push_back(std::move(value));
}

std::optional<std::string_view> FormFields::get(std::string_view name) const noexcept {
  const Field* field = find(name);
  if (field == nullptr || field->values.empty()) {
    return std::nullopt;
  }
  return std::string_view(field->values.front());
}

std::span<const std::string> FormFields::values(std::string_view name) const noexcept {
  const Field* field = find(name);
  if (field == nullptr) {
    return {};
  }
  return {field->values.data(), field->values.size()};
}

const FormFields::Field* FormFields::find(std::string_view name) const noexcept {
  const auto it = _index.find(name);
  return it == _index.end() ? nullptr : &_fields[it->second];
}

}  // namespace contentflow
