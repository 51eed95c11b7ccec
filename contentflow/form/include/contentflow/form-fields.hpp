#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "contentflow/vector.hpp"

namespace contentflow {

namespace internal {

struct TransparentStringHash {
  using is_transparent = void;

  std::size_t operator()(std::string_view sv) const noexcept { return std::hash<std::string_view>{}(sv); }
};

}  // namespace internal

// Decoded fields of an application/x-www-form-urlencoded body.
// Names keep their order of first appearance, and each name keeps its values in order of appearance.
class FormFields {
 public:
  struct Field {
    std::string name;
    vector<std::string> values;
  };

  using const_iterator = vector<Field>::const_iterator;

  void add(std::string name, std::string value);

  // First value of given field, if present.
  [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;

  // All values of given field (empty if absent).
  [[nodiscard]] std::span<const std::string> values(std::string_view name) const noexcept;

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return find(name) != nullptr; }

  // Number of distinct names.
  [[nodiscard]] std::size_t size() const noexcept { return _fields.size(); }

  [[nodiscard]] bool empty() const noexcept { return _fields.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _fields.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _fields.end(); }

 private:
  [[nodiscard]] const Field* find(std::string_view name) const noexcept;

  vector<Field> _fields;
  // name -> position in _fields
  std::unordered_map<std::string, std::size_t, internal::TransparentStringHash, std::equal_to<>> _index;
};

}  // namespace contentflow
