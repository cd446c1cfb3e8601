#include "statik/http-header-map.hpp"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string_view>

#include "statik/string-equal-ignore-case.hpp"

namespace statik {

HeaderMap::HeaderMap(std::initializer_list<Field> fields) : _fields(fields) {}

HeaderMap& HeaderMap::set(std::string_view name, std::string_view value) {
  auto it = std::ranges::find_if(_fields, [name](const Field& field) { return CaseInsensitiveEqual(field.name, name); });
  if (it == _fields.end()) {
    return append(name, value);
  }
  it->value.assign(value);
  // Fields before 'it' do not match, so the kept field does not move.
  std::erase_if(_fields, [name, firstField = &*it](const Field& field) {
    return &field != firstField && CaseInsensitiveEqual(field.name, name);
  });
  return *this;
}

HeaderMap& HeaderMap::append(std::string_view name, std::string_view value) {
  _fields.push_back(Field{std::string(name), std::string(value)});
  return *this;
}

std::size_t HeaderMap::erase(std::string_view name) {
  return std::erase_if(_fields, [name](const Field& field) { return CaseInsensitiveEqual(field.name, name); });
}

std::optional<std::string_view> HeaderMap::get(std::string_view name) const noexcept {
  const auto it =
      std::ranges::find_if(_fields, [name](const Field& field) { return CaseInsensitiveEqual(field.name, name); });
  if (it == _fields.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

}  // namespace statik
