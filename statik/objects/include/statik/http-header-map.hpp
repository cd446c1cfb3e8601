#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace statik {

// Ordered list of HTTP header fields with case-insensitive name lookups.
// Insertion order is preserved on serialization. Small sizes are expected so lookups are linear.
class HeaderMap {
 public:
  struct Field {
    std::string name;
    std::string value;

    bool operator==(const Field&) const = default;
  };

  using const_iterator = std::vector<Field>::const_iterator;

  HeaderMap() noexcept = default;

  HeaderMap(std::initializer_list<Field> fields);

  // Replaces the value of the first field with this name (removing the others), or appends a new field.
  HeaderMap& set(std::string_view name, std::string_view value);

  // Appends a new field, even if a field with the same name already exists.
  HeaderMap& append(std::string_view name, std::string_view value);

  // Removes all fields with this name. Returns the number of removed fields.
  std::size_t erase(std::string_view name);

  // Value of the first field with this name, if any.
  [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return get(name).has_value(); }

  [[nodiscard]] std::size_t size() const noexcept { return _fields.size(); }

  [[nodiscard]] bool empty() const noexcept { return _fields.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _fields.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _fields.end(); }

  void clear() noexcept { _fields.clear(); }

  bool operator==(const HeaderMap&) const = default;

 private:
  std::vector<Field> _fields;
};

}  // namespace statik
