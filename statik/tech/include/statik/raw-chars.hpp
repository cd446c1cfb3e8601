#pragma once

#include <cstddef>
#include <string_view>

namespace statik {

// Growable contiguous char buffer with uninitialized spare capacity.
// Used for connection in/out buffers: callers reserve capacity, write directly into data() + size(),
// then commit the written bytes with addSize.
class RawChars {
 public:
  using value_type = char;
  using size_type = std::size_t;
  using pointer = char *;
  using const_pointer = const char *;
  using iterator = char *;
  using const_iterator = const char *;

  RawChars() noexcept = default;

  explicit RawChars(size_type capacity);

  explicit RawChars(std::string_view data);

  RawChars(const RawChars &rhs);
  RawChars(RawChars &&rhs) noexcept;
  RawChars &operator=(const RawChars &rhs);
  RawChars &operator=(RawChars &&rhs) noexcept;

  ~RawChars();

  void append(std::string_view data);

  void push_back(char ch);

  void assign(std::string_view data);

  // Removes the first n bytes, shifting the remaining ones to the front.
  void erase_front(size_type n) noexcept;

  // Makes sure at least 'availableCapacity' bytes can be written after size() without reallocation.
  void ensureAvailableCapacity(size_type availableCapacity);

  // Same as ensureAvailableCapacity, but grows the capacity geometrically to amortize repeated small appends.
  void ensureAvailableCapacityExponential(size_type availableCapacity);

  void reserve(size_type newCapacity);

  // Commits 'n' bytes previously written in the spare capacity.
  void addSize(size_type n) noexcept { _size += n; }

  void clear() noexcept { _size = 0; }

  // Releases the allocated memory.
  void shrink_to_empty() noexcept;

  [[nodiscard]] pointer data() noexcept { return _buf; }
  [[nodiscard]] const_pointer data() const noexcept { return _buf; }

  [[nodiscard]] iterator begin() noexcept { return _buf; }
  [[nodiscard]] const_iterator begin() const noexcept { return _buf; }

  [[nodiscard]] iterator end() noexcept { return _buf + _size; }
  [[nodiscard]] const_iterator end() const noexcept { return _buf + _size; }

  [[nodiscard]] size_type size() const noexcept { return _size; }
  [[nodiscard]] size_type capacity() const noexcept { return _capacity; }
  [[nodiscard]] size_type availableCapacity() const noexcept { return _capacity - _size; }

  [[nodiscard]] bool empty() const noexcept { return _size == 0; }

  char &operator[](size_type pos) noexcept { return _buf[pos]; }
  char operator[](size_type pos) const noexcept { return _buf[pos]; }

  operator std::string_view() const noexcept { return {_buf, _size}; }

  bool operator==(const RawChars &rhs) const noexcept { return std::string_view(*this) == std::string_view(rhs); }

  void swap(RawChars &rhs) noexcept;

 private:
  void reallocUp(size_type newCapacity);

  char *_buf{nullptr};
  size_type _size{0};
  size_type _capacity{0};
};

}  // namespace statik
