#include "statik/raw-chars.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <new>
#include <string_view>
#include <utility>

namespace statik {

RawChars::RawChars(size_type capacity) : _buf(static_cast<char *>(std::malloc(capacity))), _capacity(capacity) {
  if (capacity != 0 && _buf == nullptr) {
    throw std::bad_alloc();
  }
}

RawChars::RawChars(std::string_view data) : RawChars(data.size()) {
  if (!data.empty()) {
    std::memcpy(_buf, data.data(), data.size());
    _size = data.size();
  }
}

RawChars::RawChars(const RawChars &rhs) : RawChars(std::string_view(rhs)) {}

RawChars::RawChars(RawChars &&rhs) noexcept
    : _buf(std::exchange(rhs._buf, nullptr)),
      _size(std::exchange(rhs._size, 0)),
      _capacity(std::exchange(rhs._capacity, 0)) {}

RawChars &RawChars::operator=(const RawChars &rhs) {
  if (this != &rhs) {
    assign(std::string_view(rhs));
  }
  return *this;
}

RawChars &RawChars::operator=(RawChars &&rhs) noexcept {
  if (this != &rhs) {
    std::free(_buf);
    _buf = std::exchange(rhs._buf, nullptr);
    _size = std::exchange(rhs._size, 0);
    _capacity = std::exchange(rhs._capacity, 0);
  }
  return *this;
}

RawChars::~RawChars() { std::free(_buf); }

void RawChars::append(std::string_view data) {
  if (!data.empty()) {
    ensureAvailableCapacityExponential(data.size());
    std::memcpy(_buf + _size, data.data(), data.size());
    _size += data.size();
  }
}

void RawChars::push_back(char ch) {
  ensureAvailableCapacityExponential(1U);
  _buf[_size++] = ch;
}

void RawChars::assign(std::string_view data) {
  _size = 0;
  append(data);
}

void RawChars::erase_front(size_type n) noexcept {
  n = std::min(n, _size);
  if (n == _size) {
    _size = 0;
  } else if (n != 0) {
    std::memmove(_buf, _buf + n, _size - n);
    _size -= n;
  }
}

void RawChars::ensureAvailableCapacity(size_type availableCapacity) {
  if (_size + availableCapacity > _capacity) {
    reallocUp(_size + availableCapacity);
  }
}

void RawChars::ensureAvailableCapacityExponential(size_type availableCapacity) {
  if (_size + availableCapacity > _capacity) {
    reallocUp(std::max(_size + availableCapacity, _capacity * 2U));
  }
}

void RawChars::reserve(size_type newCapacity) {
  if (newCapacity > _capacity) {
    reallocUp(newCapacity);
  }
}

void RawChars::shrink_to_empty() noexcept {
  std::free(_buf);
  _buf = nullptr;
  _size = 0;
  _capacity = 0;
}

void RawChars::swap(RawChars &rhs) noexcept {
  using std::swap;
  swap(_buf, rhs._buf);
  swap(_size, rhs._size);
  swap(_capacity, rhs._capacity);
}

void RawChars::reallocUp(size_type newCapacity) {
  auto *newBuf = static_cast<char *>(std::realloc(_buf, newCapacity));
  if (newBuf == nullptr) {
    throw std::bad_alloc();
  }
  _buf = newBuf;
  _capacity = newCapacity;
}

}  // namespace statik
