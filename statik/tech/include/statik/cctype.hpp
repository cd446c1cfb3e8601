#pragma once

namespace statik {

constexpr bool isdigit(char ch) { return ch >= '0' && ch <= '9'; }

constexpr bool isalpha(char ch) { return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z'); }

constexpr bool isspace(char ch) { return ch == ' ' || (ch >= '\t' && ch <= '\r'); }

constexpr bool isxdigit(char ch) { return isdigit(ch) || (ch >= 'a' && ch <= 'f') || (ch >= 'A' && ch <= 'F'); }

}  // namespace statik
