#include "pattern/charSet.hpp"

#include <cctype>
#include <functional>
#include <unordered_map>

namespace regen {
namespace charset {

namespace {

std::string collect(int first, int last, const std::function<bool(int)> &keep) {
  std::string chars;
  for (int c = first; c <= last; c++) {
    if (keep(c)) {
      chars += static_cast<char>(c);
    }
  }
  return chars;
}

std::string ascii(const std::function<bool(int)> &keep) {
  return collect(0, 127, keep);
}

const std::string whitespace = " \t\n\r\f\v";

} // namespace

const std::string &defaultUniverse() {
  static const std::string universe =
      collect(0x20, 0x7E, [](int) { return true; });
  return universe;
}

std::optional<std::string> shorthand(char name) {
  switch (name) {
  case 'w':
    return posix("word");
  case 's':
    return whitespace;
  case 'd':
    return posix("digit");
  default:
    return std::nullopt;
  }
}

std::optional<std::string> posix(const std::string &name) {
  static const std::unordered_map<std::string, std::string> classes = {
      {"alnum", ascii([](int c) { return std::isalnum(c) != 0; })},
      {"alpha", ascii([](int c) { return std::isalpha(c) != 0; })},
      {"blank", " \t"},
      {"cntrl", ascii([](int c) { return std::iscntrl(c) != 0; })},
      {"digit", ascii([](int c) { return std::isdigit(c) != 0; })},
      {"graph", ascii([](int c) { return std::isgraph(c) != 0; })},
      {"lower", ascii([](int c) { return std::islower(c) != 0; })},
      {"print", ascii([](int c) { return std::isprint(c) != 0; })},
      {"punct", ascii([](int c) { return std::ispunct(c) != 0; })},
      {"space", whitespace},
      {"upper", ascii([](int c) { return std::isupper(c) != 0; })},
      {"word", ascii([](int c) { return std::isalnum(c) != 0 || c == '_'; })},
      {"xdigit", ascii([](int c) { return std::isxdigit(c) != 0; })},
  };

  auto it = classes.find(name);
  if (it == classes.end()) {
    return std::nullopt;
  }
  return it->second;
}

void appendUnique(std::string &alphabet, const std::string &chars) {
  for (char c : chars) {
    if (alphabet.find(c) == std::string::npos) {
      alphabet += c;
    }
  }
}

std::string complement(const std::string &excluded) {
  std::string result;
  for (char c : defaultUniverse()) {
    if (excluded.find(c) == std::string::npos) {
      result += c;
    }
  }
  return result;
}

} // namespace charset
} // namespace regen
