#pragma once

#include <optional>
#include <string>

namespace regen {

/**
 * Character sets are ordered, duplicate-free strings. Order matters: a
 * distribution attached to a class draws an index into its set.
 */
namespace charset {

/**
 * Default universe for '.' and for negated classes: printable ASCII,
 * 0x20 (space) through 0x7E ('~'), in code point order.
 */
const std::string &defaultUniverse();

// Members of the shorthand class \w, \s or \d ('w', 's' or 'd')
std::optional<std::string> shorthand(char name);

// Members of a POSIX class by name ("digit", "alpha", ...)
std::optional<std::string> posix(const std::string &name);

// Append characters of chars not already in alphabet, keeping their order
void appendUnique(std::string &alphabet, const std::string &chars);

// Universe characters not in excluded, in universe order
std::string complement(const std::string &excluded);

} // namespace charset

} // namespace regen
