#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "struct_view.hpp"

namespace flatdata {

// Line based diff between two schema texts.
// Lines only in `expected` are prefixed with "-", lines only in `stored` with "+",
// common lines with two spaces. Returns an empty string iff the texts are equal.
std::string schemaDiff(std::string_view expected, std::string_view stored);

// Schemas are compared as exact text, annotations included
inline bool schemasEqual(std::string_view expected, std::string_view stored) {
  return expected == stored;
}

// Check that schema bytes form valid UTF-8
bool isValidUtf8(std::string_view text);

// Derive reflection tables from the `struct Name { field : type : width; ... }`
// declarations in a schema. Fields are packed LSB-first in declaration order.
// A struct declared more than once (e.g. repeated per resource) is reported once.
// Returns std::nullopt on malformed input, with error message in outError if provided
std::optional<std::vector<StructLayout>> parseStructLayouts(std::string_view schema,
                                                            std::string *outError = nullptr);

} // namespace flatdata
