#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <unordered_set>

#include <flatdata/schema.hpp>

namespace flatdata {

StructLayout::StructLayout(std::string name, size_t sizeInBytes, std::vector<FieldInfo> fields)
    : name_(std::move(name)), sizeInBytes_(sizeInBytes), fields_(std::move(fields)) {}

const FieldInfo *StructLayout::find(std::string_view fieldName) const {
  auto it = std::find_if(fields_.begin(), fields_.end(),
                         [&](const FieldInfo &field) { return field.name == fieldName; });
  return it == fields_.end() ? nullptr : &*it;
}

namespace {

struct BasicType {
  std::string_view name;
  uint32_t bits;
  bool isSigned;
};

constexpr BasicType basicTypes[] = {
    {"bool", 1, false}, {"u8", 8, false},  {"u16", 16, false}, {"u32", 32, false},
    {"u64", 64, false}, {"i8", 8, true},   {"i16", 16, true},  {"i32", 32, true},
    {"i64", 64, true},
};

// Replace comments with whitespace so the tokenizer can ignore them
std::string stripComments(std::string_view text) {
  std::string result;
  result.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    if (text.compare(i, 2, "/*") == 0) {
      size_t end = text.find("*/", i + 2);
      i = end == std::string_view::npos ? text.size() : end + 2;
      result += ' ';
    } else if (text.compare(i, 2, "//") == 0) {
      size_t end = text.find('\n', i);
      i = end == std::string_view::npos ? text.size() : end;
    } else {
      result += text[i++];
    }
  }
  return result;
}

std::vector<std::string> tokenize(const std::string &text) {
  std::vector<std::string> tokens;
  size_t i = 0;
  while (i < text.size()) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    if (std::isspace(c)) {
      ++i;
    } else if (std::isalnum(c) || c == '_' || c == '.') {
      size_t start = i;
      while (i < text.size() && (std::isalnum(static_cast<unsigned char>(text[i])) ||
                                 text[i] == '_' || text[i] == '.')) {
        ++i;
      }
      tokens.emplace_back(text.substr(start, i - start));
    } else {
      tokens.emplace_back(1, text[i++]);
    }
  }
  return tokens;
}

} // namespace

std::optional<std::vector<StructLayout>> parseStructLayouts(std::string_view schema,
                                                            std::string *outError) {
  auto tokens = tokenize(stripComments(schema));
  std::vector<StructLayout> layouts;
  std::unordered_set<std::string> seen;

  auto expect = [&](size_t pos, std::string_view token) {
    if (pos < tokens.size() && tokens[pos] == token) {
      return true;
    }
    if (outError) {
      *outError = std::format("Expected '{}' at token {} but got '{}'", token, pos,
                              pos < tokens.size() ? tokens[pos] : std::string("<end>"));
    }
    return false;
  };

  size_t pos = 0;
  while (pos < tokens.size()) {
    if (tokens[pos] != "struct") {
      ++pos;
      continue;
    }
    if (pos + 1 >= tokens.size()) {
      if (outError) {
        *outError = "Struct declaration without a name";
      }
      return std::nullopt;
    }

    std::string structName = tokens[pos + 1];
    pos += 2;
    if (!expect(pos++, "{")) {
      return std::nullopt;
    }

    std::vector<FieldInfo> fields;
    uint32_t bitOffset = 0;
    while (pos < tokens.size() && tokens[pos] != "}") {
      // name : type : width ;
      if (!expect(pos + 1, ":") || !expect(pos + 3, ":") ||
          !expect(pos + 5, ";")) {
        return std::nullopt;
      }
      const std::string &fieldName = tokens[pos];
      const std::string &typeName = tokens[pos + 2];
      const std::string &widthText = tokens[pos + 4];

      auto type = std::find_if(std::begin(basicTypes), std::end(basicTypes),
                               [&](const BasicType &t) { return t.name == typeName; });
      if (type == std::end(basicTypes)) {
        if (outError) {
          *outError = std::format("Unknown type '{}' of field {}.{}", typeName, structName,
                                  fieldName);
        }
        return std::nullopt;
      }

      uint32_t width = 0;
      auto [end, ec] =
          std::from_chars(widthText.data(), widthText.data() + widthText.size(), width);
      if (ec != std::errc() || end != widthText.data() + widthText.size() || width == 0 ||
          width > type->bits) {
        if (outError) {
          *outError = std::format("Invalid width '{}' of field {}.{} (type {})", widthText,
                                  structName, fieldName, typeName);
        }
        return std::nullopt;
      }

      fields.push_back(FieldInfo{fieldName, bitOffset, width, type->isSigned});
      bitOffset += width;
      pos += 6;
    }
    if (!expect(pos++, "}")) {
      return std::nullopt;
    }

    if (seen.insert(structName).second) {
      layouts.emplace_back(structName, (bitOffset + 7) / 8, std::move(fields));
    }
  }

  return layouts;
}

} // namespace flatdata
