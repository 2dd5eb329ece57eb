#include "table_name.hpp"

#include <cctype>
#include <vector>

namespace pgshadow::model {

std::string QuoteIdent(std::string_view ident) {
  std::string out;
  out.reserve(ident.size() + 2);
  out.push_back('"');
  for (char c : ident) {
    if (c == '"') {
      out.push_back('"');
    }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string QuoteLiteral(std::string_view value) {
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('\'');
  for (char c : value) {
    if (c == '\'') {
      out.push_back('\'');
    }
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

std::string TableName::Qualified() const {
  return QuoteIdent(schema) + "." + QuoteIdent(name);
}

std::string TableName::Display() const {
  return schema + "." + name;
}

std::optional<TableName> ParseTableName(std::string_view text, std::string_view default_schema) {
  std::vector<std::string> parts;
  std::size_t              i = 0;

  auto skip_space = [&] {
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
  };

  skip_space();
  for (;;) {
    std::string part;
    if (i < text.size() && text[i] == '"') {
      ++i;
      bool closed = false;
      while (i < text.size()) {
        if (text[i] == '"') {
          if (i + 1 < text.size() && text[i + 1] == '"') {
            part.push_back('"');
            i += 2;
            continue;
          }
          ++i;
          closed = true;
          break;
        }
        part.push_back(text[i++]);
      }
      if (!closed || part.empty()) return std::nullopt;
    } else {
      while (i < text.size()) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (!(std::isalnum(c) || c == '_' || c == '$' || c >= 0x80)) break;
        part.push_back(static_cast<char>(std::tolower(c)));
        ++i;
      }
      if (part.empty() || std::isdigit(static_cast<unsigned char>(part[0]))) return std::nullopt;
    }
    parts.push_back(std::move(part));

    skip_space();
    if (i < text.size() && text[i] == '.') {
      ++i;
      skip_space();
      continue;
    }
    break;
  }

  skip_space();
  if (i != text.size()) return std::nullopt;

  if (parts.size() == 1) {
    return TableName{std::string(default_schema), parts[0]};
  }
  if (parts.size() == 2) {
    return TableName{parts[0], parts[1]};
  }
  return std::nullopt;
}

} // namespace pgshadow::model
