#include "parse_tree.hpp"

#include <google/protobuf/util/json_util.h>
#include <pg_query.h>

#include <cctype>
#include <stdexcept>
#include <utility>

#include "internal/util/errors.hpp"

namespace pgshadow::ddl {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

// Owns a PgQueryParseResult.
class ParseResult {
 public:
  explicit ParseResult(const std::string& sql) : result_(pg_query_parse(sql.c_str())) {
  }

  ~ParseResult() {
    pg_query_free_parse_result(result_);
  }

  ParseResult(const ParseResult&)            = delete;
  ParseResult& operator=(const ParseResult&) = delete;

  const PgQueryParseResult* operator->() const {
    return &result_;
  }

 private:
  PgQueryParseResult result_;
};

const Value* Field(const Struct& node, const std::string& field) {
  const auto it = node.fields().find(field);
  return it == node.fields().end() ? nullptr : &it->second;
}

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsIdentChar(char c) {
  const auto u = static_cast<unsigned char>(c);
  return std::isalnum(u) != 0 || c == '_' || c == '$' || u >= 0x80;
}

std::size_t SkipSpace(std::string_view sql, std::size_t pos) {
  while (pos < sql.size() && IsSpace(sql[pos])) ++pos;
  return pos;
}

std::size_t QuotedEnd(std::string_view sql, std::size_t pos) {
  for (++pos; pos < sql.size(); ++pos) {
    if (sql[pos] != '"') continue;
    if (pos + 1 < sql.size() && sql[pos + 1] == '"') {
      ++pos;
      continue;
    }
    return pos + 1;
  }
  return pos;
}

std::size_t NamePartEnd(std::string_view sql, std::size_t pos) {
  if (pos < sql.size() && sql[pos] == '"') {
    return QuotedEnd(sql, pos);
  }
  while (pos < sql.size() && IsIdentChar(sql[pos])) ++pos;
  return pos;
}

} // namespace

std::vector<ParsedStatement> ParseStatements(std::string_view sql) {
  const std::string input(sql);
  ParseResult       result(input);

  if (result->error != nullptr) {
    throw util::ValidationError("target DDL: " + std::string(result->error->message) + " at position " +
                                std::to_string(result->error->cursorpos) + " in: " + input);
  }

  Struct tree;
  auto   status = google::protobuf::util::JsonStringToMessage(result->parse_tree, &tree);
  if (!status.ok()) {
    throw std::runtime_error("libpg_query returned an unreadable parse tree: " + std::string(status.message()));
  }

  std::vector<ParsedStatement> out;
  const ListValue*             stmts = Items(tree, "stmts");
  if (stmts == nullptr) {
    return out;
  }

  for (const auto& item : stmts->values()) {
    if (item.kind_case() != Value::kStructValue) continue;
    const Struct& raw  = item.struct_value();
    const Struct* stmt = Child(raw, "stmt");
    if (stmt == nullptr || stmt->fields().size() != 1) continue;

    ParsedStatement parsed;
    const auto& [type, body] = *stmt->fields().begin();
    parsed.type              = type;
    if (body.kind_case() == Value::kStructValue) {
      parsed.node = body.struct_value();
    }

    // a zero length means "to the end of the input"
    const auto location = static_cast<std::size_t>(Number(raw, "stmt_location", 0));
    const auto length   = static_cast<std::size_t>(Number(raw, "stmt_len", 0));
    parsed.begin        = location;
    parsed.end          = length == 0 ? sql.size() : location + length;
    while (parsed.begin < parsed.end && IsSpace(sql[parsed.begin])) ++parsed.begin;
    while (parsed.end > parsed.begin && IsSpace(sql[parsed.end - 1])) --parsed.end;

    out.push_back(std::move(parsed));
  }
  return out;
}

const Struct* Child(const Struct& node, const std::string& field) {
  const Value* v = Field(node, field);
  return v != nullptr && v->kind_case() == Value::kStructValue ? &v->struct_value() : nullptr;
}

const ListValue* Items(const Struct& node, const std::string& field) {
  const Value* v = Field(node, field);
  return v != nullptr && v->kind_case() == Value::kListValue ? &v->list_value() : nullptr;
}

std::string Text(const Struct& node, const std::string& field) {
  const Value* v = Field(node, field);
  return v != nullptr && v->kind_case() == Value::kStringValue ? v->string_value() : std::string();
}

bool Flag(const Struct& node, const std::string& field) {
  const Value* v = Field(node, field);
  return v != nullptr && v->kind_case() == Value::kBoolValue && v->bool_value();
}

int64_t Number(const Struct& node, const std::string& field, int64_t fallback) {
  const Value* v = Field(node, field);
  return v != nullptr && v->kind_case() == Value::kNumberValue ? static_cast<int64_t>(v->number_value()) : fallback;
}

const Struct* Unwrap(const Value& item, const std::string& type) {
  if (item.kind_case() != Value::kStructValue) {
    return nullptr;
  }
  return Child(item.struct_value(), type);
}

std::size_t NameEnd(std::string_view sql, std::size_t begin, int parts) {
  std::size_t end = NamePartEnd(sql, begin);
  for (int i = 1; i < parts; ++i) {
    std::size_t pos = SkipSpace(sql, end);
    if (pos >= sql.size() || sql[pos] != '.') break;
    end = NamePartEnd(sql, SkipSpace(sql, pos + 1));
  }
  return end;
}

std::size_t FindKeyword(std::string_view sql, std::size_t from, std::size_t to, std::string_view keyword) {
  std::size_t pos = from;
  while (pos < to) {
    const char c = sql[pos];
    if (c == '"') {
      pos = QuotedEnd(sql, pos);
    } else if (c == '-' && pos + 1 < to && sql[pos + 1] == '-') {
      while (pos < to && sql[pos] != '\n') ++pos;
    } else if (c == '/' && pos + 1 < to && sql[pos + 1] == '*') {
      const auto close = sql.find("*/", pos + 2);
      pos              = close == std::string_view::npos ? to : close + 2;
    } else if (IsIdentChar(c)) {
      const std::size_t start = pos;
      while (pos < to && IsIdentChar(sql[pos])) ++pos;
      const auto word = sql.substr(start, pos - start);
      if (word.size() == keyword.size()) {
        bool same = true;
        for (std::size_t i = 0; i < word.size() && same; ++i) {
          same = std::tolower(static_cast<unsigned char>(word[i])) == std::tolower(static_cast<unsigned char>(keyword[i]));
        }
        if (same) return start;
      }
    } else {
      ++pos;
    }
  }
  return std::string_view::npos;
}

} // namespace pgshadow::ddl
