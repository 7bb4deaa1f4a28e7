#ifndef CELLWATCH_CORE_CSV_UTILS_HPP_
#define CELLWATCH_CORE_CSV_UTILS_HPP_

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cellwatch::core::csv {

inline void TrimTrailingCarriageReturn(std::string& line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
}

inline std::string Trim(std::string_view raw) {
  std::size_t begin = 0;
  while (begin < raw.size() && std::isspace(static_cast<unsigned char>(raw[begin])) != 0) {
    ++begin;
  }
  std::size_t end = raw.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1])) != 0) {
    --end;
  }
  return std::string(raw.substr(begin, end - begin));
}

// Splits one CSV record. Unquoted fields are trimmed; a field wrapped in
// double quotes keeps its content verbatim, may contain commas, and escapes a
// quote as "". Records never span lines.
inline bool SplitLine(std::string_view line, std::vector<std::string>& columns,
                      std::string& error) {
  columns.clear();
  std::size_t pos = 0;
  while (true) {
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) {
      ++pos;
    }

    std::string field;
    if (pos < line.size() && line[pos] == '"') {
      ++pos;
      bool closed = false;
      while (pos < line.size()) {
        const char ch = line[pos++];
        if (ch != '"') {
          field.push_back(ch);
          continue;
        }
        if (pos < line.size() && line[pos] == '"') {
          field.push_back('"');
          ++pos;
          continue;
        }
        closed = true;
        break;
      }
      if (!closed) {
        error = "unterminated quoted field in column " + std::to_string(columns.size() + 1U);
        return false;
      }
      while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) {
        ++pos;
      }
      if (pos < line.size() && line[pos] != ',') {
        error = "unexpected character after quoted field in column " +
                std::to_string(columns.size() + 1U);
        return false;
      }
    } else {
      const std::size_t comma = line.find(',', pos);
      const std::size_t end = comma == std::string_view::npos ? line.size() : comma;
      field = Trim(line.substr(pos, end - pos));
      pos = end;
    }

    columns.push_back(std::move(field));
    if (pos >= line.size()) {
      return true;
    }
    ++pos; // ','
  }
}

// Strict decimal parse: the whole field must be consumed and the value finite.
inline bool ParseDouble(std::string_view text, double& value) {
  if (text.empty()) {
    return false;
  }
  const std::string owned(text);
  char* parse_end = nullptr;
  const double parsed = std::strtod(owned.c_str(), &parse_end);
  if (parse_end == owned.c_str() || parse_end == nullptr || *parse_end != '\0') {
    return false;
  }
  if (!std::isfinite(parsed)) {
    return false;
  }
  value = parsed;
  return true;
}

// Columns are matched by name so exports may carry extra columns in any order.
inline bool ResolveColumns(const std::vector<std::string>& header,
                           const std::vector<std::string_view>& required,
                           std::vector<std::size_t>& indices, std::string& missing) {
  indices.clear();
  indices.reserve(required.size());
  for (const std::string_view name : required) {
    bool found = false;
    for (std::size_t i = 0; i < header.size(); ++i) {
      if (header[i] == name) {
        indices.push_back(i);
        found = true;
        break;
      }
    }
    if (!found) {
      missing = std::string(name);
      return false;
    }
  }
  return true;
}

} // namespace cellwatch::core::csv

#endif // CELLWATCH_CORE_CSV_UTILS_HPP_
