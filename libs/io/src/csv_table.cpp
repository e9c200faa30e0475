/**
 * @file csv_table.cpp
 * @brief CSV reading helpers.
 * @author Watosn
 */

#include "windcurtail/io/csv_table.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>

#include <fmt/format.h>

namespace windcurtail::io {
namespace {

std::string normalize(std::string_view s) {
  std::string out;
  for (const char c : s) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  std::size_t b = 0;
  std::size_t e = out.size();
  while (b < e && std::isspace(static_cast<unsigned char>(out[b])) != 0) {
    ++b;
  }
  while (e > b && std::isspace(static_cast<unsigned char>(out[e - 1])) != 0) {
    --e;
  }
  return out.substr(b, e - b);
}

void strip_bom(std::string& line) {
  if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF && static_cast<unsigned char>(line[1]) == 0xBB &&
      static_cast<unsigned char>(line[2]) == 0xBF) {
    line.erase(0, 3);
  }
}

}  // namespace

std::optional<std::size_t> CsvTable::column(std::initializer_list<std::string_view> candidates) const {
  for (const auto candidate : candidates) {
    const std::string want = normalize(candidate);
    for (std::size_t i = 0; i < header.size(); ++i) {
      if (normalize(header[i]) == want) {
        return i;
      }
    }
  }
  return std::nullopt;
}

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields;
  fields.reserve(16);
  std::string token;
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        token.push_back('"');
        ++i;
      } else if (c == '"') {
        quoted = false;
      } else {
        token.push_back(c);
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.push_back(token);
      token.clear();
    } else if (c != '\r') {
      token.push_back(c);
    }
  }
  fields.push_back(token);
  return fields;
}

CsvRead read_csv(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    return CsvRead{.status = core::Status::DataUnavailable, .message = fmt::format("file not found: {}", path.string())};
  }

  CsvRead out{};
  std::string line;
  std::size_t line_no = 0;
  bool header_consumed = false;
  while (std::getline(in, line)) {
    ++line_no;
    if (!header_consumed) {
      strip_bom(line);
    }
    if (line.empty() || line == "\r" || line.front() == '#') {
      continue;
    }
    if (!header_consumed) {
      out.table.header = split_csv_line(line);
      header_consumed = true;
      continue;
    }
    out.table.rows.push_back(split_csv_line(line));
    out.table.line_numbers.push_back(line_no);
  }

  if (!header_consumed) {
    return CsvRead{.status = core::Status::InvalidInput, .message = fmt::format("empty file: {}", path.string())};
  }
  return out;
}

double parse_cell(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  if (text.empty()) {
    return core::kMissing;
  }
  const std::string s(text);
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (end == s.c_str() || *end != '\0') {
    return core::kMissing;
  }
  return v;
}

std::string_view cell(const std::vector<std::string>& row, std::size_t col) {
  return col < row.size() ? std::string_view(row[col]) : std::string_view{};
}

}  // namespace windcurtail::io
