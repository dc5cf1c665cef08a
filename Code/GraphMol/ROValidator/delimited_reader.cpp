#include "delimited_reader.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace ro_validator::details {

std::string trim(std::string s) {
  auto not_space = [](unsigned char c) { return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::vector<std::string> split_delimited_line(const std::string &line,
                                              char separator) {
  std::vector<std::string> fields;
  std::string cur;
  bool in_quotes = false;

  for (size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (c == '"') {
      if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
        cur.push_back('"');
        ++i;
      } else {
        in_quotes = !in_quotes;
      }
    } else if (c == separator && !in_quotes) {
      fields.push_back(cur);
      cur.clear();
    } else if (c != '\r') {
      cur.push_back(c);
    }
  }
  fields.push_back(cur);
  return fields;
}

DelimitedReader::DelimitedReader(std::istream &in, std::string source_name)
    : d_in(in), d_source_name(std::move(source_name)) {}

bool DelimitedReader::next_content_line(std::string &line) {
  while (std::getline(d_in, line)) {
    ++d_line_no;
    const auto t = trim(line);
    if (t.empty() || t[0] == '#') {
      continue;
    }
    return true;
  }
  return false;
}

bool DelimitedReader::read_header() {
  std::string line;
  if (!next_content_line(line)) {
    return false;
  }
  d_separator = line.find('\t') != std::string::npos ? '\t' : ',';
  d_header = split_delimited_line(line, d_separator);
  for (auto &h : d_header) {
    h = to_lower(trim(h));
  }
  return true;
}

std::optional<std::size_t> DelimitedReader::column(
    const std::vector<std::string> &names) const {
  for (const auto &name : names) {
    auto it = std::find(d_header.begin(), d_header.end(), to_lower(name));
    if (it != d_header.end()) {
      return static_cast<std::size_t>(it - d_header.begin());
    }
  }
  return std::nullopt;
}

bool DelimitedReader::next(std::vector<std::string> &fields) {
  std::string line;
  if (!next_content_line(line)) {
    return false;
  }
  fields = split_delimited_line(line, d_separator);
  for (auto &f : fields) {
    f = trim(f);
  }
  return true;
}

}  // namespace ro_validator::details
