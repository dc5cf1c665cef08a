#ifndef RO_VALIDATOR_DELIMITED_READER_HPP
#define RO_VALIDATOR_DELIMITED_READER_HPP

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace ro_validator::details {

std::string trim(std::string s);
std::string to_lower(std::string s);

/**
 * Split one CSV or TSV line. Double quotes protect separators; a doubled
 * quote inside quotes is a literal quote.
 */
std::vector<std::string> split_delimited_line(const std::string &line,
                                              char separator);

/**
 * Line-oriented reader for the reference-data files: a header row followed
 * by records. The separator is a tab if the header contains one, otherwise
 * a comma. Blank lines and lines starting with '#' are skipped.
 */
class DelimitedReader {
 public:
  DelimitedReader(std::istream &in, std::string source_name);

  // False when the input has no header row.
  bool read_header();

  // Index of the first header column matching any of `names`
  // (case-insensitive).
  std::optional<std::size_t> column(
      const std::vector<std::string> &names) const;

  // Next record with trimmed fields; false at end of input.
  bool next(std::vector<std::string> &fields);

  std::size_t line_number() const { return d_line_no; }
  const std::string &source_name() const { return d_source_name; }

 private:
  bool next_content_line(std::string &line);

  std::istream &d_in;
  std::string d_source_name;
  char d_separator = ',';
  std::size_t d_line_no = 0;
  std::vector<std::string> d_header;
};

}  // namespace ro_validator::details

#endif  // RO_VALIDATOR_DELIMITED_READER_HPP
