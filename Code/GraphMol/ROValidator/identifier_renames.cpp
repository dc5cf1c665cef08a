#include "identifier_renames.hpp"
#include "delimited_reader.hpp"
#include "errors.hpp"

#include <fstream>

namespace ro_validator {

IdentifierRenames IdentifierRenames::load(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open() || in.bad()) {
    throw CorpusLoadError("Couldn't open identifier rename file " + path);
  }
  return load(in, path);
}

IdentifierRenames IdentifierRenames::load(std::istream &in,
                                          const std::string &source_name) {
  IdentifierRenames res;
  details::DelimitedReader reader(in, source_name);
  if (!reader.read_header()) {
    return res;
  }
  const auto wrong_col = reader.column({"wrong_identifier", "wrong_inchi"});
  const auto correct_col =
      reader.column({"correct_identifier", "correct_inchi"});
  if (!wrong_col || !correct_col) {
    throw CorpusLoadError(
        "Identifier rename file " + source_name +
        " needs wrong_identifier and correct_identifier columns");
  }

  std::vector<std::string> fields;
  while (reader.next(fields)) {
    if (*wrong_col >= fields.size() || *correct_col >= fields.size() ||
        fields[*wrong_col].empty() || fields[*correct_col].empty()) {
      throw CorpusLoadError("Bad format for identifier rename file " +
                            source_name + " on line " +
                            std::to_string(reader.line_number()));
    }
    res.add(fields[*wrong_col], fields[*correct_col]);
  }
  return res;
}

void IdentifierRenames::add(const std::string &wrong,
                            const std::string &correct) {
  d_renames[wrong] = correct;
}

std::string IdentifierRenames::rename_if_listed(
    const std::string &identifier) const {
  auto it = d_renames.find(identifier);
  return it == d_renames.end() ? identifier : it->second;
}

}  // namespace ro_validator
