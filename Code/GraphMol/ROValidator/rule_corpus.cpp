#include "rule_corpus.hpp"
#include "delimited_reader.hpp"
#include "errors.hpp"

#include <RDGeneral/RDLog.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <limits>
#include <unordered_set>

namespace ro_validator {

namespace {
const std::string DB_PERFECT_CLASSIFICATION = "perfect";

std::string where(const details::DelimitedReader &reader) {
  return reader.source_name() + " line " +
         std::to_string(reader.line_number());
}

long long parse_integer(const std::string &text, const std::string &what,
                        const details::DelimitedReader &reader) {
  std::size_t pos = 0;
  long long val = 0;
  try {
    val = std::stoll(text, &pos);
  } catch (const std::exception &) {
    pos = 0;
  }
  if (text.empty() || pos != text.size()) {
    throw CorpusLoadError("Bad " + what + " '" + text + "' in " +
                          where(reader));
  }
  return val;
}

// Arity column value in [min_value, INT_MAX].
int parse_arity(const std::string &text, const std::string &what,
                long long min_value, const details::DelimitedReader &reader) {
  const long long val = parse_integer(text, what, reader);
  if (val < min_value || val > std::numeric_limits<int>::max()) {
    throw CorpusLoadError(what + " " + text + " out of range in " +
                          where(reader));
  }
  return static_cast<int>(val);
}

const std::string &field(const std::vector<std::string> &fields,
                         std::optional<std::size_t> col) {
  static const std::string empty;
  if (!col || *col >= fields.size()) {
    return empty;
  }
  return fields[*col];
}

// Derive the curation status the way the legacy operator records encode it.
CurationStatus legacy_curation(const std::string &category,
                               const std::string &manual_validation,
                               const details::DelimitedReader &reader) {
  if (details::to_lower(category) == DB_PERFECT_CLASSIFICATION) {
    return CurationStatus::Perfect;
  }
  const auto mv = details::to_lower(manual_validation);
  if (mv == "true" || mv == "1") {
    return CurationStatus::ManuallyValidated;
  }
  if (mv == "false" || mv == "0") {
    return CurationStatus::ManuallyInvalidated;
  }
  if (mv.empty() || mv == "null" || mv == "none") {
    return CurationStatus::Unknown;
  }
  throw CorpusLoadError("Bad manual_validation '" + manual_validation +
                        "' in " + where(reader));
}
}  // namespace

RuleCorpus::RuleCorpus(std::vector<TransformationRule> rules) {
  d_rules.reserve(rules.size());
  for (auto &r : rules) {
    d_rules.push_back(std::make_shared<const TransformationRule>(std::move(r)));
  }
}

RuleCorpus::RuleCorpus(std::vector<RulePtr> rules) : d_rules(std::move(rules)) {}

RuleCorpus RuleCorpus::load(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open() || in.bad()) {
    throw CorpusLoadError("Couldn't open rule corpus file " + path);
  }
  return load(in, path);
}

RuleCorpus RuleCorpus::load(std::istream &in, const std::string &source_name) {
  details::DelimitedReader reader(in, source_name);
  if (!reader.read_header()) {
    throw CorpusLoadError("Rule corpus " + source_name + " is empty");
  }

  const auto id_col = reader.column({"id", "ro_id", "rule_id"});
  const auto rule_col = reader.column({"rule", "ro", "smarts", "template"});
  const auto arity_col =
      reader.column({"substrate_count", "substrate_arity"});
  if (!id_col || !rule_col || !arity_col) {
    throw CorpusLoadError("Rule corpus " + source_name +
                          " needs id, rule and substrate_count columns");
  }
  const auto status_col = reader.column({"curation_status"});
  const auto category_col = reader.column({"category"});
  const auto validation_col = reader.column({"manual_validation"});
  const auto product_col = reader.column({"product_count", "product_arity"});
  const auto name_col = reader.column({"name"});

  std::vector<TransformationRule> rules;
  std::unordered_set<RuleId> seen_ids;
  std::vector<std::string> fields;
  while (reader.next(fields)) {
    TransformationRule rule;
    rule.id = parse_integer(field(fields, id_col), "rule id", reader);
    rule.rule_template = field(fields, rule_col);
    if (rule.rule_template.empty()) {
      throw CorpusLoadError("Empty rule template in " + where(reader));
    }
    rule.substrate_arity =
        parse_arity(field(fields, arity_col), "substrate_count", 1, reader);
    if (!field(fields, product_col).empty()) {
      rule.product_arity =
          parse_arity(field(fields, product_col), "product_count", 0, reader);
    }
    rule.name = field(fields, name_col);

    if (status_col) {
      auto status = curation_status_from_string(field(fields, status_col));
      if (!status) {
        throw CorpusLoadError("Unknown curation_status '" +
                              field(fields, status_col) + "' in " +
                              where(reader));
      }
      rule.curation_status = *status;
    } else {
      rule.curation_status = legacy_curation(
          field(fields, category_col), field(fields, validation_col), reader);
    }

    if (!seen_ids.insert(rule.id).second) {
      throw CorpusLoadError("Duplicate rule id " + std::to_string(rule.id) +
                            " in " + where(reader));
    }
    rules.push_back(std::move(rule));
  }

  BOOST_LOG(rdInfoLog) << "Loaded " << rules.size() << " rules from "
                       << source_name << std::endl;
  return RuleCorpus(std::move(rules));
}

RulePtr RuleCorpus::find(RuleId id) const {
  auto it = std::find_if(d_rules.begin(), d_rules.end(),
                         [id](const RulePtr &r) { return r->id == id; });
  return it == d_rules.end() ? RulePtr() : *it;
}

template <typename Pred>
RuleCorpus RuleCorpus::filter(Pred pred) const {
  std::vector<RulePtr> kept;
  std::copy_if(d_rules.begin(), d_rules.end(), std::back_inserter(kept),
               [&](const RulePtr &r) { return pred(*r); });
  return RuleCorpus(std::move(kept));
}

RuleCorpus RuleCorpus::filter_by_substrate_arity(int arity) const {
  return filter([arity](const TransformationRule &r) {
    return r.substrate_arity == arity;
  });
}

RuleCorpus RuleCorpus::filter_by_product_arity(int arity) const {
  return filter([arity](const TransformationRule &r) {
    return r.product_arity == arity;
  });
}

RuleCorpus RuleCorpus::filter_by_curation_status(
    const std::set<CurationStatus> &statuses) const {
  return filter([&statuses](const TransformationRule &r) {
    return statuses.count(r.curation_status) > 0;
  });
}

RuleCorpus RuleCorpus::filter_by_ids(const std::vector<RuleId> &ids) const {
  const std::unordered_set<RuleId> wanted(ids.begin(), ids.end());
  return filter([&wanted](const TransformationRule &r) {
    return wanted.count(r.id) > 0;
  });
}

}  // namespace ro_validator
