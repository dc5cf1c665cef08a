#include "types.hpp"

#include <algorithm>
#include <cctype>

namespace ro_validator {

namespace {
std::string normalise_label(const std::string &label) {
  auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto first = std::find_if(label.begin(), label.end(), not_space);
  auto last = std::find_if(label.rbegin(), label.rend(), not_space).base();

  std::string out;
  for (auto it = first; it < last; ++it) {
    const unsigned char c = *it;
    out.push_back(c == '-' || c == ' ' ? '_'
                                       : static_cast<char>(std::tolower(c)));
  }
  return out;
}
}  // namespace

std::optional<CurationStatus> curation_status_from_string(
    const std::string &label) {
  const std::string key = normalise_label(label);
  if (key == "perfect") {
    return CurationStatus::Perfect;
  }
  if (key == "manually_validated" || key == "validated") {
    return CurationStatus::ManuallyValidated;
  }
  if (key == "manually_not_verified" || key == "not_verified") {
    return CurationStatus::ManuallyNotVerified;
  }
  if (key == "manually_invalidated" || key == "invalidated") {
    return CurationStatus::ManuallyInvalidated;
  }
  if (key.empty() || key == "unknown") {
    return CurationStatus::Unknown;
  }
  return std::nullopt;
}

std::string to_string(CurationStatus status) {
  switch (status) {
    case CurationStatus::Perfect:
      return "perfect";
    case CurationStatus::ManuallyValidated:
      return "manually_validated";
    case CurationStatus::ManuallyNotVerified:
      return "manually_not_verified";
    case CurationStatus::ManuallyInvalidated:
      return "manually_invalidated";
    case CurationStatus::Unknown:
      return "unknown";
  }
  return "unknown";
}

ObservedReaction &ObservedReaction::add_substrate(
    ChemicalId id, std::optional<int> coefficient) {
  return add(id, ChemicalRole::Substrate, coefficient);
}

ObservedReaction &ObservedReaction::add_product(
    ChemicalId id, std::optional<int> coefficient) {
  return add(id, ChemicalRole::Product, coefficient);
}

ObservedReaction &ObservedReaction::add(ChemicalId id, ChemicalRole role,
                                        std::optional<int> coefficient) {
  auto it = std::find_if(d_participants.begin(), d_participants.end(),
                         [&](const ReactionParticipant &p) {
                           return p.id == id && p.role == role;
                         });
  if (it != d_participants.end()) {
    it->coefficient = coefficient;
  } else {
    d_participants.push_back(ReactionParticipant{id, role, coefficient});
  }
  return *this;
}

std::vector<ChemicalId> ObservedReaction::substrates() const {
  return ids_with_role(ChemicalRole::Substrate);
}

std::vector<ChemicalId> ObservedReaction::products() const {
  return ids_with_role(ChemicalRole::Product);
}

std::optional<int> ObservedReaction::substrate_coefficient(
    ChemicalId id) const {
  return coefficient_with_role(id, ChemicalRole::Substrate);
}

std::optional<int> ObservedReaction::product_coefficient(ChemicalId id) const {
  return coefficient_with_role(id, ChemicalRole::Product);
}

std::vector<ChemicalId> ObservedReaction::ids_with_role(
    ChemicalRole role) const {
  std::vector<ChemicalId> ids;
  for (const auto &p : d_participants) {
    if (p.role == role) {
      ids.push_back(p.id);
    }
  }
  return ids;
}

std::optional<int> ObservedReaction::coefficient_with_role(
    ChemicalId id, ChemicalRole role) const {
  for (const auto &p : d_participants) {
    if (p.id == id && p.role == role) {
      return p.coefficient;
    }
  }
  return std::nullopt;
}

}  // namespace ro_validator
