#include "errors.hpp"

namespace ro_validator {

std::string to_string(ProjectionErrorKind kind) {
  switch (kind) {
    case ProjectionErrorKind::InvalidTemplate:
      return "invalid rule template";
    case ProjectionErrorKind::EngineFailure:
      return "chemistry engine failure";
    case ProjectionErrorKind::NoSubstrates:
      return "no substrates";
  }
  return "unknown projection error";
}

}  // namespace ro_validator
