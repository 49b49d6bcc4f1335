#include "internal/model/relationship.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace kinship::model {

using namespace kinship::graph::v1;

namespace {

constexpr std::array<std::pair<std::string_view, RelationshipKind>, 7> kTypeCodes = {{
    {"rel-6a0ede824d101", RELATIONSHIP_KIND_FATHER},
    {"rel-6a0ede824d102", RELATIONSHIP_KIND_MOTHER},
    {"rel-6a0ede824d103", RELATIONSHIP_KIND_DAUGHTER},
    {"rel-6a0ede824d104", RELATIONSHIP_KIND_SON},
    {"rel-6a0ede824d105", RELATIONSHIP_KIND_WIFE},
    {"rel-6a0ede824d106", RELATIONSHIP_KIND_HUSBAND},
    {"rel-6a0ede824d107", RELATIONSHIP_KIND_SPOUSE},
}};

constexpr std::array<std::pair<std::string_view, RelationshipKind>, 7> kNames = {{
    {"father", RELATIONSHIP_KIND_FATHER},
    {"mother", RELATIONSHIP_KIND_MOTHER},
    {"daughter", RELATIONSHIP_KIND_DAUGHTER},
    {"son", RELATIONSHIP_KIND_SON},
    {"wife", RELATIONSHIP_KIND_WIFE},
    {"husband", RELATIONSHIP_KIND_HUSBAND},
    {"spouse", RELATIONSHIP_KIND_SPOUSE},
}};

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

Gender ResolveGender(std::string_view gender_id, const GenderIds& ids) {
  if (gender_id.empty()) return Gender::kUnknown;
  if (gender_id == ids.male_id) return Gender::kMale;
  if (gender_id == ids.female_id) return Gender::kFemale;
  return Gender::kUnknown;
}

std::optional<Gender> ParseGenderCode(std::string_view code) {
  const auto lowered = Lower(code);
  if (lowered == "male" || lowered == "m") return Gender::kMale;
  if (lowered == "female" || lowered == "f") return Gender::kFemale;
  return std::nullopt;
}

MaritalStatus ParseMaritalStatus(std::string_view text) {
  const auto lowered = Lower(text);
  if (lowered == "single") return MaritalStatus::kSingle;
  if (lowered == "married") return MaritalStatus::kMarried;
  if (lowered == "divorced") return MaritalStatus::kDivorced;
  if (lowered == "widowed") return MaritalStatus::kWidowed;
  if (lowered == "separated") return MaritalStatus::kSeparated;
  return MaritalStatus::kUnknown;
}

std::optional<RelationshipKind> ParseRelationshipKind(std::string_view text) {
  for (const auto& [code, kind] : kTypeCodes) {
    if (text == code) return kind;
  }

  const auto lowered = Lower(text);
  for (const auto& [name, kind] : kNames) {
    if (lowered == name) return kind;
  }
  return std::nullopt;
}

RelationshipKind InverseKind(RelationshipKind kind, Gender source_gender) {
  switch (kind) {
    case RELATIONSHIP_KIND_FATHER:
    case RELATIONSHIP_KIND_MOTHER:
    case RELATIONSHIP_KIND_PARENT:
      if (source_gender == Gender::kMale) return RELATIONSHIP_KIND_SON;
      if (source_gender == Gender::kFemale) return RELATIONSHIP_KIND_DAUGHTER;
      return RELATIONSHIP_KIND_CHILD;

    case RELATIONSHIP_KIND_SON:
    case RELATIONSHIP_KIND_DAUGHTER:
    case RELATIONSHIP_KIND_CHILD:
      if (source_gender == Gender::kMale) return RELATIONSHIP_KIND_FATHER;
      if (source_gender == Gender::kFemale) return RELATIONSHIP_KIND_MOTHER;
      return RELATIONSHIP_KIND_PARENT;

    case RELATIONSHIP_KIND_WIFE:
    case RELATIONSHIP_KIND_HUSBAND:
    case RELATIONSHIP_KIND_SPOUSE:
      return RELATIONSHIP_KIND_SPOUSE;

    default:
      return RELATIONSHIP_KIND_UNSPECIFIED;
  }
}

std::string_view RelationshipLabel(RelationshipKind kind) {
  switch (kind) {
    case RELATIONSHIP_KIND_FATHER:
      return "Father";
    case RELATIONSHIP_KIND_MOTHER:
      return "Mother";
    case RELATIONSHIP_KIND_DAUGHTER:
      return "Daughter";
    case RELATIONSHIP_KIND_SON:
      return "Son";
    case RELATIONSHIP_KIND_WIFE:
      return "Wife";
    case RELATIONSHIP_KIND_HUSBAND:
      return "Husband";
    case RELATIONSHIP_KIND_SPOUSE:
      return "Spouse";
    case RELATIONSHIP_KIND_PARENT:
      return "Parent";
    case RELATIONSHIP_KIND_CHILD:
      return "Child";
    default:
      return "";
  }
}

} // namespace kinship::model
