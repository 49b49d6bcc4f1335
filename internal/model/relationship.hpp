#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "kinship/graph/v1.hpp"

namespace kinship::model {

using RelationshipKind = kinship::graph::v1::RelationshipKind;

enum class Gender : std::uint8_t {
  kUnknown = 0,
  kMale    = 1,
  kFemale  = 2,
};

constexpr std::string_view ToString(Gender gender) {
  switch (gender) {
    case Gender::kMale:
      return "male";
    case Gender::kFemale:
      return "female";
    case Gender::kUnknown:
    default:
      return "unknown";
  }
}

// Ids the person store seeds for its two gender rows.
inline constexpr std::string_view kDefaultMaleGenderId   = "4eb743f7-0a50-4da2-a20d-3473b3b3db83";
inline constexpr std::string_view kDefaultFemaleGenderId = "691fde27-f82c-4a84-832f-4243acef4b95";

struct GenderIds {
  std::string male_id{kDefaultMaleGenderId};
  std::string female_id{kDefaultFemaleGenderId};
};

Gender ResolveGender(std::string_view gender_id, const GenderIds& ids);

// "MALE"/"M" and "FEMALE"/"F" in any case.
std::optional<Gender> ParseGenderCode(std::string_view code);

enum class MaritalStatus : std::uint8_t {
  kUnknown   = 0,
  kSingle    = 1,
  kMarried   = 2,
  kDivorced  = 3,
  kWidowed   = 4,
  kSeparated = 5,
};

// Unrecognized or empty text reads as kUnknown.
MaritalStatus ParseMaritalStatus(std::string_view text);

/*
  Accepts the kind names ("father", "Father") and the store's type codes
  ("rel-6a0ede824d101" .. "rel-6a0ede824d107"). Only the seven storable
  kinds parse; PARENT and CHILD are labels the normalizer derives.
*/
std::optional<RelationshipKind> ParseRelationshipKind(std::string_view text);

/*
  Edge (u, v, kind) reads "v is u's <kind>". The inverse describes u as
  seen from v, so parent/child inversions depend on u's gender:

    father, mother     -> son, daughter  (child when unknown)
    son, daughter      -> father, mother (parent when unknown)
    wife, husband,
    spouse             -> spouse
*/
RelationshipKind InverseKind(RelationshipKind kind, Gender source_gender);

std::string_view RelationshipLabel(RelationshipKind kind);

} // namespace kinship::model
