#pragma once

#include <string>

namespace kinship::db::model {

/*
  Directed relationship row.

  person ---relationship_type---> related_person

  Reads "related_person is person's <relationship_type>". The store may or
  may not hold the inverse row; relationship_type is kept as stored and
  parsed only when the graph is normalized.
*/

struct RelationshipRecord {
  std::string id;

  std::string person_id;
  std::string related_person_id;

  std::string relationship_type;

  bool is_active = true;
};

} // namespace kinship::db::model
