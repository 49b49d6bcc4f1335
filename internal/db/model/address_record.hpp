#pragma once

#include <string>

namespace kinship::db::model {

// Current address of a person with the display name of every level set.
struct AddressRecord {
  std::string person_id;

  std::string country_id;
  std::string state_id;
  std::string district_id;
  std::string sub_district_id;
  std::string locality_id;

  std::string country_name;
  std::string state_name;
  std::string district_name;
  std::string sub_district_name;
  std::string locality_name;
};

} // namespace kinship::db::model
