#pragma once

#include <string>

namespace kinship::db::model {

/*
  Person row as the person store keeps it.

  Dates are ISO "YYYY-MM-DD"; an empty date_of_death means alive.
  marital_status is one of unknown, single, married, divorced, widowed,
  separated; empty reads as unknown.
*/

struct PersonRecord {
  std::string id;

  std::string first_name;
  std::string middle_name;
  std::string last_name;

  std::string gender_id;

  std::string date_of_birth;
  std::string date_of_death;

  std::string marital_status;
};

} // namespace kinship::db::model
