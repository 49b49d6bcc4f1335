#pragma once

#include <string>

namespace kinship::db::model {

struct ReligionRecord {
  std::string person_id;

  std::string religion_id;
  std::string category_id;
  std::string sub_category_id;

  std::string religion_name;
  std::string category_name;
  std::string sub_category_name;
};

} // namespace kinship::db::model
