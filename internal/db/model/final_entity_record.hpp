#pragma once

#include <string>

namespace catalog::db::model {

/*
  Stitched output row (table: final_entities), 1:1 with EntityRecord.
*/

struct FinalEntityRecord {
  std::string entity_id;
  std::string hash;
  std::string stitch_ticket;
};

} // namespace catalog::db::model
