#pragma once

#include <cstdint>
#include <string>

namespace shortener::db::model {

/*
  Persistent link row.

  - id is assigned by the store on insert
  - short_code carries the uniqueness constraint
*/

struct LinkRecord {
  int64_t     id = 0;
  std::string original_url;
  std::string short_code;
  uint64_t    created_at_ms = 0;
};

} // namespace shortener::db::model
