#pragma once

#include "repertoire/store/database.hpp"

namespace repertoire::store
{
  // Creates every table and index that does not exist yet. Safe to repeat.
  void initSchema(Database &db);

} // namespace repertoire::store
