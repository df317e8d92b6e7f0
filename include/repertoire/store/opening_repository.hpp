#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "repertoire/store/database.hpp"
#include "repertoire/study/study_types.hpp"

namespace repertoire::store
{
  class OpeningRepository
  {
  public:
    explicit OpeningRepository(Database &db) : m_db(db) {}

    // Stores a named line. Throws Error for an empty name or line and
    // StoreError when the name is taken.
    study::OpeningLine add(const std::string &name, const study::TokenSequence &tokens);

    std::optional<study::OpeningLine> findById(study::OpeningId id);
    std::optional<study::OpeningLine> findByName(const std::string &name);

    // Ordered by name. An empty prefix matches everything; limit 0 is unlimited.
    std::vector<study::OpeningLine> listByPrefix(const std::string &prefix, std::size_t limit = 0);
    std::vector<study::OpeningLine> listAll() { return listByPrefix({}); }

    std::size_t count();

  private:
    std::vector<study::OpeningLine> query(const std::string &pattern, std::size_t limit);

    Database &m_db;
  };

} // namespace repertoire::store
