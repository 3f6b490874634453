#pragma once

#include <sqlite_modern_cpp.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "ragkb_core/index/index_snapshot.hpp"

namespace ragkb_core {

/**
 * @class IndexRepository
 * @brief Persists an IndexSnapshot as a single SQLite container file.
 *
 * The container holds the serialized vector collection, the chunk metadata
 * and the per-document records. Saving writes a sibling "<path>.tmp" file and
 * renames it over the previous container, so readers see either the old
 * index or the new one, never a mix.
 */
class IndexRepository {
 public:
  static constexpr int FORMAT_VERSION = 1;

  explicit IndexRepository(std::filesystem::path index_path);

  const std::filesystem::path &path() const {
    return index_path_;
  }

  bool exists() const;

  /**
   * @throw StorageError if the container cannot be written or renamed.
   */
  void save(const IndexSnapshot &snapshot) const;

  /**
   * @throw IndexNotFoundError when the container, its vector collection or its
   *        chunk metadata is missing.
   * @throw IndexIntegrityError when the stored parts disagree with each other.
   * @throw StorageError for any other SQLite failure.
   */
  std::shared_ptr<const IndexSnapshot> load() const;

  static std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);

 private:
  static void create_schema(sqlite::database &db);
  static bool table_exists(sqlite::database &db, const std::string &table);

  std::filesystem::path index_path_;
};

}  // namespace ragkb_core
