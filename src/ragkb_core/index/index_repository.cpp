#include "ragkb_core/index/index_repository.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <vector>

#include "ragkb_core/db/sqlite_error_utils.hpp"
#include "ragkb_core/db/transaction.hpp"
#include "ragkb_core/errors.hpp"
#include "ragkb_core/index/faiss_flat_index.hpp"

namespace ragkb_core {

namespace fs = std::filesystem;

IndexRepository::IndexRepository(fs::path index_path) : index_path_(std::move(index_path)) {}

std::string IndexRepository::time_point_to_string(const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

bool IndexRepository::exists() const {
  std::error_code ec;
  return fs::is_regular_file(index_path_, ec);
}

void IndexRepository::create_schema(sqlite::database &db) {
  db << R"(
    CREATE TABLE IF NOT EXISTS index_info (
      id INTEGER PRIMARY KEY CHECK (id = 1),
      format_version INTEGER NOT NULL,
      dimension INTEGER NOT NULL,
      entry_count INTEGER NOT NULL,
      embedding_model TEXT NOT NULL,
      built_at TEXT NOT NULL,
      vector_index BLOB NOT NULL
    );
  )";

  db << R"(
    CREATE TABLE IF NOT EXISTS chunks (
      position INTEGER PRIMARY KEY,
      source TEXT NOT NULL,
      chunk_index INTEGER NOT NULL,
      text TEXT NOT NULL
    );
  )";

  db << R"(
    CREATE TABLE IF NOT EXISTS documents (
      source TEXT PRIMARY KEY,
      content_hash TEXT NOT NULL,
      file_type TEXT NOT NULL,
      chunk_count INTEGER NOT NULL
    );
  )";
}

bool IndexRepository::table_exists(sqlite::database &db, const std::string &table) {
  int count = 0;
  db << "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name = ?;" << table >>
      count;
  return count > 0;
}

void IndexRepository::save(const IndexSnapshot &snapshot) const {
  fs::path temp_path = index_path_;
  temp_path += ".tmp";

  std::error_code ec;
  if (index_path_.has_parent_path()) {
    fs::create_directories(index_path_.parent_path(), ec);
    if (ec) {
      throw StorageError("Could not create index directory " +
                         index_path_.parent_path().string() + ": " + ec.message());
    }
  }
  // Leftover from an interrupted save
  fs::remove(temp_path, ec);

  std::vector<char> vector_blob = snapshot.vectors().serialize();

  try {
    sqlite::database db(temp_path.string());
    create_schema(db);

    Transaction tx(db, "save of " + index_path_.string());
    db << "INSERT INTO index_info (id, format_version, dimension, entry_count, embedding_model, "
          "built_at, vector_index) VALUES (1, ?, ?, ?, ?, ?, ?);"
       << FORMAT_VERSION << static_cast<int64_t>(snapshot.dimension())
       << static_cast<int64_t>(snapshot.size()) << snapshot.embedding_model()
       << snapshot.built_at() << vector_blob;

    const auto &chunks = snapshot.chunks();
    for (size_t position = 0; position < chunks.size(); ++position) {
      const Chunk &chunk = chunks[position];
      db << "INSERT INTO chunks (position, source, chunk_index, text) VALUES (?, ?, ?, ?);"
         << static_cast<int64_t>(position) << chunk.source << chunk.chunk_index << chunk.text;
    }

    for (const auto &document : snapshot.documents()) {
      db << "INSERT OR REPLACE INTO documents (source, content_hash, file_type, chunk_count) "
            "VALUES (?, ?, ?, ?);"
         << document.source << document.content_hash << to_string(document.file_type)
         << static_cast<int64_t>(document.chunk_count);
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    fs::remove(temp_path, ec);
    throw to_storage_error("save_index", e);
  }

  fs::rename(temp_path, index_path_, ec);
  if (ec) {
    std::error_code cleanup_ec;
    fs::remove(temp_path, cleanup_ec);
    throw StorageError("Could not move index into place at " + index_path_.string() + ": " +
                       ec.message());
  }
  std::cout << "Saved index with " << snapshot.size() << " entries to " << index_path_.string()
            << std::endl;
}

std::shared_ptr<const IndexSnapshot> IndexRepository::load() const {
  if (!exists()) {
    throw IndexNotFoundError("Index not found at " + index_path_.string() +
                             ". Run rebuild first.");
  }

  int format_version = 0;
  int64_t dimension = 0;
  int64_t entry_count = 0;
  std::string embedding_model;
  std::string built_at;
  std::vector<char> vector_blob;
  bool has_info = false;

  std::vector<Chunk> chunks;
  bool contiguous = true;
  std::vector<DocumentRecord> documents;

  try {
    sqlite::sqlite_config config;
    config.flags = sqlite::OpenFlags::READONLY;
    sqlite::database db(index_path_.string(), config);

    if (!table_exists(db, "index_info")) {
      throw IndexNotFoundError("Vector collection missing from " + index_path_.string() +
                               ". Run rebuild first.");
    }
    if (!table_exists(db, "chunks")) {
      throw IndexNotFoundError("Chunk metadata missing from " + index_path_.string() +
                               ". Run rebuild first.");
    }

    db << "SELECT format_version, dimension, entry_count, embedding_model, built_at, vector_index "
          "FROM index_info WHERE id = 1;" >>
        [&](int version, int64_t dim, int64_t count, std::string model, std::string built,
            std::vector<char> blob) {
          format_version = version;
          dimension = dim;
          entry_count = count;
          embedding_model = std::move(model);
          built_at = std::move(built);
          vector_blob = std::move(blob);
          has_info = true;
        };

    int64_t expected_position = 0;
    db << "SELECT position, source, chunk_index, text FROM chunks ORDER BY position;" >>
        [&](int64_t position, std::string source, int chunk_index, std::string text) {
          if (position != expected_position) {
            contiguous = false;
          }
          ++expected_position;
          chunks.push_back(Chunk{std::move(source), chunk_index, std::move(text)});
        };

    if (table_exists(db, "documents")) {
      db << "SELECT source, content_hash, file_type, chunk_count FROM documents ORDER BY source;" >>
          [&](std::string source, std::string content_hash, std::string file_type,
              int64_t chunk_count) {
            documents.push_back(DocumentRecord{std::move(source), std::move(content_hash),
                                               file_type_from_string(file_type),
                                               static_cast<size_t>(chunk_count)});
          };
    }
  } catch (const sqlite::sqlite_exception &e) {
    throw to_storage_error("load_index", e);
  }

  if (!has_info) {
    throw IndexNotFoundError("Vector collection missing from " + index_path_.string() +
                             ". Run rebuild first.");
  }
  if (chunks.empty()) {
    throw IndexNotFoundError("Chunk metadata missing from " + index_path_.string() +
                             ". Run rebuild first.");
  }
  if (format_version != FORMAT_VERSION) {
    throw IndexIntegrityError("Unsupported index format version " +
                              std::to_string(format_version));
  }
  if (!contiguous) {
    throw IndexIntegrityError("Chunk positions in " + index_path_.string() +
                              " are not contiguous");
  }

  std::unique_ptr<FaissFlatIndex> vectors;
  try {
    vectors = FaissFlatIndex::deserialize(vector_blob);
  } catch (const VectorIndexError &e) {
    throw IndexIntegrityError("Stored vector collection is unreadable: " + std::string(e.what()));
  }

  if (static_cast<int64_t>(vectors->size()) != entry_count ||
      vectors->size() != chunks.size()) {
    throw IndexIntegrityError("Index holds " + std::to_string(vectors->size()) +
                              " vectors but " + std::to_string(chunks.size()) +
                              " chunk records (expected " + std::to_string(entry_count) + ")");
  }
  if (static_cast<int64_t>(vectors->dimension()) != dimension) {
    throw IndexIntegrityError("Stored vector dimension " + std::to_string(vectors->dimension()) +
                              " does not match recorded dimension " + std::to_string(dimension));
  }

  return std::make_shared<const IndexSnapshot>(std::move(vectors), std::move(chunks),
                                               std::move(documents), std::move(embedding_model),
                                               std::move(built_at));
}

}  // namespace ragkb_core
