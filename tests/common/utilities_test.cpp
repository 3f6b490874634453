#include "utilities_test.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <stdexcept>

#include "ragkb_core/index/faiss_flat_index.hpp"
#include "ragkb_core/index/vector_math.hpp"

namespace ragkb_tests {

std::filesystem::path TestUtilities::create_temp_dir(const std::string &prefix) {
  static std::atomic<int> counter{0};
  auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  std::filesystem::path dir = std::filesystem::temp_directory_path() /
                              (prefix + "_" + std::to_string(stamp) + "_" +
                               std::to_string(counter++));
  std::filesystem::create_directories(dir);
  return dir;
}

void TestUtilities::cleanup_temp_dir(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

void TestUtilities::write_file(const std::filesystem::path &path, const std::string &contents) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    throw std::runtime_error("Failed to write test file " + path.string());
  }
  out << contents;
}

std::string TestUtilities::numbered_words(size_t count, const std::string &prefix) {
  std::string text;
  for (size_t i = 0; i < count; ++i) {
    if (i > 0) {
      text += ' ';
    }
    text += prefix + std::to_string(i);
  }
  return text;
}

std::shared_ptr<const ragkb_core::IndexSnapshot> TestUtilities::create_test_snapshot(
    const std::vector<std::vector<float>> &vectors) {
  std::vector<std::vector<float>> normalized = vectors;
  for (auto &vector : normalized) {
    ragkb_core::normalize_l2(vector);
  }
  auto index = std::make_unique<ragkb_core::FaissFlatIndex>(normalized.front().size());
  index->add(normalized);

  std::vector<ragkb_core::Chunk> chunks;
  for (size_t i = 0; i < normalized.size(); ++i) {
    chunks.push_back({"doc.txt", static_cast<int>(i), "chunk " + std::to_string(i)});
  }
  std::vector<ragkb_core::DocumentRecord> documents = {
      {"doc.txt", "hash", ragkb_core::FileType::Text, normalized.size()}};

  return std::make_shared<const ragkb_core::IndexSnapshot>(
      std::move(index), std::move(chunks), std::move(documents), "test-model",
      "2024-01-01 00:00:00");
}

}  // namespace ragkb_tests
