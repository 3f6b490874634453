#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "ragkb_core/index/index_snapshot.hpp"

namespace ragkb_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Fresh empty directory under the system temp dir
  static std::filesystem::path create_temp_dir(const std::string &prefix = "ragkb_test");
  static void cleanup_temp_dir(const std::filesystem::path &dir);

  static void write_file(const std::filesystem::path &path, const std::string &contents);

  // "w0 w1 ... w{count-1}"
  static std::string numbered_words(size_t count, const std::string &prefix = "w");

  // Snapshot holding one chunk per vector, named doc.txt / chunk i
  static std::shared_ptr<const ragkb_core::IndexSnapshot> create_test_snapshot(
      const std::vector<std::vector<float>> &vectors);
};

/**
 * Base fixture owning a temp workspace with a docs/ folder and an index path.
 */
class CorpusTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    workspace_ = TestUtilities::create_temp_dir();
    docs_dir_ = workspace_ / "docs";
    std::filesystem::create_directories(docs_dir_);
    index_path_ = workspace_ / "data" / "index.db";
  }

  void TearDown() override {
    TestUtilities::cleanup_temp_dir(workspace_);
  }

  void add_document(const std::string &name, const std::string &contents) {
    TestUtilities::write_file(docs_dir_ / name, contents);
  }

  std::filesystem::path workspace_;
  std::filesystem::path docs_dir_;
  std::filesystem::path index_path_;
};

}  // namespace ragkb_tests
