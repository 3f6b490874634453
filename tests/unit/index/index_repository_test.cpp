#include <gtest/gtest.h>
#include <sqlite_modern_cpp.h>

#include "ragkb_core/errors.hpp"
#include "ragkb_core/index/index_repository.hpp"
#include "../../common/utilities_test.hpp"

namespace ragkb_core {

class IndexRepositoryTest : public ragkb_tests::CorpusTestBase {
 protected:
  void SetUp() override {
    CorpusTestBase::SetUp();
    repository_ = std::make_unique<IndexRepository>(index_path_);
    snapshot_ = ragkb_tests::TestUtilities::create_test_snapshot(
        {{1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}, {1.0f, 1.0f, 0.0f}, {0.0f, 0.0f, 1.0f}});
  }

  // Runs one statement against the saved container
  void tamper(const std::string &sql) {
    sqlite::database db(index_path_.string());
    db << sql;
  }

  std::unique_ptr<IndexRepository> repository_;
  std::shared_ptr<const IndexSnapshot> snapshot_;
};

TEST_F(IndexRepositoryTest, LoadWithoutSaveThrowsIndexNotFound) {
  EXPECT_FALSE(repository_->exists());
  EXPECT_THROW(repository_->load(), IndexNotFoundError);
}

TEST_F(IndexRepositoryTest, SaveCreatesParentDirectoriesAndNoTempFile) {
  repository_->save(*snapshot_);

  EXPECT_TRUE(repository_->exists());
  std::filesystem::path temp_path = index_path_;
  temp_path += ".tmp";
  EXPECT_FALSE(std::filesystem::exists(temp_path));
}

TEST_F(IndexRepositoryTest, RoundTripPreservesEverything) {
  repository_->save(*snapshot_);
  auto loaded = repository_->load();

  EXPECT_EQ(loaded->size(), snapshot_->size());
  EXPECT_EQ(loaded->dimension(), snapshot_->dimension());
  EXPECT_EQ(loaded->chunks(), snapshot_->chunks());
  EXPECT_EQ(loaded->embedding_model(), "test-model");
  EXPECT_EQ(loaded->built_at(), "2024-01-01 00:00:00");
  ASSERT_EQ(loaded->documents().size(), 1u);
  EXPECT_EQ(loaded->documents()[0].source, "doc.txt");
  EXPECT_EQ(loaded->documents()[0].file_type, FileType::Text);
  EXPECT_EQ(loaded->documents()[0].chunk_count, 4u);

  std::vector<float> query = {1.0f, 0.0f, 0.0f};
  auto before = snapshot_->search(query, 3);
  auto after = loaded->search(query, 3);
  ASSERT_EQ(before.size(), after.size());
  for (size_t i = 0; i < before.size(); ++i) {
    EXPECT_EQ(before[i].position, after[i].position);
    EXPECT_FLOAT_EQ(before[i].score, after[i].score);
  }
}

TEST_F(IndexRepositoryTest, SaveReplacesPreviousContainer) {
  repository_->save(*snapshot_);
  auto smaller = ragkb_tests::TestUtilities::create_test_snapshot({{1.0f, 2.0f}});
  repository_->save(*smaller);

  auto loaded = repository_->load();
  EXPECT_EQ(loaded->size(), 1u);
  EXPECT_EQ(loaded->dimension(), 2u);
}

TEST_F(IndexRepositoryTest, MissingChunkRowIsAnIntegrityError) {
  repository_->save(*snapshot_);
  tamper("DELETE FROM chunks WHERE position = 3;");
  EXPECT_THROW(repository_->load(), IndexIntegrityError);
}

TEST_F(IndexRepositoryTest, GapInPositionsIsAnIntegrityError) {
  repository_->save(*snapshot_);
  tamper("UPDATE chunks SET position = 10 WHERE position = 1;");
  EXPECT_THROW(repository_->load(), IndexIntegrityError);
}

TEST_F(IndexRepositoryTest, WrongRecordedCountIsAnIntegrityError) {
  repository_->save(*snapshot_);
  tamper("UPDATE index_info SET entry_count = 7 WHERE id = 1;");
  EXPECT_THROW(repository_->load(), IndexIntegrityError);
}

TEST_F(IndexRepositoryTest, MissingVectorCollectionIsIndexNotFound) {
  repository_->save(*snapshot_);
  tamper("DELETE FROM index_info;");
  EXPECT_THROW(repository_->load(), IndexNotFoundError);
}

TEST_F(IndexRepositoryTest, MissingChunkMetadataIsIndexNotFound) {
  repository_->save(*snapshot_);
  tamper("DROP TABLE chunks;");
  EXPECT_THROW(repository_->load(), IndexNotFoundError);
}

TEST_F(IndexRepositoryTest, CorruptVectorBlobIsAnIntegrityError) {
  repository_->save(*snapshot_);
  tamper("UPDATE index_info SET vector_index = X'00010203' WHERE id = 1;");
  EXPECT_THROW(repository_->load(), IndexIntegrityError);
}

TEST_F(IndexRepositoryTest, FileThatIsNotAContainerIsAStorageError) {
  ragkb_tests::TestUtilities::write_file(index_path_, std::string(4096, 'x'));
  EXPECT_THROW(repository_->load(), StorageError);
}

}  // namespace ragkb_core
