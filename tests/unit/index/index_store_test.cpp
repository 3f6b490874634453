#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "ragkb_core/errors.hpp"
#include "ragkb_core/index/index_store.hpp"
#include "ragkb_core/index/vector_math.hpp"
#include "ragkb_core/text/utf8_text.hpp"
#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

namespace ragkb_core {

using ::testing::_;
using ::testing::Return;

class IndexStoreTest : public ragkb_tests::CorpusTestBase {
 protected:
  void SetUp() override {
    CorpusTestBase::SetUp();
    embedder_ = std::make_shared<ragkb_tests::KeywordEmbeddingProvider>(
        std::vector<std::string>{"apple", "banana", "cherry", "durian", "elderberry"});
    repository_ = std::make_shared<IndexRepository>(index_path_);
  }

  std::shared_ptr<IndexStore> make_store(IndexStoreOptions options = {}) {
    return std::make_shared<IndexStore>(embedder_, repository_, options);
  }

  void add_fruit_corpus() {
    add_document("a.txt", "apple apple banana");
    add_document("b.md", "cherry durian");
    add_document("c.txt", "elderberry banana cherry");
    add_document("ignored.pdf", "apple apple apple");
  }

  std::shared_ptr<ragkb_tests::KeywordEmbeddingProvider> embedder_;
  std::shared_ptr<IndexRepository> repository_;
};

TEST_F(IndexStoreTest, QueryBeforeBuildIsIndexNotFound) {
  auto store = make_store();
  EXPECT_FALSE(store->is_loaded());
  EXPECT_THROW(store->snapshot(), IndexNotFoundError);
  EXPECT_THROW(store->size(), IndexNotFoundError);
}

TEST_F(IndexStoreTest, HelloWorldBuildsExactlyOneEntry) {
  add_document("hello.txt", "hello world");
  auto store = make_store();

  BuildSummary summary = store->build(docs_dir_);

  EXPECT_EQ(summary.entry_count, 1u);
  EXPECT_EQ(summary.dimension, embedder_->dimension());
  EXPECT_EQ(summary.document_count, 1u);
  auto snapshot = store->snapshot();
  ASSERT_EQ(snapshot->chunks().size(), 1u);
  EXPECT_EQ(snapshot->chunks()[0].source, "hello.txt");
  EXPECT_EQ(snapshot->chunks()[0].chunk_index, 0);
  EXPECT_EQ(snapshot->chunks()[0].text, "hello world");
}

TEST_F(IndexStoreTest, BuildOrdersEntriesByDocumentThenChunk) {
  add_fruit_corpus();
  auto store = make_store();
  store->build(docs_dir_);

  auto snapshot = store->snapshot();
  ASSERT_EQ(snapshot->size(), 3u);
  EXPECT_EQ(snapshot->chunks()[0].source, "a.txt");
  EXPECT_EQ(snapshot->chunks()[1].source, "b.md");
  EXPECT_EQ(snapshot->chunks()[2].source, "c.txt");

  ASSERT_EQ(snapshot->documents().size(), 3u);
  EXPECT_EQ(snapshot->documents()[1].file_type, FileType::Markdown);
  EXPECT_EQ(snapshot->documents()[1].chunk_count, 1u);
  EXPECT_EQ(snapshot->embedding_model(), "keyword-test");
}

TEST_F(IndexStoreTest, PersistedIndexLoadsIntoAFreshStore) {
  add_fruit_corpus();
  auto builder = make_store();
  builder->build(docs_dir_);

  auto reader = make_store();
  reader->load();
  EXPECT_TRUE(reader->is_loaded());
  EXPECT_EQ(reader->size(), builder->size());
  EXPECT_EQ(reader->dimension(), builder->dimension());

  std::vector<float> query = embedder_->embed("banana cherry");
  normalize_l2(query);
  auto expected = builder->search(query, 3);
  auto actual = reader->search(query, 3);
  ASSERT_EQ(expected.size(), actual.size());
  for (size_t i = 0; i < expected.size(); ++i) {
    EXPECT_EQ(expected[i].position, actual[i].position);
    EXPECT_FLOAT_EQ(expected[i].score, actual[i].score);
  }
}

TEST_F(IndexStoreTest, FirstQueryLoadsFromDisk) {
  add_fruit_corpus();
  make_store()->build(docs_dir_);

  auto store = make_store();
  EXPECT_FALSE(store->is_loaded());
  EXPECT_EQ(store->size(), 3u);
  EXPECT_TRUE(store->is_loaded());
}

TEST_F(IndexStoreTest, RebuildOfUnchangedCorpusIsIdempotent) {
  add_fruit_corpus();
  auto store = make_store();

  BuildSummary first = store->build(docs_dir_);
  auto first_chunks = store->snapshot()->chunks();
  BuildSummary second = store->build(docs_dir_);

  EXPECT_EQ(first.entry_count, second.entry_count);
  EXPECT_EQ(first.dimension, second.dimension);
  EXPECT_EQ(first_chunks, store->snapshot()->chunks());
  EXPECT_EQ(repository_->load()->chunks(), first_chunks);
}

TEST_F(IndexStoreTest, StoredVectorsHaveUnitNorm) {
  add_fruit_corpus();
  auto store = make_store();
  store->build(docs_dir_);

  // A unit query scores exactly 1 against its own entry only if that entry is unit length
  auto snapshot = store->snapshot();
  for (size_t i = 0; i < snapshot->size(); ++i) {
    std::vector<float> query = embedder_->embed(snapshot->chunks()[i].text);
    normalize_l2(query);
    auto hits = snapshot->search(query, 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].position, static_cast<int64_t>(i));
    EXPECT_NEAR(hits[0].score, 1.0f, 1e-5);
  }
}

TEST_F(IndexStoreTest, SearchScoresAreNonIncreasing) {
  add_fruit_corpus();
  add_document("d.txt", "apple cherry elderberry");
  auto store = make_store();
  store->build(docs_dir_);

  std::vector<float> query = embedder_->embed("apple cherry");
  normalize_l2(query);
  auto hits = store->search(query, 4);
  ASSERT_EQ(hits.size(), 4u);
  for (size_t i = 1; i < hits.size(); ++i) {
    EXPECT_GE(hits[i - 1].score, hits[i].score);
  }
}

TEST_F(IndexStoreTest, MissingCorpusDirectoryFailsWithoutWritingAnIndex) {
  auto store = make_store();
  EXPECT_THROW(store->build(workspace_ / "no_such_docs"), CorpusNotFoundError);
  EXPECT_FALSE(repository_->exists());
}

TEST_F(IndexStoreTest, CorpusWithoutTextIsEmptyCorpus) {
  add_document("ignored.pdf", "apple");
  add_document("blank.txt", "   \n\t ");
  auto store = make_store();
  EXPECT_THROW(store->build(docs_dir_), EmptyCorpusError);
  EXPECT_FALSE(repository_->exists());
}

TEST_F(IndexStoreTest, FailedRebuildKeepsPreviousIndex) {
  add_fruit_corpus();
  auto store = make_store();
  store->build(docs_dir_);

  EXPECT_THROW(store->build(workspace_ / "no_such_docs"), CorpusNotFoundError);
  EXPECT_EQ(store->size(), 3u);
  EXPECT_EQ(repository_->load()->size(), 3u);
}

TEST_F(IndexStoreTest, StoredTextIsTruncatedButFullChunkIsEmbedded) {
  const std::string long_text = "abcdefghij klmnopqrst uvwxyz";
  add_document("long.txt", long_text);

  auto mock = std::make_shared<ragkb_tests::MockEmbeddingProvider>();
  EXPECT_CALL(*mock, embed(long_text)).WillOnce(Return(std::vector<float>{1.0f, 2.0f}));

  IndexStoreOptions options;
  options.max_stored_chars = 10;
  IndexStore store(mock, repository_, options);
  store.build(docs_dir_);

  EXPECT_EQ(store.snapshot()->chunks()[0].text, "abcdefghij");
}

TEST_F(IndexStoreTest, InconsistentEmbeddingDimensionsAreRejected) {
  add_document("a.txt", "first");
  add_document("b.txt", "second");

  auto mock = std::make_shared<ragkb_tests::MockEmbeddingProvider>();
  EXPECT_CALL(*mock, embed("first")).WillOnce(Return(std::vector<float>{1.0f, 0.0f, 0.0f}));
  EXPECT_CALL(*mock, embed("second")).WillOnce(Return(std::vector<float>{1.0f, 0.0f}));

  IndexStore store(mock, repository_);
  EXPECT_THROW(store.build(docs_dir_), DimensionMismatchError);
  EXPECT_FALSE(repository_->exists());
}

TEST_F(IndexStoreTest, ZeroEmbeddingFailsTheBuild) {
  add_document("a.txt", "first");
  auto mock = std::make_shared<ragkb_tests::MockEmbeddingProvider>();
  EXPECT_CALL(*mock, embed(_)).WillOnce(Return(std::vector<float>{0.0f, 0.0f}));

  IndexStore store(mock, repository_);
  EXPECT_THROW(store.build(docs_dir_), EmbeddingError);
}

TEST_F(IndexStoreTest, ParallelEmbeddingKeepsCorpusOrder) {
  for (int i = 0; i < 9; ++i) {
    add_document("doc" + std::to_string(i) + ".txt",
                 i % 2 == 0 ? "apple banana" : "cherry durian elderberry");
  }

  auto serial = make_store();
  serial->build(docs_dir_);
  auto serial_chunks = serial->snapshot()->chunks();

  IndexStoreOptions options;
  options.num_workers = 4;
  auto parallel = make_store(options);
  parallel->build(docs_dir_);

  EXPECT_EQ(parallel->snapshot()->chunks(), serial_chunks);
  std::vector<float> query = embedder_->embed("cherry");
  normalize_l2(query);
  auto serial_hits = serial->search(query, 9);
  auto parallel_hits = parallel->search(query, 9);
  ASSERT_EQ(serial_hits.size(), parallel_hits.size());
  for (size_t i = 0; i < serial_hits.size(); ++i) {
    EXPECT_FLOAT_EQ(serial_hits[i].score, parallel_hits[i].score);
  }
}

TEST_F(IndexStoreTest, ProviderFailureDuringParallelEmbeddingPropagates) {
  add_document("a.txt", "first");
  add_document("b.txt", "second");
  add_document("c.txt", "third");

  auto mock = std::make_shared<ragkb_tests::MockEmbeddingProvider>();
  ON_CALL(*mock, embed(_)).WillByDefault(Return(std::vector<float>{1.0f, 0.0f}));
  ON_CALL(*mock, embed("second")).WillByDefault(
      [](const std::string &) -> std::vector<float> { throw EmbeddingError("provider down"); });
  EXPECT_CALL(*mock, embed(_)).Times(3);

  IndexStoreOptions options;
  options.num_workers = 3;
  IndexStore store(mock, repository_, options);
  EXPECT_THROW(store.build(docs_dir_), EmbeddingError);
  EXPECT_FALSE(repository_->exists());
}

TEST_F(IndexStoreTest, PersistWithoutSnapshotIsIndexNotFound) {
  auto store = make_store();
  EXPECT_THROW(store->persist(), IndexNotFoundError);
}

TEST_F(IndexStoreTest, PersistRewritesTheContainer) {
  add_fruit_corpus();
  auto store = make_store();
  store->build(docs_dir_);
  std::filesystem::remove(index_path_);

  store->persist();
  EXPECT_EQ(repository_->load()->size(), 3u);
}

TEST_F(IndexStoreTest, InvalidChunkingPolicyIsAConfigurationError) {
  IndexStoreOptions options;
  options.chunk_size = 10;
  options.chunk_overlap = 10;
  EXPECT_THROW(make_store(options), ConfigurationError);
}

}  // namespace ragkb_core
