#include <gtest/gtest.h>

#include <memory>

#include <nlohmann/json.hpp>

#include "ragkb_api/routes.hpp"
#include "ragkb_core/index/index_store.hpp"
#include "ragkb_core/lang/stopword_language_detector.hpp"
#include "ragkb_core/llm/answer_synthesizer.hpp"
#include "ragkb_core/services/query_service.hpp"
#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

namespace ragkb_api {

class RoutesTest : public ragkb_tests::CorpusTestBase {
 protected:
  void SetUp() override {
    CorpusTestBase::SetUp();
    auto embedder = std::make_shared<ragkb_tests::KeywordEmbeddingProvider>(
        std::vector<std::string>{"refund", "shipping", "warranty"});
    index_store_ = std::make_shared<ragkb_core::IndexStore>(
        embedder, std::make_shared<ragkb_core::IndexRepository>(index_path_));
    auto query_service = std::make_shared<ragkb_core::QueryService>(
        index_store_, embedder, std::make_shared<ragkb_core::StopwordLanguageDetector>(),
        std::make_shared<ragkb_core::CitationOnlySynthesizer>());
    routes_ = std::make_unique<Routes>(index_store_, query_service, docs_dir_.string(), 2);
  }

  void add_policy_corpus() {
    add_document("refunds.txt", "refund refund policy");
    add_document("shipping.md", "shipping takes five days");
    add_document("warranty.txt", "warranty covers one year");
  }

  static crow::request make_request(const std::string &body) {
    crow::request req;
    req.body = body;
    return req;
  }

  static nlohmann::json body_of(const crow::response &resp) {
    return nlohmann::json::parse(resp.body);
  }

  std::shared_ptr<ragkb_core::IndexStore> index_store_;
  std::unique_ptr<Routes> routes_;
};

TEST_F(RoutesTest, HealthCheckReportsServiceAndIndexState) {
  crow::response resp = routes_->handle_health_check(make_request(""));
  ASSERT_EQ(resp.code, 200);

  auto body = body_of(resp);
  EXPECT_EQ(body["status"], "ok");
  EXPECT_EQ(body["service"], "ragkb");
  EXPECT_EQ(body["index_loaded"], false);
}

TEST_F(RoutesTest, QueryBeforeBuildIsNotFound) {
  crow::response resp = routes_->handle_query(make_request(R"({"query": "refund"})"));
  EXPECT_EQ(resp.code, 404);

  auto body = body_of(resp);
  EXPECT_EQ(body["status"], "error");
  EXPECT_EQ(body["kind"], "index_not_found");
}

TEST_F(RoutesTest, RebuildThenQueryReturnsRankedResults) {
  add_policy_corpus();

  crow::response rebuilt = routes_->handle_rebuild(make_request(""));
  ASSERT_EQ(rebuilt.code, 200);
  auto rebuild_body = body_of(rebuilt);
  EXPECT_EQ(rebuild_body["entry_count"], 3);
  EXPECT_EQ(rebuild_body["dimension"], 4);
  EXPECT_EQ(rebuild_body["document_count"], 3);
  EXPECT_TRUE(rebuild_body["elapsed_time"].is_number());

  crow::response resp =
      routes_->handle_query(make_request(R"({"query": "what is the refund policy"})"));
  ASSERT_EQ(resp.code, 200);
  EXPECT_EQ(resp.get_header_value("Content-Type"), "application/json");

  auto body = body_of(resp);
  EXPECT_EQ(body["query"], "what is the refund policy");
  EXPECT_EQ(body["detected_language"], "en");
  ASSERT_EQ(body["results"].size(), 2u);
  EXPECT_EQ(body["results"][0]["source"], "refunds.txt");
  EXPECT_EQ(body["results"][0]["chunk_index"], 0);
  EXPECT_EQ(body["results"][0]["text"], "refund refund policy");
  EXPECT_GE(body["results"][0]["score"].get<double>(), body["results"][1]["score"].get<double>());
  EXPECT_FALSE(body.contains("answer"));
}

TEST_F(RoutesTest, QueryHonoursExplicitKAndSynthesis) {
  add_policy_corpus();
  ASSERT_EQ(routes_->handle_rebuild(make_request("")).code, 200);

  crow::response resp = routes_->handle_query(
      make_request(R"({"query": "shipping", "k": 10, "synthesize": true})"));
  ASSERT_EQ(resp.code, 200);

  auto body = body_of(resp);
  EXPECT_EQ(body["results"].size(), 3u);
  EXPECT_EQ(body["results"][0]["source"], "shipping.md");
  EXPECT_EQ(body["answer"], "LLM synthesis not configured; returning cited passages instead.");
}

TEST_F(RoutesTest, MissingQueryIsBadRequest) {
  add_policy_corpus();
  ASSERT_EQ(routes_->handle_rebuild(make_request("")).code, 200);

  crow::response resp = routes_->handle_query(make_request(R"({"k": 3})"));
  EXPECT_EQ(resp.code, 400);
  EXPECT_EQ(body_of(resp)["kind"], "invalid_request");

  EXPECT_EQ(routes_->handle_query(make_request(R"({"query": "refund", "k": 0})")).code, 400);
  EXPECT_EQ(routes_->handle_query(make_request(R"(["refund"])")).code, 400);
}

TEST_F(RoutesTest, OutOfRangeKIsBadRequestNotTruncated) {
  add_policy_corpus();
  ASSERT_EQ(routes_->handle_rebuild(make_request("")).code, 200);

  for (const char *body : {R"({"query": "refund", "k": 4294967299})",
                           R"({"query": "refund", "k": 4294967296})",
                           R"({"query": "refund", "k": -4294967296})",
                           R"({"query": "refund", "k": 18446744073709551615})",
                           R"({"query": "refund", "k": 2.5})",
                           R"({"query": "refund", "k": "3"})"}) {
    crow::response resp = routes_->handle_query(make_request(body));
    EXPECT_EQ(resp.code, 400) << body;
    EXPECT_EQ(body_of(resp)["kind"], "invalid_request") << body;
  }

  crow::response resp = routes_->handle_query(make_request(R"({"query": "refund", "k": 1})"));
  ASSERT_EQ(resp.code, 200);
  EXPECT_EQ(body_of(resp)["results"].size(), 1u);
}

TEST_F(RoutesTest, MalformedJsonIsBadRequest) {
  crow::response resp = routes_->handle_query(make_request("{ not json"));
  EXPECT_EQ(resp.code, 400);
  EXPECT_EQ(body_of(resp)["kind"], "invalid_request");

  EXPECT_EQ(routes_->handle_rebuild(make_request("{ not json")).code, 400);
}

TEST_F(RoutesTest, RebuildOfMissingDirectoryFails) {
  nlohmann::json request = {{"docs_dir", (workspace_ / "missing").string()}};
  crow::response resp = routes_->handle_rebuild(make_request(request.dump()));
  EXPECT_EQ(resp.code, 500);
  EXPECT_EQ(body_of(resp)["kind"], "corpus_not_found");
}

TEST_F(RoutesTest, RebuildOfEmptyCorpusFails) {
  crow::response resp = routes_->handle_rebuild(make_request(""));
  EXPECT_EQ(resp.code, 500);
  EXPECT_EQ(body_of(resp)["kind"], "empty_corpus");
}

TEST_F(RoutesTest, StatsDescribeTheBuiltIndex) {
  EXPECT_EQ(routes_->handle_stats(make_request("")).code, 404);

  add_policy_corpus();
  ASSERT_EQ(routes_->handle_rebuild(make_request("")).code, 200);

  crow::response resp = routes_->handle_stats(make_request(""));
  ASSERT_EQ(resp.code, 200);
  auto body = body_of(resp);
  EXPECT_EQ(body["entry_count"], 3);
  EXPECT_EQ(body["embedding_model"], "keyword-test");
  ASSERT_EQ(body["documents"].size(), 3u);
  EXPECT_EQ(body["documents"][1]["source"], "shipping.md");
  EXPECT_EQ(body["documents"][1]["file_type"], "Markdown");
  EXPECT_EQ(body["documents"][1]["chunk_count"], 1);
  EXPECT_EQ(body["documents"][1]["content_hash"].get<std::string>().size(), 64u);

  EXPECT_EQ(body_of(routes_->handle_health_check(make_request("")))["index_loaded"], true);
}

TEST(RoutesStatusTest, MapsErrorKindsToHttpStatus) {
  using ragkb_core::ErrorKind;
  EXPECT_EQ(Routes::status_for(ErrorKind::InvalidRequest), 400);
  EXPECT_EQ(Routes::status_for(ErrorKind::IndexNotFound), 404);
  EXPECT_EQ(Routes::status_for(ErrorKind::Embedding), 502);
  EXPECT_EQ(Routes::status_for(ErrorKind::Synthesis), 502);
  EXPECT_EQ(Routes::status_for(ErrorKind::IndexIntegrity), 500);
  EXPECT_EQ(Routes::status_for(ErrorKind::CorpusNotFound), 500);
  EXPECT_EQ(Routes::status_for(ErrorKind::Storage), 500);
}

}  // namespace ragkb_api
