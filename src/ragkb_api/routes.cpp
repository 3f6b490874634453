#include "ragkb_api/routes.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>

#include "ragkb_core/index/index_store.hpp"
#include "ragkb_core/services/query_service.hpp"

namespace ragkb_api {

Routes::Routes(std::shared_ptr<ragkb_core::IndexStore> index_store,
               std::shared_ptr<ragkb_core::QueryService> query_service,
               std::string docs_dir,
               int default_top_k)
    : index_store_(std::move(index_store)),
      query_service_(std::move(query_service)),
      docs_dir_(std::move(docs_dir)),
      default_top_k_(default_top_k) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/rebuild").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_rebuild(req);
  });

  CROW_ROUTE(app, "/query").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_query(req);
  });

  CROW_ROUTE(app, "/stats")
  ([this](const crow::request &req) { return handle_stats(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

int Routes::status_for(ragkb_core::ErrorKind kind) {
  switch (kind) {
    case ragkb_core::ErrorKind::InvalidRequest:
      return 400;
    case ragkb_core::ErrorKind::IndexNotFound:
      return 404;
    case ragkb_core::ErrorKind::Embedding:
    case ragkb_core::ErrorKind::Synthesis:
      return 502;
    default:
      return 500;
  }
}

crow::response Routes::handle_health_check(const crow::request & /*req*/) {
  nlohmann::json response;
  response["status"] = "ok";
  response["service"] = SERVICE_NAME;
  response["version"] = SERVICE_VERSION;
  response["index_loaded"] = index_store_->is_loaded();
  return create_json_response(response);
}

crow::response Routes::handle_rebuild(const crow::request &req) {
  try {
    std::string docs_dir = docs_dir_;
    if (!req.body.empty()) {
      auto json_body = parse_json_body(req.body);
      docs_dir = json_body.value("docs_dir", docs_dir_);
    }
    std::cout << "Rebuilding index from " << docs_dir << std::endl;

    auto started = std::chrono::steady_clock::now();
    ragkb_core::BuildSummary summary = index_store_->build(docs_dir);
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;

    nlohmann::json response;
    response["status"] = "ok";
    response["entry_count"] = summary.entry_count;
    response["dimension"] = summary.dimension;
    response["document_count"] = summary.document_count;
    response["elapsed_time"] = round_seconds(elapsed.count());
    return create_json_response(response);
  } catch (const ragkb_core::RagkbError &e) {
    return create_error_response("handle_rebuild", e, ragkb_core::to_string(e.kind()),
                                 status_for(e.kind()));
  } catch (const nlohmann::json::exception &e) {
    return create_error_response("handle_rebuild", e, "invalid_request", 400);
  } catch (const std::exception &e) {
    return create_error_response("handle_rebuild", e, "internal", 500);
  }
}

int Routes::read_top_k(const nlohmann::json &json_body) const {
  if (!json_body.contains("k")) {
    return default_top_k_;
  }
  const auto &k_json = json_body["k"];
  if (!k_json.is_number_integer()) {
    throw ragkb_core::InvalidRequestError("k must be an integer");
  }
  // Values beyond int64 arrive as unsigned
  if (k_json.is_number_unsigned() &&
      k_json.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
    throw ragkb_core::InvalidRequestError("k is out of range: " + k_json.dump());
  }
  const int64_t k = k_json.get<int64_t>();
  if (k < std::numeric_limits<int>::min() || k > std::numeric_limits<int>::max()) {
    throw ragkb_core::InvalidRequestError("k is out of range: " + k_json.dump());
  }
  return static_cast<int>(k);
}

crow::response Routes::handle_query(const crow::request &req) {
  try {
    auto json_body = parse_json_body(req.body);
    if (!json_body.is_object()) {
      throw ragkb_core::InvalidRequestError("Request body must be a JSON object");
    }
    std::string query = json_body.value("query", "");
    int k = read_top_k(json_body);
    bool synthesize = json_body.value("synthesize", false);

    std::cout << "Query: " << query << " with k: " << k << std::endl;

    auto started = std::chrono::steady_clock::now();
    ragkb_core::QueryResult result = query_service_->query(query, k);

    nlohmann::json results_json = nlohmann::json::array();
    for (const auto &hit : result.results) {
      nlohmann::json hit_json;
      hit_json["score"] = hit.score;
      hit_json["source"] = hit.source;
      hit_json["chunk_index"] = hit.chunk_index;
      hit_json["text"] = hit.text;
      results_json.push_back(hit_json);
    }

    nlohmann::json response;
    response["status"] = "ok";
    response["query"] = result.query;
    response["detected_language"] = result.detected_language;
    response["results"] = results_json;
    if (synthesize) {
      response["answer"] = query_service_->synthesize(result);
    }
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
    response["elapsed_time"] = round_seconds(elapsed.count());
    return create_json_response(response);
  } catch (const ragkb_core::RagkbError &e) {
    return create_error_response("handle_query", e, ragkb_core::to_string(e.kind()),
                                 status_for(e.kind()));
  } catch (const nlohmann::json::exception &e) {
    return create_error_response("handle_query", e, "invalid_request", 400);
  } catch (const std::exception &e) {
    return create_error_response("handle_query", e, "internal", 500);
  }
}

crow::response Routes::handle_stats(const crow::request & /*req*/) {
  try {
    std::shared_ptr<const ragkb_core::IndexSnapshot> snapshot = index_store_->snapshot();

    nlohmann::json documents_json = nlohmann::json::array();
    for (const auto &document : snapshot->documents()) {
      nlohmann::json document_json;
      document_json["source"] = document.source;
      document_json["file_type"] = ragkb_core::to_string(document.file_type);
      document_json["chunk_count"] = document.chunk_count;
      document_json["content_hash"] = document.content_hash;
      documents_json.push_back(document_json);
    }

    nlohmann::json response;
    response["status"] = "ok";
    response["entry_count"] = snapshot->size();
    response["dimension"] = snapshot->dimension();
    response["embedding_model"] = snapshot->embedding_model();
    response["built_at"] = snapshot->built_at();
    response["documents"] = documents_json;
    return create_json_response(response);
  } catch (const ragkb_core::RagkbError &e) {
    return create_error_response("handle_stats", e, ragkb_core::to_string(e.kind()),
                                 status_for(e.kind()));
  } catch (const std::exception &e) {
    return create_error_response("handle_stats", e, "internal", 500);
  }
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

crow::response Routes::create_error_response(const std::string &handler, const std::exception &e,
                                             const std::string &kind, int status_code) {
  std::cerr << "Exception in " << handler << ": " << e.what() << std::endl;
  nlohmann::json response;
  response["status"] = "error";
  response["kind"] = kind;
  response["message"] = e.what();
  return create_json_response(response, status_code);
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

double Routes::round_seconds(double seconds) {
  return std::round(seconds * 100.0) / 100.0;
}

}  // namespace ragkb_api
