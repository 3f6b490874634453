#pragma once
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "ragkb_core/errors.hpp"
#include "server.hpp"

// Forward declarations
namespace ragkb_core {
class IndexStore;
class QueryService;
}  // namespace ragkb_core

namespace ragkb_api {

class Routes {
 public:
  static constexpr const char *SERVICE_NAME = "ragkb";
  static constexpr const char *SERVICE_VERSION = "0.1.0";

  Routes(std::shared_ptr<ragkb_core::IndexStore> index_store,
         std::shared_ptr<ragkb_core::QueryService> query_service,
         std::string docs_dir,
         int default_top_k);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Route handlers, callable without a running server
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_rebuild(const crow::request &req);
  crow::response handle_query(const crow::request &req);
  crow::response handle_stats(const crow::request &req);

  // 400 for bad requests, 404 for a missing index, 502 when an upstream
  // provider failed, 500 for everything else
  static int status_for(ragkb_core::ErrorKind kind);

 private:
  std::shared_ptr<ragkb_core::IndexStore> index_store_;
  std::shared_ptr<ragkb_core::QueryService> query_service_;
  std::string docs_dir_;
  int default_top_k_;

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  // "k" from the query body, or default_top_k_ when absent
  // @throw InvalidRequestError for non-integers and values outside int
  int read_top_k(const nlohmann::json &json_body) const;
  crow::response create_error_response(const std::string &handler, const std::exception &e,
                                       const std::string &kind, int status_code);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
  static double round_seconds(double seconds);
};

}  // namespace ragkb_api
