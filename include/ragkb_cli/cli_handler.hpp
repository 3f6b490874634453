#pragma once

#include <curl/curl.h>

#include <iostream>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace ragkb_cli
{

  enum class Command
  {
    Rebuild,
    Query,
    Info,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string docs_dir;  // empty means the server's configured folder
    std::string query;
    int top_k = 3;
    bool answer = false;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  // Passages are cut to this many characters in the query report
  constexpr size_t REPORT_TEXT_CHARS = 400;

  class CliHandler
  {
  public:
    explicit CliHandler(const std::string &api_base_url, std::ostream &out = std::cout);
    ~CliHandler();

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Allow move constructor and assignment
    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Parse command line arguments
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command
    void execute_command(const CliOptions &options);

    std::string get_api_base_url() const;

    // Report printers, fed with the server's JSON replies
    static void print_rebuild_report(const nlohmann::json &response, std::ostream &out);
    static void print_query_report(const nlohmann::json &response, std::ostream &out);
    static void print_info_report(const nlohmann::json &response, std::ostream &out);
    static void print_help(std::ostream &out);

    // "127.0.0.1:5000" -> "http://127.0.0.1:5000"
    static std::string normalize_base_url(const std::string &api_base_url);

    // Message of a {status: "error", message} reply, or a generic one
    static std::string error_message_from(const std::string &body, long http_code);

  private:
    std::string api_base_url_;
    std::ostream *out_;
    CURL *curl_handle_;

    // Command handlers
    void handle_rebuild_command(const CliOptions &options);
    void handle_query_command(const CliOptions &options);
    void handle_info_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json perform_request(const std::string &endpoint);

    // Helper methods
    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    std::string build_url(const std::string &endpoint) const;
  };

}
