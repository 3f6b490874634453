#include "ragkb_cli/cli_handler.hpp"

#include <iomanip>
#include <memory>
#include <stdexcept>

#include "ragkb_core/text/utf8_text.hpp"

namespace ragkb_cli {

CliHandler::CliHandler(const std::string& api_base_url, std::ostream& out)
    : api_base_url_(normalize_base_url(api_base_url)), out_(&out), curl_handle_(nullptr) {
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

CliHandler::CliHandler(CliHandler&& other) noexcept
    : api_base_url_(std::move(other.api_base_url_))
    , out_(other.out_)
    , curl_handle_(other.curl_handle_) {
    other.curl_handle_ = nullptr;
}

CliHandler& CliHandler::operator=(CliHandler&& other) noexcept {
    if (this != &other) {
        if (curl_handle_) {
            curl_easy_cleanup(curl_handle_);
        }
        api_base_url_ = std::move(other.api_base_url_);
        out_ = other.out_;
        curl_handle_ = other.curl_handle_;
        other.curl_handle_ = nullptr;
    }
    return *this;
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::string CliHandler::normalize_base_url(const std::string& api_base_url) {
    std::string url = api_base_url;
    if (url.find("://") == std::string::npos) {
        url = "http://" + url;
    }
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    // Flags that take a value consume the next argument
    auto value_of = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw CliError("Missing value for " + flag);
        }
        return argv[++i];
    };

    if (command == "rebuild" || command == "r") {
        options.command = Command::Rebuild;
        for (int i = 2; i < argc; ++i) {
            std::string flag = argv[i];
            if (flag == "--docs" || flag == "-d") {
                options.docs_dir = value_of(i, flag);
            } else {
                throw CliError("Unknown option for rebuild: " + flag);
            }
        }
    } else if (command == "query" || command == "q") {
        options.command = Command::Query;
        for (int i = 2; i < argc; ++i) {
            std::string flag = argv[i];
            if (flag == "--query" || flag == "-q") {
                options.query = value_of(i, flag);
            } else if (flag == "--top-k" || flag == "-k") {
                std::string value = value_of(i, flag);
                try {
                    options.top_k = std::stoi(value);
                } catch (const std::logic_error&) {
                    throw CliError("--top-k expects a number, got '" + value + "'");
                }
                if (options.top_k <= 0) {
                    throw CliError("--top-k must be greater than 0");
                }
            } else if (flag == "--answer" || flag == "-a") {
                options.answer = true;
            } else {
                throw CliError("Unknown option for query: " + flag);
            }
        }
        if (options.query.empty()) {
            throw CliError("Query command requires a query. Usage: query --query <text>");
        }
    } else if (command == "info" || command == "i") {
        options.command = Command::Info;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command + ". Run 'ragkb_cli help' for usage.");
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Rebuild:
            handle_rebuild_command(options);
            break;
        case Command::Query:
            handle_query_command(options);
            break;
        case Command::Info:
            handle_info_command(options);
            break;
        case Command::Help:
            print_help(*out_);
            break;
    }
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

void CliHandler::handle_rebuild_command(const CliOptions& options) {
    nlohmann::json request = nlohmann::json::object();
    if (!options.docs_dir.empty()) {
        request["docs_dir"] = options.docs_dir;
    }
    print_rebuild_report(make_post_request("/rebuild", request), *out_);
}

void CliHandler::handle_query_command(const CliOptions& options) {
    nlohmann::json request;
    request["query"] = options.query;
    request["k"] = options.top_k;
    request["synthesize"] = options.answer;
    print_query_report(make_post_request("/query", request), *out_);
}

void CliHandler::handle_info_command(const CliOptions& /*options*/) {
    print_info_report(make_get_request("/stats"), *out_);
}

void CliHandler::print_rebuild_report(const nlohmann::json& response, std::ostream& out) {
    out << "Rebuilt index: " << response.value("entry_count", 0) << " vectors (dim="
        << response.value("dimension", 0) << ") in " << std::fixed << std::setprecision(2)
        << response.value("elapsed_time", 0.0) << "s" << std::endl;
}

void CliHandler::print_query_report(const nlohmann::json& response, std::ostream& out) {
    out << "Detected language: " << response.value("detected_language", "unknown") << std::endl;
    out << "Query: " << response.value("query", "") << "\n" << std::endl;

    int rank = 1;
    for (const auto& result : response.value("results", nlohmann::json::array())) {
        out << rank++ << ". Source: " << result.value("source", "") << " (chunk "
            << result.value("chunk_index", 0) << ") \u2014 score " << std::fixed
            << std::setprecision(4) << result.value("score", 0.0) << std::endl;
        out << "   \""
            << ragkb_core::truncate_code_points(result.value("text", ""), REPORT_TEXT_CHARS)
            << "\"" << std::endl;
    }

    if (response.contains("answer")) {
        out << "\nAnswer:\n" << response["answer"].get<std::string>() << std::endl;
    }

    out << "\n--- Report ---" << std::endl;
    out << "Elapsed time: " << std::fixed << std::setprecision(2)
        << response.value("elapsed_time", 0.0) << "s" << std::endl;
}

void CliHandler::print_info_report(const nlohmann::json& response, std::ostream& out) {
    out << "Index: " << response.value("entry_count", 0) << " entries (dim="
        << response.value("dimension", 0) << ")" << std::endl;
    out << "Embedding model: " << response.value("embedding_model", "") << std::endl;
    out << "Built at: " << response.value("built_at", "") << " UTC" << std::endl;

    auto documents = response.value("documents", nlohmann::json::array());
    out << "Documents (" << documents.size() << "):" << std::endl;
    for (const auto& document : documents) {
        out << "  - " << document.value("source", "") << " ("
            << document.value("file_type", "") << ", " << document.value("chunk_count", 0)
            << " chunks)" << std::endl;
    }
}

std::string CliHandler::error_message_from(const std::string& body, long http_code) {
    std::string fallback = "HTTP request failed with status code: " + std::to_string(http_code);
    nlohmann::json reply = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (reply.is_object() && reply.contains("message") && reply["message"].is_string()) {
        return reply["message"].get<std::string>();
    }
    return fallback;
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPGET, 1L);
    return perform_request(endpoint);
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string request_json = data.dump();
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"), &curl_slist_free_all);

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_COPYPOSTFIELDS, request_json.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());
    return perform_request(endpoint);
}

nlohmann::json CliHandler::perform_request(const std::string& endpoint) {
    std::string url = build_url(endpoint);
    std::string response_buffer;

    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)) +
                       ". Is ragkb_api running at " + api_base_url_ + "?");
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200) {
        throw CliError(error_message_from(response_buffer, http_code));
    }

    try {
        return nlohmann::json::parse(response_buffer);
    } catch (const nlohmann::json::parse_error& e) {
        throw CliError("Server sent an unreadable reply: " + std::string(e.what()));
    }
}

std::string CliHandler::build_url(const std::string& endpoint) const {
    return api_base_url_ + endpoint;
}

void CliHandler::print_help(std::ostream& out) {
    out << R"(
ragkb CLI - Retrieval over a local knowledge base

Usage: ragkb_cli <command> [options]

Every command is sent to a running ragkb_api server; start it first.

Commands:
  rebuild, r    Rebuild the index from the docs folder
    --docs, -d <dir>     Folder to index (default: the server's docs_dir)

  query, q      Retrieve the passages closest to a question
    --query, -q <text>   Question to ask
    --top-k, -k <num>    Number of passages to return (default: 3)
    --answer, -a         Also ask the server for a synthesized answer

  info, i       Show index statistics and indexed documents

  help, h       Show this help message

Configuration:
  ragkbrc.json (or the file named by RAGKB_CONFIG) supplies api_base_url,
  the address of the ragkb_api server (default: 127.0.0.1:5000).

Examples:
  ragkb_cli rebuild
  ragkb_cli rebuild --docs ./docs
  ragkb_cli query --query "What is the refund policy?" --top-k 5
  ragkb_cli query --query "Quelle est la politique de retour ?" --answer
  ragkb_cli info
)" << std::endl;
}

}  // namespace ragkb_cli
