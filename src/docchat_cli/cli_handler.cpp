#include "docchat_cli/cli_handler.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace docchat_cli {

CliHandler::CliHandler(const std::string &api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
  setup_curl_handle();
  register_builtin_commands();
}

CliHandler::~CliHandler() {
  if (curl_handle_) {
    curl_easy_cleanup(curl_handle_);
  }
}

void CliHandler::setup_curl_handle() {
  curl_handle_ = curl_easy_init();
  if (!curl_handle_) {
    throw CliError("Failed to initialize CURL");
  }
}

size_t CliHandler::write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

// ============================================================================
// Command registry
// ============================================================================

void CliHandler::register_builtin_commands() {
  register_command({"upload", "u", "upload --file <path>",
                    "Upload a document and queue it for ingestion", {"file"},
                    [this](const CliOptions &o) { handle_upload_command(o); }});
  register_command({"list", "l", "list", "List documents and their ingestion status", {},
                    [this](const CliOptions &o) { handle_list_command(o); }});
  register_command({"status", "s", "status --id <document_id> | --task <task_id>",
                    "Show a document's status or a task's progress", {},
                    [this](const CliOptions &o) { handle_status_command(o); }});
  register_command({"ask", "a", "ask --question <text> [--conversation <id>] [--timeout-ms <n>]",
                    "Ask a question; starts a new conversation when none is given",
                    {"question"},
                    [this](const CliOptions &o) { handle_ask_command(o); }});
  register_command({"export", "e",
                    "export --conversation <id> [--format json|text|markdown] [--out <path>]",
                    "Export a conversation transcript", {"conversation"},
                    [this](const CliOptions &o) { handle_export_command(o); }});
  register_command({"help", "h", "help", "Show this help message", {},
                    [this](const CliOptions &o) { handle_help_command(o); }});
}

void CliHandler::register_command(CommandEntry entry) {
  if (entry.name.empty() || !entry.handler) {
    throw CliError("A command needs a name and a handler");
  }
  if (!entry.alias.empty()) {
    aliases_[entry.alias] = entry.name;
  }
  std::string name = entry.name;
  commands_[name] = std::move(entry);
}

bool CliHandler::has_command(const std::string &name) const {
  return commands_.count(name) > 0 || aliases_.count(name) > 0;
}

std::vector<std::string> CliHandler::command_names() const {
  std::vector<std::string> names;
  for (const auto &[name, entry] : commands_) {
    names.push_back(name);
  }
  return names;
}

const CliHandler::CommandEntry &CliHandler::find_command(const std::string &name_or_alias) const {
  auto it = commands_.find(name_or_alias);
  if (it != commands_.end()) {
    return it->second;
  }
  auto alias = aliases_.find(name_or_alias);
  if (alias != aliases_.end()) {
    return commands_.at(alias->second);
  }
  throw CliError("Unknown command: " + name_or_alias);
}

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) const {
  CliOptions options;
  if (argc < 2) {
    options.command = "help";
    return options;
  }

  std::string command = argv[1];
  if (command == "--help" || command == "-h") {
    command = "help";
  }
  const CommandEntry &entry = find_command(command);
  options.command = entry.name;

  for (int i = 2; i < argc; ++i) {
    std::string flag = argv[i];
    if (flag == "--verbose" || flag == "-v") {
      options.verbose = true;
      continue;
    }
    if (flag.rfind("--", 0) != 0) {
      throw CliError("Unexpected argument '" + flag + "'. Usage: " + entry.usage);
    }
    if (i + 1 >= argc) {
      throw CliError("Flag " + flag + " needs a value. Usage: " + entry.usage);
    }
    options.flags[flag.substr(2)] = argv[++i];
  }

  for (const auto &required : entry.required_flags) {
    if (options.get(required).empty()) {
      throw CliError("The " + entry.name + " command requires --" + required +
                     ". Usage: " + entry.usage);
    }
  }
  return options;
}

void CliHandler::execute_command(const CliOptions &options) {
  find_command(options.command).handler(options);
}

// ============================================================================
// Command handlers
// ============================================================================

void CliHandler::handle_upload_command(const CliOptions &options) {
  const std::string path = options.get("file");
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw CliError("Cannot open file: " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  std::string filename = path.substr(path.find_last_of('/') + 1);
  std::cout << "Uploading " << filename << "..." << std::endl;

  nlohmann::json request_data = {{"filename", filename},
                                 {"content_base64", base64_encode(buffer.str())}};
  try {
    nlohmann::json response = make_post_request("/documents", request_data);
    if (options.verbose) {
      print_json_response(response);
      return;
    }
    const auto &data = response["data"];
    std::cout << response.value("message", "") << ": document "
              << data.value("document_id", 0LL);
    if (data.contains("task_id")) {
      std::cout << " (task " << data["task_id"].get<long long>() << ")";
    }
    std::cout << std::endl;
  } catch (const std::exception &e) {
    print_error("Failed to upload document: " + std::string(e.what()));
  }
}

void CliHandler::handle_list_command(const CliOptions &options) {
  try {
    nlohmann::json response = make_get_request("/documents");
    if (options.verbose) {
      print_json_response(response);
      return;
    }
    const auto &documents = response["data"]["documents"];
    if (documents.empty()) {
      std::cout << "No documents." << std::endl;
      return;
    }
    std::cout << std::left << std::setw(6) << "ID" << std::setw(12) << "STATUS" << std::setw(8)
              << "CHUNKS" << "FILENAME" << std::endl;
    for (const auto &doc : documents) {
      std::string status = doc.value("status", "");
      if (doc.contains("failure_reason")) {
        status += "(" + doc["failure_reason"].get<std::string>() + ")";
      }
      std::cout << std::left << std::setw(6) << doc.value("id", 0LL) << std::setw(12) << status
                << std::setw(8) << doc.value("chunk_count", 0) << doc.value("filename", "")
                << std::endl;
    }
  } catch (const std::exception &e) {
    print_error("Failed to list documents: " + std::string(e.what()));
  }
}

void CliHandler::handle_status_command(const CliOptions &options) {
  try {
    if (options.has("task")) {
      nlohmann::json response = make_get_request("/tasks/" + options.get("task") + "/progress");
      const auto &data = response["data"];
      std::cout << "Task " << options.get("task") << ": " << std::fixed << std::setprecision(0)
                << data.value("progress_percent", 0.0) * 100 << "% "
                << data.value("status_message", "") << std::endl;
      return;
    }
    if (!options.has("id")) {
      throw CliError("status requires --id <document_id> or --task <task_id>");
    }
    nlohmann::json response = make_get_request("/documents/" + options.get("id"));
    print_json_response(response["data"]);
  } catch (const CliError &e) {
    print_error(e.what());
  } catch (const std::exception &e) {
    print_error("Failed to get status: " + std::string(e.what()));
  }
}

void CliHandler::handle_ask_command(const CliOptions &options) {
  try {
    std::string conversation_id = options.get("conversation");
    if (conversation_id.empty()) {
      nlohmann::json created = make_post_request("/conversations", nlohmann::json::object());
      conversation_id = created["data"]["id"].get<std::string>();
      std::cout << "Started conversation " << conversation_id << std::endl;
    }

    nlohmann::json request_data = {{"question", options.get("question")}};
    if (options.has("timeout-ms")) {
      request_data["timeout_ms"] = std::stoi(options.get("timeout-ms"));
    }
    nlohmann::json response =
        make_post_request("/conversations/" + conversation_id + "/ask", request_data);
    if (options.verbose) {
      print_json_response(response);
      return;
    }
    print_answer(response["data"]);
  } catch (const std::exception &e) {
    print_error("Failed to ask question: " + std::string(e.what()));
  }
}

void CliHandler::handle_export_command(const CliOptions &options) {
  try {
    std::string format = options.get("format", "text");
    char *escaped = curl_easy_escape(curl_handle_, format.c_str(), static_cast<int>(format.size()));
    std::string query = escaped ? escaped : format;
    curl_free(escaped);

    std::string body = perform_request(
        "GET", "/conversations/" + options.get("conversation") + "/export?format=" + query,
        nullptr);

    if (options.has("out")) {
      std::ofstream out(options.get("out"), std::ios::binary);
      if (!out.is_open()) {
        throw CliError("Cannot write file: " + options.get("out"));
      }
      out << body;
      std::cout << "Wrote " << body.size() << " bytes to " << options.get("out") << std::endl;
    } else {
      std::cout << body << std::endl;
    }
  } catch (const std::exception &e) {
    print_error("Failed to export conversation: " + std::string(e.what()));
  }
}

void CliHandler::handle_help_command(const CliOptions &options) {
  print_help();
}

// ============================================================================
// HTTP
// ============================================================================

nlohmann::json CliHandler::make_get_request(const std::string &endpoint) {
  return nlohmann::json::parse(perform_request("GET", endpoint, nullptr));
}

nlohmann::json CliHandler::make_post_request(const std::string &endpoint,
                                             const nlohmann::json &data) {
  std::string request_json = data.dump();
  return nlohmann::json::parse(perform_request("POST", endpoint, &request_json));
}

std::string CliHandler::perform_request(const std::string &method,
                                        const std::string &endpoint,
                                        const std::string *body) {
  if (!curl_handle_) {
    throw CliError("CURL handle not initialized");
  }

  std::string url = build_url(endpoint);
  std::string response_buffer;

  curl_easy_reset(curl_handle_);
  curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

  curl_slist *headers = nullptr;
  if (method == "POST") {
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, body ? body->c_str() : "");
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(body ? body->size() : 0));
  } else if (method != "GET") {
    curl_easy_setopt(curl_handle_, CURLOPT_CUSTOMREQUEST, method.c_str());
  }

  CURLcode res = curl_easy_perform(curl_handle_);
  curl_slist_free_all(headers);
  if (res != CURLE_OK) {
    throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code < 200 || http_code >= 300) {
    std::string detail;
    nlohmann::json error_body = nlohmann::json::parse(response_buffer, nullptr, false);
    if (!error_body.is_discarded() && error_body.is_object()) {
      detail = error_body.value("error", "");
    }
    throw CliError("HTTP request failed with status code: " + std::to_string(http_code) +
                   (detail.empty() ? "" : " (" + detail + ")"));
  }
  return response_buffer;
}

// ============================================================================
// Helpers
// ============================================================================

std::string CliHandler::base64_encode(const std::string &bytes) {
  if (bytes.empty()) {
    return "";
  }
  std::string encoded(4 * ((bytes.size() + 2) / 3), '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(encoded.data()),
                                reinterpret_cast<const unsigned char *>(bytes.data()),
                                static_cast<int>(bytes.size()));
  encoded.resize(static_cast<size_t>(written));
  return encoded;
}

void CliHandler::set_api_base_url(const std::string &url) {
  api_base_url_ = url;
}

std::string CliHandler::get_api_base_url() const {
  return api_base_url_;
}

void CliHandler::print_json_response(const nlohmann::json &response) {
  std::cout << response.dump(2) << std::endl;
}

void CliHandler::print_answer(const nlohmann::json &turn) {
  if (turn.value("status", "ok") != "ok") {
    print_error("The answer could not be generated (" + turn.value("failure_reason", "unknown") +
                ")");
    return;
  }
  std::cout << "\n" << turn.value("text", "") << "\n" << std::endl;
  const auto &citations = turn["citations"];
  if (citations.empty()) {
    return;
  }
  std::cout << "Sources:" << std::endl;
  for (const auto &citation : citations) {
    std::cout << "  [" << citation.value("marker", 0) << "] document "
              << citation.value("document_id", 0LL) << ", chunk "
              << citation.value("chunk_id", "") << " (score: " << std::fixed
              << std::setprecision(3) << citation.value("score", 0.0) << ")" << std::endl;
  }
}

void CliHandler::print_error(const std::string &error) {
  std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
  std::cout << "docchat - ask questions about your documents\n\n";
  std::cout << "Usage: docchat_cli <command> [--flag value ...] [--verbose]\n\n";
  std::cout << "Commands:\n";
  for (const auto &[name, entry] : commands_) {
    std::cout << "  " << std::left << std::setw(10) << name
              << (entry.alias.empty() ? "" : "(" + entry.alias + ") ") << entry.description << "\n"
              << "      " << entry.usage << "\n";
  }
  std::cout << "\nEnvironment:\n";
  std::cout << "  API_BASE_URL   API server address (default: http://127.0.0.1:3030)" << std::endl;
}

std::string CliHandler::build_url(const std::string &endpoint) {
  std::string base = api_base_url_;
  if (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + endpoint;
}

}  // namespace docchat_cli
