#pragma once

#include <curl/curl.h>

#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace docchat_cli {

struct CliOptions {
  std::string command;
  // --flag value pairs, keyed without the leading dashes
  std::map<std::string, std::string> flags;
  bool verbose = false;

  bool has(const std::string &flag) const {
    return flags.count(flag) > 0;
  }
  std::string get(const std::string &flag, const std::string &fallback = "") const {
    auto it = flags.find(flag);
    return it == flags.end() ? fallback : it->second;
  }
};

class CliError : public std::exception {
 public:
  explicit CliError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class CliHandler
 * @brief Command-line client for the docchat HTTP API.
 *
 * Commands live in a registry keyed by name; each entry carries its usage
 * line, its required flags and the handler that runs it. parse_arguments
 * resolves aliases and checks required flags before anything is sent.
 */
class CliHandler {
 public:
  using CommandHandler = std::function<void(const CliOptions &)>;

  struct CommandEntry {
    std::string name;
    std::string alias;
    std::string usage;
    std::string description;
    std::vector<std::string> required_flags;
    CommandHandler handler;
  };

  explicit CliHandler(const std::string &api_base_url);
  ~CliHandler();

  CliHandler(const CliHandler &) = delete;
  CliHandler &operator=(const CliHandler &) = delete;

  CliOptions parse_arguments(int argc, char *argv[]) const;

  void execute_command(const CliOptions &options);

  void register_command(CommandEntry entry);
  bool has_command(const std::string &name) const;
  std::vector<std::string> command_names() const;

  void set_api_base_url(const std::string &url);
  std::string get_api_base_url() const;

  static std::string base64_encode(const std::string &bytes);

 private:
  std::string api_base_url_;
  CURL *curl_handle_;
  std::map<std::string, CommandEntry> commands_;
  std::map<std::string, std::string> aliases_;

  void register_builtin_commands();
  const CommandEntry &find_command(const std::string &name_or_alias) const;

  // Command handlers
  void handle_upload_command(const CliOptions &options);
  void handle_list_command(const CliOptions &options);
  void handle_status_command(const CliOptions &options);
  void handle_ask_command(const CliOptions &options);
  void handle_export_command(const CliOptions &options);
  void handle_help_command(const CliOptions &options);

  // HTTP methods
  nlohmann::json make_get_request(const std::string &endpoint);
  nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
  std::string perform_request(const std::string &method,
                              const std::string &endpoint,
                              const std::string *body);

  // Helper methods
  void setup_curl_handle();
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
  void print_json_response(const nlohmann::json &response);
  void print_answer(const nlohmann::json &turn);
  void print_error(const std::string &error);
  void print_help();
  std::string build_url(const std::string &endpoint);
};

}  // namespace docchat_cli
