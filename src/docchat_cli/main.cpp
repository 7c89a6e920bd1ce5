#include <cstdlib>
#include <iostream>

#include "docchat_cli/cli_handler.hpp"

int main(int argc, char *argv[]) {
  try {
    const char *api_base_url = std::getenv("API_BASE_URL");
    std::string base_url = api_base_url ? api_base_url : "http://127.0.0.1:3030";

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int exit_code = 0;
    {
      docchat_cli::CliHandler handler(base_url);
      try {
        docchat_cli::CliOptions options = handler.parse_arguments(argc, argv);
        handler.execute_command(options);
      } catch (const docchat_cli::CliError &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
      }
    }
    curl_global_cleanup();
    return exit_code;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
