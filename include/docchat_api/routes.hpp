#pragma once
#include <memory>
#include <nlohmann/json.hpp>

#include "server.hpp"

namespace docchat_core {
class RagOrchestrator;
struct Document;
}  // namespace docchat_core

namespace docchat_api {

class Routes {
 public:
  explicit Routes(std::shared_ptr<docchat_core::RagOrchestrator> orchestrator);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  void register_routes(Server &server);

 private:
  std::shared_ptr<docchat_core::RagOrchestrator> orchestrator_;

  crow::response handle_health_check(const crow::request &req);

  // Documents
  crow::response handle_upload_document(const crow::request &req);
  crow::response handle_list_documents(const crow::request &req);
  crow::response handle_get_document(const crow::request &req, long long document_id);
  crow::response handle_delete_document(const crow::request &req, long long document_id);
  crow::response handle_reingest_document(const crow::request &req, long long document_id);
  crow::response handle_cancel_ingestion(const crow::request &req, long long document_id);

  // Conversations
  crow::response handle_create_conversation(const crow::request &req);
  crow::response handle_get_conversation(const crow::request &req,
                                          const std::string &conversation_id);
  crow::response handle_ask(const crow::request &req, const std::string &conversation_id);
  crow::response handle_export_conversation(const crow::request &req,
                                            const std::string &conversation_id);
  crow::response handle_import_conversation(const crow::request &req);

  crow::response handle_get_task_progress(const crow::request &req, long long task_id);

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  static nlohmann::json document_to_json(const docchat_core::Document &document);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
  // Maps a core exception onto an HTTP status and error body.
  crow::response create_exception_response(const std::string &handler);
};

}  // namespace docchat_api
