#include "docchat_api/routes.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <nlohmann/json.hpp>

#include "docchat_core/conversation/conversation_codec.hpp"
#include "docchat_core/db/time_format.hpp"
#include "docchat_core/errors.hpp"
#include "docchat_core/pipeline/rag_orchestrator.hpp"

namespace docchat_api {

using docchat_core::RagOrchestrator;

Routes::Routes(std::shared_ptr<RagOrchestrator> orchestrator)
    : orchestrator_(std::move(orchestrator)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  // Documents
  CROW_ROUTE(app, "/documents").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_upload_document(req);
  });

  CROW_ROUTE(app, "/documents")
  ([this](const crow::request &req) { return handle_list_documents(req); });

  CROW_ROUTE(app, "/documents/<int>")
  ([this](const crow::request &req, int64_t id) { return handle_get_document(req, id); });

  CROW_ROUTE(app, "/documents/<int>")
      .methods(crow::HTTPMethod::DELETE)(
          [this](const crow::request &req, int64_t id) { return handle_delete_document(req, id); });

  CROW_ROUTE(app, "/documents/<int>/reingest")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, int64_t id) {
        return handle_reingest_document(req, id);
      });

  CROW_ROUTE(app, "/documents/<int>/cancel")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, int64_t id) {
        return handle_cancel_ingestion(req, id);
      });

  // Conversations
  CROW_ROUTE(app, "/conversations")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_create_conversation(req); });

  CROW_ROUTE(app, "/conversations/import")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_import_conversation(req); });

  CROW_ROUTE(app, "/conversations/<string>")
  ([this](const crow::request &req, const std::string &id) {
    return handle_get_conversation(req, id);
  });

  CROW_ROUTE(app, "/conversations/<string>/ask")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &id) {
        return handle_ask(req, id);
      });

  CROW_ROUTE(app, "/conversations/<string>/export")
  ([this](const crow::request &req, const std::string &id) {
    return handle_export_conversation(req, id);
  });

  // Tasks
  CROW_ROUTE(app, "/tasks/<int>/progress")
  ([this](const crow::request &req, int64_t id) { return handle_get_task_progress(req, id); });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("docchat API is running");
  response["version"] = "0.1.0";
  response["status"] = orchestrator_->is_running() ? "healthy" : "stopped";
  return create_json_response(response);
}

// ============================================================================
// Document Route Handlers
// ============================================================================

crow::response Routes::handle_upload_document(const crow::request &req) {
  try {
    auto json_body = parse_json_body(req.body);
    std::string filename = json_body.value("filename", "");
    std::string encoded = json_body.value("content_base64", "");
    if (filename.empty()) {
      return create_json_response(create_error_response("filename is required"), 400);
    }
    std::string bytes = crow::utility::base64decode(encoded, encoded.size());
    std::cout << "Uploading document: " << filename << " (" << bytes.size() << " bytes)"
              << std::endl;

    docchat_core::SubmitResult result = orchestrator_->submit_document(filename, bytes);

    nlohmann::json data;
    data["document_id"] = result.document_id;
    data["deduplicated"] = result.deduplicated;
    if (result.task_id) {
      data["task_id"] = *result.task_id;
    }
    if (result.deduplicated) {
      return create_json_response(create_success_response("Document already indexed", data));
    }
    return create_json_response(create_success_response("Document queued for ingestion", data),
                                202);
  } catch (const std::exception &) {
    return create_exception_response("handle_upload_document");
  }
}

crow::response Routes::handle_list_documents(const crow::request &req) {
  try {
    nlohmann::json documents = nlohmann::json::array();
    for (const auto &document : orchestrator_->list_documents()) {
      documents.push_back(document_to_json(document));
    }
    nlohmann::json response = create_success_response("Documents retrieved successfully");
    response["data"]["documents"] = documents;
    response["data"]["count"] = documents.size();
    return create_json_response(response);
  } catch (const std::exception &) {
    return create_exception_response("handle_list_documents");
  }
}

crow::response Routes::handle_get_document(const crow::request &req, long long document_id) {
  try {
    auto document = orchestrator_->get_document(document_id);
    return create_json_response(
        create_success_response("Document retrieved successfully", document_to_json(document)));
  } catch (const std::exception &) {
    return create_exception_response("handle_get_document");
  }
}

crow::response Routes::handle_delete_document(const crow::request &req, long long document_id) {
  try {
    std::cout << "Removing document: " << document_id << std::endl;
    if (!orchestrator_->remove_document(document_id)) {
      return create_json_response(create_error_response("Document not found"), 404);
    }
    return create_json_response(create_success_response("Document removed successfully"));
  } catch (const std::exception &) {
    return create_exception_response("handle_delete_document");
  }
}

crow::response Routes::handle_reingest_document(const crow::request &req,
                                                long long document_id) {
  try {
    long long task_id = orchestrator_->reingest_document(document_id);
    nlohmann::json data;
    data["document_id"] = document_id;
    data["task_id"] = task_id;
    return create_json_response(create_success_response("Document queued for re-ingestion", data),
                                202);
  } catch (const std::exception &) {
    return create_exception_response("handle_reingest_document");
  }
}

crow::response Routes::handle_cancel_ingestion(const crow::request &req, long long document_id) {
  try {
    if (!orchestrator_->cancel_ingestion(document_id)) {
      return create_json_response(
          create_error_response("No ingestion in progress for this document"), 404);
    }
    return create_json_response(create_success_response("Cancellation requested"));
  } catch (const std::exception &) {
    return create_exception_response("handle_cancel_ingestion");
  }
}

// ============================================================================
// Conversation Route Handlers
// ============================================================================

crow::response Routes::handle_create_conversation(const crow::request &req) {
  try {
    auto conversation = orchestrator_->create_conversation();
    return create_json_response(
        create_success_response("Conversation created",
                                docchat_core::ConversationCodec::to_json(conversation)),
        201);
  } catch (const std::exception &) {
    return create_exception_response("handle_create_conversation");
  }
}

crow::response Routes::handle_get_conversation(const crow::request &req,
                                               const std::string &conversation_id) {
  try {
    auto conversation = orchestrator_->get_conversation(conversation_id);
    return create_json_response(
        create_success_response("Conversation retrieved successfully",
                                docchat_core::ConversationCodec::to_json(conversation)));
  } catch (const std::exception &) {
    return create_exception_response("handle_get_conversation");
  }
}

crow::response Routes::handle_ask(const crow::request &req, const std::string &conversation_id) {
  try {
    auto json_body = parse_json_body(req.body);
    std::string question = json_body.value("question", "");
    if (question.empty()) {
      return create_json_response(create_error_response("question is required"), 400);
    }
    bool record_question = json_body.value("record_question", true);
    int timeout_ms = json_body.value("timeout_ms", 0);

    docchat_core::CancellationToken token;
    if (timeout_ms > 0) {
      token = docchat_core::CancellationToken::with_timeout(std::chrono::milliseconds(timeout_ms));
    }

    std::cout << "Question for conversation " << conversation_id << ": " << question << std::endl;
    docchat_core::Turn turn = record_question
                                  ? orchestrator_->ask(conversation_id, question, token)
                                  : orchestrator_->answer(conversation_id, question, token);

    nlohmann::json data = docchat_core::ConversationCodec::turn_to_json(turn);
    std::string message = turn.ok() ? "Answer generated" : "Answer failed";
    return create_json_response(create_success_response(message, data));
  } catch (const std::exception &) {
    return create_exception_response("handle_ask");
  }
}

crow::response Routes::handle_export_conversation(const crow::request &req,
                                                  const std::string &conversation_id) {
  try {
    const char *format_param = req.url_params.get("format");
    docchat_core::ExportFormat format = docchat_core::export_format_from_string(
        format_param ? format_param : std::string("json"));

    std::string body = orchestrator_->export_conversation(conversation_id, format);
    crow::response resp(200, body);
    switch (format) {
      case docchat_core::ExportFormat::JSON:
        resp.add_header("Content-Type", "application/json");
        break;
      case docchat_core::ExportFormat::MARKDOWN:
        resp.add_header("Content-Type", "text/markdown; charset=utf-8");
        break;
      case docchat_core::ExportFormat::TEXT:
        resp.add_header("Content-Type", "text/plain; charset=utf-8");
        break;
    }
    return resp;
  } catch (const std::exception &) {
    return create_exception_response("handle_export_conversation");
  }
}

crow::response Routes::handle_import_conversation(const crow::request &req) {
  try {
    auto conversation = orchestrator_->import_conversation(req.body);
    nlohmann::json data;
    data["id"] = conversation.id;
    data["turn_count"] = conversation.turns.size();
    return create_json_response(create_success_response("Conversation imported", data), 201);
  } catch (const std::exception &) {
    return create_exception_response("handle_import_conversation");
  }
}

// ============================================================================
// Task Route Handlers
// ============================================================================

crow::response Routes::handle_get_task_progress(const crow::request &req, long long task_id) {
  try {
    auto progress = orchestrator_->get_task_progress(task_id);
    if (!progress.has_value()) {
      return create_json_response(create_error_response("Task progress not found"), 404);
    }

    nlohmann::json progress_json;
    progress_json["task_id"] = progress->task_id;
    progress_json["progress_percent"] = progress->progress_percent;
    progress_json["status_message"] = progress->status_message;
    progress_json["updated_at"] = progress->updated_at;
    return create_json_response(
        create_success_response("Task progress retrieved successfully", progress_json));
  } catch (const std::exception &) {
    return create_exception_response("handle_get_task_progress");
  }
}

// ============================================================================
// Helpers
// ============================================================================

nlohmann::json Routes::document_to_json(const docchat_core::Document &document) {
  nlohmann::json json;
  json["id"] = document.id;
  json["filename"] = document.filename;
  json["content_hash"] = document.content_hash;
  json["status"] = docchat_core::to_string(document.status);
  json["revision"] = document.revision;
  json["created_at"] = docchat_core::time_point_to_string(document.created_at);
  json["chunk_count"] = document.chunk_ids.size();
  if (document.failure_reason) {
    json["failure_reason"] = *document.failure_reason;
  }
  return json;
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

crow::response Routes::create_exception_response(const std::string &handler) {
  try {
    throw;
  } catch (const docchat_core::DocumentNotFoundError &e) {
    return create_json_response(create_error_response(e.what()), 404);
  } catch (const docchat_core::ConversationNotFoundError &e) {
    return create_json_response(create_error_response(e.what()), 404);
  } catch (const docchat_core::ConversationExistsError &e) {
    return create_json_response(create_error_response(e.what()), 409);
  } catch (const docchat_core::InvalidTransitionError &e) {
    return create_json_response(create_error_response(e.what()), 409);
  } catch (const docchat_core::InvalidConversationDataError &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const docchat_core::OperationCancelledError &e) {
    return create_json_response(create_error_response(e.what()), 504);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(std::string("Invalid JSON: ") + e.what()),
                                400);
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in " << handler << ": " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

}  // namespace docchat_api
