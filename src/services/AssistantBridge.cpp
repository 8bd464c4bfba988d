#include "services/AssistantBridge.hpp"
#include <gio/gio.h>
#include <json-glib/json-glib.h>
#include <spdlog/spdlog.h>

namespace DryDock {

namespace {

struct PendingCall {
    std::function<HttpClient::Response()> request;
    HttpClient::Response response{0, "", {}, false, ""};
};

void runRequest(GTask* task, gpointer /*source*/, gpointer taskData, GCancellable* /*cancellable*/) {
    auto* call = static_cast<PendingCall*>(taskData);
    call->response = call->request();
    g_task_return_boolean(task, TRUE);
}

void onRequestDone(GObject* /*source*/, GAsyncResult* result, gpointer userData) {
    g_task_propagate_boolean(G_TASK(result), nullptr);
    g_main_loop_quit(static_cast<GMainLoop*>(userData));
}

}

AssistantBridge::AssistantBridge(Options options)
    : AssistantBridge(std::move(options), nullptr) {}

AssistantBridge::AssistantBridge(Options options, ClientFactory factory)
    : options_(std::move(options)), factory_(std::move(factory)) {
    if (!factory_) {
        factory_ = []() { return std::make_unique<HttpClient>(); };
    }
}

HttpClient::Response AssistantBridge::runOnPrivateContext(std::function<HttpClient::Response()> request) {
    PendingCall call;
    call.request = std::move(request);

    GMainContext* context = g_main_context_new();
    g_main_context_push_thread_default(context);
    GMainLoop* loop = g_main_loop_new(context, FALSE);

    // The completion callback is dispatched on the thread-default context
    // captured here, i.e. the private one.
    GTask* task = g_task_new(nullptr, nullptr, onRequestDone, loop);
    g_task_set_task_data(task, &call, nullptr);
    g_task_run_in_thread(task, runRequest);
    g_object_unref(task);

    g_main_loop_run(loop);

    g_main_loop_unref(loop);
    g_main_context_pop_thread_default(context);
    g_main_context_unref(context);
    return call.response;
}

Result<std::string> AssistantBridge::sendMessage(const std::vector<ChatMessage>& messages) {
    if (messages.empty()) {
        return Error(ErrorCode::InvalidArgument, "No messages to send");
    }

    std::string payload = buildRequestJson(options_.model, messages);
    std::string url = chatUrl();
    long timeout = options_.timeoutSeconds;
    ClientFactory factory = factory_;

    spdlog::debug("[Assistant] Sending {} messages to {}", messages.size(), url);
    HttpClient::Response response = runOnPrivateContext([factory, url, payload, timeout]() {
        std::unique_ptr<HttpClient> client = factory();
        client->setTimeout(timeout);
        return client->post(url, payload);
    });

    if (!response.success) {
        if (response.statusCode != 0) {
            spdlog::warn("[Assistant] HTTP {} from {}", response.statusCode, url);
            return Error(ErrorCode::Assistant,
                         "Assistant returned HTTP " + std::to_string(response.statusCode) + ": " + response.body);
        }
        spdlog::warn("[Assistant] Request to {} failed: {}", url, response.error);
        return Error(ErrorCode::Assistant, "Failed to reach assistant at " + url + ": " + response.error);
    }

    return parseReplyJson(response.body);
}

bool AssistantBridge::checkServerStatus() {
    std::string url = tagsUrl();
    ClientFactory factory = factory_;

    HttpClient::Response response = runOnPrivateContext([factory, url]() {
        std::unique_ptr<HttpClient> client = factory();
        client->setTimeout(2);
        return client->get(url);
    });

    if (!response.success) {
        spdlog::info("[Assistant] Server not reachable at {}", url);
    }
    return response.success;
}

std::string AssistantBridge::buildRequestJson(const std::string& model, const std::vector<ChatMessage>& messages) {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);

    json_builder_set_member_name(builder, "model");
    json_builder_add_string_value(builder, model.c_str());

    json_builder_set_member_name(builder, "messages");
    json_builder_begin_array(builder);
    for (const auto& msg : messages) {
        json_builder_begin_object(builder);
        json_builder_set_member_name(builder, "role");
        json_builder_add_string_value(builder, roleName(msg.role));
        json_builder_set_member_name(builder, "content");
        json_builder_add_string_value(builder, msg.content.c_str());
        json_builder_end_object(builder);
    }
    json_builder_end_array(builder);

    json_builder_set_member_name(builder, "stream");
    json_builder_add_boolean_value(builder, FALSE);

    json_builder_end_object(builder);

    JsonGenerator* gen = json_generator_new();
    JsonNode* rootNode = json_builder_get_root(builder);
    json_generator_set_root(gen, rootNode);
    gchar* data = json_generator_to_data(gen, nullptr);
    std::string result(data);

    g_free(data);
    json_node_unref(rootNode);
    g_object_unref(gen);
    g_object_unref(builder);
    return result;
}

Result<std::string> AssistantBridge::parseReplyJson(const std::string& body) {
    JsonParser* parser = json_parser_new();
    GError* error = nullptr;

    if (!json_parser_load_from_data(parser, body.c_str(), static_cast<gssize>(body.size()), &error)) {
        Error result(ErrorCode::Assistant,
                     std::string("Invalid reply from assistant: ") + (error ? error->message : "unknown error"));
        if (error) g_error_free(error);
        g_object_unref(parser);
        return result;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        g_object_unref(parser);
        return Error(ErrorCode::Assistant, "Invalid reply from assistant: not an object");
    }

    JsonObject* obj = json_node_get_object(root);
    Result<std::string> result(Error(ErrorCode::Assistant, "Reply has no message content"));

    if (json_object_has_member(obj, "error")) {
        const char* message = json_object_get_string_member(obj, "error");
        result = Error(ErrorCode::Assistant, std::string("Assistant error: ") + (message ? message : "unknown"));
    } else if (json_object_has_member(obj, "message")) {
        JsonObject* message = json_object_get_object_member(obj, "message");
        if (message && json_object_has_member(message, "content")) {
            const char* content = json_object_get_string_member(message, "content");
            if (content) result = Result<std::string>(std::string(content));
        }
    }

    g_object_unref(parser);
    return result;
}

}
