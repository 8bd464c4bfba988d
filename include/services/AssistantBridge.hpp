#pragma once
#include "models/ChatMessage.hpp"
#include "utils/Error.hpp"
#include "utils/HttpClient.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace DryDock {

// Blocking chat calls against a local Ollama server. Each call spins up its
// own GMainContext, runs the HTTP request on a GTask worker and tears the
// context down again, so callers on any thread get a plain return value.
class AssistantBridge {
public:
    struct Options {
        std::string baseUrl = "http://localhost:11434";
        std::string model = "gemma3";
        long timeoutSeconds = 60;
    };

    using ClientFactory = std::function<std::unique_ptr<HttpClient>()>;

    explicit AssistantBridge(Options options);
    AssistantBridge(Options options, ClientFactory factory);

    Result<std::string> sendMessage(const std::vector<ChatMessage>& messages);

    // GET /api/tags with a 2 second timeout
    bool checkServerStatus();

    std::string chatUrl() const { return options_.baseUrl + "/api/chat"; }
    std::string tagsUrl() const { return options_.baseUrl + "/api/tags"; }

    static std::string buildRequestJson(const std::string& model, const std::vector<ChatMessage>& messages);
    static Result<std::string> parseReplyJson(const std::string& body);

private:
    HttpClient::Response runOnPrivateContext(std::function<HttpClient::Response()> request);

    Options options_;
    ClientFactory factory_;
};

}
