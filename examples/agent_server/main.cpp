/// Agent server: a streamable HTTP endpoint with a canned local responder.
/// Usage: ./agent_server [config.json]
/// Environment: STREAMRPC_HOST, STREAMRPC_PORT, STREAMRPC_LOG_LEVEL

#include <streamrpc/streamrpc.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <sstream>
#include <thread>

namespace {

constexpr const char* MODEL = "local-demo";

std::string greet(const std::string& name) {
    return "Hello, " + name + "! Nice to meet you. I'm your AI assistant powered by " +
           MODEL + "!";
}

std::vector<std::string> words_of(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream in(text);
    std::string w;
    while (in >> w) words.push_back(w);
    return words;
}

bool mentions_greeting(std::string message) {
    std::transform(message.begin(), message.end(), message.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& w : words_of(message)) {
        if (w == "hello" || w == "hi" || w == "greeting") return true;
    }
    return false;
}

/// Streams the reply word by word from a worker thread, then a summary.
std::unique_ptr<streamrpc::FragmentSource> chat(const nlohmann::json& params,
                                                streamrpc::CallContext& ctx) {
    std::string message = params.value("message", std::string());
    if (message.empty()) {
        throw streamrpc::HandlerFailure("'message' is required", streamrpc::error::InvalidParams);
    }

    auto channel = std::make_shared<streamrpc::FragmentChannel>();
    std::thread([channel, message, session = ctx.session_id()] {
        bool tool = mentions_greeting(message);
        std::string reply = tool ? greet("User") : "Local model response to: '" + message + "'";

        auto words = words_of(reply);
        for (size_t i = 0; i < words.size(); ++i) {
            std::string piece = i + 1 < words.size() ? words[i] + " " : words[i];
            if (!channel->push(piece)) return;
            std::this_thread::sleep_for(std::chrono::milliseconds(40));
        }
        nlohmann::json summary = {
            {"tool_used", tool ? nlohmann::json("greeting") : nlohmann::json(nullptr)},
            {"reasoning", tool ? "Detected greeting intent, using greeting tool."
                               : "Local model processing."},
            {"model_used", MODEL},
            {"session_id", session}
        };
        channel->push(std::move(summary));
        channel->close();
    }).detach();

    return std::make_unique<streamrpc::ChannelSource>(channel);
}

} // namespace

int main(int argc, char* argv[]) {
    streamrpc::EngineConfig config;
    try {
        if (argc > 1) config = streamrpc::load_config(argv[1]);
        streamrpc::apply_env_overrides(config);
        streamrpc::logging::set_level(streamrpc::logging::level_from_string(config.log_level));
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    streamrpc::StreamServer server{config};

    server.add_method("greeting", [](const nlohmann::json& params, streamrpc::CallContext&)
                                      -> streamrpc::HandlerResult {
        return greet(params.value("name", std::string("Friend")));
    });

    server.add_method("get_capabilities", [](const nlohmann::json&, streamrpc::CallContext&)
                                              -> streamrpc::HandlerResult {
        return nlohmann::json{
            {"capabilities", {"chat", "greeting", "tool_execution"}},
            {"available_tools", {"greeting", "get_capabilities"}},
            {"llm_provider", "local"},
            {"llm_model", MODEL},
            {"protocol", "streamable-http"},
            {"version", std::string(streamrpc::LIBRARY_VERSION)}
        };
    });

    // echo answers in one piece, or word by word when the size policy streams it
    server.add_method("echo", [](const nlohmann::json& params, streamrpc::CallContext&)
                                  -> streamrpc::HandlerResult {
        return params.value("text", std::string());
    });
    server.add_streaming_method("echo", [](const nlohmann::json& params, streamrpc::CallContext&) {
        auto words = words_of(params.value("text", std::string()));
        std::vector<nlohmann::json> fragments(words.begin(), words.end());
        return std::make_unique<streamrpc::VectorSource>(std::move(fragments));
    }, false);

    server.add_streaming_method("chat", chat);

    try {
        server.serve_http();
    } catch (const streamrpc::TransportError& e) {
        streamrpc::logging::logger()->critical("{}", e.what());
        return 1;
    }
    return 0;
}
