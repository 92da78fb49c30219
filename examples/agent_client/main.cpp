/// Agent client: sends one call and prints the response or the event stream.
/// Usage: ./agent_client <url> <method> [params-json]
/// Example: ./agent_client http://127.0.0.1:8080/mcp chat '{"message":"hi there"}'

#include <streamrpc/streamrpc.hpp>
#include <iostream>

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <url> <method> [params-json]\n";
        std::cerr << "Example: " << argv[0]
                  << " http://127.0.0.1:8080/mcp greeting '{\"name\":\"Ada\"}'\n";
        return 1;
    }

    try {
        nlohmann::json params = nlohmann::json::object();
        if (argc > 3) params = streamrpc::Codec::parse_json(argv[3]);

        streamrpc::HttpClient client{argv[1]};
        auto outcome = client.call(argv[2], params, [](const streamrpc::StreamEvent& ev) {
            std::cout << "[" << ev.sequence << " " << streamrpc::to_string(ev.kind) << "] "
                      << ev.payload.dump() << "\n";
            return true;
        });

        std::cout << "session: " << outcome.session_id << "\n";
        if (outcome.response) {
            nlohmann::json j;
            streamrpc::to_json(j, *outcome.response);
            std::cout << j.dump(2) << "\n";
        }
        if (auto err = outcome.error()) {
            std::cerr << "error " << err->code << ": " << err->message << "\n";
            return 2;
        }
        client.close_session();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
