#include "../include/http_framing.hpp"
#include <iostream>
#include <vector>
#include <string>

int main() {
    using namespace co::http_framing;

    std::cout << "Incremental Parsing Demo\n";
    std::cout << "=======================\n\n";

    // Simulate receiving HTTP data in chunks
    std::vector<std::string> chunks = {
        "POST /api/users HTTP/1.1\r\n",
        "Host: api.example.com\r\n",
        "User-Agent: MyClient/1.0\r\n",
        "Content-Type: application/json\r\n",
        "Transfer-Encoding: chunked\r\n",
        "\r\n",
        "f\r\n{\"name\":\"John\",",
        "\r\n9\r\n\"age\":30}\r\n",
        "0\r\n\r\n"
    };

    auto server = http1::server();
    std::string body;

    std::cout << "Processing HTTP request in chunks:\n";

    for (size_t i = 0; i < chunks.size(); ++i) {
        std::cout << "\nChunk " << (i + 1) << ": " << chunks[i].size() << " bytes\n";

        if (auto received = server.receive_data(chunks[i]); !received) {
            std::cout << "✗ Receive error: " << error_string(received.error()) << "\n";
            return 1;
        }

        // Pull every event the buffered bytes allow
        while (true) {
            auto result = server.next_event();
            if (!result) {
                std::cout << "✗ Parse error: " << error_string(result.error()) << "\n";
                return 1;
            }
            if (is_need_data(*result)) {
                std::cout << "◦ Need more data to continue parsing\n";
                break;
            }
            if (is_paused(*result)) {
                std::cout << "◦ Paused until the response is sent\n";
                break;
            }

            const auto& ev = *get_event(*result);
            std::cout << "✓ Event: " << to_string(kind_of(ev)) << "\n";

            if (const auto* line = std::get_if<request_line>(&ev)) {
                std::cout << "  Method: " << line->method << "\n";
                std::cout << "  Target: " << line->target << "\n";
                std::cout << "  Version: " << to_string(line->http_version) << "\n";
            } else if (const auto* h = std::get_if<headers>(&ev)) {
                std::cout << "  Headers (" << h->fields.size() << "):\n";
                for (const auto& field : h->fields) {
                    std::cout << "    " << field.name << ": " << field.value << "\n";
                }
            } else if (const auto* d = std::get_if<data>(&ev)) {
                // The bytes are only valid until the next call, copy them
                body.append(d->bytes);
                std::cout << "  " << d->bytes.size() << " body bytes"
                          << (d->chunk_end ? " (end of chunk)" : "") << "\n";
            }
        }
    }

    std::cout << "\n" << std::string(40, '=') << "\n";
    std::cout << "Client state: " << to_string(server.their_state()) << "\n";
    std::cout << "Server state: " << to_string(server.our_state()) << "\n";
    std::cout << "Body: " << body << "\n";

    return 0;
}
