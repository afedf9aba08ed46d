#include "../include/http_framing.hpp"
#include <algorithm>
#include <iostream>
#include <vector>
#include <string>

using namespace co::http_framing;

// 模拟网络数据分片传输
std::vector<std::string> split_data(const std::string& bytes, size_t chunk_size = 32) {
    std::vector<std::string> chunks;
    for (size_t i = 0; i < bytes.size(); i += chunk_size) {
        chunks.push_back(bytes.substr(i, std::min(chunk_size, bytes.size() - i)));
    }
    return chunks;
}

// 发送一组事件，返回要写入传输层的字节
bool send_events(connection& conn, const std::vector<event>& events, std::string& wire) {
    for (const auto& ev : events) {
        auto bytes = conn.send(ev);
        if (!bytes) {
            std::cout << "✗ 发送失败: " << error_string(bytes.error()) << "\n";
            return false;
        }
        wire += *bytes;
    }
    return true;
}

// 读取事件直到需要更多数据
bool print_events(connection& conn) {
    while (true) {
        auto result = conn.next_event();
        if (!result) {
            std::cout << "✗ 解析失败: " << error_string(result.error())
                      << " (建议状态码 " << result.error().status_hint << ")\n";
            return false;
        }
        const auto* ev = get_event(*result);
        if (!ev) {
            return true;
        }

        if (const auto* line = std::get_if<request_line>(ev)) {
            std::cout << "  请求行: " << line->method << " " << line->target << "\n";
        } else if (const auto* status = std::get_if<response_line>(ev)) {
            std::cout << "  状态行: " << status->status_code << " " << status->reason << "\n";
        } else if (const auto* h = std::get_if<headers>(ev)) {
            for (const auto& field : h->fields) {
                std::cout << "    " << field.name << ": " << field.value << "\n";
            }
        } else if (const auto* d = std::get_if<data>(ev)) {
            std::cout << "  正文: " << d->bytes << "\n";
        } else if (std::holds_alternative<end_of_message>(*ev)) {
            std::cout << "  消息结束\n";
        }
    }
}

void demo_request_response_cycle() {
    std::cout << "\n=== HTTP/1.1 请求/响应周期示例 ===\n";

    auto client = http1::client();
    auto server = http1::server();

    // 1. 客户端发送POST请求
    std::string request_wire;
    auto head = http1::request().POST("/api/users").host("api.example.com").content_type("application/json")
                    .content_length(10).build();
    if (!send_events(client, head, request_wire) ||
        !send_events(client, {data{R"({"id": 42})"}, end_of_message{}},
                     request_wire)) {
        return;
    }

    // 2. 服务器分片接收
    std::cout << "服务器收到:\n";
    for (const auto& chunk : split_data(request_wire)) {
        if (!server.receive_data(chunk) || !print_events(server)) {
            return;
        }
    }

    // 3. 服务器以分块编码应答
    std::string response_wire;
    if (!send_events(server, http1::response().ok().content_type("text/plain").chunked().build(), response_wire) ||
        !send_events(server, {data{"created "}, data{"user 42"}, end_of_message{}}, response_wire)) {
        return;
    }
    std::cout << "\n服务器发送:\n" << response_wire << "\n";

    // 4. 客户端解析响应
    std::cout << "\n客户端收到:\n";
    if (!client.receive_data(response_wire) || !print_events(client)) {
        return;
    }

    // 5. 双方都完成后复用连接
    if (client.start_next_cycle() && server.start_next_cycle()) {
        std::cout << "✓ 连接可复用: " << to_string(client.our_state()) << "/"
                  << to_string(client.their_state()) << "\n";
    }
}

void demo_error_handling() {
    std::cout << "\n=== 请求走私防护示例 ===\n";

    auto server = http1::server();
    std::string smuggled =
        "POST / HTTP/1.1\r\n"
        "Host: example.com\r\n"
        "Content-Length: 6\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "0\r\n\r\nX";

    if (server.receive_data(smuggled) && !print_events(server)) {
        std::cout << "✓ 有歧义的请求已被拒绝\n";
    }
    std::cout << "客户端状态: " << to_string(server.their_state()) << "\n";
}

int main() {
    std::cout << "HTTP Framing Library - HTTP/1.1 示例\n";
    std::cout << "====================================\n";

    demo_request_response_cycle();
    demo_error_handling();

    return 0;
}
