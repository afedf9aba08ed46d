#pragma once

// =============================================================================
// HTTP Framing Library - Sans-I/O HTTP/1.1 Connection Engine
// HTTP分帧库 - 无I/O的HTTP/1.1连接引擎
//
// A pure C++23 header-only HTTP/1.1 message framing library
// 一个纯C++23头文件HTTP/1.1消息分帧库
//
// Features / 特性:
// - Byte stream in, protocol events out; events in, bytes out
//   字节流输入产生协议事件；事件输入产生字节
// - Content-Length, chunked and close-delimited bodies
//   支持Content-Length、分块和连接关闭界定的正文
// - Pipelined request/response cycles on one connection
//   单连接上的流水线请求/响应周期
// - Request smuggling defenses (ambiguous framing is rejected)
//   请求走私防护（拒绝有歧义的分帧）
// - Modern C++23 with std::expected error handling
//   现代C++23设计，使用std::expected错误处理
// =============================================================================

#include "http_framing/buffer.hpp"
#include "http_framing/builder.hpp"
#include "http_framing/connection.hpp"
#include "http_framing/core.hpp"
#include "http_framing/events.hpp"
#include "http_framing/framing.hpp"
#include "http_framing/options.hpp"
#include "http_framing/parser.hpp"
#include "http_framing/state.hpp"
#include "http_framing/writer.hpp"

namespace co::http_framing {

// =============================================================================
// HTTP/1.1 Convenience Interface / HTTP/1.1便捷接口
// One-call helpers for the common connection setups
// 常见连接配置的一次调用辅助函数
// =============================================================================

namespace http1 {

/**
 * @brief Create the client side of a connection
 * @brief 创建连接的客户端
 *
 * @param options Limits and parsing policies / 限制与解析策略
 * @return connection A connection in the IDLE/IDLE state / 处于IDLE/IDLE状态的连接
 *
 * @example
 * auto conn = http1::client();
 * auto bytes = conn.send(request_line{"GET", "/", version::http_1_1});
 */
inline connection client(connection_options options = {}) {
  return connection(role::client, std::move(options));
}

/**
 * @brief Create the server side of a connection
 * @brief 创建连接的服务器端
 *
 * @param options Limits and parsing policies / 限制与解析策略
 * @return connection A connection in the IDLE/IDLE state / 处于IDLE/IDLE状态的连接
 *
 * @details The server reads requests and writes responses:
 * @details 服务器读取请求并写入响应：
 * - Feed bytes with receive_data() / 通过receive_data()输入字节
 * - Pull events with next_event() until need_data / 调用next_event()直到need_data
 * - Answer with send() / 通过send()应答
 */
inline connection server(connection_options options = {}) {
  return connection(role::server, std::move(options));
}

/**
 * @brief Start building a request head
 * @brief 开始构建请求头部
 *
 * @example
 * for (const auto& ev : http1::request().GET("/index.html").host("example.com").build()) {
 *   conn.send(ev);
 * }
 */
inline request_builder request() { return request_builder{}; }

/**
 * @brief Start building a response head
 * @brief 开始构建响应头部
 *
 * @example
 * auto head = http1::response().ok().content_length(5).build();
 */
inline response_builder response() { return response_builder{}; }

} // namespace http1

// =============================================================================
// Error Handling Utilities / 错误处理工具
// =============================================================================

/**
 * @brief Get a human-readable description of a protocol error
 * @brief 获取协议错误的可读描述
 *
 * @param error The error to describe / 要描述的错误
 * @return std::string "<code>: <message>" / 形如"<code>: <message>"的字符串
 */
inline std::string error_string(const protocol_error& error) {
  if (error.message.empty()) {
    return to_string(error.code);
  }
  return to_string(error.code) + ": " + error.message;
}

/**
 * @brief Get a human-readable description of an error code
 * @brief 获取错误码的可读描述
 */
inline std::string error_string(error_code code) { return to_string(code); }

} // namespace co::http_framing
