#include "generation_client.hpp"

#include "errors.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

[[noreturn]] void raiseTransportError(const beast::error_code& ec, const std::string& step, const OllamaSettings& s,
                                      std::chrono::milliseconds timeout) {
  std::string where = s.host + ":" + std::to_string(s.port);
  if (ec == beast::error::timeout) {
    throw GenerationTimeout("generation service at " + where + " did not answer within " +
                            std::to_string(timeout.count()) + " ms (" + step + ")");
  }
  throw GenerationUnavailable("generation service at " + where + " unavailable during " + step + ": " + ec.message());
}

// Runs one asynchronous step to completion. tcp_stream enforces its deadline
// only on asynchronous operations.
template <class Start>
beast::error_code runStep(asio::io_context& ioc, Start start) {
  beast::error_code result;
  start([&result](beast::error_code ec, auto&&...) { result = ec; });
  ioc.restart();
  ioc.run();
  return result;
}

} // namespace

nlohmann::json buildChatRequestBody(const PlanRequest& request) {
  nlohmann::json message = {{"role", "user"}, {"content", request.prompt}};
  return {
    {"model", request.model},
    {"messages", nlohmann::json::array({message})},
    {"format", "json"},
    {"stream", false},
    {"options", {{"temperature", request.temperature}}},
  };
}

std::string extractChatContent(unsigned status, const std::string& body, const std::string& model) {
  nlohmann::json reply = nlohmann::json::parse(body, nullptr, false);
  std::string serviceError;
  if (!reply.is_discarded() && reply.is_object() && reply.contains("error") && reply["error"].is_string()) {
    serviceError = reply["error"].get<std::string>();
  }

  if (status == 404) throw GenerationUnavailable("model '" + model + "' not found" + (serviceError.empty() ? "" : ": " + serviceError));
  if (status < 200 || status >= 300) {
    throw GenerationUnavailable("generation service returned HTTP " + std::to_string(status) +
                                (serviceError.empty() ? "" : ": " + serviceError));
  }
  if (reply.is_discarded() || !reply.is_object()) throw GenerationUnavailable("generation service reply is not JSON");
  if (!serviceError.empty()) throw GenerationUnavailable("generation service error: " + serviceError);
  if (!reply.contains("message") || !reply["message"].is_object() || !reply["message"].contains("content") ||
      !reply["message"]["content"].is_string()) {
    throw GenerationUnavailable("generation service reply has no message content");
  }
  return reply["message"]["content"].get<std::string>();
}

OllamaGenerationClient::OllamaGenerationClient(OllamaSettings settings) : settings_(std::move(settings)) {}

std::string OllamaGenerationClient::generate(const PlanRequest& request) {
  asio::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);
  beast::error_code ec;

  auto results = resolver.resolve(settings_.host, std::to_string(settings_.port), ec);
  if (ec) raiseTransportError(ec, "resolve", settings_, request.timeout);

  stream.expires_after(request.timeout);
  ec = runStep(ioc, [&](auto handler) { stream.async_connect(results, handler); });
  if (ec) raiseTransportError(ec, "connect", settings_, request.timeout);

  http::request<http::string_body> req{http::verb::post, "/api/chat", 11};
  req.set(http::field::host, settings_.host);
  req.set(http::field::user_agent, "afyaplate");
  req.set(http::field::content_type, "application/json");
  req.body() = buildChatRequestBody(request).dump();
  req.prepare_payload();

  spdlog::debug("GenerationClient: POST /api/chat model={} attempt={} prompt={} chars", request.model,
                request.attempt, request.prompt.size());
  ec = runStep(ioc, [&](auto handler) { http::async_write(stream, req, handler); });
  if (ec) raiseTransportError(ec, "write", settings_, request.timeout);

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  ec = runStep(ioc, [&](auto handler) { http::async_read(stream, buffer, res, handler); });
  if (ec) raiseTransportError(ec, "read", settings_, request.timeout);

  // the service may already have closed its end
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);

  return extractChatContent(res.result_int(), res.body(), request.model);
}
