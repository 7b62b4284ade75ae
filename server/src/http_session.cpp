/*
 * 설명: HTTP 요청을 처리하고 헬스체크/메트릭/WS 업그레이드를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol.md
 * 테스트: server/tests/e2e/race_flow_test.cpp
 */
#include "cuberace/http_session.hpp"

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "cuberace/websocket_session.hpp"

namespace cuberace {

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<RaceService> race_service,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), coordinator_(std::move(coordinator)),
      race_service_(std::move(race_service)), observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_->NextTraceId();
  observability_->IncrementRequest();
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "cube-race-server");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string path = std::string(req_.target());
  auto qpos = path.find('?');
  if (qpos != std::string::npos) {
    path = path.substr(0, qpos);
  }

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    return SendJson(res, http::status::ok, MakeSuccessEnvelope(payload));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot();
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}, {"players", snapshot.players_connected}}},
                        {"race",
                         {{"status", snapshot.race_running ? "running" : "waiting"},
                          {"ticks", snapshot.ticks},
                          {"finished", snapshot.races_finished}}},
                        {"commands", {{"accepted", snapshot.commands_accepted}, {"rejected", snapshot.commands_rejected}}}};
    return SendJson(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  SendJson(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::SendJson(std::shared_ptr<Response> res, boost::beast::http::status status,
                           const nlohmann::json& body) {
  res->result(status);
  res->body() = body.dump();
  res->content_length(res->body().size());
  SendResponse(std::move(res));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    observability_->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  LogContext ctx;
  ctx.trace_id = trace_id_;
  ctx.name = std::string(req_.target());
  ctx.latency_ms = latency;
  ctx.detail = {{"status", res->result_int()}};
  observability_->Log(LogLevel::kInfo, ctx);
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::HandleWebSocket() {
  std::string path = std::string(req_.target());
  if (path != "/ws") {
    request_start_ = std::chrono::steady_clock::now();
    trace_id_ = observability_->NextTraceId();
    auto res = std::make_shared<Response>();
    res->version(req_.version());
    res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    return SendJson(res, boost::beast::http::status::not_found,
                    MakeErrorEnvelope("not_found", "WS 업그레이드는 /ws 경로만 지원합니다"));
  }
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, "cube-race-server");
  }));
  try {
    ws.accept(req_);
    std::make_shared<WebSocketSession>(std::move(ws), coordinator_->NextPlayerId(), coordinator_, race_service_,
                                       config_.ws_queue_limit_messages, config_.ws_queue_limit_bytes)
        ->Run();
  } catch (const boost::system::system_error& ex) {
    LogContext ctx;
    ctx.trace_id = observability_->NextTraceId();
    ctx.name = "ws_handshake_failed";
    ctx.detail = {{"error", ex.what()}};
    observability_->Log(LogLevel::kWarn, ctx);
  }
}

}  // namespace cuberace
