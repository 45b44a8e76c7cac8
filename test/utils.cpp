#include "utils.h"

#include <chrono>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

FakeServer::FakeServer() {
  handlers_["sandbox.start"] = [](const nlohmann::json&, httplib::Response& res) {
    ReplyResult(res, {{"message", "Sandbox started"}});
  };
  handlers_["sandbox.stop"] = [](const nlohmann::json&, httplib::Response& res) {
    ReplyResult(res, {{"message", "Sandbox stopped"}});
  };
  handlers_["sandbox.repl.run"] = [](const nlohmann::json&, httplib::Response& res) {
    ReplyResult(res, {{"execution_id", "exec-1"}});
  };
  handlers_["sandbox.repl.getOutput"] = OutputLines(nlohmann::json::array());
  handlers_["sandbox.command.run"] = [](const nlohmann::json& params, httplib::Response& res) {
    ReplyResult(res, {
        {"command", params.at("command")}, {"args", params.at("args")},
        {"exit_code", 0}, {"stdout", ""}, {"stderr", ""}});
  };
  handlers_["sandbox.metrics.get"] = [](const nlohmann::json& params, httplib::Response& res) {
    ReplyResult(res, {
        {"name", params.at("sandbox")}, {"namespace", params.at("namespace")}, {"running", true}});
  };
  svr_.Post(R"((/.*)?/api/v1/rpc)", [this](const httplib::Request& req, httplib::Response& res) {
    Handle_(req, res);
  });
  port_ = svr_.bind_to_any_port("127.0.0.1");
  thr_ = std::thread([this]() { svr_.listen_after_bind(); });
  while (!svr_.is_running()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
}

FakeServer::~FakeServer() {
  svr_.stop();
  thr_.join();
}

std::string FakeServer::Url() const {
  return "http://127.0.0.1:" + std::to_string(port_);
}

void FakeServer::On(const std::string& method, Handler handler) {
  std::lock_guard lck(mtx_);
  handlers_[method] = std::move(handler);
}

void FakeServer::Handle_(const httplib::Request& req, httplib::Response& res) {
  using nlohmann::json;
  Request rec;
  rec.path = req.path;
  rec.authorization = req.get_header_value("Authorization");
  rec.content_type = req.get_header_value("Content-Type");
  try {
    rec.envelope = json::parse(req.body);
    rec.method = rec.envelope.at("method").get<std::string>();
    rec.params = rec.envelope.at("params");
  } catch (json::exception& err) {
    spdlog::warn("Fake server got a bad request: {}", err.what());
    ReplyStatus(res, 400, "bad request");
    return;
  }
  Handler handler;
  {
    std::lock_guard lck(mtx_);
    requests_.push_back(rec);
    if (auto it = handlers_.find(rec.method); it != handlers_.end()) handler = it->second;
  }
  if (!handler) {
    res.status = 404;
    res.set_content(json{{"jsonrpc", "2.0"}, {"error", {{"code", -32601},
        {"message", "Method not found: " + rec.method}}}}.dump(), "application/json");
    return;
  }
  handler(rec.params, res);
}

std::vector<FakeServer::Request> FakeServer::Requests() {
  std::lock_guard lck(mtx_);
  return requests_;
}

size_t FakeServer::Count(const std::string& method) {
  std::lock_guard lck(mtx_);
  size_t ret = 0;
  for (auto& req : requests_) ret += req.method == method;
  return ret;
}

FakeServer::Request FakeServer::Last(const std::string& method) {
  std::lock_guard lck(mtx_);
  for (auto it = requests_.rbegin(); it != requests_.rend(); ++it) {
    if (it->method == method) return *it;
  }
  ADD_FAILURE() << "no request of " << method;
  return Request();
}

void ReplyResult(httplib::Response& res, const nlohmann::json& result) {
  res.status = 200;
  res.set_content(nlohmann::json{{"jsonrpc", "2.0"}, {"result", result}, {"id", 1}}.dump(),
                  "application/json");
}

void ReplyRpcError(httplib::Response& res, const std::string& message, int code) {
  res.status = 200;
  res.set_content(nlohmann::json{{"jsonrpc", "2.0"},
      {"error", {{"code", code}, {"message", message}}}, {"id", 1}}.dump(), "application/json");
}

void ReplyStatus(httplib::Response& res, int status, const std::string& body) {
  res.status = status;
  res.set_content(body, "text/plain");
}

FakeServer::Handler OutputLines(const nlohmann::json& lines) {
  return [lines](const nlohmann::json&, httplib::Response& res) {
    ReplyResult(res, {{"lines", lines}});
  };
}

LogCapture::LogCapture() : saved_(spdlog::default_logger()) {
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out_);
  auto logger = std::make_shared<spdlog::logger>("capture", sink);
  logger->set_level(spdlog::level::trace);
  logger->set_pattern("%l %v");
  spdlog::set_default_logger(logger);
}

LogCapture::~LogCapture() {
  spdlog::set_default_logger(saved_);
}
