#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <mutex>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <exception>
#include <functional>
#include <unordered_map>

#include <httplib.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// JSON-RPC sandbox server on an ephemeral localhost port.
// Records every request and answers each method with a replaceable handler.
class FakeServer {
 public:
  using Handler = std::function<void(const nlohmann::json& params, httplib::Response&)>;
  struct Request {
    std::string path;
    std::string method;
    nlohmann::json envelope;
    nlohmann::json params;
    std::string authorization; // empty if absent
    std::string content_type;
  };

 private:
  httplib::Server svr_;
  int port_;
  std::thread thr_;
  std::mutex mtx_;
  std::unordered_map<std::string, Handler> handlers_;
  std::vector<Request> requests_;

  void Handle_(const httplib::Request& req, httplib::Response& res);
 public:
  FakeServer();
  ~FakeServer();

  std::string Url() const;
  void On(const std::string& method, Handler handler);

  std::vector<Request> Requests();
  size_t Count(const std::string& method);
  // last request of method; fails the test if there is none
  Request Last(const std::string& method);
};

void ReplyResult(httplib::Response&, const nlohmann::json& result);
void ReplyRpcError(httplib::Response&, const std::string& message, int code = -32000);
void ReplyStatus(httplib::Response&, int status, const std::string& body);

// handler answering sandbox.repl.getOutput with fixed lines
FakeServer::Handler OutputLines(const nlohmann::json& lines);

// Routes the default spdlog logger into a string while alive.
class LogCapture {
  std::ostringstream out_;
  std::shared_ptr<spdlog::logger> saved_;
 public:
  LogCapture();
  ~LogCapture();
  std::string Text() const { return out_.str(); }
};

// whether err was thrown with a nested exception of type T
template <class T>
bool NestedIs(const std::exception& err) {
  try {
    std::rethrow_if_nested(err);
  } catch (const T&) {
    return true;
  } catch (const std::exception&) {
    return false;
  }
  return false;
}

#endif // TEST_UTILS_H_
