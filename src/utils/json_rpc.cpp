#include "utils/json_rpc.hpp"
#include <stdexcept>

using json = nlohmann::json;

static std::string DescribeError(const json& err) {
  if (err.is_object() && err.contains("message") && err["message"].is_string()) {
    std::string msg = err["message"].get<std::string>();
    if (err.contains("code")) msg = "(" + err["code"].dump() + ") " + msg;
    return msg;
  }
  return err.dump();
}

namespace JsonRpcUtil {
  std::string BuildRequest(const std::string& method, const json& params) {
    json j = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", method}, {"params", params}};
    return j.dump();
  }

  json ExtractResult(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) throw std::runtime_error("malformed JSON-RPC body: " + body.substr(0, 200));
    if (j.contains("error") && !j["error"].is_null()) throw std::runtime_error(DescribeError(j["error"]));
    if (!j.contains("result")) throw std::runtime_error("missing result");
    return j["result"];
  }

  std::string ExtractError(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::string();
    if (j.contains("error") && !j["error"].is_null()) return DescribeError(j["error"]);
    return std::string();
  }
}
