#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace JsonRpcUtil {
  // {"jsonrpc":"2.0","id":1,"method":...,"params":...}
  std::string BuildRequest(const std::string& method, const nlohmann::json& params);
  // Returns the "result" member, throws std::runtime_error on an error payload or malformed body
  nlohmann::json ExtractResult(const std::string& json_body);
  // Extract error message if present, empty otherwise (also empty on unparsable bodies)
  std::string ExtractError(const std::string& json_body);
}
