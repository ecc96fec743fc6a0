#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace porkbun::api {

/// Converts registrar response objects into domain types.
/// Throws ApiDecodeError when a required field is missing or mistyped.
/// Class abbreviation: N/A (static interface)
class ResponseParser {
 public:
  /// True when the response carries status "SUCCESS".
  static bool isSuccess(const nlohmann::json& jResponse);

  /// Registrar-supplied "message", if any.
  static std::optional<std::string> message(const nlohmann::json& jResponse);

  static common::DnsRecord parseRecord(const nlohmann::json& jRecord);

  /// Parse the "records" array of a retrieve response, preserving order.
  static std::vector<common::DnsRecord> parseRecordSet(const nlohmann::json& jResponse);

  /// The caller's address from a /ping/ response ("yourIp").
  static std::string parseYourIp(const nlohmann::json& jResponse);
};

}  // namespace porkbun::api
