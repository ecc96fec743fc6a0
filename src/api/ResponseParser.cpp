#include "api/ResponseParser.hpp"

#include "common/Errors.hpp"

namespace porkbun::api {

namespace {

// The registrar sends ids, TTLs and priorities as strings on retrieve and
// as numbers on create.
std::optional<std::string> scalarAsString(const nlohmann::json& jObject, const char* pKey) {
  const auto it = jObject.find(pKey);
  if (it == jObject.end() || it->is_null()) {
    return std::nullopt;
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  if (it->is_number() || it->is_boolean()) {
    return it->dump();
  }
  throw common::ApiDecodeError("invalid_field",
                               std::string("Record field '") + pKey + "' has unexpected type");
}

std::string requiredString(const nlohmann::json& jObject, const char* pKey) {
  auto oValue = scalarAsString(jObject, pKey);
  if (!oValue.has_value()) {
    throw common::ApiDecodeError("missing_field",
                                 std::string("Record is missing field '") + pKey + "'");
  }
  return *oValue;
}

}  // anonymous namespace

bool ResponseParser::isSuccess(const nlohmann::json& jResponse) {
  const auto it = jResponse.find("status");
  return it != jResponse.end() && it->is_string() && it->get<std::string>() == "SUCCESS";
}

std::optional<std::string> ResponseParser::message(const nlohmann::json& jResponse) {
  const auto it = jResponse.find("message");
  if (it == jResponse.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

common::DnsRecord ResponseParser::parseRecord(const nlohmann::json& jRecord) {
  if (!jRecord.is_object()) {
    throw common::ApiDecodeError("invalid_record", "Record entry is not an object");
  }

  common::DnsRecord dr;
  dr.sId = requiredString(jRecord, "id");
  dr.sName = requiredString(jRecord, "name");
  dr.sType = requiredString(jRecord, "type");
  dr.sContent = scalarAsString(jRecord, "content").value_or("");
  dr.oTtl = scalarAsString(jRecord, "ttl");
  dr.oPriority = scalarAsString(jRecord, "prio");
  dr.oNotes = scalarAsString(jRecord, "notes");
  return dr;
}

std::vector<common::DnsRecord> ResponseParser::parseRecordSet(const nlohmann::json& jResponse) {
  const auto it = jResponse.find("records");
  if (it == jResponse.end() || !it->is_array()) {
    throw common::ApiDecodeError("missing_records", "Response has no 'records' array");
  }

  std::vector<common::DnsRecord> vRecords;
  vRecords.reserve(it->size());
  for (const auto& jRecord : *it) {
    vRecords.push_back(parseRecord(jRecord));
  }
  return vRecords;
}

std::string ResponseParser::parseYourIp(const nlohmann::json& jResponse) {
  const auto it = jResponse.find("yourIp");
  if (it == jResponse.end() || !it->is_string()) {
    throw common::ApiDecodeError("missing_field", "Ping response has no 'yourIp' string");
  }
  return it->get<std::string>();
}

}  // namespace porkbun::api
