#include "companion_client.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <string>

namespace ask_continue {
namespace {

static std::string JsonStringField(const nlohmann::json& j, const char* key) {
  if (!j.is_object() || !j.contains(key)) return {};
  if (j[key].is_string()) return j[key].get<std::string>();
  if (j[key].is_null()) return {};
  return j[key].dump();
}

static AttemptOutcome TransportFailure(httplib::Error err, int port) {
  AttemptOutcome out;
  switch (err) {
    case httplib::Error::Connection:
      out.kind = AttemptKind::kUnreachable;
      out.detail = "cannot connect to port " + std::to_string(port);
      break;
    case httplib::Error::ConnectionTimeout:
    case httplib::Error::Read:
      out.kind = AttemptKind::kTimedOut;
      out.detail = "timed out talking to port " + std::to_string(port);
      break;
    default:
      out.kind = AttemptKind::kUnreachable;
      out.detail = "port " + std::to_string(port) + ": " + httplib::to_string(err);
      break;
  }
  return out;
}

}  // namespace

const char* AttemptKindName(AttemptKind kind) {
  switch (kind) {
    case AttemptKind::kAccepted:
      return "accepted";
    case AttemptKind::kRefused:
      return "refused";
    case AttemptKind::kUnreachable:
      return "unreachable";
    case AttemptKind::kTimedOut:
      return "timed_out";
  }
  return "unknown";
}

AttemptOutcome AskCompanion(const std::string& host,
                            int port,
                            const std::string& request_id,
                            const std::string& reason,
                            int callback_port,
                            int timeout_seconds) {
  httplib::Client cli(host, port);
  cli.set_connection_timeout(timeout_seconds);
  cli.set_read_timeout(timeout_seconds);
  cli.set_write_timeout(timeout_seconds);

  nlohmann::json body;
  body["type"] = "ask_continue";
  body["requestId"] = request_id;
  body["reason"] = reason;
  body["callbackPort"] = callback_port;

  auto res = cli.Post("/ask", body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
  if (!res) return TransportFailure(res.error(), port);

  auto j = nlohmann::json::parse(res->body, nullptr, false);
  if (res->status < 200 || res->status >= 300) {
    AttemptOutcome out;
    out.kind = AttemptKind::kRefused;
    if (!j.is_discarded() && j.is_object() && j.contains("error")) {
      out.detail = "companion error: " + JsonStringField(j, "error") + " - " + JsonStringField(j, "details");
    } else {
      out.detail = "companion error: http " + std::to_string(res->status);
    }
    return out;
  }

  if (!j.is_discarded() && j.is_object() && j.contains("success") && j["success"].is_boolean() &&
      j["success"].get<bool>()) {
    return {AttemptKind::kAccepted, {}};
  }
  return {AttemptKind::kRefused, "companion did not accept request"};
}

}  // namespace ask_continue
