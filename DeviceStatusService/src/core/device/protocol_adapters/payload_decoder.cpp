#include "core/device/protocol_adapters/payload_decoder.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>

#include "mongoose.h"

namespace devstatus {
namespace core {
namespace device {
namespace protocol_adapters {

namespace {

static std::string ToStdString(const struct mg_str& s) {
  return std::string(s.buf, s.len);
}

static bool IsSpace(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

// Decodes a JSON string token; falls back to the raw token text.
static std::string Unquote(const struct mg_str& tok) {
  char* s = mg_json_get_str(tok, "$");
  if (s == nullptr) return ToStdString(tok);
  std::string out(s);
  mg_free(s);
  return out;
}

static model::PayloadValue DecodeNumber(const struct mg_str& tok) {
  const std::string text = ToStdString(tok);
  if (text.find_first_of(".eE") == std::string::npos) {
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(text.c_str(), &end, 10);
    if (errno == 0 && end != nullptr && *end == '\0') return static_cast<std::int64_t>(v);
  }
  double d = 0.0;
  if (mg_json_get_num(tok, "$", &d)) return d;
  return text;
}

static model::PayloadValue DecodeValue(const struct mg_str& tok) {
  if (tok.len == 0) return nullptr;
  const char c = tok.buf[0];
  if (c == '"') return Unquote(tok);
  if (c == 't' || c == 'f') {
    bool b = false;
    if (mg_json_get_bool(tok, "$", &b)) return b;
    return ToStdString(tok);
  }
  if (c == 'n') return nullptr;
  if (c == '-' || (c >= '0' && c <= '9')) return DecodeNumber(tok);
  return ToStdString(tok);
}

}  // namespace

bool DecodeJsonPayload(const std::string& body, model::StatusPayload& out) {
  const struct mg_str json = mg_str_n(body.data(), body.size());
  int toklen = 0;
  const int root = mg_json_get(json, "$", &toklen);
  if (root < 0 || toklen <= 0) return false;
  if (body[static_cast<size_t>(root)] != '{') return false;

  const struct mg_str obj = mg_str_n(body.data() + root, static_cast<size_t>(toklen));
  model::StatusPayload p;
  struct mg_str key {};
  struct mg_str val {};
  size_t ofs = 0;
  while ((ofs = mg_json_next(obj, ofs, &key, &val)) > 0) {
    p[Unquote(key)] = DecodeValue(val);
  }
  out = std::move(p);
  return true;
}

model::StatusPayload DecodeHeartbeatPayload(const std::string& body) {
  model::StatusPayload p;
  size_t i = 0;
  while (i < body.size() && IsSpace(body[i])) ++i;
  if (i == body.size()) return p;

  if (body[i] == '{' && DecodeJsonPayload(body, p)) return p;

  p["raw"] = body;
  return p;
}

}  // namespace protocol_adapters
}  // namespace device
}  // namespace core
}  // namespace devstatus
