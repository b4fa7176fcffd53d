#include "reply_parser.hpp"

#include <cctype>
#include <cstddef>
#include <string>
#include <utility>

namespace ask_continue {
namespace {

constexpr const char* kAttachmentLabels[] = {"Image", "File", "图片", "文件"};
constexpr const char* kUploadedLabels[] = {"Uploaded image", "Uploaded file", "已上传图片", "已上传文件"};

static bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && IsSpace(s[start])) start++;
  size_t end = s.size();
  while (end > start && IsSpace(s[end - 1])) end--;
  return s.substr(start, end - start);
}

static bool StartsWithAt(const std::string& s, size_t pos, const std::string& prefix) {
  return pos <= s.size() && s.compare(pos, prefix.size(), prefix) == 0;
}

// Matches "[<label> <digits>: <name>]" at `pos`. Returns the index just past
// the closing bracket, or npos.
template <size_t N>
static size_t MatchTag(const std::string& s, size_t pos, const char* const (&labels)[N], std::string* name) {
  if (pos >= s.size() || s[pos] != '[') return std::string::npos;
  for (const char* label : labels) {
    size_t i = pos + 1;
    const std::string l(label);
    if (!StartsWithAt(s, i, l)) continue;
    i += l.size();
    if (i >= s.size() || s[i] != ' ') continue;
    i++;
    const size_t digits = i;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) i++;
    if (i == digits || !StartsWithAt(s, i, ": ")) continue;
    i += 2;
    const size_t close = s.find(']', i);
    if (close == std::string::npos || close == i) continue;
    if (name) *name = s.substr(i, close - i);
    return close + 1;
  }
  return std::string::npos;
}

// Matches a full attachment block at `pos`:
// "[Image N: name]\ndata:<mime>;base64,<payload>". The payload runs to the
// next whitespace and may be megabytes long.
static size_t MatchAttachment(const std::string& s, size_t pos, ReplyAttachment* out) {
  std::string name;
  size_t i = MatchTag(s, pos, kAttachmentLabels, &name);
  if (i == std::string::npos || i >= s.size() || s[i] != '\n') return std::string::npos;
  i++;
  if (!StartsWithAt(s, i, "data:")) return std::string::npos;
  i += 5;
  const size_t semi = s.find(';', i);
  if (semi == std::string::npos || semi == i || !StartsWithAt(s, semi + 1, "base64,")) return std::string::npos;
  const size_t payload = semi + 1 + 7;
  size_t end = payload;
  while (end < s.size() && !IsSpace(s[end])) end++;
  if (end == payload) return std::string::npos;

  out->name = std::move(name);
  out->mime_type = s.substr(i, semi - i);
  out->base64_data = s.substr(payload, end - payload);
  return end;
}

static std::string StripUploadedTags(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  size_t copied = 0;
  for (size_t pos = s.find('['); pos != std::string::npos; pos = s.find('[', pos + 1)) {
    const size_t end = MatchTag(s, pos, kUploadedLabels, nullptr);
    if (end == std::string::npos) continue;
    out.append(s, copied, pos - copied);
    copied = end;
    pos = end - 1;
  }
  out.append(s, copied, std::string::npos);
  return out;
}

}  // namespace

ParsedReply ParseUserReply(const std::string& reply) {
  ParsedReply out;
  std::string text;
  size_t copied = 0;
  for (size_t pos = reply.find('['); pos != std::string::npos; pos = reply.find('[', pos + 1)) {
    ReplyAttachment a;
    const size_t end = MatchAttachment(reply, pos, &a);
    if (end == std::string::npos) continue;
    text.append(reply, copied, pos - copied);
    out.attachments.push_back(std::move(a));
    copied = end;
    pos = end - 1;
  }
  if (out.attachments.empty()) {
    out.text = Trim(reply);
    return out;
  }
  text.append(reply, copied, std::string::npos);
  out.text = Trim(StripUploadedTags(text));
  return out;
}

}  // namespace ask_continue
