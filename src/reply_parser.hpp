#pragma once

#include <string>
#include <vector>

namespace ask_continue {

struct ReplyAttachment {
  std::string name;
  std::string mime_type;
  std::string base64_data;

  bool IsImage() const { return mime_type.rfind("image/", 0) == 0; }
};

struct ParsedReply {
  std::string text;
  std::vector<ReplyAttachment> attachments;
};

// Splits a companion reply into plain text and the inline attachments it
// carries as "[Image N: name]\ndata:<mime>;base64,<payload>" blocks (the
// companion's localized marker labels are accepted too).
ParsedReply ParseUserReply(const std::string& reply);

}  // namespace ask_continue
