/***
 * Name: puretop::codegen::Emitter (impl)
 */
#include "codegen/Emitter.h"
#include <algorithm>
#include <cstddef>
#include <string>

namespace puretop::codegen {

std::string Emitter::render(const ast::Comment& comment) {
  if (comment.kind == ast::CommentKind::Line) { return "//" + comment.text + "\n"; }
  return "/*" + comment.text + "*/";
}

std::string Emitter::emit(const std::string& source, const ast::SourceComments& comments) {
  const auto inserts = comments.synthesized();
  if (inserts.empty()) { return source; }
  std::string out;
  out.reserve(source.size() + inserts.size() * 16);
  std::size_t cursor = 0;
  for (const auto& [pos, comment] : inserts) {
    const std::size_t at = std::min(pos, source.size());
    if (at > cursor) {
      out.append(source, cursor, at - cursor);
      cursor = at;
    }
    out += render(*comment);
  }
  out.append(source, cursor, std::string::npos);
  return out;
}

} // namespace puretop::codegen
