/***
 * Name: puretop::Transformer (impl)
 */
#include "transformer/Transformer.h"
#include "ast/Module.h"
#include "codegen/Emitter.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include <memory>
#include <string>

namespace puretop {

TransformResult Transformer::transform(const std::string& source, const std::string& name,
                                       const purity::Denylist& denylist) {
  lex::Lexer lexer;
  lexer.pushString(source, name);
  parse::Parser parser(lexer);
  std::unique_ptr<ast::Module> mod = parser.parseModule();

  opt::PureToplevel pass(denylist);
  TransformResult result;
  result.annotated = pass.run(*mod);
  result.stats = pass.stats();
  result.decisions = pass.decisions();
  result.code = codegen::Emitter::emit(lexer.source(), mod->comments);
  return result;
}

std::string Transformer::transform(const std::string& source) {
  return transform(source, "<input>", purity::Denylist::defaults()).code;
}

} // namespace puretop
