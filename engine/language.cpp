#include "engine/language.hpp"

#include <capnp/compat/json.h>
#include <capnp/dynamic.h>
#include <kj/debug.h>

namespace engine {

namespace {
// A JSON string literal is also a valid Python and JavaScript string literal.
std::string StringLiteral(const std::string& value) {
  capnp::JsonCodec codec;
  kj::String literal =
      codec.encode(capnp::DynamicValue::Reader(capnp::Text::Reader(
                       value.c_str(), value.size())),
                   capnp::Type(capnp::schema::Type::TEXT));
  return literal.cStr();
}
}  // namespace

const std::vector<LanguageSpec>& Languages() {
  static const std::vector<LanguageSpec> languages = {
      {Language::PYTHON, "python", "python3", "script.py"},
      {Language::NODE, "node", "node", "script.js"},
  };
  return languages;
}

kj::Maybe<const LanguageSpec&> FindLanguage(const std::string& name) {
  for (const LanguageSpec& spec : Languages()) {
    if (name == spec.name) return spec;
  }
  return nullptr;
}

const LanguageSpec& GetLanguage(Language language) {
  for (const LanguageSpec& spec : Languages()) {
    if (spec.language == language) return spec;
  }
  KJ_FAIL_ASSERT("Unknown language", static_cast<int>(language));
}

std::string Prelude(Language language, const std::string& output_dir) {
  std::string literal = StringLiteral(output_dir);
  switch (language) {
    case Language::PYTHON:
      return "import os; os.environ[\"OUTPUT_DIR\"] = " + literal + "\n";
    case Language::NODE:
      return "process.env.OUTPUT_DIR = " + literal + ";\n";
  }
  KJ_FAIL_ASSERT("Unknown language", static_cast<int>(language));
}

}  // namespace engine
