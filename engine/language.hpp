#ifndef ENGINE_LANGUAGE_HPP
#define ENGINE_LANGUAGE_HPP

#include <string>
#include <vector>

#include <kj/common.h>

namespace engine {

enum class Language { PYTHON, NODE };

// How code of a language is staged and started. The interpreter is never
// derived from request data: it comes from this table only.
struct LanguageSpec {
  Language language;
  // Identifier used in requests and advertised by /health.
  const char* name;
  // Command looked up in the sandbox PATH.
  const char* interpreter;
  // File name of the staged script inside the work root.
  const char* script_name;
};

// All the supported languages, in the order they are advertised.
const std::vector<LanguageSpec>& Languages();

// Returns the entry named name, if the language is supported.
kj::Maybe<const LanguageSpec&> FindLanguage(const std::string& name);

const LanguageSpec& GetLanguage(Language language);

// Returns the code placed before the submitted code. It sets the OUTPUT_DIR
// environment variable of the interpreter to output_dir, which is embedded as
// a JSON string literal.
std::string Prelude(Language language, const std::string& output_dir);

}  // namespace engine

#endif
