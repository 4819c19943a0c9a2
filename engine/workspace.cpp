#include "engine/workspace.hpp"

#include <kj/debug.h>

namespace engine {

Workspace::Workspace(const std::string& base, const LanguageSpec& language,
                     const std::string& code)
    : root_(base, "snipbox-"),
      output_dir_(util::File::JoinPath(root_.Path(), "output")),
      script_path_(util::File::JoinPath(root_.Path(), language.script_name)) {
  util::File::MakeDirs(output_dir_);
  util::File::WriteAll(script_path_,
                       Prelude(language.language, output_dir_) + code);
  KJ_LOG(INFO, "Workspace staged", root_.Path(), language.name, code.size());
}

}  // namespace engine
