#ifndef ENGINE_WORKSPACE_HPP
#define ENGINE_WORKSPACE_HPP

#include <string>

#include "engine/language.hpp"
#include "util/file.hpp"

namespace engine {

// The directory tree of one execution: a uniquely named work root containing
// the output directory and the staged script. The whole tree is removed when
// the workspace is destroyed; removal errors are logged and never thrown.
class Workspace {
 public:
  // Creates the tree under base and stages code for language. Throws
  // std::system_error if the tree or the script cannot be created.
  Workspace(const std::string& base, const LanguageSpec& language,
            const std::string& code);

  const std::string& Root() const { return root_.Path(); }
  const std::string& OutputDir() const { return output_dir_; }
  const std::string& ScriptPath() const { return script_path_; }

  KJ_DISALLOW_COPY(Workspace);

 private:
  util::TempDir root_;
  std::string output_dir_;
  std::string script_path_;
};

}  // namespace engine

#endif
