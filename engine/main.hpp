#ifndef ENGINE_MAIN_HPP
#define ENGINE_MAIN_HPP
#include <kj/main.h>

namespace engine {

class Main {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit Main(kj::ProcessContext& context) : context(context) {}
  kj::MainBuilder::Validity Run(kj::StringPtr file);
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
};
}  // namespace engine
#endif
