#include "engine/main.hpp"
#include "gateway/main.hpp"
#include "util/version.hpp"

class SnipboxMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit SnipboxMain(kj::ProcessContext& context)
      : context(context), gm(context), em(context) {}
  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "snipbox (" + util::version + ")",
                           "Runs untrusted code snippets under a wall-clock "
                           "limit and returns their output and files")
        .addSubCommand("serve", KJ_BIND_METHOD(gm, getMain),
                       "serve the HTTP interface")
        .addSubCommand("run", KJ_BIND_METHOD(em, getMain),
                       "run one file and print the result")
        .build();
  }

 private:
  kj::ProcessContext& context;
  gateway::Main gm;
  engine::Main em;
};

KJ_MAIN(SnipboxMain);
