#include "engine/main.hpp"

#include <unistd.h>
#include <system_error>

#include <kj/debug.h>
#include <kj/io.h>

#include "backward.hpp"
#include "engine/engine.hpp"
#include "gateway/codec.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace engine {
kj::MainBuilder::Validity Main::Run(kj::StringPtr file) {
  backward::SignalHandling sh;
  util::LogManager log_manager(&context);
  util::LogManager::ConfigureLevel();

  ExecutionRequest request;
  KJ_IF_MAYBE(spec, FindLanguage(Flags::language)) {
    request.language = spec->language;
  } else {
    return kj::str("unsupported language: ", Flags::language.c_str());
  }
  try {
    auto producer = util::File::Read(file.cStr());
    for (auto chunk = producer(); chunk.size() > 0; chunk = producer()) {
      request.code.append(reinterpret_cast<const char*>(chunk.begin()),
                          chunk.size());
    }
  } catch (const std::system_error& e) {
    return kj::str("cannot read ", file, ": ", e.what());
  }
  if (util::isBlank(request.code)) return kj::str("empty code");
  request.timeout_seconds = ClampTimeout(Flags::timeout);

  EngineOptions options;
  options.temp_directory = Flags::temp_directory;
  ExecutionResult result = Engine(options).Run(request);

  std::string json = gateway::EncodeResult(result) + "\n";
  kj::FdOutputStream out(STDOUT_FILENO);
  out.write(json.data(), json.size());
  return true;
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, "snipbox run (" + util::version + ")",
                         "Executes one file like POST /run would and prints "
                         "the JSON result")
      .addOptionWithArg({'g', "language"}, util::setString(&Flags::language),
                        "<LANG>", "Language of the file (python or node)")
      .addOptionWithArg({'t', "timeout"}, util::setInt(&Flags::timeout),
                        "<SECONDS>", "Wall-clock limit, clamped to [1, 120]")
      .addOptionWithArg({'T', "temp-dir"},
                        util::setString(&Flags::temp_directory), "<DIR>",
                        "Path where the workspaces should be created")
      .addOptionWithArg({'L', "logfile"}, util::setString(&Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(&Flags::verbose),
                 "Print stack traces of logged exceptions")
      .addOption({'q', "quiet"}, util::setBool(&Flags::quiet),
                 "Only log warnings and errors")
      .expectArg("<FILE>", KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace engine
