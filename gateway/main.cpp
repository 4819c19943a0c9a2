#include "gateway/main.hpp"

#include <csignal>
#include <cstdlib>

#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <kj/compat/http.h>
#include <kj/debug.h>

#include "backward.hpp"
#include "gateway/server.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace gateway {
kj::MainBuilder::Validity Main::Run() {
  // Must happen before any thread is started.
  kj::UnixEventPort::captureSignal(SIGTERM);
  kj::UnixEventPort::captureSignal(SIGINT);

  backward::SignalHandling sh;
  util::LogManager log_manager(&context);
  util::LogManager::ConfigureLevel();

  engine::EngineOptions options;
  options.temp_directory = Flags::temp_directory;

  auto io = kj::setupAsyncIo();
  kj::HttpHeaderTable table;
  Service service(table, engine::Engine(options));
  kj::HttpServer server(io.provider->getTimer(), table, service);

  auto address = io.provider->getNetwork()
                     .parseAddress(Flags::listen_address, Flags::port)
                     .wait(io.waitScope);
  auto listener = address->listen();
  KJ_LOG(INFO, "Listening", Flags::listen_address, listener->getPort(),
         options.temp_directory);

  auto shutdown = io.unixEventPort.onSignal(SIGTERM)
                      .ignoreResult()
                      .exclusiveJoin(
                          io.unixEventPort.onSignal(SIGINT).ignoreResult());
  server.listenHttp(*listener).exclusiveJoin(kj::mv(shutdown)).wait(
      io.waitScope);

  KJ_LOG(INFO, "Shutting down, waiting for open requests");
  server.drain().wait(io.waitScope);
  // Requests whose client went away leave their executions running.
  KJ_LOG(INFO, "Waiting for running executions", service.RunningExecutions());
  service.WaitForExecutions();
  return true;
}

kj::MainFunc Main::getMain() {
  const char* port = getenv("PORT");  // NOLINT
  if (port != nullptr) {
    auto validity = util::setInt(&Flags::port)(port);
    if (validity.getError() != nullptr) {
      context.exitError(kj::str("invalid PORT: ", port));
    }
  }
  return kj::MainBuilder(context, "snipbox serve (" + util::version + ")",
                         "Serves GET /health and POST /run")
      .addOptionWithArg({'l', "address"},
                        util::setString(&Flags::listen_address), "<ADDRESS>",
                        "Address to listen on")
      .addOptionWithArg({'p', "port"}, util::setInt(&Flags::port), "<PORT>",
                        "Port to listen on, default $PORT or 8888")
      .addOptionWithArg({'T', "temp-dir"},
                        util::setString(&Flags::temp_directory), "<DIR>",
                        "Path where the workspaces should be created")
      .addOptionWithArg({'L', "logfile"}, util::setString(&Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(&Flags::verbose),
                 "Print stack traces of logged exceptions")
      .addOption({'q', "quiet"}, util::setBool(&Flags::quiet),
                 "Only log warnings and errors")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace gateway
