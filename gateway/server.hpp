#ifndef GATEWAY_SERVER_HPP
#define GATEWAY_SERVER_HPP

#include <string>

#include <kj/async.h>
#include <kj/compat/http.h>
#include <kj/mutex.h>

#include "engine/engine.hpp"

namespace gateway {

// HTTP front of the engine:
//   GET  /health  capability document
//   POST /run     executes one snippet
// Every response is JSON. Executions run on their own thread each, so the
// event loop keeps serving while snippets run. An execution whose client went
// away still runs to completion; the Service must outlive it, see
// WaitForExecutions.
class Service final : public kj::HttpService {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  Service(kj::HttpHeaderTable& table, engine::Engine engine)
      : table_(table), engine_(std::move(engine)) {}
  ~Service();

  kj::Promise<void> request(kj::HttpMethod method, kj::StringPtr url,
                            const kj::HttpHeaders& headers,
                            kj::AsyncInputStream& requestBody,
                            Response& response) override;

  // Blocks until every execution started by this service has finished and
  // its workspace is gone. Call after the server has been drained.
  void WaitForExecutions() const;

  size_t RunningExecutions() const;

 private:
  kj::Promise<void> Run(kj::AsyncInputStream& body, Response& response);
  kj::Promise<void> Execute(engine::ExecutionRequest request,
                            Response& response);
  kj::Promise<void> Send(Response& response, unsigned status,
                         std::string body);

  kj::HttpHeaderTable& table_;
  engine::Engine engine_;
  kj::MutexGuarded<size_t> running_{0};
};

}  // namespace gateway

#endif
