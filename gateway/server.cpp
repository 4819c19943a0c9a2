#include "gateway/server.hpp"

#include <chrono>
#include <thread>

#include <kj/debug.h>

#include "gateway/codec.hpp"
#include "util/log_manager.hpp"

namespace gateway {

namespace {
const char* StatusText(unsigned status) {
  switch (status) {
    case 200:
      return "OK";
    case 400:
      return "Bad Request";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 413:
      return "Payload Too Large";
    default:
      return "Internal Server Error";
  }
}

// Fills buffer from body, starting at filled, until EOF or until the buffer is
// full. Resolves to the number of bytes read.
kj::Promise<size_t> ReadBounded(kj::AsyncInputStream& body,
                                kj::ArrayPtr<kj::byte> buffer, size_t filled) {
  if (filled == buffer.size()) return filled;
  return body.tryRead(buffer.begin() + filled, 1, buffer.size() - filled)
      .then([&body, buffer, filled](size_t n) -> kj::Promise<size_t> {
        if (n == 0) return filled;
        return ReadBounded(body, buffer, filled + n);
      });
}

int64_t MillisSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}
}  // namespace

kj::Promise<void> Service::request(kj::HttpMethod method, kj::StringPtr url,
                                   const kj::HttpHeaders& headers,
                                   kj::AsyncInputStream& requestBody,
                                   Response& response) {
  std::string path(url.begin(), url.size());
  path = path.substr(0, path.find('?'));
  if (path == "/health") {
    if (method != kj::HttpMethod::GET) {
      KJ_LOG(INFO, method, path, 405);
      return Send(response, 405, EncodeError("method not allowed"));
    }
    KJ_LOG(INFO, method, path, 200);
    return Send(response, 200, EncodeHealth());
  }
  if (path == "/run") {
    if (method != kj::HttpMethod::POST) {
      KJ_LOG(INFO, method, path, 405);
      return Send(response, 405, EncodeError("method not allowed"));
    }
    return Run(requestBody, response);
  }
  KJ_LOG(INFO, method, path, 404);
  return Send(response, 404, EncodeError("not found"));
}

kj::Promise<void> Service::Run(kj::AsyncInputStream& body,
                               Response& response) {
  KJ_IF_MAYBE(length, body.tryGetLength()) {
    if (*length > engine::kMaxRequestBytes) {
      KJ_LOG(INFO, "POST /run rejected", 413, *length);
      return Send(response, 413, EncodeError("request body too large"));
    }
  }
  // One byte more than allowed, to tell a body at the limit from a longer one.
  auto buffer = kj::heapArray<kj::byte>(engine::kMaxRequestBytes + 1);
  auto data = buffer.asPtr();
  return ReadBounded(body, data, 0)
      .then(
          [this, &response, data](size_t size) -> kj::Promise<void> {
            if (size > engine::kMaxRequestBytes) {
              KJ_LOG(INFO, "POST /run rejected", 413, size);
              return Send(response, 413, EncodeError("request body too large"));
            }
            std::string text(data.begin(), data.begin() + size);
            engine::ExecutionRequest request;
            std::string error_msg;
            if (!ParseRunRequest(text, &request, &error_msg)) {
              KJ_LOG(INFO, "POST /run rejected", 400, error_msg);
              return Send(response, 400, EncodeError(error_msg));
            }
            return Execute(std::move(request), response);
          },
          [this, &response](kj::Exception&& e) -> kj::Promise<void> {
            KJ_LOG(INFO, "POST /run rejected", 400, e.getDescription());
            return Send(response, 400, EncodeError("invalid request"));
          })
      .attach(kj::mv(buffer));
}

kj::Promise<void> Service::Execute(engine::ExecutionRequest request,
                                   Response& response) {
  auto start = std::chrono::steady_clock::now();
  const char* language = engine::GetLanguage(request.language).name;
  size_t code_size = request.code.size();
  int32_t timeout = request.timeout_seconds;

  // The execution is not cancelled if the client goes away: the fulfiller
  // ignores the result once the promise is gone.
  auto paf = kj::newPromiseAndCrossThreadFulfiller<engine::ExecutionResult>();
  *running_.lockExclusive() += 1;
  std::thread([this, runner = engine_, request = std::move(request),
               fulfiller = kj::mv(paf.fulfiller)]() mutable {
    {
      util::LogManager log_manager;
      engine::ExecutionResult result;
      KJ_IF_MAYBE(exc, kj::runCatchingExceptions(
                           [&]() { result = runner.Run(request); })) {
        fulfiller->reject(kj::mv(*exc));
      } else {
        fulfiller->fulfill(kj::mv(result));
      }
      fulfiller = nullptr;
    }
    *running_.lockExclusive() -= 1;
  }).detach();

  return paf.promise.then(
      [this, &response, start, language, code_size,
       timeout](engine::ExecutionResult result) {
        KJ_LOG(INFO, "POST /run", 200, language, code_size, timeout,
               result.exit_code, result.stdout_data.size(),
               result.stderr_data.size(), result.files.size(),
               MillisSince(start));
        return Send(response, 200, EncodeResult(result));
      },
      [this, &response, start](kj::Exception&& e) {
        KJ_LOG(ERROR, "POST /run failed", 500, e.getDescription(),
               MillisSince(start));
        return Send(response, 500, EncodeError("internal error"));
      });
}

void Service::WaitForExecutions() const {
  running_.when([](const size_t& running) { return running == 0; },
                [](const size_t&) {});
}

size_t Service::RunningExecutions() const {
  return *running_.lockShared();
}

Service::~Service() { WaitForExecutions(); }

kj::Promise<void> Service::Send(Response& response, unsigned status,
                                std::string body) {
  kj::HttpHeaders headers(table_);
  headers.set(kj::HttpHeaderId::CONTENT_TYPE, "application/json");
  auto stream = response.send(status, StatusText(status), headers,
                              static_cast<uint64_t>(body.size()));
  auto data = kj::heapString(body.data(), body.size());
  auto promise = stream->write(data.begin(), data.size());
  return promise.attach(kj::mv(stream), kj::mv(data));
}

}  // namespace gateway
