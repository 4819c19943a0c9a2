#include "gateway/codec.hpp"

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>

#include "capnp/runner.capnp.h"
#include "util/misc.hpp"

namespace gateway {

namespace {
capnp::Text::Reader ToText(const std::string& s) {
  return capnp::Text::Reader(s.data(), s.size());
}

std::string FromText(capnp::Text::Reader text) {
  return std::string(text.begin(), text.size());
}

template <typename Reader>
std::string Encode(Reader reader) {
  capnp::JsonCodec codec;
  kj::String json = codec.encode(reader);
  return std::string(json.begin(), json.size());
}
}  // namespace

bool ParseRunRequest(const std::string& body,
                     engine::ExecutionRequest* request,
                     std::string* error_msg) {
  std::string text = body.empty() ? "{}" : body;
  auto input = kj::arrayPtr(text.data(), text.size());
  capnp::JsonCodec codec;

  capnp::MallocMessageBuilder raw_message;
  auto raw = raw_message.initRoot<capnp::JsonValue>();
  KJ_IF_MAYBE(exc, kj::runCatchingExceptions(
                       [&]() { codec.decodeRaw(input, raw); })) {
    KJ_LOG(INFO, "Rejected request body", exc->getDescription());
    *error_msg = "invalid JSON";
    return false;
  }
  if (raw.which() != capnp::JsonValue::OBJECT) {
    *error_msg = "invalid request";
    return false;
  }

  capnp::MallocMessageBuilder message;
  auto builder = message.initRoot<capnproto::RunRequest>();
  KJ_IF_MAYBE(exc, kj::runCatchingExceptions(
                       [&]() { codec.decode(input, builder); })) {
    KJ_LOG(INFO, "Rejected request fields", exc->getDescription());
    *error_msg = "invalid request";
    return false;
  }
  auto reader = builder.asReader();

  std::string language = FromText(reader.getLanguage());
  KJ_IF_MAYBE(spec, engine::FindLanguage(language)) {
    request->language = spec->language;
  } else {
    *error_msg = "unsupported language: " + language;
    return false;
  }

  std::string code = FromText(reader.getCode());
  if (util::isBlank(code)) {
    *error_msg = "empty code";
    return false;
  }
  request->code = std::move(code);
  request->timeout_seconds = engine::ClampTimeout(reader.getTimeout());
  return true;
}

std::string EncodeResult(const engine::ExecutionResult& result) {
  capnp::MallocMessageBuilder message;
  auto builder = message.initRoot<capnproto::RunResult>();
  builder.setStdout(ToText(result.stdout_data));
  builder.setStderr(ToText(result.stderr_data));
  builder.setExitCode(result.exit_code);
  auto files = builder.initFiles(result.files.size());
  for (size_t i = 0; i < result.files.size(); i++) {
    files[i].setName(ToText(result.files[i].name));
    files[i].setData(ToText(result.files[i].data));
    files[i].setSize(result.files[i].size);
  }
  return Encode(builder.asReader());
}

std::string EncodeError(const std::string& message) {
  capnp::MallocMessageBuilder builder;
  auto error = builder.initRoot<capnproto::Error>();
  error.setError(ToText(message));
  return Encode(error.asReader());
}

std::string EncodeHealth() {
  capnp::MallocMessageBuilder builder;
  auto health = builder.initRoot<capnproto::Health>();
  health.setOk(true);
  const auto& languages = engine::Languages();
  auto names = health.initLanguages(languages.size());
  for (size_t i = 0; i < languages.size(); i++) {
    names.set(i, languages[i].name);
  }
  return Encode(health.asReader());
}

}  // namespace gateway
