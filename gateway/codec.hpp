#ifndef GATEWAY_CODEC_HPP
#define GATEWAY_CODEC_HPP

#include <string>

#include "engine/engine.hpp"

namespace gateway {

// Parses the body of a /run request. An empty body is read as "{}". Returns
// false and sets error_msg to the message for the client if the request has
// to be rejected; nothing is allocated for the execution in that case.
bool ParseRunRequest(const std::string& body,
                     engine::ExecutionRequest* request,
                     std::string* error_msg);

std::string EncodeResult(const engine::ExecutionResult& result);
std::string EncodeError(const std::string& message);
// The /health document, advertising every supported language.
std::string EncodeHealth();

}  // namespace gateway

#endif
