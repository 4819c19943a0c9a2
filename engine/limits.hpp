#ifndef ENGINE_LIMITS_HPP
#define ENGINE_LIMITS_HPP

#include <cstddef>
#include <cstdint>

namespace engine {

static const constexpr int32_t kMaxTimeoutSeconds = 120;
static const constexpr int32_t kMinTimeoutSeconds = 1;
static const constexpr int32_t kDefaultTimeoutSeconds = 30;

// Caps on what one execution returns.
static const constexpr size_t kMaxOutputBytes = 100 * 1024;
static const constexpr int64_t kMaxFileBytes = 5 * 1024 * 1024;

// Reserved exit code of an execution killed because of its timeout.
static const constexpr int32_t kTimeoutExitCode = 124;

// How long output is read after the process group has been killed.
static const constexpr int64_t kDrainMillis = 5000;

// Largest accepted /run body.
static const constexpr size_t kMaxRequestBytes = 512 * 1024;

// The only PATH executed code sees; interpreters are looked up here too.
static const constexpr char* kSandboxPath = "/usr/local/bin:/usr/bin:/bin";

}  // namespace engine

#endif
