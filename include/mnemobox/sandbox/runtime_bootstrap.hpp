#pragma once

#include "mnemobox/sandbox/policy.hpp"
#include "mnemobox/sandbox/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mnemobox::sandbox {

/// Descriptor numbers the runtime uses to talk to the broker.
inline constexpr int kRuntimeRequestFd = 3;
inline constexpr int kRuntimeReplyFd = 4;

/// Program fed to the runtime on stdin: the payload (snippet and context)
/// followed by the host script that hosts the snippet in a fresh context.
[[nodiscard]] std::string build_runtime_program(const std::string &code,
                                                const ExecutionContext &context);

/// Command-line flags: permission model without grants, no code generation
/// from strings, and a heap ceiling derived from the memory limit.
[[nodiscard]] std::vector<std::string> runtime_flags(const PolicyConfig &policy);

[[nodiscard]] std::uint64_t runtime_heap_megabytes(const PolicyConfig &policy);

} // namespace mnemobox::sandbox
