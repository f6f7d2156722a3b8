#pragma once

#include "core/shared/types.h"

#include <QString>

namespace cw {
namespace tools {

// Command line of a tool invocation: Codex function_call arguments.command
// (top level, then payload) or Claude tool_use input. Empty otherwise.
QString commandText(const Message& message);

// Captured output of a tool: Codex function_call_output output, Claude
// tool_result content (stderr when is_error). Empty otherwise.
QString stdoutText(const Message& message);
QString stderrText(const Message& message);

} // namespace tools
} // namespace cw
