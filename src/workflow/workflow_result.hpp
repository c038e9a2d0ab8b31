#pragma once

#include "core/errors/exit_codes.hpp"

#include <filesystem>
#include <string>
#include <utility>

namespace diststage::workflow {

// kSkipped means a gate was not met: informational, no side effects, and
// not an error.
enum class WorkflowOutcome {
  kCompleted,
  kSkipped,
  kFailed,
};

inline const char* ToString(WorkflowOutcome outcome) {
  switch (outcome) {
  case WorkflowOutcome::kCompleted:
    return "completed";
  case WorkflowOutcome::kSkipped:
    return "skipped";
  case WorkflowOutcome::kFailed:
    return "failed";
  }
  return "unknown";
}

struct WorkflowResult {
  WorkflowOutcome outcome = WorkflowOutcome::kCompleted;
  core::errors::FailureKind failure = core::errors::FailureKind::kNone;
  // Skip reason or failure description. For VCS failures this carries the
  // backend's command output verbatim.
  std::string message;
  // Set by a real (non dry-run) stage commit.
  std::string revision;
  // Set by compress-site.
  std::filesystem::path output_path;

  static WorkflowResult Completed() {
    return WorkflowResult{};
  }

  static WorkflowResult Skipped(std::string reason) {
    WorkflowResult result;
    result.outcome = WorkflowOutcome::kSkipped;
    result.message = std::move(reason);
    return result;
  }

  static WorkflowResult Failed(core::errors::FailureKind kind, std::string message) {
    WorkflowResult result;
    result.outcome = WorkflowOutcome::kFailed;
    result.failure = kind;
    result.message = std::move(message);
    return result;
  }
};

inline core::errors::ExitCode ExitCodeFor(const WorkflowResult& result) {
  if (result.outcome != WorkflowOutcome::kFailed) {
    return core::errors::ExitCode::kSuccess;
  }
  if (result.failure == core::errors::FailureKind::kNone) {
    return core::errors::ExitCode::kFailure;
  }
  return core::errors::ExitCodeFor(result.failure);
}

} // namespace diststage::workflow
