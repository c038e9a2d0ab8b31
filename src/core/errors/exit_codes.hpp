#pragma once

#include <string_view>

namespace diststage::core::errors {

// Process-exit contract for release automation.
//
// 0/1/2 keep their conventional meanings. A goal that skips because its gates
// are unmet still exits 0. The remaining values let release scripts tell a
// broken configuration apart from a filesystem, archive or VCS failure.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kIoFailure = 20,
  kArchiveFailure = 30,
  kVcsFailure = 40,
};

// Where a run failed. kNone is only seen on completed or skipped runs.
enum class FailureKind {
  kNone,
  kConfig,
  kIo,
  kArchive,
  kVcs,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

constexpr ExitCode ExitCodeFor(FailureKind kind) {
  switch (kind) {
  case FailureKind::kNone:
    return ExitCode::kSuccess;
  case FailureKind::kConfig:
    return ExitCode::kConfigInvalid;
  case FailureKind::kIo:
    return ExitCode::kIoFailure;
  case FailureKind::kArchive:
    return ExitCode::kArchiveFailure;
  case FailureKind::kVcs:
    return ExitCode::kVcsFailure;
  }
  return ExitCode::kFailure;
}

inline std::string_view ToString(FailureKind kind) {
  switch (kind) {
  case FailureKind::kNone:
    return "none";
  case FailureKind::kConfig:
    return "config";
  case FailureKind::kIo:
    return "io";
  case FailureKind::kArchive:
    return "archive";
  case FailureKind::kVcs:
    return "vcs";
  }
  return "unknown";
}

} // namespace diststage::core::errors
