#pragma once
#include <chrono>
#include <cstdint>
#include <string_view>

namespace commitgate::consts {

// Directory and file names
inline constexpr std::string_view kGitDir       = ".git";
inline constexpr std::string_view kGitDirPrefix = "gitdir: ";
inline constexpr std::string_view kHooksDir     = "hooks";
inline constexpr std::string_view kPreCommit    = "pre-commit";
inline constexpr std::string_view kEditMsgFile  = "COMMIT_EDITMSG";
inline constexpr std::string_view kConfigFile   = ".commitgate";

// ——— Thresholds ———
inline constexpr std::chrono::seconds kLintTimeout{5 * 60};
inline constexpr std::uint64_t kLargeFileBytes  = 1024 * 1024; // warn strictly above
inline constexpr std::size_t   kMinMessageChars = 10;          // warn strictly below

// Lines of tool output echoed under a failed stage
inline constexpr std::size_t kToolOutputTail = 40;

// ——— Exit codes ———
inline constexpr int kExitOk      = 0;
inline constexpr int kExitBlocked = 1;
inline constexpr int kExitUsage   = 2;

// ——— Auto-merge policy ———
inline constexpr std::string_view kDependabotActor = "dependabot[bot]";
inline constexpr std::string_view kSemverMinor     = "version-update:semver-minor";
inline constexpr std::string_view kSemverPatch     = "version-update:semver-patch";

// Marker written into hooks installed by `commitgate install`
inline constexpr std::string_view kHookMarker = "# installed by commitgate";

} // namespace commitgate::consts
