#pragma once

#include <filesystem>

namespace qbank::common {

/// Returns the directory containing the running executable.
std::filesystem::path executableDir();

/// Resolves the read-only resource directory shipped with the application.
/// Search order: $APPDIR/usr/share/qbank/ -> <exe_dir>/
std::filesystem::path bundledResourceDir();

/// Resolves the per-user application data directory.
/// On Linux: $XDG_DATA_HOME/qbank or ~/.local/share/qbank.
/// On Windows: %APPDATA%\qbank. On macOS: ~/Library/Application Support/qbank.
/// Returns an empty path when no user data location is available.
std::filesystem::path userDataDir();

}  // namespace qbank::common
