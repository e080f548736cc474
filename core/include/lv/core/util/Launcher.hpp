#pragma once

#include <filesystem>
#include <functional>

namespace lv {

/// Hands a file to whatever the desktop uses to open it
using ViewerLauncher = std::function<void(const std::filesystem::path&)>;

/**
 * @brief Open @p path with the platform's default application
 *
 * Uses xdg-open (Linux) or open (macOS), detached from the caller.
 * @throws lv::Error Open when no opener is available or it cannot be started
 */
void openWithDefaultApp(const std::filesystem::path& path);

}  // namespace lv
