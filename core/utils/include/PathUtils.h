#pragma once

#include <filesystem>
#include <string>

namespace PeerBeam {

class PathUtils {
public:
    static std::filesystem::path getHome();
    static std::filesystem::path getConfigDir();

    /// $XDG_CONFIG_HOME/peerbeam/peerbeam.conf (or ~/.config/...)
    static std::filesystem::path getDefaultConfigPath();

    static void ensureDirectory(const std::filesystem::path& dir);

    /**
     * @brief Reduce a peer-supplied file name to a safe single path component
     *
     * Keeps only the last component after '/' or '\\', drops control
     * characters, and rejects "." and "..". Returns @p fallback when nothing
     * usable remains.
     */
    static std::string sanitizeFileName(const std::string& name,
                                        const std::string& fallback = "received.bin");
};

} // namespace PeerBeam
