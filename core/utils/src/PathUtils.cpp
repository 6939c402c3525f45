#include "PathUtils.h"
#include <cstdlib>
#include <stdexcept>

namespace PeerBeam {

std::filesystem::path PathUtils::getHome() {
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home);
    }
    throw std::runtime_error("HOME environment variable is not set");
}

std::filesystem::path PathUtils::getConfigDir() {
    if (const char* config = std::getenv("XDG_CONFIG_HOME")) {
        return std::filesystem::path(config) / "peerbeam";
    }
    return getHome() / ".config" / "peerbeam";
}

std::filesystem::path PathUtils::getDefaultConfigPath() {
    return getConfigDir() / "peerbeam.conf";
}

void PathUtils::ensureDirectory(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        std::filesystem::create_directories(dir, ec);
    }
    if (ec) {
        throw std::runtime_error("Failed to create directory: " + dir.string() + " (" + ec.message() + ")");
    }
}

std::string PathUtils::sanitizeFileName(const std::string& name, const std::string& fallback) {
    auto sep = name.find_last_of("/\\");
    std::string base = (sep == std::string::npos) ? name : name.substr(sep + 1);

    std::string cleaned;
    cleaned.reserve(base.size());
    for (char c : base) {
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
            continue;
        }
        cleaned += c;
    }

    if (cleaned.empty() || cleaned == "." || cleaned == "..") {
        return fallback;
    }
    return cleaned;
}

} // namespace PeerBeam
