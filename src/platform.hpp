#ifndef VID2MP3_PLATFORM_HPP
#define VID2MP3_PLATFORM_HPP

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <atomic>

#ifdef _WIN32
#include <windows.h>
#include <io.h>
#else
#include <unistd.h>
#endif

namespace platform {
namespace fs = std::filesystem;

/// Permission query: can the current process write into this path?
inline bool can_write(const fs::path& path) {
#ifdef _WIN32
    return ::_waccess(path.wstring().c_str(), 02) == 0;
#else
    return ::access(path.c_str(), W_OK) == 0;
#endif
}

/// Permission query: can the current process read this path?
inline bool can_read(const fs::path& path) {
#ifdef _WIN32
    return ::_waccess(path.wstring().c_str(), 04) == 0;
#else
    return ::access(path.c_str(), R_OK) == 0;
#endif
}

/// Process id, used to keep probe file names unique between instances
inline unsigned long process_id() {
#ifdef _WIN32
    return static_cast<unsigned long>(GetCurrentProcessId());
#else
    return static_cast<unsigned long>(::getpid());
#endif
}

/// Open output file stream (takes fs::path only, preventing accidental std::string overload)
inline std::ofstream ofstream_open(const fs::path& path,
                                   std::ios::openmode mode = std::ios::binary) {
    return std::ofstream(path, mode);
}

/// Trial write: create and remove a small file inside dir.
/// Catches read-only mounts and ACLs that access() does not report.
inline bool probe_write(const fs::path& dir) {
    static std::atomic<unsigned> counter{0};
    fs::path probe = dir / (".vid2mp3_probe_" + std::to_string(process_id()) + "_" +
                            std::to_string(counter.fetch_add(1)));
    bool ok = false;
    {
        auto stream = ofstream_open(probe);
        if (stream.is_open()) {
            stream << "probe";
            stream.flush();
            ok = stream.good();
        }
    }
    std::error_code ec;
    fs::remove(probe, ec);
    return ok;
}

/// UTF-8 form of a path, as expected by FFmpeg's URL-based open calls
inline std::string utf8_path(const fs::path& path) {
#ifdef _WIN32
    auto u8 = path.u8string();
    return std::string(u8.begin(), u8.end());
#else
    return path.string();
#endif
}

} // namespace platform

#endif // VID2MP3_PLATFORM_HPP
