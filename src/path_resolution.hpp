#ifndef VID2MP3_PATH_RESOLUTION_HPP
#define VID2MP3_PATH_RESOLUTION_HPP

#include <string>
#include <variant>
#include <utility>

namespace vid2mp3 {

struct ResolvedPath {
    std::string path;           // Absolute, lexically normalized
};

struct PathError {
    std::string message;
};

class PathResult {
public:
    PathResult(ResolvedPath path) : result_(std::move(path)) {}
    PathResult(PathError error) : result_(std::move(error)) {}

    bool has_value() const { return std::holds_alternative<ResolvedPath>(result_); }
    const ResolvedPath& operator*() const { return std::get<ResolvedPath>(result_); }
    const ResolvedPath* operator->() const { return &std::get<ResolvedPath>(result_); }
    std::string error() const { return std::get<PathError>(result_).message; }

private:
    std::variant<ResolvedPath, PathError> result_;
};

// Checks that output_dir exists, is a directory and accepts new files
// (permission query followed by a trial write)
PathResult resolve_output_dir(const std::string& output_dir);

// Checks that input_path names an existing, readable regular file
PathResult resolve_input_file(const std::string& input_path);

// Case-insensitive suffix match; extension may be given with or without the dot
bool has_extension(const std::string& path, const std::string& extension);

// output_dir/<stem of input_path>.mp3
std::string resolve_output_path(const std::string& input_path, const std::string& output_dir);

// Canonical key for duplicate detection (absolute, lexically normalized)
std::string normalize_path(const std::string& path);

}  // namespace vid2mp3

#endif  // VID2MP3_PATH_RESOLUTION_HPP
