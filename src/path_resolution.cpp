#include "path_resolution.hpp"
#include "platform.hpp"
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace vid2mp3 {

static constexpr const char* OUTPUT_EXTENSION = ".mp3";

std::string normalize_path(const std::string& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(fs::path(path), ec);
    if (ec) {
        return fs::path(path).lexically_normal().string();
    }
    return abs.lexically_normal().string();
}

PathResult resolve_output_dir(const std::string& output_dir) {
    if (output_dir.empty()) {
        return PathError{"No output directory given"};
    }

    std::error_code ec;
    fs::path dir(output_dir);
    if (!fs::exists(dir, ec)) {
        return PathError{"Output directory does not exist: " + output_dir};
    }
    if (!fs::is_directory(dir, ec)) {
        return PathError{"Output path is not a directory: " + output_dir};
    }
    if (!platform::can_write(dir) || !platform::probe_write(dir)) {
        return PathError{"Cannot write to output directory: " + output_dir};
    }

    return ResolvedPath{normalize_path(output_dir)};
}

PathResult resolve_input_file(const std::string& input_path) {
    std::error_code ec;
    fs::path p(input_path);
    if (!fs::exists(p, ec)) {
        return PathError{"File not found: " + input_path};
    }
    if (!fs::is_regular_file(p, ec)) {
        return PathError{"Not a regular file: " + input_path};
    }
    if (!platform::can_read(p)) {
        return PathError{"File is not readable: " + input_path};
    }
    return ResolvedPath{normalize_path(input_path)};
}

bool has_extension(const std::string& path, const std::string& extension) {
    if (extension.empty()) return true;

    std::string ext = extension[0] == '.' ? extension : "." + extension;
    std::string actual = fs::path(path).extension().string();
    if (actual.size() != ext.size()) return false;

    return std::equal(actual.begin(), actual.end(), ext.begin(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

std::string resolve_output_path(const std::string& input_path, const std::string& output_dir) {
    fs::path out = fs::path(output_dir) / fs::path(input_path).stem();
    out += OUTPUT_EXTENSION;
    return out.string();
}

}  // namespace vid2mp3
