#pragma once

#include <filesystem>
#include <random>
#include <string>

namespace readsync::util {

namespace fs = std::filesystem;

// Fresh, empty directory under the system temp directory.
inline fs::path create_temp_directory(const std::string& prefix = "tmp")
{
    fs::path temp_dir = fs::temp_directory_path();

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 999999);

    fs::path new_dir;
    do {
        new_dir = temp_dir / (prefix + "_" + std::to_string(dis(gen)));
    } while (fs::exists(new_dir));

    fs::create_directory(new_dir);
    return new_dir;
}

// Removes its directory tree on destruction.
class ScopedTempDirectory
{
public:
    explicit ScopedTempDirectory(const std::string& prefix = "readsync")
        : _path(create_temp_directory(prefix))
    {
    }

    ~ScopedTempDirectory()
    {
        std::error_code ec;
        fs::remove_all(_path, ec);
    }

    ScopedTempDirectory(const ScopedTempDirectory&) = delete;
    ScopedTempDirectory& operator=(const ScopedTempDirectory&) = delete;

    const fs::path& path() const { return _path; }

private:
    fs::path _path;
};

} // namespace readsync::util
