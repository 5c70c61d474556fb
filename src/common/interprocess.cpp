#include "common/interprocess.hpp"
#include <cerrno>
#include <fstream>
#include <system_error>

namespace sortbot {
namespace fs = std::filesystem;
namespace ip = boost::interprocess;

ip::file_lock lock_directory(const fs::path &dir) {
    fs::create_directories(dir);
    fs::path lock_file = dir / ".lock";
    if (!fs::exists(lock_file)) {
        std::ofstream create_lock_file(lock_file);
        if (!create_lock_file)
            throw std::system_error(errno, std::system_category(), "unable to create lock file " + lock_file.string());
    }
    return ip::file_lock(lock_file.c_str());
}

}  // namespace sortbot
