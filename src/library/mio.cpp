/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */
#include "mio.h"

#include <fcntl.h>
#include <unistd.h>
#include <cstdlib>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include "exceptions.h"
#include "logger.h"
#include "utils.h"

namespace mtd{
namespace io{

bool Path::checkExtension(const std::vector<std::string>& matches) const {
    std::string ext = p.extension().string();
    if (ext.size() < 1) return false;
    std::string extLowerCase = ext.substr(1, ext.length());
    utils::toLower(extLowerCase);

    for (auto &m : matches) {
        std::string ext = m;
        utils::toLower(ext);
        if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
        if (ext == extLowerCase) return true;
    }
    return false;
}

bool Path::isHidden() const {
    std::string name = p.filename().string();
    return !name.empty() && name[0] == '.';
}

time_t Path::getModifiedTime() const {
    struct stat result;
    if(stat(p.string().c_str(), &result) == 0) {
        return result.st_mtime;
    } else {
        throw FSException("Cannot stat mtime " + p.string());
    }
}

time_t Path::getAccessTime() const {
    struct stat result;
    if(stat(p.string().c_str(), &result) == 0) {
        return result.st_atime;
    } else {
        throw FSException("Cannot stat atime " + p.string());
    }
}

std::string Path::string() const{
    return p.string();
}

void createDirectories(const fs::path &d){
    std::error_code e;
    fs::create_directories(d, e);
    if (e) throw FSException("Cannot create directory " + d.string() + ": " + e.message());
}

std::vector<uint8_t> readFile(const fs::path &p){
    std::ifstream in(p, std::ios::in | std::ios::binary);
    if (!in.is_open()) throw FSException("Cannot open " + p.string());

    in.seekg(0, std::ios::end);
    const auto size = in.tellg();
    if (size < 0) throw FSException("Cannot read " + p.string());
    in.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(static_cast<size_t>(size));
    if (!data.empty() && !in.read(reinterpret_cast<char *>(data.data()), size)){
        throw FSException("Cannot read " + p.string());
    }

    return data;
}

void writeFile(const fs::path &p, const std::vector<uint8_t> &data){
    // Hidden and unique, so it never clashes with other files in the folder
    std::string pattern = (p.parent_path() / ("." + p.filename().string() + ".XXXXXX")).string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    const int fd = mkstemp(name.data());
    if (fd == -1) throw FSException("Cannot create temporary file for " + p.string() + ": " + std::strerror(errno));
    const fs::path tmp(name.data());

    auto fail = [&](const std::string &msg){
        const std::string reason = std::strerror(errno);
        ::close(fd);
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw FSException(msg + ": " + reason);
    };

    if (fchmod(fd, 0644) != 0) fail("Cannot set permissions of " + tmp.string());

    size_t written = 0;
    while (written < data.size()){
        const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0){
            if (errno == EINTR) continue;
            fail("Cannot write " + tmp.string());
        }
        written += static_cast<size_t>(n);
    }

    if (::close(fd) != 0){
        const std::string reason = std::strerror(errno);
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw FSException("Cannot write " + tmp.string() + ": " + reason);
    }

    std::error_code e;
    fs::rename(tmp, p, e);
    if (e){
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw FSException("Cannot move " + tmp.string() + " to " + p.string() + ": " + e.message());
    }
}

void setFileTimes(const fs::path &p, time_t t){
    struct timespec times[2];
    times[0].tv_sec = t; // Access time
    times[0].tv_nsec = 0;
    times[1].tv_sec = t; // Modification time
    times[1].tv_nsec = 0;

    if (utimensat(AT_FDCWD, p.string().c_str(), times, 0) != 0){
        throw FSException("Cannot set times of " + p.string() + ": " + std::strerror(errno));
    }

    LOGD << "Set times of " << p.string() << " to " << t;
}

}
}
