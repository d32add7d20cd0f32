#include "atomic_file.hpp"
#include <fstream>
#include <sstream>
#include <vector>
#include <cerrno>
#include <cstring>
#include <cstdio>
#include <unistd.h>
#include <sys/stat.h>
#include <fmt/format.h>

static std::string errno_message(const std::string& what, const fs::path& path) {
    return fmt::format("{} {}: {}", what, path.string(), std::strerror(errno));
}

Result<void> atomic_write(const fs::path& dest, const std::string& content, unsigned mode) {
    fs::path dir = dest.has_parent_path() ? dest.parent_path() : fs::path(".");

    std::string tmpl = (dir / ("." + dest.filename().string() + ".XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    int fd = mkstemp(buf.data());
    if (fd < 0) {
        return Result<void>::Err(errno_message("Cannot create temp file in", dir));
    }
    fs::path tmp_path(buf.data());

    auto fail = [&](const std::string& what) {
        std::string msg = errno_message(what, tmp_path);
        close(fd);
        unlink(tmp_path.c_str());
        return Result<void>::Err(msg);
    };

    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return fail("Cannot write");
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }

    if (fchmod(fd, static_cast<mode_t>(mode)) != 0) return fail("Cannot chmod");
    if (fsync(fd) != 0) return fail("Cannot sync");

    if (close(fd) != 0) {
        std::string msg = errno_message("Cannot close", tmp_path);
        unlink(tmp_path.c_str());
        return Result<void>::Err(msg);
    }

    if (std::rename(tmp_path.c_str(), dest.c_str()) != 0) {
        std::string msg = errno_message("Cannot replace", dest);
        unlink(tmp_path.c_str());
        return Result<void>::Err(msg);
    }

    return Result<void>::Ok();
}

Result<std::string> read_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        return Result<std::string>::Err(errno_message("Cannot read", path));
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        return Result<std::string>::Err("Cannot read " + path.string());
    }
    return Result<std::string>::Ok(ss.str());
}
