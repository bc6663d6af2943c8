#include "common/io_utils.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <fmt/core.h>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace testbox {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(fs::path const &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), fmt::format("unable to open {}", path.string()));
    fout.write(content.data(), content.size());
    if (!fout)
        throw system_error(errno, system_category(), fmt::format("unable to write {}", path.string()));
}

bool utf8_check_is_valid(const string &string) {
    int c, i, ix, n, j;
    for (i = 0, ix = string.length(); i < ix; i++) {
        c = (unsigned char)string[i];
        if (0x00 <= c && c <= 0x7f)
            n = 0;  // 0bbbbbbb
        else if ((c & 0xE0) == 0xC0)
            n = 1;  // 110bbbbb
        else if (c == 0xed && i < (ix - 1) && ((unsigned char)string[i + 1] & 0xa0) == 0xa0)
            return false;  // U+d800 to U+dfff
        else if ((c & 0xF0) == 0xE0)
            n = 2;  // 1110bbbb
        else if ((c & 0xF8) == 0xF0)
            n = 3;  // 11110bbb
        else
            return false;
        for (j = 0; j < n && i < ix; j++) {  // n bytes matching 10bbbbbb follow ?
            if ((++i == ix) || (((unsigned char)string[i] & 0xC0) != 0x80))
                return false;
        }
    }
    return true;
}

fs::path path_in_root(const fs::path &root, const fs::path &inside) {
    fs::path relative = inside.lexically_normal().relative_path();
    for (auto &part : relative) {
        if (part == "..")
            throw invalid_argument("path escapes the isolated root: " + inside.string());
    }
    if (relative.empty() || relative == ".")
        return root;
    return root / relative;
}

unique_fd::unique_fd() : fd(-1) {}

unique_fd::unique_fd(int fd) : fd(fd) {}

unique_fd::unique_fd(unique_fd &&other) noexcept : fd(other.release()) {}

unique_fd::~unique_fd() {
    if (fd >= 0) ::close(fd);
}

unique_fd &unique_fd::operator=(unique_fd &&other) noexcept {
    if (this != &other) {
        if (fd >= 0) ::close(fd);
        fd = other.release();
    }
    return *this;
}

int unique_fd::get() const noexcept {
    return fd;
}

bool unique_fd::valid() const noexcept {
    return fd >= 0;
}

int unique_fd::release() noexcept {
    int result = fd;
    fd = -1;
    return result;
}

void unique_fd::reset() {
    if (fd < 0) return;
    int old = release();
    if (::close(old) != 0)
        throw system_error(errno, system_category(), fmt::format("closing fd {}", old));
}

void make_pipe(unique_fd &read_end, unique_fd &write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw system_error(errno, system_category(), "creating pipe");
    read_end = unique_fd(fds[0]);
    write_end = unique_fd(fds[1]);
}

void set_nonblocking(int fd, bool nonblocking) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1)
        throw system_error(errno, system_category(), "fcntl, getting flags");
    flags = nonblocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (fcntl(fd, F_SETFL, flags) == -1)
        throw system_error(errno, system_category(), "fcntl, setting flags");
}

}  // namespace testbox
