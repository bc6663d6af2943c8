#pragma once

#include <filesystem>
#include <string>

namespace testbox {

/**
 * @brief Reads the whole content of a file
 * @param path path of the file
 * @return content of the file (no encoding assumed)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief Reads the whole content of a file
 * @param path path of the file
 * @param def returned when the file does not exist
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief Writes bytes to a file, replacing its content
 * @throw std::system_error when the file cannot be written
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief Maps a path as seen by the subject onto the host filesystem.
 * The path is interpreted relative to the isolated root. Paths climbing
 * out of the root with ".." are rejected, the harness runs with
 * privileges and must never touch files outside the root on behalf of
 * the subject.
 * @param root the isolated root on the host
 * @param inside absolute or relative path inside the root
 * @throw std::invalid_argument when the path would leave the root
 */
std::filesystem::path path_in_root(const std::filesystem::path &root, const std::filesystem::path &inside);

/**
 * @brief Owns a file descriptor and closes it on destruction.
 */
struct unique_fd {
    unique_fd();
    explicit unique_fd(int fd);
    unique_fd(unique_fd &&) noexcept;
    unique_fd(const unique_fd &) = delete;
    ~unique_fd();

    unique_fd &operator=(unique_fd &&) noexcept;
    unique_fd &operator=(const unique_fd &) = delete;

    int get() const noexcept;
    bool valid() const noexcept;

    /**
     * @brief Gives up ownership without closing.
     */
    int release() noexcept;

    /**
     * @brief Closes the descriptor now.
     * @throw std::system_error when close fails
     */
    void reset();

private:
    int fd;
};

/**
 * @brief Creates a pipe with both ends marked close-on-exec.
 * @param read_end receives the read end
 * @param write_end receives the write end
 */
void make_pipe(unique_fd &read_end, unique_fd &write_end);

void set_nonblocking(int fd, bool nonblocking);

}  // namespace testbox
