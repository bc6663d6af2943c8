#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <mutex>
#include <string>
#include <thread>
#include "common/io_utils.hpp"

namespace testbox {

/**
 * @brief Bytes captured from one output stream of the subject.
 * At most cap bytes are kept, the rest is counted and discarded.
 */
struct stream_buffer {
    explicit stream_buffer(std::size_t cap);

    /**
     * @throw std::logic_error when the buffer is frozen
     */
    void append(const char *bytes, std::size_t count);

    void freeze();

    bool frozen() const;

    const std::string &data() const;

    bool truncated() const;

    /**
     * @brief Bytes written by the subject, including the discarded ones
     */
    std::uint64_t total_bytes() const;

    std::size_t cap() const;

private:
    std::size_t capacity;
    std::string content;
    std::uint64_t total = 0;
    bool is_frozen = false;
};

/**
 * @brief Drains stdout and stderr of the subject into two stream buffers.
 *
 * A single pump thread polls both pipes, so the subject never blocks on
 * a full pipe whatever it writes and in whatever order.
 */
struct output_collector {
    /**
     * @param stdout_fd read end of the subject's stdout pipe, owned from now on
     * @param stderr_fd read end of the subject's stderr pipe, owned from now on
     * @param cap retained bytes per stream
     */
    output_collector(unique_fd stdout_fd, unique_fd stderr_fd, std::size_t cap);

    output_collector(const output_collector &) = delete;
    output_collector &operator=(const output_collector &) = delete;

    ~output_collector();

    /**
     * @brief Starts the pump thread
     * @throw std::system_error when the pipes cannot be set up
     */
    void start();

    /**
     * @brief Reads what is left in the pipes, until both reach end of file
     * or drain_timeout expires, then freezes both buffers.
     * Only call this once termination of the subject is final.
     * @throw std::system_error rethrown from the pump thread
     */
    void finish(std::chrono::milliseconds drain_timeout);

    /**
     * @brief Hands the stdout buffer over, only valid after finish()
     */
    stream_buffer take_stdout();

    stream_buffer take_stderr();

private:
    void pump();
    void wake();

    unique_fd out_fd, err_fd, wake_read, wake_write;
    stream_buffer out, err;

    std::mutex mut;
    std::chrono::steady_clock::time_point drain_deadline;
    bool draining = false;
    bool finished = false;
    std::exception_ptr failure;
    std::thread worker;
};

}  // namespace testbox
