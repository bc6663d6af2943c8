#include "output_collector.hpp"
#include <errno.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace testbox {
using namespace std;

static constexpr size_t CHUNK_SIZE = 64 * 1024;

stream_buffer::stream_buffer(size_t cap) : capacity(cap) {}

void stream_buffer::append(const char *bytes, size_t count) {
    if (is_frozen) throw logic_error("appending to a frozen stream buffer");
    total += count;
    if (content.size() < capacity) {
        size_t kept = min(count, capacity - content.size());
        content.append(bytes, kept);
    }
}

void stream_buffer::freeze() {
    is_frozen = true;
}

bool stream_buffer::frozen() const {
    return is_frozen;
}

const string &stream_buffer::data() const {
    return content;
}

bool stream_buffer::truncated() const {
    return total > content.size();
}

uint64_t stream_buffer::total_bytes() const {
    return total;
}

size_t stream_buffer::cap() const {
    return capacity;
}

output_collector::output_collector(unique_fd stdout_fd, unique_fd stderr_fd, size_t cap)
    : out_fd(move(stdout_fd)), err_fd(move(stderr_fd)), out(cap), err(cap) {}

output_collector::~output_collector() {
    if (!worker.joinable()) return;
    {
        lock_guard<mutex> lock(mut);
        draining = true;
        drain_deadline = chrono::steady_clock::now();
    }
    wake();
    worker.join();
}

void output_collector::start() {
    if (worker.joinable() || finished) throw logic_error("output collector started twice");
    make_pipe(wake_read, wake_write);
    set_nonblocking(wake_read.get(), true);
    set_nonblocking(wake_write.get(), true);
    set_nonblocking(out_fd.get(), true);
    set_nonblocking(err_fd.get(), true);
    worker = thread([this] { pump(); });
}

void output_collector::wake() {
    char c = 0;
    // a full wake-up pipe already wakes the pump
    while (write(wake_write.get(), &c, 1) < 0 && errno == EINTR) {}
}

/**
 * @return false at end of file
 */
static bool read_available(int fd, stream_buffer &buffer, const char *name) {
    static thread_local vector<char> chunk(CHUNK_SIZE);
    while (true) {
        ssize_t n = read(fd, chunk.data(), chunk.size());
        if (n > 0) {
            bool was_truncated = buffer.truncated();
            buffer.append(chunk.data(), n);
            if (!was_truncated && buffer.truncated())
                LOG(WARNING) << name << " of subject exceeded " << buffer.cap() << " bytes, truncating";
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        throw system_error(errno, system_category(), fmt::format("reading {} of subject", name));
    }
}

void output_collector::pump() {
    try {
        while (out_fd.valid() || err_fd.valid()) {
            int timeout = -1;
            {
                lock_guard<mutex> lock(mut);
                if (draining) {
                    auto left = chrono::ceil<chrono::milliseconds>(drain_deadline - chrono::steady_clock::now());
                    if (left.count() <= 0) {
                        LOG(WARNING) << "output pipes still open after the drain timeout, "
                                     << "a process outside the subject's group may hold them";
                        break;
                    }
                    timeout = (int)left.count();
                }
            }

            struct pollfd fds[3];
            nfds_t nfds = 0;
            fds[nfds++] = {wake_read.get(), POLLIN, 0};
            int out_index = -1, err_index = -1;
            if (out_fd.valid()) {
                out_index = nfds;
                fds[nfds++] = {out_fd.get(), POLLIN, 0};
            }
            if (err_fd.valid()) {
                err_index = nfds;
                fds[nfds++] = {err_fd.get(), POLLIN, 0};
            }

            int ready = poll(fds, nfds, timeout);
            if (ready < 0) {
                if (errno == EINTR) continue;
                throw system_error(errno, system_category(), "polling output pipes");
            }

            if (fds[0].revents) {
                char drain[64];
                while (read(wake_read.get(), drain, sizeof(drain)) > 0) {}
            }
            if (out_index >= 0 && fds[out_index].revents) {
                if (!read_available(out_fd.get(), out, "stdout")) out_fd.reset();
            }
            if (err_index >= 0 && fds[err_index].revents) {
                if (!read_available(err_fd.get(), err, "stderr")) err_fd.reset();
            }
        }
    } catch (exception &e) {
        LOG(ERROR) << "output collection failed: " << e.what();
        lock_guard<mutex> lock(mut);
        failure = current_exception();
    }
}

void output_collector::finish(chrono::milliseconds drain_timeout) {
    if (finished) throw logic_error("output collector finished twice");
    if (worker.joinable()) {
        {
            lock_guard<mutex> lock(mut);
            draining = true;
            drain_deadline = chrono::steady_clock::now() + drain_timeout;
        }
        wake();
        worker.join();
    }
    finished = true;
    out_fd.reset();
    err_fd.reset();
    out.freeze();
    err.freeze();
    if (failure) rethrow_exception(failure);
}

stream_buffer output_collector::take_stdout() {
    if (!finished) throw logic_error("stdout taken before the collector finished");
    return move(out);
}

stream_buffer output_collector::take_stderr() {
    if (!finished) throw logic_error("stderr taken before the collector finished");
    return move(err);
}

}  // namespace testbox
