#include "deadline.hpp"
#include <errno.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <cstring>
#include <stdexcept>
#include <system_error>

namespace testbox {
using namespace std;

const char *to_string(termination_level level) {
    switch (level) {
        case termination_level::graceful: return "graceful";
        case termination_level::forced: return "forced";
    }
    return "unknown";
}

const char *to_string(escalation_step step) {
    switch (step) {
        case escalation_step::none: return "none";
        case escalation_step::graceful: return "graceful";
        case escalation_step::wait: return "wait";
        case escalation_step::forced: return "forced";
    }
    return "unknown";
}

termination_token::~termination_token() = default;

process_group_terminator::process_group_terminator(pid_t pgid) : pgid(pgid) {}

void process_group_terminator::request(termination_level level) {
    int sig = level == termination_level::graceful ? SIGTERM : SIGKILL;
    LOG(INFO) << "sending " << strsignal(sig) << " to process group " << pgid;
    if (kill(-pgid, sig) != 0 && errno != ESRCH)
        throw system_error(errno, system_category(), fmt::format("unable to signal process group {}", pgid));
}

escalation_step decide_escalation(run_phase phase, bool fired, bool grace_elapsed) {
    switch (phase) {
        case run_phase::launched:
        case run_phase::running:
            return escalation_step::graceful;
        case run_phase::terminating:
            return grace_elapsed ? escalation_step::forced : escalation_step::wait;
        case run_phase::exited:
            return fired ? escalation_step::forced : escalation_step::none;
    }
    return escalation_step::none;
}

deadline_enforcer::deadline_enforcer(run_handle &handle, termination_token &token,
                                     chrono::milliseconds time_limit,
                                     chrono::milliseconds grace_window)
    : handle(handle), token(token), time_limit(time_limit), grace_window(grace_window) {}

deadline_enforcer::~deadline_enforcer() {
    if (!worker.joinable()) return;
    {
        lock_guard<mutex> lock(mut);
        stopping = true;
    }
    cv.notify_all();
    worker.join();
    if (failure) {
        try {
            rethrow_exception(failure);
        } catch (exception &e) {
            LOG(ERROR) << "termination request of subject " << handle.pid() << " failed: " << e.what();
        }
    }
}

atomic<size_t> deadline_enforcer::armed_total{0};

size_t deadline_enforcer::armed_count() {
    return armed_total;
}

void deadline_enforcer::arm() {
    lock_guard<mutex> lock(mut);
    if (armed) throw logic_error("deadline enforcer armed twice");
    if (!handle.advance(run_phase::launched, run_phase::running))
        throw logic_error(fmt::format("cannot arm deadline of subject in phase {}", to_string(handle.phase())));
    armed = true;
    ++armed_total;
    worker = thread([this] { run(); });
}

bool deadline_enforcer::finish() {
    {
        lock_guard<mutex> lock(mut);
        stopping = true;
    }
    cv.notify_all();
    if (worker.joinable()) worker.join();

    lock_guard<mutex> lock(mut);
    if (failure) {
        exception_ptr e = failure;
        failure = nullptr;
        rethrow_exception(e);
    }
    return has_fired;
}

bool deadline_enforcer::fired() const {
    lock_guard<mutex> lock(mut);
    return has_fired;
}

vector<termination_level> deadline_enforcer::requests() const {
    lock_guard<mutex> lock(mut);
    return delivered;
}

void deadline_enforcer::deliver(termination_level level) {
    // called with mut held
    token.request(level);
    delivered.push_back(level);
}

void deadline_enforcer::run() {
    unique_lock<mutex> lock(mut);
    auto deadline = handle.start_time() + time_limit;
    cv.wait_until(lock, deadline, [this] { return stopping; });
    if (stopping) return;

    // losing this race means the leader exited right at the deadline
    if (!handle.advance(run_phase::running, run_phase::terminating)) return;
    has_fired = true;
    LOG(WARNING) << "subject " << handle.pid() << " reached the deadline of "
                 << time_limit.count() << "ms, terminating";

    try {
        deliver(termination_level::graceful);

        auto grace_deadline = chrono::steady_clock::now() + grace_window;
        while (true) {
            bool grace_elapsed = stopping || chrono::steady_clock::now() >= grace_deadline;
            escalation_step step = decide_escalation(handle.phase(), has_fired, grace_elapsed);
            if (step == escalation_step::wait) {
                cv.wait_until(lock, grace_deadline, [this] { return stopping; });
                continue;
            }
            if (step == escalation_step::forced)
                deliver(termination_level::forced);
            break;
        }
    } catch (exception &e) {
        LOG(ERROR) << "termination request of subject " << handle.pid() << " failed: " << e.what();
        failure = current_exception();
    }
}

}  // namespace testbox
