#include "result.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <cstring>
#include <nlohmann/json.hpp>
#include <ostream>
#include <stdexcept>
#include "common/io_utils.hpp"
#include "output_collector.hpp"

namespace testbox {
using namespace std;
using namespace nlohmann;

const char *to_string(outcome_kind kind) {
    switch (kind) {
        case outcome_kind::exited_normally: return "exited_normally";
        case outcome_kind::exited_by_signal: return "exited_by_signal";
        case outcome_kind::killed_by_deadline: return "killed_by_deadline";
        case outcome_kind::killed_by_resource_limit: return "killed_by_resource_limit";
    }
    return "unknown";
}

termination_outcome termination_outcome::exited_normally(int code) {
    termination_outcome outcome;
    outcome.kind = outcome_kind::exited_normally;
    outcome.exit_code = code;
    return outcome;
}

termination_outcome termination_outcome::exited_by_signal(int signal) {
    termination_outcome outcome;
    outcome.kind = outcome_kind::exited_by_signal;
    outcome.signal = signal;
    return outcome;
}

termination_outcome termination_outcome::killed_by_deadline(int signal) {
    termination_outcome outcome;
    outcome.kind = outcome_kind::killed_by_deadline;
    outcome.signal = signal;
    return outcome;
}

termination_outcome termination_outcome::killed_by_resource_limit(limit_kind kind, int signal) {
    termination_outcome outcome;
    outcome.kind = outcome_kind::killed_by_resource_limit;
    outcome.signal = signal;
    outcome.limit = kind;
    return outcome;
}

bool termination_outcome::operator==(const termination_outcome &other) const {
    return kind == other.kind && exit_code == other.exit_code && signal == other.signal && limit == other.limit;
}

void outcome_slot::set(const termination_outcome &outcome) {
    if (value)
        throw logic_error(fmt::format("outcome already decided as {}", to_string(value->kind)));
    value = outcome;
}

bool outcome_slot::has_value() const {
    return value.has_value();
}

const termination_outcome &outcome_slot::get() const {
    if (!value) throw logic_error("outcome not decided yet");
    return *value;
}

captured_stream::captured_stream(stream_buffer &&buffer) {
    if (!buffer.frozen()) throw logic_error("capturing a stream that is still being written");
    truncated = buffer.truncated();
    total_bytes = buffer.total_bytes();
    data = buffer.data();
}

static string encode_base64(const string &bytes) {
    using namespace boost::archive::iterators;
    using base64_iterator = base64_from_binary<transform_width<string::const_iterator, 6, 8>>;
    string encoded(base64_iterator(bytes.begin()), base64_iterator(bytes.end()));
    encoded.append((3 - bytes.size() % 3) % 3, '=');
    return encoded;
}

static double to_seconds(chrono::nanoseconds duration) {
    return chrono::duration<double>(duration).count();
}

void to_json(json &j, const termination_outcome &outcome) {
    j = {{"kind", to_string(outcome.kind)}};
    switch (outcome.kind) {
        case outcome_kind::exited_normally:
            j["exit_code"] = outcome.exit_code;
            break;
        case outcome_kind::killed_by_resource_limit:
            if (outcome.limit) j["limit"] = to_string(*outcome.limit);
            j["signal"] = outcome.signal;
            j["signal_name"] = strsignal(outcome.signal);
            break;
        default:
            j["signal"] = outcome.signal;
            j["signal_name"] = strsignal(outcome.signal);
            break;
    }
}

void to_json(json &j, const captured_stream &stream) {
    if (utf8_check_is_valid(stream.data)) {
        j = {{"data", stream.data}, {"encoding", "utf-8"}};
    } else {
        j = {{"data", encode_base64(stream.data)}, {"encoding", "base64"}};
    }
    j["truncated"] = stream.truncated;
    j["total_bytes"] = stream.total_bytes;
}

void to_json(json &j, const fs_change &change) {
    // file names are arbitrary bytes
    if (utf8_check_is_valid(change.path) && utf8_check_is_valid(change.detail)) {
        j = {{"path", change.path}, {"kind", to_string(change.kind)}, {"detail", change.detail}};
    } else {
        j = {{"path", encode_base64(change.path)},
             {"kind", to_string(change.kind)},
             {"detail", encode_base64(change.detail)},
             {"encoding", "base64"}};
    }
}

void to_json(json &j, const result_record &record) {
    json requests = json::array();
    for (auto level : record.termination_requests)
        requests.push_back(to_string(level));

    j = {
        {"type", "result"},
        {"outcome", record.outcome},
        {"stdout", record.stdout_stream},
        {"stderr", record.stderr_stream},
        {"wall_time", to_seconds(record.wall_time)},
        {"user_time", to_seconds(record.user_time)},
        {"sys_time", to_seconds(record.sys_time)},
        {"memory_bytes", record.memory_bytes},
        {"deadline", {{"fired", record.deadline_fired}, {"requests", requests}}},
        {"stray_processes_killed", record.stray_processes_killed},
        {"fs_delta", record.fs_delta}};
}

void to_json(json &j, const setup_error_record &record) {
    j = {{"type", "setup_error"}, {"kind", to_string(record.kind)}, {"message", record.message}};
}

result_sink::~result_sink() = default;

json_stream_sink::json_stream_sink(ostream &os) : os(os) {}

static string dump_line(const json &j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

void json_stream_sink::accept(result_record record) {
    os << dump_line(record) << endl;
}

void json_stream_sink::accept(setup_error_record record) {
    os << dump_line(record) << endl;
}

stream_saving_sink::stream_saving_sink(result_sink &next, string stdout_file, string stderr_file)
    : next(next), stdout_file(move(stdout_file)), stderr_file(move(stderr_file)) {}

static void save_stream(const string &file, const string &data, const char *name) {
    if (file.empty()) return;
    try {
        write_file_content(file, data);
    } catch (exception &e) {
        LOG(ERROR) << "unable to save captured " << name << " to " << file << ": " << e.what();
    }
}

void stream_saving_sink::accept(result_record record) {
    string out = stdout_file.empty() ? "" : record.stdout_stream.data;
    string err = stderr_file.empty() ? "" : record.stderr_stream.data;
    next.accept(move(record));
    save_stream(stdout_file, out, "stdout");
    save_stream(stderr_file, err, "stderr");
}

void stream_saving_sink::accept(setup_error_record record) {
    next.accept(move(record));
}

result_assembler::result_assembler(result_sink &sink) : sink(sink) {}

void result_assembler::set_outcome(const termination_outcome &value) {
    outcome.set(value);
}

void result_assembler::set_streams(captured_stream stdout_stream, captured_stream stderr_stream) {
    record.stdout_stream = move(stdout_stream);
    record.stderr_stream = move(stderr_stream);
    has_streams = true;
}

void result_assembler::set_times(chrono::nanoseconds wall_time, chrono::nanoseconds user_time,
                                 chrono::nanoseconds sys_time) {
    record.wall_time = wall_time;
    record.user_time = user_time;
    record.sys_time = sys_time;
    has_times = true;
}

void result_assembler::set_memory(int64_t memory_bytes) {
    record.memory_bytes = memory_bytes;
}

void result_assembler::set_deadline(bool fired, vector<termination_level> requests) {
    record.deadline_fired = fired;
    record.termination_requests = move(requests);
}

void result_assembler::set_stray_processes_killed(bool killed) {
    record.stray_processes_killed = killed;
}

void result_assembler::set_fs_delta(vector<fs_change> delta) {
    record.fs_delta = move(delta);
    has_delta = true;
}

void result_assembler::emit() {
    if (done) throw logic_error("a record was already emitted for this invocation");
    if (!outcome.has_value()) throw logic_error("result record without outcome");
    if (!has_streams) throw logic_error("result record without captured streams");
    if (!has_times) throw logic_error("result record without timing");
    if (!has_delta) throw logic_error("result record without filesystem delta");

    record.outcome = outcome.get();
    LOG(INFO) << "result: " << to_string(record.outcome.kind) << ", " << record.fs_delta.size()
              << " filesystem change(s)";
    sink.accept(move(record));
    done = true;
}

void result_assembler::emit_setup_error(setup_error_record error) {
    if (done) throw logic_error("a record was already emitted for this invocation");
    LOG(ERROR) << "setup error (" << to_string(error.kind) << "): " << error.message;
    sink.accept(move(error));
    done = true;
}

bool result_assembler::emitted() const {
    return done;
}

}  // namespace testbox
