#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/exceptions.hpp"
#include "deadline.hpp"
#include "fs_observer.hpp"
#include "limits.hpp"

namespace testbox {

struct stream_buffer;

enum class outcome_kind {
    exited_normally,
    exited_by_signal,
    killed_by_deadline,
    killed_by_resource_limit
};

const char *to_string(outcome_kind kind);

/**
 * @brief How and why the subject stopped running
 */
struct termination_outcome {
    outcome_kind kind = outcome_kind::exited_normally;

    /**
     * @brief Exit code, only meaningful for exited_normally
     */
    int exit_code = 0;

    /**
     * @brief Terminating signal, 0 when the subject exited normally
     */
    int signal = 0;

    /**
     * @brief Exhausted resource, only for killed_by_resource_limit
     */
    std::optional<limit_kind> limit;

    static termination_outcome exited_normally(int code);
    static termination_outcome exited_by_signal(int signal);
    static termination_outcome killed_by_deadline(int signal);
    static termination_outcome killed_by_resource_limit(limit_kind kind, int signal);

    bool operator==(const termination_outcome &other) const;
    bool operator!=(const termination_outcome &other) const { return !(*this == other); }
};

/**
 * @brief Holds the outcome of a run, which can be decided only once.
 */
struct outcome_slot {
    /**
     * @throw std::logic_error when an outcome was already set
     */
    void set(const termination_outcome &outcome);

    bool has_value() const;

    /**
     * @throw std::logic_error when no outcome was set
     */
    const termination_outcome &get() const;

private:
    std::optional<termination_outcome> value;
};

struct captured_stream {
    std::string data;
    bool truncated = false;
    std::uint64_t total_bytes = 0;

    captured_stream() = default;

    /**
     * @throw std::logic_error when the buffer is not frozen yet
     */
    explicit captured_stream(stream_buffer &&buffer);
};

struct result_record {
    termination_outcome outcome;
    captured_stream stdout_stream;
    captured_stream stderr_stream;

    std::chrono::nanoseconds wall_time{0};
    std::chrono::nanoseconds user_time{0};
    std::chrono::nanoseconds sys_time{0};

    /**
     * @brief Peak memory usage in bytes, -1 when not measured
     */
    std::int64_t memory_bytes = -1;

    bool deadline_fired = false;
    std::vector<termination_level> termination_requests;

    /**
     * @brief Members of the process group were still alive after the
     * leader exited and had to be killed
     */
    bool stray_processes_killed = false;

    std::vector<fs_change> fs_delta;
};

struct setup_error_record {
    setup_error_kind kind;
    std::string message;
};

void to_json(nlohmann::json &j, const termination_outcome &outcome);
void to_json(nlohmann::json &j, const captured_stream &stream);
/**
 * @brief A change whose path or detail is not valid UTF-8 has both encoded
 * as base64, marked by "encoding": "base64"
 */
void to_json(nlohmann::json &j, const fs_change &change);
void to_json(nlohmann::json &j, const result_record &record);
void to_json(nlohmann::json &j, const setup_error_record &record);

/**
 * @brief Receives the single record produced by an invocation.
 * Records are handed over, the sink owns them from then on.
 */
struct result_sink {
    virtual ~result_sink();

    virtual void accept(result_record record) = 0;
    virtual void accept(setup_error_record record) = 0;
};

/**
 * @brief Writes each record as one line of JSON.
 * Invalid UTF-8 left in a message is replaced, never thrown.
 */
struct json_stream_sink : public result_sink {
    explicit json_stream_sink(std::ostream &os);

    void accept(result_record record) override;
    void accept(setup_error_record record) override;

private:
    std::ostream &os;
};

/**
 * @brief Forwards every record to another sink, then persists the captured
 * streams of a result record to host files.
 * A file that cannot be written is logged, the record is already delivered.
 */
struct stream_saving_sink : public result_sink {
    /**
     * @param stdout_file host file receiving stdout, nothing is written when empty
     * @param stderr_file host file receiving stderr, nothing is written when empty
     */
    stream_saving_sink(result_sink &next, std::string stdout_file, std::string stderr_file);

    void accept(result_record record) override;
    void accept(setup_error_record record) override;

private:
    result_sink &next;
    std::string stdout_file, stderr_file;
};

/**
 * @brief Collects the parts of a result record and emits it exactly once.
 */
struct result_assembler {
    explicit result_assembler(result_sink &sink);

    void set_outcome(const termination_outcome &outcome);
    void set_streams(captured_stream stdout_stream, captured_stream stderr_stream);
    void set_times(std::chrono::nanoseconds wall_time, std::chrono::nanoseconds user_time,
                   std::chrono::nanoseconds sys_time);
    void set_memory(std::int64_t memory_bytes);
    void set_deadline(bool fired, std::vector<termination_level> requests);
    void set_stray_processes_killed(bool killed);
    void set_fs_delta(std::vector<fs_change> delta);

    /**
     * @brief Hands the result record to the sink
     * @throw std::logic_error when the outcome, the streams, the times or
     * the filesystem delta are missing, or when a record was already emitted
     */
    void emit();

    /**
     * @brief Hands a setup-error record to the sink instead of a result
     * @throw std::logic_error when a record was already emitted
     */
    void emit_setup_error(setup_error_record error);

    /**
     * @brief Whether the sink accepted a record. A sink that threw has not.
     */
    bool emitted() const;

private:
    result_sink &sink;
    outcome_slot outcome;
    result_record record;
    bool has_streams = false, has_times = false, has_delta = false;
    bool done = false;
};

}  // namespace testbox
