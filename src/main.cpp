#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/system.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "invocation.hpp"
#include "runner.hpp"
using namespace std;
using namespace testbox;

struct seconds_value {
    chrono::milliseconds value;
};

void validate(boost::any &v, const vector<string> &values, seconds_value *, int) {
    using namespace boost::program_options;
    validators::check_first_occurrence(v);

    string const &s = validators::get_single_string(values);
    try {
        v = seconds_value{parse_seconds(s)};
    } catch (invalid_argument &) {
        throw validation_error(validation_error::invalid_option_value);
    }
}

static int resolve_id(const string &name, bool user) {
    if (is_number(name)) return boost::lexical_cast<int>(name);
    int id = user ? get_userid(name.c_str()) : get_groupid(name.c_str());
    if (id < 0)
        throw invalid_argument(fmt::format("{} {} does not exist", user ? "user" : "group", name));
    return id;
}

int main(int argc, const char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("testbox options");
    po::positional_options_description pos;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("root,r", po::value<string>(), "isolated root directory the command runs in, already populated. Paths below are interpreted inside it.")
        ("work-dir,d", po::value<string>(), "working directory of the command, inside the root (default /)")
        ("user,u", po::value<string>(), "run command as user with username or user id")
        ("group,g", po::value<string>(), "run command under group with groupname or group id. If only 'user' is set, this defaults to the same")
        ("wall-time,T", po::value<seconds_value>(), "terminate command after wall time clock seconds (floating point is acceptable)")
        ("grace", po::value<seconds_value>(), "seconds between SIGTERM and SIGKILL once the wall time is reached")
        ("cpu-time,t", po::value<seconds_value>(), "set maximum CPU time (floating point is acceptable) consumption of the command in seconds")
        ("memory-limit,m", po::value<size_t>(), "set maximum memory consumption of the command in KB")
        ("file-limit,f", po::value<size_t>(), "set maximum created file size of the command in KB")
        ("nproc,p", po::value<size_t>(), "set maximum process living simutanously")
        ("stream-size", po::value<size_t>(), "truncate captured output streams at the size in KB")
        ("standard-input-file,i", po::value<string>(), "redirect command standard input fd to file inside the root")
        ("standard-output-file", po::value<string>(), "also write the captured standard output to this host file")
        ("standard-error-file", po::value<string>(), "also write the captured standard error to this host file")
        ("variable,V", po::value<vector<string>>(), "environment variables of the command, nothing else is passed (e.g. -Vkey1=value1 -Vkey2=value2)")
        ("watch,w", po::value<string>(), "directory inside the root observed for file changes (default the working directory)")
        ("invocation,I", po::value<string>(), "read the invocation from a JSON file, options given on the command line take precedence")
        ("out-result,M", po::value<string>(), "write the result record to file instead of standard output")
        ("cmd", po::value<vector<string>>()->composing(), "command and its arguments")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    pos.add("cmd", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(pos)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return E_USAGE;
    }

    if (vm.count("help")) {
        cout << "testbox: run a test program in an isolated root under a deadline, "
             << "capture its output and the files it changed." << endl
             << "Requires root privilege if 'root', 'user' or 'memory-limit' is given." << endl
             << "Usage: " << argv[0] << " [options] -- [command]" << endl;
        cout << desc << endl;
        return E_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "testbox 1.0" << endl;
        return E_SUCCESS;
    }

    invocation_spec spec;
    try {
        load_config_from_env();
        spec = invocation_spec();

        if (vm.count("invocation")) {
            string path = vm["invocation"].as<string>();
            ifstream fin(path);
            if (!fin) throw invalid_argument(fmt::format("unable to open invocation file {}", path));
            spec = parse_invocation(nlohmann::json::parse(fin));
        } else if (!vm.count("cmd")) {
            throw invalid_argument("no command given");
        }

        if (vm.count("cmd")) {
            auto cmd = vm["cmd"].as<vector<string>>();
            spec.program = cmd[0];
            spec.args.assign(cmd.begin() + 1, cmd.end());
        }
        if (vm.count("root")) spec.root = vm["root"].as<string>();
        if (vm.count("work-dir")) spec.work_dir = vm["work-dir"].as<string>();

        if (vm.count("user")) {
            string user = vm["user"].as<string>();
            spec.user_id = resolve_id(user, true);
            if (!vm.count("group")) spec.group_id = resolve_id(user, false);
        }
        if (vm.count("group")) spec.group_id = resolve_id(vm["group"].as<string>(), false);

        if (vm.count("variable")) {
            for (auto &entry : vm["variable"].as<vector<string>>()) {
                auto [key, value] = split_assignment(entry);
                spec.env[key] = value;
            }
        }

        if (vm.count("wall-time")) spec.time_limit = vm["wall-time"].as<seconds_value>().value;
        if (vm.count("grace")) spec.grace_window = vm["grace"].as<seconds_value>().value;
        if (vm.count("cpu-time")) spec.cpu_limit = vm["cpu-time"].as<seconds_value>().value;
        if (vm.count("memory-limit")) spec.memory_limit = (int64_t)vm["memory-limit"].as<size_t>() * 1024;
        if (vm.count("file-limit")) spec.output_limit = (int64_t)vm["file-limit"].as<size_t>() * 1024;
        if (vm.count("nproc")) spec.process_limit = (int64_t)vm["nproc"].as<size_t>();
        if (vm.count("stream-size")) spec.stream_size = vm["stream-size"].as<size_t>() * 1024;
        if (vm.count("standard-input-file")) spec.stdin_file = vm["standard-input-file"].as<string>();
        if (vm.count("watch")) spec.watch_dir = vm["watch"].as<string>();
    } catch (exception &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return E_USAGE;
    }

    ofstream fout;
    if (vm.count("out-result")) {
        fout.open(vm["out-result"].as<string>());
        if (!fout) {
            cerr << "unable to open result file " << vm["out-result"].as<string>() << endl;
            return E_USAGE;
        }
    }

    json_stream_sink json_sink(vm.count("out-result") ? static_cast<ostream &>(fout) : cout);
    stream_saving_sink sink(json_sink,
                            vm.count("standard-output-file") ? vm["standard-output-file"].as<string>() : "",
                            vm.count("standard-error-file") ? vm["standard-error-file"].as<string>() : "");

    try {
        return run_invocation(spec, sink) ? E_SUCCESS : E_SETUP_ERROR;
    } catch (testbox_exception &e) {
        LOG(ERROR) << e;
        return E_INTERNAL_ERROR;
    } catch (exception &e) {
        LOG(ERROR) << boost::diagnostic_information(e);
        return E_INTERNAL_ERROR;
    }
}
