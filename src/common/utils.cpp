#include "common/utils.hpp"
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace testbox {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

pair<string, string> split_assignment(const string &entry) {
    auto idx = entry.find('=');
    if (idx == string::npos || idx == 0)
        throw invalid_argument("expected KEY=VALUE, got " + entry);
    return {entry.substr(0, idx), entry.substr(idx + 1)};
}

chrono::milliseconds parse_seconds(const string &text) {
    double seconds;
    try {
        seconds = boost::lexical_cast<double>(text);
    } catch (boost::bad_lexical_cast &) {
        throw invalid_argument("not a number of seconds: " + text);
    }
    if (!isfinite(seconds) || seconds < 0)
        throw invalid_argument("not a number of seconds: " + text);
    return chrono::milliseconds((long long)llround(seconds * 1000));
}

bool is_number(const string &s) {
    return !s.empty() && all_of(s.begin(), s.end(), [](unsigned char c) { return isdigit(c) != 0; });
}

}  // namespace testbox
