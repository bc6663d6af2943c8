#include "config.hpp"
#include <boost/lexical_cast.hpp>
#include <stdexcept>
#include "common/utils.hpp"

namespace testbox {
using namespace std;

chrono::milliseconds GRACE_WINDOW(500);
chrono::milliseconds DRAIN_TIMEOUT(1000);
size_t STREAM_SIZE = 16 << 20;        // 16M
size_t DIGEST_SIZE_LIMIT = 64 << 20;  // 64M

void load_config_from_env() {
    string grace = get_env("TESTBOX_GRACE_WINDOW", "");
    if (!grace.empty()) GRACE_WINDOW = parse_seconds(grace);

    string drain = get_env("TESTBOX_DRAIN_TIMEOUT", "");
    if (!drain.empty()) DRAIN_TIMEOUT = parse_seconds(drain);

    string stream_size = get_env("TESTBOX_STREAM_SIZE", "");
    if (!stream_size.empty()) {
        if (!is_number(stream_size))
            throw invalid_argument("TESTBOX_STREAM_SIZE should be a size in bytes");
        STREAM_SIZE = boost::lexical_cast<size_t>(stream_size);
    }
}

}  // namespace testbox
