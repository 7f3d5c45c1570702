#include "validation/flakiness.hpp"
#include <glog/logging.h>
#include <algorithm>
#include "common/exceptions.hpp"

namespace difftest {
using namespace std;

optional<validation_error> retry_flaky(const validation_attempt &attempt,
                                       int flakiness,
                                       const set<error_kind> &retriable) {
    int attempts = max(flakiness, 1);
    optional<validation_error> last_error;
    string last_timeout;

    for (int j = 1; j <= attempts; ++j) {
        try {
            last_error = attempt();
            if (!last_error) return nullopt;

            if (!retriable.empty() && !retriable.count(last_error->kind))
                return last_error;

            LOG(WARNING) << "Validation callback failed, attempt=" << j << "/" << attempts << ": " << *last_error;
        } catch (environment_timeout &ex) {
            last_timeout = ex.what();
            LOG(WARNING) << "Validation callback timed out, attempt=" << j << "/" << attempts << ": " << ex.what();
        }
    }

    if (!last_error)
        return validation_error(error_kind::EXECUTION_TIMEOUT, nlohmann::json::object({{"reason", last_timeout}}));
    return last_error;
}

}  // namespace difftest
