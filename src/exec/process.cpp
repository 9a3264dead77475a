/*
 * Process control helpers - transferd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <transferd/exec/process.hpp>

namespace transferd {

const char* to_string(SignalResult r) {
    switch (r) {
        case SignalResult::Ok: return "ok";
        case SignalResult::NotRunning: return "not running";
        case SignalResult::Unsupported: return "not supported on this platform";
        case SignalResult::Failed: return "failed";
    }
    return "failed";
}

} // namespace transferd
