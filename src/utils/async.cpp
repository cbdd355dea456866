#include "realtime_bridge/utils/async.hpp"

#include <exception>
#include <thread>

#include "realtime_bridge/logging.hpp"

namespace realtime_bridge::utils {

void run_async(std::function<void()> task) {
    std::thread worker([task = std::move(task)]() mutable {
        try {
            task();
        } catch (const std::exception& ex) {
            logging::error("Async task failed", {kv("error", ex.what())});
        }
    });
    worker.detach();
}

}
