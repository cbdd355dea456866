#pragma once

#include <functional>

namespace realtime_bridge {
namespace utils {

// Runs a task on a detached thread. Exceptions are logged, not propagated.
void run_async(std::function<void()> task);

}
}
