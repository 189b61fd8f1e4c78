#pragma once

#include <functional>

namespace voicelive_bridge {
namespace utils {

// Runs the task on a detached worker thread. Exceptions escaping the task are logged.
void run_async(std::function<void()> task);

}
}
