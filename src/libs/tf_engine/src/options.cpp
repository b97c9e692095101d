#include <tf_engine/options.hpp>
#include <algorithm>
#include <thread>

namespace tf_engine {

EngineOptions normalized(EngineOptions options) {
    if (options.max_parallel <= 0) {
        const unsigned hw = std::thread::hardware_concurrency();
        options.max_parallel = hw == 0 ? 1 : static_cast<int>(hw);
    }
    options.max_parallel = std::min(options.max_parallel, kMaxParallelCap);
    return options;
}

} // namespace tf_engine
