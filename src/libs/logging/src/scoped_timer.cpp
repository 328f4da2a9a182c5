#include <logging/logger.h>
#include <logging/scoped_timer.h>

namespace logging
{
scoped_timer::scoped_timer(std::string name) :
    name_{std::move(name)},
    start_{std::chrono::steady_clock::now()}
{
    LOG(DEBUG) << "[" << name_ << "] starting";
}

double scoped_timer::elapsed_ms() const
{
    using namespace std::chrono;
    return duration_cast<microseconds>(steady_clock::now() - start_).count() / 1000.0;
}

scoped_timer::~scoped_timer()
{
    LOG(INFO) << "[" << name_ << "] finished"
              << " (" << elapsed_ms() << "ms)";
}

}// namespace logging
