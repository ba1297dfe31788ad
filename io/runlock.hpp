#pragma once
/*-----------------------------------------------------------------------------
 *  runlock.hpp
 *
 *  Exclusive advisory lock (flock) serializing engine runs against one store.
 *---------------------------------------------------------------------------*/
#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace attribution {

class RunLock
{
public:
    /** Open `path` (created if missing). Throws StoreUnavailable on I/O errors. */
    explicit RunLock(std::string path);
    ~RunLock();

    RunLock(const RunLock&) = delete;
    RunLock& operator=(const RunLock&) = delete;

    /** Non-blocking; false when another process holds the lock. */
    bool tryLock();
    void unlock() noexcept;

    bool locked() const noexcept { return locked_; }
    const std::string& path() const noexcept { return path_; }

private:
    std::string                     path_;
    std::shared_ptr<spdlog::logger> log_;   ///< taken at construction, unlock() must not build one
    int                             fd_{-1};
    bool                            locked_{false};
};

} // namespace attribution
