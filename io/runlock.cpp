#include "runlock.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <utility>

#include "../errors.hpp"
#include "../logging.hpp"

namespace attribution {

RunLock::RunLock(std::string path)
    : path_(std::move(path))
    , log_(logging::get())
{
    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0)
        throw StoreUnavailable("cannot open lock file '" + path_ + "': " + std::strerror(errno));
}

RunLock::~RunLock()
{
    unlock();
    if (fd_ >= 0)
        ::close(fd_);
}

bool RunLock::tryLock()
{
    if (locked_)
        return true;
    if (::flock(fd_, LOCK_EX | LOCK_NB) == 0)
    {
        locked_ = true;
        return true;
    }
    if (errno == EWOULDBLOCK)
        return false;
    throw StoreUnavailable("cannot lock '" + path_ + "': " + std::strerror(errno));
}

void RunLock::unlock() noexcept
{
    if (!locked_)
        return;
    if (::flock(fd_, LOCK_UN) != 0)
        log_->warn("cannot unlock '{}': {}", path_, std::strerror(errno));
    locked_ = false;
}

} // namespace attribution
