#include "BundleLock.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include "Errors.h"
#include "Utils.h"

namespace dylibembed {

bool sameFile(int fd, const std::string& path)
{
    struct stat opened;
    struct stat named;
    if (fstat(fd, &opened) != 0 || stat(path.c_str(), &named) != 0)
        return false;
    return opened.st_dev == named.st_dev && opened.st_ino == named.st_ino;
}

BundleLock::BundleLock(const std::string& path) : path(path), fd(-1)
{
    // The previous holder unlinks the file before unlocking it. Whoever
    // locked that old inode in between does not own `path`, so it retries.
    for (int attempt = 0; attempt < 10; ++attempt) {
        fd = open(path.c_str(), O_RDWR | O_CREAT, 0644);
        if (fd < 0)
            throw PreconditionError("Cannot open lock file " + path + ": "
                                    + std::strerror(errno));

        if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
            const int err = errno;
            close(fd);
            if (err == EWOULDBLOCK)
                throw PreconditionError("Bundle is locked by another process ("
                                        + path + ")");
            throw PreconditionError("Cannot lock " + path + ": "
                                    + std::strerror(err));
        }

        if (sameFile(fd, path))
            return;
        close(fd);
    }
    throw PreconditionError("Lock file " + path + " keeps being replaced");
}

BundleLock::~BundleLock()
{
    // the lock file would otherwise end up inside the signed bundle
    unlink(path.c_str());
    flock(fd, LOCK_UN);
    close(fd);
}

std::string BundleLock::pathFor(const std::string& embedding_dir)
{
    std::string dir = embedding_dir;
    while (dir.size() > 1 && dir[dir.size() - 1] == '/')
        dir.erase(dir.size() - 1);
    return joinPath(dirName(dir), "." + stripPrefix(dir) + ".lock");
}

}
