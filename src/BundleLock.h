#ifndef DYLIBEMBED_BUNDLE_LOCK_H
#define DYLIBEMBED_BUNDLE_LOCK_H

#include <string>

namespace dylibembed {

// Advisory exclusive lock (flock) on `path`, held until destruction.
// Throws PreconditionError if another process holds it.
class BundleLock {
public:
    explicit BundleLock(const std::string& path);
    ~BundleLock();

    // lock file guarding the given embedding directory, kept beside it
    static std::string pathFor(const std::string& embedding_dir);

private:
    BundleLock(const BundleLock&);
    BundleLock& operator=(const BundleLock&);

    std::string path;
    int fd;
};

// true while `path` still names the file open as `fd`
bool sameFile(int fd, const std::string& path);

}

#endif
