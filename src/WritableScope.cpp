#include "WritableScope.h"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <sys/stat.h>

#include "Errors.h"

namespace dylibembed {

WritableScope::WritableScope(const std::string& path) : path(path)
{
    struct stat st;
    if (stat(path.c_str(), &st) != 0)
        throw RewriteError("Cannot read permissions of " + path + ": "
                           + std::strerror(errno));
    original_mode = st.st_mode & 07777;

    const mode_t writable = original_mode | S_IWUSR | S_IWGRP;
    if (writable != original_mode && chmod(path.c_str(), writable) != 0)
        throw RewriteError("Cannot set write permissions on " + path + ": "
                           + std::strerror(errno));
}

WritableScope::~WritableScope()
{
    if (chmod(path.c_str(), original_mode) != 0) {
        std::cerr << "\n/!\\ WARNING : Cannot restore permissions of " << path
                  << ": " << std::strerror(errno) << std::endl;
    }
}

void withWritable(const std::string& path,
                  const std::function<void()>& mutation)
{
    WritableScope scope(path);
    mutation();
}

}
