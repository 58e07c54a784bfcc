#ifndef DYLIBEMBED_WRITABLE_SCOPE_H
#define DYLIBEMBED_WRITABLE_SCOPE_H

#include <functional>
#include <string>
#include <sys/types.h>

namespace dylibembed {

// Makes `path` owner/group writable for the lifetime of the object and puts
// the original permission bits back on destruction. The constructor throws
// RewriteError if the permissions cannot be read or widened.
//
// A process killed while the scope is open leaves the file widened.
class WritableScope {
public:
    explicit WritableScope(const std::string& path);
    ~WritableScope();

    mode_t originalMode() const { return original_mode; }

private:
    WritableScope(const WritableScope&);
    WritableScope& operator=(const WritableScope&);

    std::string path;
    mode_t original_mode;
};

void withWritable(const std::string& path,
                  const std::function<void()>& mutation);

}

#endif
