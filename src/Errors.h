#ifndef DYLIBEMBED_ERRORS_H
#define DYLIBEMBED_ERRORS_H

#include <stdexcept>
#include <string>

namespace dylibembed {

class EmbedError : public std::runtime_error {
public:
    explicit EmbedError(const std::string& what) : std::runtime_error(what) {}
};

// missing input executable or library, or the bundle is busy
class PreconditionError : public EmbedError {
public:
    explicit PreconditionError(const std::string& what) : EmbedError(what) {}
};

// binary metadata could not be inspected (missing, corrupt, not Mach-O)
class DescriptorReadError : public EmbedError {
public:
    explicit DescriptorReadError(const std::string& what) : EmbedError(what) {}
};

// an edit of a binary was rejected by the underlying tool or filesystem
class RewriteError : public EmbedError {
public:
    explicit RewriteError(const std::string& what) : EmbedError(what) {}
};

}

#endif
