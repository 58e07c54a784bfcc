#ifndef DYLIBEMBED_RELOCATION_LAYOUT_H
#define DYLIBEMBED_RELOCATION_LAYOUT_H

#include <string>

namespace dylibembed {

// Where embedded libraries live on disk and how binaries refer to them.
struct RelocationLayout {
    // the embedding directory as given by the caller
    std::string embedding_dir;
    // the same directory with symlinks resolved; it may not exist yet
    std::string resolved_embedding_dir;
    // embedding directory relative to the executable's directory
    std::string relative_dir;
    // @executable_path, @loader_path, ...
    std::string loader_token;

    std::string embeddedPath(const std::string& basename) const;

    // The string `binary` must use to refer to the embedded `basename`.
    // With @loader_path the path is relative to the directory of `binary`
    // itself; every other token is followed by `relative_dir`.
    std::string relocatablePath(const std::string& binary,
                                const std::string& basename) const;

    // `executable` must exist and `embedding_dir` must lie inside its
    // directory, otherwise PreconditionError. Nothing is created on disk.
    static RelocationLayout forExecutable(const std::string& executable,
                                          const std::string& embedding_dir,
                                          const std::string& loader_token);
};

}

#endif
