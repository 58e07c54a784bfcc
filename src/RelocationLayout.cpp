#include "RelocationLayout.h"

#include <climits>
#include <cstdlib>
#include <unistd.h>
#include <vector>

#include "Errors.h"
#include "Utils.h"

#ifdef __linux
#include <linux/limits.h>
#endif

namespace dylibembed {

namespace {

std::string resolvedPath(const std::string& path)
{
    char buffer[PATH_MAX];
    if (realpath(path.c_str(), buffer) == NULL)
        throw PreconditionError("Cannot resolve path '" + path + "'");
    return buffer;
}

// realpath for a path whose trailing components may not exist yet
std::string resolvedPathAllowingMissing(const std::string& path)
{
    std::string absolute = path;
    if (absolute.empty() || absolute[0] != '/') {
        char cwd[PATH_MAX];
        if (getcwd(cwd, sizeof(cwd)) == NULL)
            throw PreconditionError("Cannot resolve path '" + path + "'");
        absolute = joinPath(cwd, absolute);
    }

    std::vector<std::string> missing;
    std::string existing = absolute;
    while (!fileExists(existing)) {
        const std::string name = stripPrefix(existing);
        if (name == "..")
            throw PreconditionError("Cannot resolve path '" + path + "'");
        if (!name.empty() && name != ".")
            missing.push_back(name);
        existing = dirName(existing);
    }

    std::string resolved = resolvedPath(existing);
    for (std::vector<std::string>::reverse_iterator it = missing.rbegin();
         it != missing.rend(); ++it)
        resolved = joinPath(resolved, *it);
    return resolved;
}

}

std::string RelocationLayout::embeddedPath(const std::string& basename) const
{
    return joinPath(embedding_dir, basename);
}

std::string RelocationLayout::relocatablePath(const std::string& binary,
                                              const std::string& basename) const
{
    if (loader_token != "@loader_path")
        return joinPath(joinPath(loader_token, relative_dir), basename);

    const std::string from = resolvedPath(dirName(binary));
    const std::string relative = relativePath(from, resolved_embedding_dir);
    if (relative.empty())
        return joinPath(loader_token, basename);
    return joinPath(joinPath(loader_token, relative), basename);
}

RelocationLayout RelocationLayout::forExecutable(
    const std::string& executable, const std::string& embedding_dir,
    const std::string& loader_token)
{
    const std::string exe_dir = normalizePrefix(
        dirName(resolvedPath(executable)));
    const std::string dir = resolvedPathAllowingMissing(embedding_dir);

    if (!startsWith(dir, exe_dir) || dir.size() == exe_dir.size())
        throw PreconditionError("Embedding directory " + embedding_dir
                                + " is not inside " + exe_dir);

    RelocationLayout layout;
    layout.embedding_dir = embedding_dir;
    layout.resolved_embedding_dir = dir;
    layout.relative_dir = dir.substr(exe_dir.size());
    layout.loader_token = loader_token;
    return layout;
}

}
