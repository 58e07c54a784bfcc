#include "Platform.h"

#include <sys/utsname.h>

#include "Utils.h"

namespace dylibembed {

std::string embeddingDirName(const std::string& arch,
                             const std::string& os_version)
{
    return "lib-" + arch + "-" + os_version;
}

std::string embeddingDirName()
{
    return embeddingDirName(hostArchitecture(), hostOsVersion());
}

std::string hostArchitecture()
{
    struct utsname name;
    if (uname(&name) != 0)
        return "unknown";
    return name.machine;
}

std::string hostOsVersion()
{
    std::string version
        = system_get_output("sw_vers -productVersion 2>/dev/null");
    rtrim(version);
    if (version.empty()) {
        struct utsname name;
        if (uname(&name) != 0)
            return "unknown";
        version = name.release;
    }
    return majorMinor(version);
}

std::string majorMinor(const std::string& version)
{
    const std::string::size_type first = version.find('.');
    if (first == std::string::npos)
        return version;
    const std::string::size_type second = version.find('.', first + 1);
    if (second == std::string::npos)
        return version;
    return version.substr(0, second);
}

}
