#ifndef DYLIBEMBED_PLATFORM_H
#define DYLIBEMBED_PLATFORM_H

#include <string>

namespace dylibembed {

// "lib-<arch>-<os version>", e.g. "lib-arm64-14.2"
std::string embeddingDirName(const std::string& arch,
                             const std::string& os_version);
std::string embeddingDirName();

std::string hostArchitecture();

// major.minor of the running OS
std::string hostOsVersion();

// keeps the first two dot separated components of a version string
std::string majorMinor(const std::string& version);

}

#endif
