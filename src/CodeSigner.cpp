#include "CodeSigner.h"

#include <cstdlib>
#include <iostream>
#include <unistd.h>
#include <vector>

#include "Errors.h"
#include "Platform.h"
#include "Utils.h"

namespace dylibembed {

AdhocCodeSigner::AdhocCodeSigner()
    : signature_required(hostArchitecture().find("arm") != std::string::npos)
{
}

void AdhocCodeSigner::sign(const std::string& file)
{
    const std::string signCommand = std::string(
                                        "codesign --force --deep "
                                        "--preserve-metadata=entitlements,"
                                        "requirements,flags,runtime --sign - \"")
        + file + "\"";
    if (systemp(signCommand) == 0)
        return;

    // If the codesigning fails, it may be a bug in Apple's codesign
    // utility. A known workaround is to copy the file to another inode,
    // then move it back erasing the previous file. Then sign again.
    std::cerr << "  * Error : An error occurred while applying ad-hoc "
                 "signature to "
              << file << ". Attempting workaround" << std::endl;

    const auto fail = [this](const std::string& message) {
        if (signature_required)
            throw RewriteError(message);
        std::cerr << "\n/!\\ WARNING : " << message << std::endl;
    };

    const char* tmpEnv = std::getenv("TMPDIR");
    std::string tempDirTemplate = normalizePrefix(tmpEnv ? tmpEnv : "/tmp")
        + "dylibembed.XXXXXXXX";
    std::vector<char> tmpDirBuffer(tempDirTemplate.begin(),
                                   tempDirTemplate.end());
    tmpDirBuffer.push_back('\0');
    if (mkdtemp(&tmpDirBuffer[0]) == NULL) {
        fail("Unable to create temp directory for signing workaround");
        return;
    }

    const std::string tmpDir = &tmpDirBuffer[0];
    const std::string tmpFile = joinPath(tmpDir, stripPrefix(file));

    bool moved = systemp("cp -p \"" + file + "\" \"" + tmpFile + "\"") == 0
        && systemp("mv -f \"" + tmpFile + "\" \"" + file + "\"") == 0;
    if (systemp("rm -rf \"" + tmpDir + "\"") != 0)
        std::cerr << "\n/!\\ WARNING : Cannot remove " << tmpDir << std::endl;

    if (!moved) {
        fail("An error occurred moving " + file + " through " + tmpDir);
        return;
    }
    if (systemp(signCommand) != 0)
        fail("An error occurred while applying ad-hoc signature to " + file);
}

}
