#include "Settings.h"

#include "Platform.h"
#include "Utils.h"

namespace dylibembed {

EmbedConfig::EmbedConfig()
    : loader_token("@executable_path"), codesign(true), lock(true)
{
}

std::string embeddingDirFor(const EmbedConfig& config)
{
    const std::string name = config.embedding_dir_name.empty()
        ? embeddingDirName()
        : config.embedding_dir_name;
    return joinPath(dirName(config.executable), name);
}

}
