#ifndef DYLIBEMBED_SETTINGS_H
#define DYLIBEMBED_SETTINGS_H

#include <string>
#include <vector>

namespace dylibembed {

struct EmbedConfig {
    EmbedConfig();

    // the executable to make self-contained
    std::string executable;
    // libraries under this prefix are embedded, everything else is left alone
    std::string source_prefix;
    // embedded even though nothing links against them, in this order
    std::vector<std::string> extra_libraries;

    // name of the embedding directory next to the executable; empty means
    // lib-<arch>-<os version> of the host
    std::string embedding_dir_name;
    std::string loader_token;

    bool codesign;
    bool lock;
};

// full path of the embedding directory described by `config`
std::string embeddingDirFor(const EmbedConfig& config);

}

#endif
