#ifndef DYLIBEMBED_RELOCATOR_H
#define DYLIBEMBED_RELOCATOR_H

#include <cstddef>
#include <string>
#include <vector>

namespace dylibembed {

class CodeSigner;
class DescriptorReader;
class LinkRewriter;
struct EmbedConfig;

// Makes an executable self-contained: embeds the source-tree libraries it
// needs (plus caller supplied extras) and rewrites every reference to them
// into a path relative to the executable.
//
// Any error aborts the whole call. What was already copied or rewritten
// stays; running embed again with the same inputs completes the job.
class Relocator {
public:
    // `signer` may be NULL to skip ad-hoc signing
    Relocator(DescriptorReader& reader, LinkRewriter& rewriter,
              CodeSigner* signer = NULL);

    void embed(const std::string& executable,
               const std::string& library_source_prefix,
               const std::string& embedding_dir,
               const std::vector<std::string>& extra_libraries);

    void embed(const EmbedConfig& config);

    void setLoaderToken(const std::string& token) { loader_token = token; }
    void setLocking(bool on) { use_lock = on; }

private:
    DescriptorReader& reader;
    LinkRewriter& rewriter;
    CodeSigner* signer;

    std::string loader_token;
    bool use_lock;
};

}

#endif
