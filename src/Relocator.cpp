#include "Relocator.h"

#include <iostream>
#include <memory>

#include "BundleLock.h"
#include "ClosureWalker.h"
#include "CodeSigner.h"
#include "Errors.h"
#include "LinkRewriter.h"
#include "RelocationLayout.h"
#include "SelfReferenceResolver.h"
#include "Settings.h"
#include "Utils.h"
#include "WritableScope.h"

namespace dylibembed {

Relocator::Relocator(DescriptorReader& reader, LinkRewriter& rewriter,
                     CodeSigner* signer)
    : reader(reader), rewriter(rewriter), signer(signer),
      loader_token("@executable_path"), use_lock(true)
{
}

void Relocator::embed(const std::string& executable,
                      const std::string& library_source_prefix,
                      const std::string& embedding_dir,
                      const std::vector<std::string>& extra_libraries)
{
    if (!isRegularFile(executable))
        throw PreconditionError("Executable " + executable + " does not exist");
    for (const auto& extra : extra_libraries) {
        if (!isRegularFile(extra))
            throw PreconditionError("Library " + extra + " does not exist");
    }

    if (library_source_prefix.empty())
        throw PreconditionError("No library source prefix given");
    const std::string prefix = normalizePrefix(library_source_prefix);

    // validated before anything is created on disk
    const RelocationLayout layout = RelocationLayout::forExecutable(
        executable, embedding_dir, loader_token);

    std::cout << "* Checking output directory " << embedding_dir << std::endl;
    makeDirectory(embedding_dir);

    std::unique_ptr<BundleLock> lock;
    if (use_lock)
        lock.reset(new BundleLock(BundleLock::pathFor(embedding_dir)));

    ClosureWalker walker(reader, rewriter);
    walker.walk(executable, prefix, layout);

    for (const auto& extra : extra_libraries) {
        const std::string name = stripPrefix(extra);
        const std::string install_path = layout.embeddedPath(name);

        std::cout << "\n* Processing extra library " << extra << std::endl;
        if (!fileExists(install_path))
            copyFile(extra, install_path);
        walker.noteEmbedded(name, extra);
        rewriter.rewriteSelfIdentity(
            install_path, layout.relocatablePath(install_path, name));
        walker.walk(install_path, prefix, layout);
    }

    std::cout << "\n* Resolving references between embedded libraries"
              << std::endl;
    SelfReferenceResolver resolver(reader, rewriter);
    resolver.resolve(executable, layout);

    if (signer != NULL) {
        // copies of read-only libraries keep their mode; codesign rewrites
        // the file in place
        for (const auto& name : listDirectory(embedding_dir)) {
            const std::string file = layout.embeddedPath(name);
            withWritable(file, [&]() { signer->sign(file); });
        }
        withWritable(executable, [&]() { signer->sign(executable); });
    }
}

void Relocator::embed(const EmbedConfig& config)
{
    setLoaderToken(config.loader_token);
    setLocking(config.lock);
    embed(config.executable, config.source_prefix, embeddingDirFor(config),
          config.extra_libraries);
}

}
