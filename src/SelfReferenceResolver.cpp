#include "SelfReferenceResolver.h"

#include <iostream>
#include <set>
#include <vector>

#include "DescriptorReader.h"
#include "LinkRewriter.h"
#include "Utils.h"

namespace dylibembed {

SelfReferenceResolver::SelfReferenceResolver(DescriptorReader& reader,
                                             LinkRewriter& rewriter)
    : reader(reader), rewriter(rewriter)
{
}

std::size_t SelfReferenceResolver::resolve(const std::string& root_binary,
                                           const RelocationLayout& layout)
{
    const std::vector<std::string> names = listDirectory(layout.embedding_dir);
    const std::set<std::string> members(names.begin(), names.end());

    std::vector<std::string> binaries;
    binaries.push_back(root_binary);
    for (const auto& name : names)
        binaries.push_back(layout.embeddedPath(name));

    std::size_t rewritten = 0;
    for (const auto& binary : binaries) {
        const std::string own_name = stripPrefix(binary);
        for (const auto& dep : unrelocatedReferences(reader, binary)) {
            const std::string name = stripPrefix(dep);
            if (members.find(name) == members.end())
                continue;

            std::cout << "  * Fixing " << dep << " in " << binary << std::endl;
            const std::string inner_path = layout.relocatablePath(binary, name);
            if (name == own_name)
                rewriter.rewriteSelfIdentity(binary, inner_path);
            else
                rewriter.rewriteDependency(binary, dep, inner_path);
            ++rewritten;
        }
    }
    return rewritten;
}

}
