#ifndef DYLIBEMBED_SELF_REFERENCE_RESOLVER_H
#define DYLIBEMBED_SELF_REFERENCE_RESOLVER_H

#include <cstddef>
#include <string>

#include "RelocationLayout.h"

namespace dylibembed {

class DescriptorReader;
class LinkRewriter;

// Final pass over the executable and every embedded library: any reference
// that still uses an absolute path but names a library present in the
// embedding directory is rewritten to its relocatable form.
//
// Must run once the closure walk is complete, since it relies on the
// embedding directory's membership being final.
class SelfReferenceResolver {
public:
    SelfReferenceResolver(DescriptorReader& reader, LinkRewriter& rewriter);

    // returns the number of references rewritten
    std::size_t resolve(const std::string& root_binary,
                        const RelocationLayout& layout);

private:
    DescriptorReader& reader;
    LinkRewriter& rewriter;
};

}

#endif
