#ifndef DYLIBEMBED_CLOSURE_WALKER_H
#define DYLIBEMBED_CLOSURE_WALKER_H

#include <map>
#include <string>
#include <vector>

#include "RelocationLayout.h"

namespace dylibembed {

class DescriptorReader;
class LinkRewriter;

// Copies the transitive closure of source-tree libraries a binary depends on
// into the embedding directory and points every reference at the copies.
//
// A library is copied at most once per basename: if a file of that name is
// already in the embedding directory it is neither copied nor visited again,
// which is also what makes the walk terminate on cyclic graphs. Two
// different source libraries sharing a basename end up as one embedded file;
// the one reached first in depth-first order wins.
class ClosureWalker {
public:
    ClosureWalker(DescriptorReader& reader, LinkRewriter& rewriter);

    // Returns the embedded copies made by this walk, in copy order.
    std::vector<std::string> walk(const std::string& root_binary,
                                  const std::string& library_source_prefix,
                                  const RelocationLayout& layout);

    // Records that `basename` in the embedding directory came from `source`.
    // Warns when a different source already claimed the name. Sources are
    // remembered across walk() calls.
    void noteEmbedded(const std::string& basename, const std::string& source);

private:
    DescriptorReader& reader;
    LinkRewriter& rewriter;

    // basename -> source path of every library embedded through this walker
    std::map<std::string, std::string> visited;
};

}

#endif
