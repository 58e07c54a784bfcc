#include "ClosureWalker.h"

#include <cstddef>
#include <iostream>

#include "DescriptorReader.h"
#include "Errors.h"
#include "LinkRewriter.h"
#include "Utils.h"

namespace dylibembed {

namespace {

// one binary being inspected, and how far through its references we are
struct Frame {
    std::string binary;
    std::vector<std::string> refs;
    std::size_t next;
};

Frame openFrame(DescriptorReader& reader, const std::string& binary)
{
    std::cout << "* Collecting dependencies of " << binary << std::endl;

    Frame frame;
    frame.binary = binary;
    frame.refs = unrelocatedReferences(reader, binary);
    frame.next = 0;
    return frame;
}

}

ClosureWalker::ClosureWalker(DescriptorReader& reader, LinkRewriter& rewriter)
    : reader(reader), rewriter(rewriter)
{
}

void ClosureWalker::noteEmbedded(const std::string& basename,
                                 const std::string& source)
{
    std::map<std::string, std::string>::const_iterator seen
        = visited.find(basename);
    if (seen == visited.end()) {
        visited[basename] = source;
    } else if (seen->second != source) {
        std::cerr << "\n/!\\ WARNING : " << source << " shares its name with "
                  << seen->second << ", only the latter is embedded"
                  << std::endl;
    }
}

std::vector<std::string> ClosureWalker::walk(
    const std::string& root_binary, const std::string& library_source_prefix,
    const RelocationLayout& layout)
{
    std::vector<std::string> copied;

    // explicit call stack: a copy is inspected completely before the binary
    // that referenced it moves on to its next reference
    std::vector<Frame> stack;
    stack.push_back(openFrame(reader, root_binary));

    while (!stack.empty()) {
        Frame& top = stack.back();
        if (top.next == top.refs.size()) {
            stack.pop_back();
            continue;
        }

        const std::string binary = top.binary;
        const std::string dep = top.refs[top.next++];

        if (!startsWith(dep, library_source_prefix))
            continue; // system library, left alone

        const std::string name = stripPrefix(dep);

        if (name == stripPrefix(binary)) {
            // the binary refers to itself under another path alias
            rewriter.rewriteSelfIdentity(
                binary, layout.relocatablePath(binary, name));
            continue;
        }

        // a missing library is reported before any reference to it changes
        const std::string install_path = layout.embeddedPath(name);
        const bool embedded = fileExists(install_path);
        if (!embedded && !fileExists(dep))
            throw PreconditionError("Library " + dep + " needed by " + binary
                                    + " does not exist");

        rewriter.rewriteDependency(binary, dep,
                                   layout.relocatablePath(binary, name));

        if (embedded) {
            noteEmbedded(name, dep);
            continue;
        }

        std::cout << "* Processing dependency " << install_path << std::endl;
        copyFile(dep, install_path);
        rewriter.rewriteSelfIdentity(
            install_path, layout.relocatablePath(install_path, name));

        noteEmbedded(name, dep);
        copied.push_back(install_path);

        // `top` is invalid from here on
        stack.push_back(openFrame(reader, install_path));
    }

    return copied;
}

}
