#ifndef DYLIBEMBED_DESCRIPTOR_READER_H
#define DYLIBEMBED_DESCRIPTOR_READER_H

#include <string>
#include <vector>

namespace dylibembed {

struct DependencyReference {
    std::string path;
    // path already starts with a loader-relative token
    bool relocatable;
};

// true for @executable_path/..., @loader_path/... and @rpath/...
bool isRelocatable(const std::string& path);

class DescriptorReader {
public:
    virtual ~DescriptorReader() {}

    // Ordered dylib references declared by `binary`, without its own
    // LC_ID_DYLIB record. Throws DescriptorReadError if the binary cannot
    // be inspected.
    virtual std::vector<DependencyReference>
    readReferences(const std::string& binary) = 0;
};

// references of `binary` that still use an absolute (build machine) path
std::vector<std::string> unrelocatedReferences(DescriptorReader& reader,
                                               const std::string& binary);

// Parses the output of `otool -l`. Throws DescriptorReadError on output
// that does not describe a Mach-O file.
std::vector<DependencyReference> parseLoadCommands(const std::string& output);

class OtoolDescriptorReader : public DescriptorReader {
public:
    std::vector<DependencyReference>
    readReferences(const std::string& binary) override;

    // install name from LC_ID_DYLIB, empty if the binary has none
    std::string readIdentity(const std::string& binary);
};

}

#endif
