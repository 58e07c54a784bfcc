#ifndef DYLIBEMBED_TESTS_FAKE_BINARY_H
#define DYLIBEMBED_TESTS_FAKE_BINARY_H

#include <string>
#include <sys/types.h>
#include <vector>

#include "CodeSigner.h"
#include "DescriptorReader.h"
#include "LinkRewriter.h"

// A fake binary is a text file:
//
//   FAKEMACHO
//   id /src/libA.dylib        (shared libraries only)
//   dep /src/libB.dylib
//   dep /usr/lib/libSystem.B.dylib
//
// Copying it with cp keeps its metadata, just like a real dylib.

namespace dylibembed {
namespace fakes {

// temporary directory removed with everything in it on destruction
class TempDir {
public:
    TempDir();
    ~TempDir();

    const std::string& path() const { return dir; }
    std::string sub(const std::string& relative) const;

private:
    std::string dir;
};

void writeBinary(const std::string& path, const std::string& id,
                 const std::vector<std::string>& deps);
std::string readFile(const std::string& path);
std::vector<std::string> readDeps(const std::string& path);
std::string readId(const std::string& path);
void mkdirs(const std::string& path);
mode_t fileMode(const std::string& path);

class FakeReader : public DescriptorReader {
public:
    FakeReader() : reads(0) {}

    std::vector<DependencyReference>
    readReferences(const std::string& binary) override;

    int reads;
    std::vector<std::string> inspected;
};

class FakeRewriter : public LinkRewriter {
public:
    FakeRewriter() : fail(false), mode_seen(0) {}

    struct Edit {
        std::string binary;
        std::string old_path; // empty for identity edits
        std::string new_path;
    };

    std::vector<Edit> identity_edits;
    std::vector<Edit> dependency_edits;

    // throw RewriteError from the primitive after touching nothing
    bool fail;
    // permission bits observed while the primitive ran
    mode_t mode_seen;

protected:
    void setIdentity(const std::string& binary,
                     const std::string& new_path) override;
    void changeDependency(const std::string& binary,
                          const std::string& old_path,
                          const std::string& new_path) override;

private:
    void replaceLine(const std::string& binary, const std::string& from,
                     const std::string& to);
};

class FakeSigner : public CodeSigner {
public:
    void sign(const std::string& file) override
    {
        signed_files.push_back(file);
        modes_seen.push_back(fileMode(file));
    }

    std::vector<std::string> signed_files;
    // permission bits of each file while it was being signed
    std::vector<mode_t> modes_seen;
};

}
}

#endif
