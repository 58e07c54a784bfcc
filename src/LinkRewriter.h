#ifndef DYLIBEMBED_LINK_REWRITER_H
#define DYLIBEMBED_LINK_REWRITER_H

#include <string>

namespace dylibembed {

class OtoolDescriptorReader;

// Edits the link metadata of a binary in place. Every edit runs inside a
// WritableScope. Edits whose target is absent are no-ops, so re-running
// against a partially rewritten binary is safe.
class LinkRewriter {
public:
    virtual ~LinkRewriter() {}

    // changes the install name a shared library reports about itself
    void rewriteSelfIdentity(const std::string& binary,
                             const std::string& new_path);

    // changes the reference `old_path` inside `binary` to `new_path`
    void rewriteDependency(const std::string& binary,
                           const std::string& old_path,
                           const std::string& new_path);

protected:
    virtual void setIdentity(const std::string& binary,
                             const std::string& new_path)
        = 0;
    virtual void changeDependency(const std::string& binary,
                                  const std::string& old_path,
                                  const std::string& new_path)
        = 0;
};

// install_name_tool backed implementation
class InstallNameToolRewriter : public LinkRewriter {
public:
    explicit InstallNameToolRewriter(OtoolDescriptorReader& reader);

protected:
    void setIdentity(const std::string& binary,
                     const std::string& new_path) override;
    void changeDependency(const std::string& binary,
                          const std::string& old_path,
                          const std::string& new_path) override;

private:
    OtoolDescriptorReader& reader;
};

}

#endif
