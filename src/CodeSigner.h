#ifndef DYLIBEMBED_CODE_SIGNER_H
#define DYLIBEMBED_CODE_SIGNER_H

#include <string>

namespace dylibembed {

class CodeSigner {
public:
    virtual ~CodeSigner() {}
    virtual void sign(const std::string& file) = 0;
};

// Ad-hoc signature, required for arm64 (Apple Silicon) binaries once
// install_name_tool has invalidated the original one.
class AdhocCodeSigner : public CodeSigner {
public:
    AdhocCodeSigner();

    void sign(const std::string& file) override;

private:
    // failures are fatal only where unsigned code refuses to load
    bool signature_required;
};

}

#endif
