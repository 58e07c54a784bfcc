#include "LinkRewriter.h"

#include "DescriptorReader.h"
#include "Errors.h"
#include "Utils.h"
#include "WritableScope.h"

namespace dylibembed {

void LinkRewriter::rewriteSelfIdentity(const std::string& binary,
                                       const std::string& new_path)
{
    withWritable(binary, [&]() { setIdentity(binary, new_path); });
}

void LinkRewriter::rewriteDependency(const std::string& binary,
                                     const std::string& old_path,
                                     const std::string& new_path)
{
    if (old_path == new_path)
        return;
    withWritable(binary,
                 [&]() { changeDependency(binary, old_path, new_path); });
}

InstallNameToolRewriter::InstallNameToolRewriter(OtoolDescriptorReader& reader)
    : reader(reader)
{
}

void InstallNameToolRewriter::setIdentity(const std::string& binary,
                                          const std::string& new_path)
{
    // executables and bundles carry no LC_ID_DYLIB; -id would fail on them
    const std::string current = reader.readIdentity(binary);
    if (current.empty() || current == new_path)
        return;

    std::string command = std::string("install_name_tool -id \"") + new_path
        + "\" \"" + binary + "\"";
    if (systemp(command) != 0)
        throw RewriteError(
            "An error occured while trying to change identity of library "
            + binary);
}

void InstallNameToolRewriter::changeDependency(const std::string& binary,
                                               const std::string& old_path,
                                               const std::string& new_path)
{
    // install_name_tool leaves the file untouched when old_path is absent
    std::string command = std::string("install_name_tool -change \"")
        + old_path + "\" \"" + new_path + "\" \"" + binary + "\"";
    if (systemp(command) != 0)
        throw RewriteError(
            "An error occured while trying to fix dependencies of " + binary);
}

}
