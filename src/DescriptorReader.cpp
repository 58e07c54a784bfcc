#include "DescriptorReader.h"

#include "Errors.h"
#include "Utils.h"

namespace dylibembed {

namespace {

// load commands whose payload names a dylib the loader must find
bool isDylibLoadCommand(const std::string& cmd)
{
    return cmd == "LC_LOAD_DYLIB" || cmd == "LC_LOAD_WEAK_DYLIB"
        || cmd == "LC_REEXPORT_DYLIB" || cmd == "LC_LAZY_LOAD_DYLIB"
        || cmd == "LC_LOAD_UPWARD_DYLIB";
}

bool looksLikeToolFailure(const std::string& output)
{
    return output.empty() || output.find("can't open file") != std::string::npos
        || output.find("No such file") != std::string::npos
        || output.find("is not an object file") != std::string::npos;
}

std::string checkedToolOutput(const std::string& binary,
                              const std::string& command)
{
    if (!fileExists(binary))
        throw DescriptorReadError("Cannot find file " + binary
                                  + " to read its dependencies");

    std::string output = system_get_output(command);
    if (looksLikeToolFailure(output))
        throw DescriptorReadError("Cannot read load commands of " + binary);
    return output;
}

}

bool isRelocatable(const std::string& path)
{
    return startsWith(path, "@executable_path")
        || startsWith(path, "@loader_path") || startsWith(path, "@rpath");
}

std::vector<std::string> unrelocatedReferences(DescriptorReader& reader,
                                               const std::string& binary)
{
    std::vector<std::string> paths;
    for (const auto& ref : reader.readReferences(binary)) {
        if (!ref.relocatable)
            paths.push_back(ref.path);
    }
    return paths;
}

std::vector<DependencyReference> parseLoadCommands(const std::string& output)
{
    if (looksLikeToolFailure(output))
        throw DescriptorReadError("Unrecognized otool output");

    std::vector<std::string> lines;
    tokenize(output, "\n", &lines);

    std::vector<DependencyReference> refs;
    bool searching = false;
    for (auto line : lines) {
        rtrim(line);
        const std::string::size_type start = line.find_first_not_of(" \t");
        if (start == std::string::npos)
            continue;
        line = line.substr(start);

        if (startsWith(line, "cmd ")) {
            if (searching)
                throw DescriptorReadError(
                    "Failed to find name before next cmd");
            searching = isDylibLoadCommand(line.substr(4));
        } else if (searching && startsWith(line, "name ")) {
            std::string path = line.substr(5);
            const std::string::size_type offset = path.rfind(" (offset");
            if (offset != std::string::npos)
                path = path.substr(0, offset);

            DependencyReference ref;
            ref.path = path;
            ref.relocatable = isRelocatable(path);
            refs.push_back(ref);
            searching = false;
        }
    }

    if (searching)
        throw DescriptorReadError("Truncated load command in otool output");

    return refs;
}

std::vector<DependencyReference>
OtoolDescriptorReader::readReferences(const std::string& binary)
{
    const std::string output = checkedToolOutput(
        binary, "otool -l \"" + binary + "\"");
    try {
        return parseLoadCommands(output);
    } catch (const DescriptorReadError& e) {
        throw DescriptorReadError(binary + ": " + e.what());
    }
}

std::string OtoolDescriptorReader::readIdentity(const std::string& binary)
{
    const std::string output = checkedToolOutput(
        binary, "otool -D \"" + binary + "\"");

    // first line echoes the file name, the install name follows
    std::vector<std::string> lines;
    tokenize(output, "\n", &lines);
    if (lines.size() < 2)
        return "";
    return rtrim(lines[1]);
}

}
