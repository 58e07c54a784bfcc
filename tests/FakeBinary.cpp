#include "FakeBinary.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

#include "Errors.h"
#include "Utils.h"

namespace dylibembed {
namespace fakes {

namespace {

const char* const MAGIC = "FAKEMACHO";

std::vector<std::string> lines(const std::string& path)
{
    std::vector<std::string> out;
    std::ifstream in(path.c_str());
    std::string line;
    while (std::getline(in, line))
        out.push_back(line);
    return out;
}

void writeLines(const std::string& path, const std::vector<std::string>& out)
{
    std::ofstream file(path.c_str(), std::ios::trunc);
    for (const auto& line : out)
        file << line << "\n";
    if (!file)
        throw RewriteError("cannot write " + path);
}

}

TempDir::TempDir()
{
    char templ[] = "/tmp/dylibembed_test.XXXXXX";
    if (mkdtemp(templ) == NULL)
        throw std::runtime_error("mkdtemp failed");
    dir = templ;
}

TempDir::~TempDir()
{
    const std::string command = "rm -rf \"" + dir + "\"";
    if (system(command.c_str()) != 0)
        std::cerr << "cannot remove " << dir << std::endl;
}

std::string TempDir::sub(const std::string& relative) const
{
    return joinPath(dir, relative);
}

void writeBinary(const std::string& path, const std::string& id,
                 const std::vector<std::string>& deps)
{
    mkdirs(dirName(path));
    std::vector<std::string> out;
    out.push_back(MAGIC);
    if (!id.empty())
        out.push_back("id " + id);
    for (const auto& dep : deps)
        out.push_back("dep " + dep);
    writeLines(path, out);
}

std::string readFile(const std::string& path)
{
    std::ifstream in(path.c_str());
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::vector<std::string> readDeps(const std::string& path)
{
    std::vector<std::string> deps;
    for (const auto& line : lines(path)) {
        if (startsWith(line, "dep "))
            deps.push_back(line.substr(4));
    }
    return deps;
}

std::string readId(const std::string& path)
{
    for (const auto& line : lines(path)) {
        if (startsWith(line, "id "))
            return line.substr(3);
    }
    return "";
}

void mkdirs(const std::string& path)
{
    const std::string command = "mkdir -p \"" + path + "\"";
    if (system(command.c_str()) != 0)
        throw std::runtime_error("cannot create " + path);
}

mode_t fileMode(const std::string& path)
{
    struct stat st;
    if (stat(path.c_str(), &st) != 0)
        throw std::runtime_error("cannot stat " + path);
    return st.st_mode & 07777;
}

std::vector<DependencyReference>
FakeReader::readReferences(const std::string& binary)
{
    ++reads;
    inspected.push_back(binary);

    if (!fileExists(binary))
        throw DescriptorReadError("Cannot find file " + binary);
    const std::vector<std::string> content = lines(binary);
    if (content.empty() || content[0] != MAGIC)
        throw DescriptorReadError(binary + " is not an object file");

    std::vector<DependencyReference> refs;
    for (const auto& dep : readDeps(binary)) {
        DependencyReference ref;
        ref.path = dep;
        ref.relocatable = isRelocatable(dep);
        refs.push_back(ref);
    }
    return refs;
}

void FakeRewriter::setIdentity(const std::string& binary,
                               const std::string& new_path)
{
    mode_seen = fileMode(binary);
    Edit edit = { binary, "", new_path };
    identity_edits.push_back(edit);
    if (fail)
        throw RewriteError("induced failure on " + binary);

    const std::string current = readId(binary);
    if (current.empty())
        return;
    replaceLine(binary, "id " + current, "id " + new_path);
}

void FakeRewriter::changeDependency(const std::string& binary,
                                    const std::string& old_path,
                                    const std::string& new_path)
{
    mode_seen = fileMode(binary);
    Edit edit = { binary, old_path, new_path };
    dependency_edits.push_back(edit);
    if (fail)
        throw RewriteError("induced failure on " + binary);

    replaceLine(binary, "dep " + old_path, "dep " + new_path);
}

void FakeRewriter::replaceLine(const std::string& binary,
                               const std::string& from, const std::string& to)
{
    std::vector<std::string> content = lines(binary);
    bool changed = false;
    for (auto& line : content) {
        if (line == from) {
            line = to;
            changed = true;
        }
    }
    if (changed)
        writeLines(binary, content);
}

}
}
