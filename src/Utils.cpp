#include "Utils.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <dirent.h>
#include <iostream>
#include <sys/stat.h>
#include <unistd.h>

#include "Errors.h"

namespace dylibembed {

void tokenize(const std::string& str, const char* delim,
              std::vector<std::string>* vectorarg)
{
    std::vector<std::string>& tokens = *vectorarg;

    std::string delimiters(delim);

    // skip delimiters at beginning.
    std::string::size_type lastPos = str.find_first_not_of(delimiters, 0);

    // find first "non-delimiter".
    std::string::size_type pos = str.find_first_of(delimiters, lastPos);

    while (std::string::npos != pos || std::string::npos != lastPos) {
        tokens.push_back(str.substr(lastPos, pos - lastPos));

        // skip delimiters.  Note the "not_of"
        lastPos = str.find_first_not_of(delimiters, pos);
        pos = str.find_first_of(delimiters, lastPos);
    }
}

std::string& rtrim(std::string& s)
{
    s.erase(std::find_if(s.rbegin(), s.rend(),
                         [](unsigned char c) { return !std::isspace(c); })
                .base(),
            s.end());
    return s;
}

bool startsWith(const std::string& str, const std::string& prefix)
{
    return str.compare(0, prefix.size(), prefix) == 0;
}

std::string stripPrefix(const std::string& in)
{
    return in.substr(in.rfind("/") + 1);
}

std::string dirName(const std::string& in)
{
    const std::string::size_type slash = in.rfind("/");
    if (slash == std::string::npos)
        return ".";
    if (slash == 0)
        return "/";
    return in.substr(0, slash);
}

std::string joinPath(const std::string& dir, const std::string& name)
{
    if (dir.empty())
        return name;
    if (dir[dir.size() - 1] == '/')
        return dir + name;
    return dir + "/" + name;
}

std::string relativePath(const std::string& from, const std::string& to)
{
    std::vector<std::string> from_parts;
    std::vector<std::string> to_parts;
    tokenize(from, "/", &from_parts);
    tokenize(to, "/", &to_parts);

    size_t common = 0;
    while (common < from_parts.size() && common < to_parts.size()
           && from_parts[common] == to_parts[common])
        ++common;

    std::string relative;
    for (size_t i = common; i < from_parts.size(); ++i)
        relative = joinPath(relative, "..");
    for (size_t i = common; i < to_parts.size(); ++i)
        relative = joinPath(relative, to_parts[i]);
    return relative;
}

std::string normalizePrefix(std::string prefix)
{
    if (!prefix.empty() && prefix[prefix.size() - 1] != '/')
        prefix += "/";
    return prefix;
}

bool fileExists(const std::string& filename)
{
    return access(filename.c_str(), F_OK) != -1;
}

bool isRegularFile(const std::string& filename)
{
    struct stat st;
    if (stat(filename.c_str(), &st) != 0)
        return false;
    return S_ISREG(st.st_mode);
}

std::vector<std::string> listDirectory(const std::string& dir)
{
    std::vector<std::string> names;

    DIR* handle = opendir(dir.c_str());
    if (handle == NULL)
        return names;

    struct dirent* entry;
    while ((entry = readdir(handle)) != NULL) {
        const std::string name = entry->d_name;
        if (name.empty() || name[0] == '.')
            continue;
        if (isRegularFile(joinPath(dir, name)))
            names.push_back(name);
    }
    closedir(handle);

    std::sort(names.begin(), names.end());
    return names;
}

void makeDirectory(const std::string& dir)
{
    if (fileExists(dir))
        return;

    std::cout << "* Creating output directory " << dir << std::endl;
    std::string command = std::string("mkdir -p \"") + dir + "\"";
    if (systemp(command) != 0)
        throw RewriteError("An error occured while creating directory " + dir);
}

void copyFile(const std::string& from, const std::string& to)
{
    if (from == to)
        return;

    std::string command = std::string("cp \"") + from + "\" \"" + to + "\"";
    if (systemp(command) != 0)
        throw RewriteError("An error occured while trying to copy file " + from
                           + " to " + to);
}

std::string system_get_output(const std::string& cmd)
{
    char output[128];
    std::string full_output;

    FILE* command_output = popen(cmd.c_str(), "r");
    if (command_output == NULL) {
        std::cerr << "An error occured while executing command " << cmd
                  << std::endl;
        return "";
    }

    size_t amount_read;
    while ((amount_read = fread(output, 1, sizeof(output), command_output))
           > 0) {
        full_output.append(output, amount_read);
    }

    if (pclose(command_output) != 0)
        return "";

    return full_output;
}

int systemp(const std::string& cmd)
{
    std::cout << "    " << cmd << std::endl;
    return system(cmd.c_str());
}

}
