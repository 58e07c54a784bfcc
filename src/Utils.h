#ifndef DYLIBEMBED_UTILS_H
#define DYLIBEMBED_UTILS_H

#include <string>
#include <vector>

namespace dylibembed {

void tokenize(const std::string& str, const char* delimiters,
              std::vector<std::string>*);

std::string& rtrim(std::string& s);
bool startsWith(const std::string& str, const std::string& prefix);

// last path component ("/a/b/libfoo.dylib" -> "libfoo.dylib")
std::string stripPrefix(const std::string& in);
// everything before the last '/', without trailing slash
std::string dirName(const std::string& in);
std::string joinPath(const std::string& dir, const std::string& name);
// path of absolute directory `to` seen from absolute directory `from`
// ("/a/b", "/a/c/d" -> "../c/d"); empty when both are the same
std::string relativePath(const std::string& from, const std::string& to);
// makes sure the path ends with '/'
std::string normalizePrefix(std::string prefix);

bool fileExists(const std::string& filename);
bool isRegularFile(const std::string& filename);

// names of the regular, non-hidden files in `dir`, sorted
std::vector<std::string> listDirectory(const std::string& dir);

void makeDirectory(const std::string& dir);
void copyFile(const std::string& from, const std::string& to);

// executes a command in the native shell and returns output in string.
// returns an empty string if the command could not run or exited non-zero.
std::string system_get_output(const std::string& cmd);

// like 'system', runs a command on the system shell, but also prints the
// command to stdout.
int systemp(const std::string& cmd);

}

#endif
