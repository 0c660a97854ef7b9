#include "test_utils.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <chrono>

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

std::string TestUtils::makeTempDir() {
    char pattern[] = "/tmp/logq_test_XXXXXX";
    char *dir = ::mkdtemp(pattern);
    if (!dir) {
        throw std::runtime_error("mkdtemp failed");
    }
    tempDirs().push_back(dir);
    return dir;
}

void TestUtils::removeTree(const std::string &path) {
    DIR *d = ::opendir(path.c_str());
    if (d) {
        struct dirent *ent;
        while ((ent = ::readdir(d)) != nullptr) {
            std::string name = ent->d_name;
            if (name == "." || name == "..") continue;
            std::string full = path + "/" + name;
            struct stat st;
            if (::lstat(full.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
                removeTree(full);
            } else {
                removeFile(full);
            }
        }
        ::closedir(d);
        ::rmdir(path.c_str());
    }
}

std::string TestUtils::readLogFile(const std::string &filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filename);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void TestUtils::writeFile(const std::string &filename, const std::string &content) {
    std::ofstream file(filename, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create file: " + filename);
    }
    file << content;
}

void TestUtils::appendFile(const std::string &filename, const std::string &content) {
    std::ofstream file(filename, std::ios::out | std::ios::app | std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filename);
    }
    file << content;
}

void TestUtils::truncateFile(const std::string &filename) {
    if (::truncate(filename.c_str(), 0) != 0) {
        throw std::runtime_error("Failed to truncate file: " + filename);
    }
}

void TestUtils::waitForFileContent(const std::string &filename, int maxAttempts) {
    for (int i = 0; i < maxAttempts; ++i) {
        if (fileExists(filename) && getFileSize(filename) > 0) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    throw std::runtime_error("Timeout waiting for file content: " + filename);
}

bool TestUtils::waitFor(const std::function<bool()> &predicate, int timeoutMs) {
    for (int waited = 0; waited < timeoutMs; waited += 10) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

void TestUtils::cleanupLogFiles() {
    std::vector<std::string> &dirs = tempDirs();
    for (size_t i = 0; i < dirs.size(); ++i) {
        removeTree(dirs[i]);
    }
    dirs.clear();
}

std::string TestUtils::threadtimeLine(int pid, char level, const std::string &tag,
                                      const std::string &message, int tid) {
    char prefix[64];
    std::snprintf(prefix, sizeof(prefix), "01-02 03:04:05.678 %5d %5d %c ",
                  pid, tid == 0 ? pid : tid, level);
    return std::string(prefix) + tag + ": " + message;
}

bool TestUtils::fileExists(const std::string &filename) {
    struct stat buffer;
    return (stat(filename.c_str(), &buffer) == 0);
}

std::uintmax_t TestUtils::getFileSize(const std::string &filename) {
    struct stat buffer;
    if (stat(filename.c_str(), &buffer) != 0) {
        return 0;
    }
    return buffer.st_size;
}

void TestUtils::removeFile(const std::string &filename) {
    std::remove(filename.c_str());
}

std::vector<std::string> &TestUtils::tempDirs() {
    static std::vector<std::string> dirs;
    return dirs;
}
