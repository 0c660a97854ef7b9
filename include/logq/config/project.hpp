#ifndef LOGQ_PROJECT_HPP
#define LOGQ_PROJECT_HPP

#include <cctype>
#include <cstring>
#include <ctime>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <dirent.h>
#include <sys/stat.h>

namespace logq {
namespace project {

    /// Directory, relative to the project root, where the wrapper writes
    /// captured logcat streams.
    inline const char* logDirectoryName() { return ".logq/logs"; }

    inline std::string joinPath(const std::string& a, const std::string& b) {
        if (a.empty()) return b;
        if (a[a.size() - 1] == '/') return a + b;
        return a + "/" + b;
    }

    inline bool isRegularFile(const std::string& path) {
        struct stat st;
        return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
    }

    /// Most recently modified regular file in `dir`; ties go to the
    /// lexicographically greater name (timestamped names sort in order).
    /// @throws std::runtime_error if the directory is missing or holds no files.
    inline std::string newestFileIn(const std::string& dir) {
        DIR* d = ::opendir(dir.c_str());
        if (!d) {
            throw std::runtime_error("Log directory not found: " + dir);
        }
        std::string best;
        std::time_t bestTime = 0;
        struct dirent* ent;
        while ((ent = ::readdir(d)) != nullptr) {
            std::string name = ent->d_name;
            if (name == "." || name == "..") continue;
            std::string full = joinPath(dir, name);
            struct stat st;
            if (::stat(full.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) continue;
            if (best.empty() || st.st_mtime > bestTime ||
                (st.st_mtime == bestTime && full > best)) {
                best = full;
                bestTime = st.st_mtime;
            }
        }
        ::closedir(d);
        if (best.empty()) {
            throw std::runtime_error("No log files in " + dir);
        }
        return best;
    }

    inline std::string defaultLogFile(const std::string& projectRoot) {
        return newestFileIn(joinPath(projectRoot.empty() ? "." : projectRoot, logDirectoryName()));
    }

    /// Extract the first quoted string following `applicationId` in Gradle
    /// text, covering both `applicationId "x"` and `applicationId = "x"`.
    inline std::string parseApplicationId(const std::string& gradle) {
        static const std::string key = "applicationId";
        size_t pos = 0;
        while ((pos = gradle.find(key, pos)) != std::string::npos) {
            size_t i = pos + key.size();
            // Skip e.g. applicationIdSuffix.
            if (i < gradle.size() && (std::isalnum(static_cast<unsigned char>(gradle[i])) || gradle[i] == '_')) {
                pos = i;
                continue;
            }
            while (i < gradle.size() && (gradle[i] == ' ' || gradle[i] == '\t' || gradle[i] == '=' || gradle[i] == '(')) ++i;
            if (i < gradle.size() && (gradle[i] == '"' || gradle[i] == '\'')) {
                char quote = gradle[i];
                size_t end = gradle.find(quote, i + 1);
                if (end != std::string::npos && end > i + 1) {
                    return gradle.substr(i + 1, end - i - 1);
                }
            }
            pos = i;
        }
        return std::string();
    }

    /// Best effort: empty when no build file declares an application id.
    inline std::string readApplicationId(const std::string& projectRoot) {
        std::string root = projectRoot.empty() ? "." : projectRoot;
        const char* candidates[] = {
            "app/build.gradle.kts", "app/build.gradle", "build.gradle.kts", "build.gradle"
        };
        for (size_t i = 0; i < sizeof(candidates) / sizeof(candidates[0]); ++i) {
            std::string path = joinPath(root, candidates[i]);
            if (!isRegularFile(path)) continue;
            std::ifstream in(path.c_str());
            if (!in.is_open()) continue;
            std::stringstream ss;
            ss << in.rdbuf();
            std::string id = parseApplicationId(ss.str());
            if (!id.empty()) return id;
        }
        return std::string();
    }

} // namespace project
} // namespace logq

#endif // LOGQ_PROJECT_HPP
