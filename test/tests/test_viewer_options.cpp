#include <gtest/gtest.h>
#include "logq.hpp"
#include "utils/test_utils.hpp"
#include <stdexcept>
#include <string>

#include <sys/stat.h>
#include <utime.h>

using logq::FilterState;
using logq::ViewerConfiguration;
using logq::ViewerOptions;
namespace project = logq::project;

class ViewerOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        TestUtils::cleanupLogFiles();
        root = TestUtils::makeTempDir();
    }

    void TearDown() override {
        TestUtils::cleanupLogFiles();
    }

    void makeDir(const std::string& relative) {
        std::string path = root;
        size_t start = 0;
        while (start < relative.size()) {
            size_t slash = relative.find('/', start);
            if (slash == std::string::npos) slash = relative.size();
            path += "/" + relative.substr(start, slash - start);
            ::mkdir(path.c_str(), 0755);
            start = slash + 1;
        }
    }

    void touch(const std::string& path, time_t mtime) {
        TestUtils::writeFile(path, "x\n");
        struct utimbuf times;
        times.actime = mtime;
        times.modtime = mtime;
        ::utime(path.c_str(), &times);
    }

    std::string root;
};

TEST_F(ViewerOptionsTest, NewestLogFileIsDefault) {
    makeDir(".logq/logs");
    touch(root + "/.logq/logs/older.txt", 1000);
    touch(root + "/.logq/logs/newer.txt", 2000);

    ViewerOptions o = ViewerConfiguration().project(root).packageFilter(false).build();
    EXPECT_EQ(o.logPath, root + "/.logq/logs/newer.txt");
}

TEST_F(ViewerOptionsTest, MissingLogDirectoryFails) {
    EXPECT_THROW(ViewerConfiguration().project(root).build(), std::runtime_error);
    makeDir(".logq/logs");
    EXPECT_THROW(ViewerConfiguration().project(root).build(), std::runtime_error);
}

TEST_F(ViewerOptionsTest, ExplicitFileSkipsLookup) {
    ViewerOptions o = ViewerConfiguration().project(root).logFile("/some/file.log").build();
    EXPECT_EQ(o.logPath, "/some/file.log");
}

TEST_F(ViewerOptionsTest, ApplicationIdFromGradle) {
    makeDir("app");
    TestUtils::writeFile(root + "/app/build.gradle.kts",
                         "android {\n"
                         "    defaultConfig {\n"
                         "        applicationIdSuffix = \".debug\"\n"
                         "        applicationId = \"com.example.kts\"\n"
                         "    }\n"
                         "}\n");
    EXPECT_EQ(project::readApplicationId(root), "com.example.kts");

    ViewerOptions o = ViewerConfiguration().project(root).logFile("x.log").build();
    EXPECT_EQ(o.appId, "com.example.kts");
    EXPECT_TRUE(o.initialFilter().packageActive());
}

TEST_F(ViewerOptionsTest, GroovyGradleSyntax) {
    EXPECT_EQ(project::parseApplicationId("defaultConfig {\n  applicationId 'com.example.groovy'\n}"),
              "com.example.groovy");
    EXPECT_EQ(project::parseApplicationId("no id here"), "");
}

TEST_F(ViewerOptionsTest, NoPackageSkipsGradle) {
    makeDir("app");
    TestUtils::writeFile(root + "/app/build.gradle", "applicationId \"com.example.app\"\n");
    ViewerOptions o = ViewerConfiguration().project(root).logFile("x.log").packageFilter(false).build();
    EXPECT_TRUE(o.appId.empty());
    EXPECT_FALSE(o.initialFilter().packageEnabled());
}

TEST_F(ViewerOptionsTest, ExplicitPackageWins) {
    makeDir("app");
    TestUtils::writeFile(root + "/app/build.gradle", "applicationId \"com.example.app\"\n");
    ViewerOptions o = ViewerConfiguration().project(root).logFile("x.log").appId("org.other").build();
    EXPECT_EQ(o.appId, "org.other");
}

TEST_F(ViewerOptionsTest, InitialFilterFromOptions) {
    ViewerOptions o = ViewerConfiguration()
        .logFile("x.log")
        .packageFilter(false)
        .tag("MyTag")
        .level("E+")
        .text("boom")
        .build();
    FilterState f = o.initialFilter();
    EXPECT_EQ(f.describe(), "level=E+ tag=MyTag text=boom");
}

TEST_F(ViewerOptionsTest, InvalidValuesRejected) {
    EXPECT_THROW(ViewerConfiguration().logFile("x.log").level("nope").build(), std::invalid_argument);
    EXPECT_THROW(ViewerConfiguration().logFile("x.log").pollInterval(0).build(), std::invalid_argument);
    EXPECT_THROW(ViewerConfiguration().logFile("x.log").capacity(0).build(), std::invalid_argument);
}
