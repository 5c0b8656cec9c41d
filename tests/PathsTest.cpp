#include "waypoint/common/Paths.hpp"

#include "WaypointTestHelpers.hpp"

#include <gtest/gtest.h>

namespace waypoint::common {
namespace {

using test_helpers::ScopedEnvVar;

TEST(PathsTest, ExpandsDollarReferences) {
    ScopedEnvVar var("WAYPOINT_TEST_VAR", std::string("/srv/data"));
    EXPECT_EQ(expandEnvironmentReferences("$WAYPOINT_TEST_VAR/Documents"), "/srv/data/Documents");
    EXPECT_EQ(expandEnvironmentReferences("${WAYPOINT_TEST_VAR}Docs"), "/srv/dataDocs");
}

TEST(PathsTest, ExpandsPercentReferences) {
    ScopedEnvVar var("WAYPOINT_TEST_VAR", std::string("C:\\Users\\alice"));
    EXPECT_EQ(expandEnvironmentReferences("%WAYPOINT_TEST_VAR%\\Documents"), "C:\\Users\\alice\\Documents");
}

TEST(PathsTest, LeavesUnknownReferencesVerbatim) {
    ScopedEnvVar var("WAYPOINT_TEST_UNSET", std::nullopt);
    EXPECT_EQ(expandEnvironmentReferences("$WAYPOINT_TEST_UNSET/x"), "$WAYPOINT_TEST_UNSET/x");
    EXPECT_EQ(expandEnvironmentReferences("%WAYPOINT_TEST_UNSET%\\x"), "%WAYPOINT_TEST_UNSET%\\x");
    EXPECT_EQ(expandEnvironmentReferences("100% sure $"), "100% sure $");
}

#ifndef _WIN32
TEST(PathsTest, HomeDirectoryComesFromEnvironment) {
    ScopedEnvVar home("HOME", std::string("/home/alice"));
    const auto resolved = homeDirectory();
    ASSERT_TRUE(resolved.has_value()) << resolved.error();
    EXPECT_EQ(*resolved, std::filesystem::path("/home/alice"));
}

TEST(PathsTest, MissingHomeDirectoryIsAnError) {
    ScopedEnvVar home("HOME", std::nullopt);
    EXPECT_FALSE(homeDirectory().has_value());
}

TEST(PathsTest, RelativeHomeDirectoryIsAnError) {
    ScopedEnvVar home("HOME", std::string("relative/home"));
    EXPECT_FALSE(homeDirectory().has_value());
}
#endif

TEST(PathsTest, PathExistsHandlesEmptyAndMissingPaths) {
    EXPECT_FALSE(pathExists({}));
    EXPECT_FALSE(pathExists(std::filesystem::temp_directory_path() / "waypoint-definitely-missing-entry"));
    EXPECT_TRUE(pathExists(std::filesystem::temp_directory_path()));
}

TEST(PathsTest, Utf8Validation) {
    EXPECT_TRUE(isValidUtf8(""));
    EXPECT_TRUE(isValidUtf8("/home/alice/Projects"));
    EXPECT_TRUE(isValidUtf8("/home/j\xC3\xBCrgen/\xE2\x82\xAC/\xF0\x9F\x93\x81"));
    EXPECT_FALSE(isValidUtf8("/srv/caf\xE9"));
    EXPECT_FALSE(isValidUtf8("\xC3"));
    EXPECT_FALSE(isValidUtf8("\xC0\xAF"));
    EXPECT_FALSE(isValidUtf8("\xED\xA0\x80"));
    EXPECT_FALSE(isValidUtf8("\xF4\x90\x80\x80"));
}

TEST(PathsTest, Utf8PathSpellingIsPreserved) {
    const std::string text = "/home/j\xC3\xBCrgen/Dokumente";
    EXPECT_EQ(pathToUtf8(pathFromUtf8(text)), text);
}

TEST(PathsTest, ConfigOverrideIsEmptyWhenUnset) {
    ScopedEnvVar config("WAYPOINT_CONFIG", std::nullopt);
    EXPECT_TRUE(configPathOverride().empty());
}

}  // namespace
}  // namespace waypoint::common
