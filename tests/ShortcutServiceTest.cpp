#include "waypoint/shortcuts/ShortcutService.hpp"

#include "waypoint/common/Paths.hpp"

#include "WaypointTestHelpers.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace waypoint::shortcuts {
namespace {

using json = nlohmann::json;
using test_helpers::CapturingSink;
using test_helpers::ScopedTempDir;

class ShortcutServiceTest : public ::testing::Test {
protected:
    ShortcutServiceTest()
        : temp_("service"),
          file_(temp_.path() / "LocationShortcuts.json"),
          store_([this]() { return file_; }, [this]() { return defaults_; }, sink_.sink()),
          service_(store_) {}

    ScopedTempDir temp_;
    std::filesystem::path file_;
    ShortcutMap defaults_;
    CapturingSink sink_;
    ShortcutStore store_;
    ShortcutService service_;
};

class ScopedCurrentPath {
public:
    explicit ScopedCurrentPath(const std::filesystem::path& path) : previous_(std::filesystem::current_path()) {
        std::filesystem::current_path(path);
    }
    ~ScopedCurrentPath() {
        std::error_code ec;
        std::filesystem::current_path(previous_, ec);
    }

private:
    std::filesystem::path previous_;
};

TEST_F(ShortcutServiceTest, AddEditRemoveScenario) {
    const auto work = temp_.makeDir("w");
    const auto work2 = temp_.makeDir("w2");
    EXPECT_TRUE(service_.getShortcuts().empty());

    ASSERT_TRUE(service_.addShortcut("Work", work).has_value());
    ShortcutMap expected;
    expected.emplace("Work", work.string());
    EXPECT_EQ(service_.getShortcuts(), expected);

    ASSERT_TRUE(service_.editShortcut("Work", work2).has_value());
    expected["Work"] = work2.string();
    EXPECT_EQ(service_.getShortcuts(), expected);

    ASSERT_TRUE(service_.removeShortcut("work").has_value());
    EXPECT_TRUE(service_.getShortcuts().empty());
    EXPECT_EQ(json::parse(test_helpers::readFile(file_)), json::object());
}

TEST_F(ShortcutServiceTest, RelativePathsResolveAgainstCurrentDirectory) {
    const auto target = temp_.makeDir("nested/target");
    ScopedCurrentPath cwd(temp_.path() / "nested");

    ASSERT_TRUE(service_.addShortcut("Target", "target/").has_value());
    EXPECT_EQ(service_.getShortcuts().at("Target"), target.lexically_normal().string());

    ASSERT_TRUE(service_.editShortcut("target", "./target/../target").has_value());
    EXPECT_EQ(service_.getShortcuts().at("Target"), target.lexically_normal().string());
}

TEST_F(ShortcutServiceTest, MissingPathAbortsBeforeMutation) {
    const auto work = temp_.makeDir("w");
    ASSERT_TRUE(service_.addShortcut("Work", work).has_value());
    const auto before = test_helpers::readFile(file_);

    const auto added = service_.addShortcut("Other", temp_.path() / "does-not-exist");
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().code, ShortcutErrorCode::InvalidPath);

    const auto edited = service_.editShortcut("Work", temp_.path() / "does-not-exist");
    ASSERT_FALSE(edited.has_value());
    EXPECT_EQ(edited.error().code, ShortcutErrorCode::InvalidPath);

    EXPECT_EQ(test_helpers::readFile(file_), before);
}

TEST_F(ShortcutServiceTest, DuplicateAddLeavesStoreUnchanged) {
    const auto work = temp_.makeDir("w");
    const auto other = temp_.makeDir("other");
    ASSERT_TRUE(service_.addShortcut("Work", work).has_value());

    const auto duplicate = service_.addShortcut("WORK", other);
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(duplicate.error().code, ShortcutErrorCode::DuplicateName);
    EXPECT_EQ(severityOf(duplicate.error().code), DiagnosticSeverity::Warning);

    const auto shortcuts = service_.getShortcuts();
    ASSERT_EQ(shortcuts.size(), 1u);
    EXPECT_EQ(shortcuts.begin()->first, "Work");
    EXPECT_EQ(shortcuts.begin()->second, work.string());
}

TEST_F(ShortcutServiceTest, InvalidNameIsRejected) {
    const auto work = temp_.makeDir("w");
    const auto added = service_.addShortcut("my work", work);
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().code, ShortcutErrorCode::InvalidName);
    EXPECT_TRUE(service_.getShortcuts().empty());
}

TEST_F(ShortcutServiceTest, InvalidNameMessageMatchesMapOperation) {
    ShortcutMap shortcuts;
    const auto fromMap = addShortcut(shortcuts, "my work", "/w");
    const auto fromService = service_.addShortcut("my work", temp_.path());
    ASSERT_FALSE(fromMap.has_value());
    ASSERT_FALSE(fromService.has_value());
    EXPECT_EQ(fromService.error().message, fromMap.error().message);
    EXPECT_EQ(fromService.error().message, invalidNameError("my work").message);
}

TEST_F(ShortcutServiceTest, MalformedFileIsNeverOverwritten) {
    const auto work = temp_.makeDir("w");
    const std::string contents = R"({"Work": "/a", "Count": 3})";
    test_helpers::writeFile(file_, contents);

    const auto added = service_.addShortcut("Tmp", work);
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().code, ShortcutErrorCode::ConfigMalformed);

    const auto edited = service_.editShortcut("Work", work);
    ASSERT_FALSE(edited.has_value());
    EXPECT_EQ(edited.error().code, ShortcutErrorCode::ConfigMalformed);

    const auto removed = service_.removeShortcut("Work");
    ASSERT_FALSE(removed.has_value());
    EXPECT_EQ(removed.error().code, ShortcutErrorCode::ConfigMalformed);

    EXPECT_EQ(test_helpers::readFile(file_), contents);
}

TEST_F(ShortcutServiceTest, UnreadableFileIsNeverOverwritten) {
    const auto work = temp_.makeDir("w");
    std::filesystem::create_directories(file_);

    const auto added = service_.addShortcut("Work", work);
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(severityOf(added.error().code), DiagnosticSeverity::Error);
    EXPECT_TRUE(std::filesystem::is_directory(file_));
}

TEST_F(ShortcutServiceTest, UnknownNamesAreReported) {
    EXPECT_EQ(service_.removeShortcut("Nope").error().code, ShortcutErrorCode::UnknownName);
    EXPECT_EQ(service_.editShortcut("Nope", temp_.path()).error().code, ShortcutErrorCode::UnknownName);
    EXPECT_EQ(service_.navigateTo("Nope").error().code, ShortcutErrorCode::UnknownName);
}

TEST_F(ShortcutServiceTest, NavigateIgnoresCase) {
    const auto work = temp_.makeDir("w");
    ASSERT_TRUE(service_.addShortcut("Work", work).has_value());

    const auto target = service_.navigateTo("WORK");
    ASSERT_TRUE(target.has_value()) << target.error().message;
    EXPECT_EQ(*target, work);
}

TEST_F(ShortcutServiceTest, NavigateToVanishedTargetFails) {
    const auto deleted = temp_.path() / "deleted-dir";
    ShortcutMap shortcuts;
    shortcuts.emplace("Old", deleted.string());
    ASSERT_TRUE(store_.save(shortcuts).has_value());
    const auto before = test_helpers::readFile(file_);

    const auto target = service_.navigateTo("Old");
    ASSERT_FALSE(target.has_value());
    EXPECT_EQ(target.error().code, ShortcutErrorCode::TargetMissing);
    EXPECT_EQ(test_helpers::readFile(file_), before);
    EXPECT_EQ(service_.getShortcuts(), shortcuts);
}

TEST_F(ShortcutServiceTest, CreateDefaultsOverwritesAndOptionallyReturnsMap) {
    const auto work = temp_.makeDir("w");
    ASSERT_TRUE(service_.addShortcut("Work", work).has_value());
    defaults_.emplace("Home", temp_.path().string());

    const auto quiet = service_.createDefaults(false);
    ASSERT_TRUE(quiet.has_value());
    EXPECT_TRUE(quiet->empty());
    EXPECT_EQ(service_.getShortcuts(), defaults_);

    const auto passthrough = service_.createDefaults(true);
    ASSERT_TRUE(passthrough.has_value());
    EXPECT_EQ(*passthrough, defaults_);
}

TEST_F(ShortcutServiceTest, SaveFailureSurfacesWriteError) {
    ShortcutStore store([this]() { return temp_.path() / "missing-dir" / "shortcuts.json"; },
                        []() { return ShortcutMap{}; }, sink_.sink());
    ShortcutService service(store);

    const auto added = service.addShortcut("Work", temp_.path());
    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().code, ShortcutErrorCode::ConfigWriteError);
}

#ifndef _WIN32
TEST(ResolveTargetPathTest, PathThatIsNotUtf8IsInvalid) {
    ScopedTempDir temp("resolve-utf8");
    const auto target = temp.path() / std::string("caf\xE9");
    std::error_code ec;
    std::filesystem::create_directories(target, ec);
    ASSERT_FALSE(ec) << ec.message();

    const auto resolved = resolveTargetPath(target);
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().code, ShortcutErrorCode::InvalidPath);
}
#endif

TEST(ResolveTargetPathTest, NonAsciiPathIsAccepted) {
    ScopedTempDir temp("resolve-non-ascii");
    const auto target = temp.path() / common::pathFromUtf8("caf\xC3\xA9");
    std::error_code ec;
    std::filesystem::create_directories(target, ec);
    ASSERT_FALSE(ec) << ec.message();

    const auto resolved = resolveTargetPath(target);
    ASSERT_TRUE(resolved.has_value()) << resolved.error().message;
    EXPECT_EQ(*resolved, target);
}

TEST(ResolveTargetPathTest, EmptyPathIsInvalid) {
    const auto resolved = resolveTargetPath({});
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().code, ShortcutErrorCode::InvalidPath);
}

}  // namespace
}  // namespace waypoint::shortcuts
