#include <gtest/gtest.h>
#include "psa/utils/path_utils.h"
#include <fstream>

using namespace psa::utils;

class PathUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / (std::string("psa_path_utils_test_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(temp_dir / "pkg");
        std::ofstream(temp_dir / "pkg" / "mod.py") << "x = 1\n";
    }

    void TearDown() override {
        fs::remove_all(temp_dir);
    }

    fs::path temp_dir;
};

TEST_F(PathUtilsTest, NormalizePath) {
    EXPECT_EQ(normalize_path("a/./b/../c.py"), "a/c.py");
}

TEST_F(PathUtilsTest, CanonicalPathResolvesDots) {
    const auto dotted = (temp_dir / "pkg" / ".." / "pkg" / "mod.py").string();
    const auto expected = fs::canonical(temp_dir / "pkg" / "mod.py").string();

    EXPECT_EQ(canonical_path(dotted), expected);
}

TEST_F(PathUtilsTest, RelativePath) {
    EXPECT_EQ(get_relative_path("/project/pkg/mod.py", "/project"), "pkg/mod.py");
    EXPECT_EQ(get_relative_path("/project/a.py", "/project/pkg"), "../a.py");
}

TEST_F(PathUtilsTest, PosixSeparators) {
    EXPECT_EQ(to_posix_separators("pkg\\sub\\mod.py"), "pkg/sub/mod.py");
}

TEST_F(PathUtilsTest, DirectoryCheck) {
    EXPECT_TRUE(is_directory((temp_dir / "pkg").string()));
    EXPECT_FALSE(is_directory((temp_dir / "pkg" / "mod.py").string()));
    EXPECT_FALSE(is_directory((temp_dir / "nope").string()));
}
