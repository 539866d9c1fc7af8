#include <gtest/gtest.h>
#include "psa/analysis/import_resolver.h"
#include <filesystem>
#include <fstream>

using namespace psa::analysis;
using namespace psa::core;
namespace fs = std::filesystem;

class ImportResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_dir = fs::temp_directory_path() / (std::string("psa_import_resolver_test_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(base_dir);
        fs::create_directories(base_dir / "project");
        base_dir = fs::canonical(base_dir);
        root = base_dir / "project";

        touch("outside.py", base_dir);
        touch("a.py");
        touch("pkg/__init__.py");
        touch("pkg/mod.py");
        touch("pkg/sub/__init__.py");
        touch("pkg/sub/deep.py");
        touch("dup.py");
        touch("dup/__init__.py");
        touch("namespace_only/thing.py");
    }

    void TearDown() override {
        fs::remove_all(base_dir);
    }

    void touch(const std::string& relative, const fs::path& under = {}) const {
        const fs::path path = (under.empty() ? root : under) / relative;
        fs::create_directories(path.parent_path());
        std::ofstream(path) << "\n";
    }

    [[nodiscard]] std::string file(const std::string& relative) const {
        return (root / relative).string();
    }

    static ImportDeclaration from_import(std::string module, const int level,
                                         std::vector<ImportDeclaration::Alias> names) {
        ImportDeclaration declaration;
        declaration.module = std::move(module);
        declaration.level = level;
        declaration.names = std::move(names);
        declaration.is_from_import = true;
        declaration.is_wildcard = declaration.names.size() == 1 && declaration.names[0].name == "*";
        return declaration;
    }

    static ImportDeclaration plain_import(std::vector<ImportDeclaration::Alias> names) {
        ImportDeclaration declaration;
        declaration.names = std::move(names);
        return declaration;
    }

    fs::path base_dir;
    fs::path root;
};

TEST_F(ImportResolverTest, AbsoluteModuleAndPackage) {
    const ImportResolver resolver(root.string());

    EXPECT_EQ(resolver.resolve("pkg.mod", 0, file("a.py")), file("pkg/mod.py"));
    EXPECT_EQ(resolver.resolve("pkg", 0, file("a.py")), file("pkg/__init__.py"));
    EXPECT_EQ(resolver.resolve("pkg.sub", 0, file("a.py")), file("pkg/sub/__init__.py"));
    EXPECT_EQ(resolver.project_root(), root.string());
}

TEST_F(ImportResolverTest, ModuleFilePreferredOverPackage) {
    const ImportResolver resolver(root.string());
    EXPECT_EQ(resolver.resolve("dup", 0, file("a.py")), file("dup.py"));
}

TEST_F(ImportResolverTest, UnresolvableModules) {
    const ImportResolver resolver(root.string());

    EXPECT_FALSE(resolver.resolve("os", 0, file("a.py")).has_value());
    EXPECT_FALSE(resolver.resolve("pkg.missing", 0, file("a.py")).has_value());
    EXPECT_FALSE(resolver.resolve("pkg.1bad", 0, file("a.py")).has_value());
    EXPECT_FALSE(resolver.resolve("namespace_only", 0, file("a.py")).has_value());
    EXPECT_FALSE(resolver.resolve("", 0, file("a.py")).has_value());
}

TEST_F(ImportResolverTest, RelativeLevels) {
    const ImportResolver resolver(root.string());
    const auto importer = file("pkg/sub/deep.py");

    EXPECT_EQ(resolver.resolve("", 1, importer), file("pkg/sub/__init__.py"));
    EXPECT_EQ(resolver.resolve("mod", 2, importer), file("pkg/mod.py"));
    EXPECT_EQ(resolver.resolve("", 2, importer), file("pkg/__init__.py"));
    EXPECT_FALSE(resolver.resolve("mod", 1, importer).has_value());
}

TEST_F(ImportResolverTest, RelativeImportCannotLeaveRoot) {
    const ImportResolver resolver(root.string());

    EXPECT_FALSE(resolver.resolve("outside", 2, file("a.py")).has_value());
    EXPECT_FALSE(resolver.resolve("outside", 3, file("pkg/mod.py")).has_value());
}

TEST_F(ImportResolverTest, FromImportPrefersSubmodule) {
    const ImportResolver resolver(root.string());

    const auto submodule = resolver.resolve_import(from_import("pkg", 0, {{"mod", ""}}), file("a.py"));
    EXPECT_EQ(submodule, std::vector<std::string>{file("pkg/mod.py")});

    const auto attribute = resolver.resolve_import(from_import("pkg", 0, {{"something", ""}}), file("a.py"));
    EXPECT_EQ(attribute, std::vector<std::string>{file("pkg/__init__.py")});
}

TEST_F(ImportResolverTest, FromImportDeduplicatesTargets) {
    const ImportResolver resolver(root.string());

    const auto targets = resolver.resolve_import(
        from_import("pkg", 0, {{"x", ""}, {"y", ""}, {"mod", ""}}), file("a.py"));

    EXPECT_EQ(targets, (std::vector<std::string>{file("pkg/__init__.py"), file("pkg/mod.py")}));
}

TEST_F(ImportResolverTest, PlainImportUsesLongestResolvablePrefix) {
    const ImportResolver resolver(root.string());

    EXPECT_EQ(resolver.resolve_import(plain_import({{"pkg.sub.deep", ""}}), file("a.py")),
              std::vector<std::string>{file("pkg/sub/deep.py")});
    EXPECT_EQ(resolver.resolve_import(plain_import({{"pkg.nothing", "alias"}}), file("a.py")),
              std::vector<std::string>{file("pkg/__init__.py")});
    EXPECT_TRUE(resolver.resolve_import(plain_import({{"json", ""}}), file("a.py")).empty());
}

TEST_F(ImportResolverTest, WildcardResolvesModule) {
    const ImportResolver resolver(root.string());

    EXPECT_EQ(resolver.resolve_import(from_import("pkg.mod", 0, {{"*", ""}}), file("a.py")),
              std::vector<std::string>{file("pkg/mod.py")});
}

TEST_F(ImportResolverTest, SelfImportDropped) {
    const ImportResolver resolver(root.string());

    EXPECT_TRUE(resolver.resolve_import(from_import("", 1, {{"mod", ""}}), file("pkg/mod.py")).empty());
}

TEST_F(ImportResolverTest, FromDotImportSibling) {
    const auto importer = file("pkg/mod.py");
    const auto declaration = from_import("", 1, {{"sibling", ""}});

    touch("pkg/sibling/__init__.py");
    EXPECT_EQ(ImportResolver(root.string()).resolve_import(declaration, importer),
              std::vector<std::string>{file("pkg/sibling/__init__.py")});

    touch("pkg/sibling.py");
    EXPECT_EQ(ImportResolver(root.string()).resolve_import(declaration, importer),
              std::vector<std::string>{file("pkg/sibling.py")});
}
