#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "keepsake/core/DataLoader.hh"

namespace keepsake {

class DataLoaderTest : public ::testing::Test {
  protected:
    // Write a temp TOML file for file-based tests
    std::filesystem::path writeTempFile(const std::string& content, const std::string& name = "test.toml") {
        auto dir = std::filesystem::temp_directory_path() / "keepsake_loader_test";
        std::filesystem::create_directories(dir);
        auto path = dir / name;
        std::ofstream ofs(path);
        ofs << content;
        ofs.close();
        return path;
    }

    void TearDown() override {
        auto dir = std::filesystem::temp_directory_path() / "keepsake_loader_test";
        std::filesystem::remove_all(dir);
    }
};

// -- DataLoader::parse --

TEST_F(DataLoaderTest, ParseValidToml) {
    auto result = DataLoader::parse(R"(
        [session]
        key_template = "DLX_template"
        [probe]
        max_attempts = 3
        [autosave]
        interval_seconds = 2.5
        enabled = true
    )");
    ASSERT_TRUE(result.isOk());
    auto& loader = result.value();

    EXPECT_EQ(loader.getString("session.key_template").value(), "DLX_template");
    EXPECT_EQ(loader.getInt("probe.max_attempts").value(), 3);
    EXPECT_DOUBLE_EQ(loader.getFloat("autosave.interval_seconds").value(), 2.5);
    EXPECT_TRUE(loader.getBool("autosave.enabled").value());
}

TEST_F(DataLoaderTest, ParseMalformedToml) {
    auto result = DataLoader::parse("[invalid\nno_closing_bracket");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::Internal);
    // Error message should contain line info
    EXPECT_NE(result.message().find(":"), std::string::npos);
}

TEST_F(DataLoaderTest, MissingKey) {
    auto result = DataLoader::parse("[section]\nkey = 1");
    ASSERT_TRUE(result.isOk());
    auto missing = result.value().getString("section.nonexistent");
    EXPECT_TRUE(missing.isError());
    EXPECT_EQ(missing.code(), ErrorCode::NotFound);
}

TEST_F(DataLoaderTest, TypeMismatch) {
    auto result = DataLoader::parse("[data]\nvalue = \"text\"");
    ASSERT_TRUE(result.isOk());
    auto asInt = result.value().getInt("data.value");
    EXPECT_TRUE(asInt.isError());
    EXPECT_EQ(asInt.code(), ErrorCode::InvalidState);
}

TEST_F(DataLoaderTest, DefaultsApplyOnlyToAbsentKeys) {
    auto result = DataLoader::parse("[a]\nb = \"not a number\"");
    ASSERT_TRUE(result.isOk());
    auto& loader = result.value();

    EXPECT_EQ(loader.getIntOr("a.missing", 7).value(), 7);
    EXPECT_EQ(loader.getStringOr("z.missing", "fallback").value(), "fallback");
    EXPECT_FALSE(loader.getBoolOr("a.missing", false).value());

    auto mistyped = loader.getIntOr("a.b", 7);
    EXPECT_TRUE(mistyped.isError());
    EXPECT_EQ(mistyped.code(), ErrorCode::InvalidState);
}

TEST_F(DataLoaderTest, FloatAcceptsInteger) {
    auto result = DataLoader::parse("[d]\nv = 10");
    ASSERT_TRUE(result.isOk());
    auto f = result.value().getFloat("d.v");
    ASSERT_TRUE(f.isOk());
    EXPECT_DOUBLE_EQ(f.value(), 10.0);
}

TEST_F(DataLoaderTest, FloatRejectsText) {
    auto result = DataLoader::parse("[autosave]\ninterval_seconds = \"soon\"");
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value().getFloat("autosave.interval_seconds").code(), ErrorCode::InvalidState);
    EXPECT_EQ(result.value().getFloatOr("autosave.interval_seconds", 1.0).code(), ErrorCode::InvalidState);
}

TEST_F(DataLoaderTest, KeyBelowAScalarIsNotFound) {
    auto result = DataLoader::parse("[probe]\nmax_attempts = 3");
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value().getInt("probe.max_attempts.extra").code(), ErrorCode::NotFound);
    EXPECT_EQ(result.value().getIntOr("probe.max_attempts.extra", 5).value(), 5);
}

// -- DataLoader::load (file-based) --

TEST_F(DataLoaderTest, LoadFromFile) {
    auto path = writeTempFile("[test]\nvalue = 99");
    auto result = DataLoader::load(path);
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value().getInt("test.value").value(), 99);
    EXPECT_NE(result.value().sourceName().find("test.toml"), std::string::npos);
}

TEST_F(DataLoaderTest, LoadMissingFile) {
    auto result = DataLoader::load("/nonexistent/path/missing.toml");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::NotFound);
}

} // namespace keepsake
