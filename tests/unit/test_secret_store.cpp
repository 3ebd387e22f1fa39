#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/run_id.hpp"
#include "core/errors/station_errors.hpp"
#include "session/secret_store.hpp"

namespace {

using station::core::errors::ErrorCategory;
using station::core::errors::get_error;
using station::core::errors::get_value;
using station::core::errors::is_error;
using station::session::ChainedSecretStore;
using station::session::EnvironmentSecretStore;
using station::session::JsonFileSecretStore;
using station::session::OverrideSecretStore;
using station::session::SecretStore;

class TempFile {
public:
    explicit TempFile(const std::string& content) {
        path_ = std::filesystem::current_path() /
                (".tmp_secrets_" + station::core::config::generate_run_id() + ".json");
        std::ofstream out(path_);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

TEST(SecretStoreTest, OverrideReturnsDeclaredValue) {
    OverrideSecretStore store(std::map<std::string, std::string>{{"FOO", "BAR"}});
    auto value = store.get("FOO");
    ASSERT_FALSE(is_error(value));
    EXPECT_EQ(get_value(value), "BAR");
}

TEST(SecretStoreTest, OverrideRejectsUndeclaredName) {
    OverrideSecretStore store(std::map<std::string, std::string>{{"FOO", "BAR"}});
    auto value = store.get("NOPE");
    ASSERT_TRUE(is_error(value));
    EXPECT_EQ(get_error(value).category, ErrorCategory::Secret);
    EXPECT_EQ(get_error(value).code, "secret_not_found");
}

TEST(SecretStoreTest, EnvironmentReadsPrefixedVariable) {
    ASSERT_EQ(setenv("STATION_TEST_SECRET_TOKEN", "s3cret", 1), 0);
    EnvironmentSecretStore store("STATION_TEST_SECRET_");

    auto value = store.get("TOKEN");
    ASSERT_FALSE(is_error(value));
    EXPECT_EQ(get_value(value), "s3cret");

    auto missing = store.get("ABSENT");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "secret_not_found");
    unsetenv("STATION_TEST_SECRET_TOKEN");
}

TEST(SecretStoreTest, JsonFileLoadsObject) {
    TempFile file(R"({"FOO": "from-file", "BAR": "x"})");
    JsonFileSecretStore store(file.path());

    auto value = store.get("FOO");
    ASSERT_FALSE(is_error(value));
    EXPECT_EQ(get_value(value), "from-file");

    auto missing = store.get("BAZ");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "secret_not_found");
}

TEST(SecretStoreTest, JsonFileMalformedIsInfrastructureFailure) {
    TempFile file("{not json");
    JsonFileSecretStore store(file.path());

    auto value = store.get("FOO");
    ASSERT_TRUE(is_error(value));
    EXPECT_EQ(get_error(value).category, ErrorCategory::Infrastructure);
    EXPECT_EQ(get_error(value).code, "secret_store_unavailable");
}

TEST(SecretStoreTest, JsonFileMissingIsInfrastructureFailure) {
    JsonFileSecretStore store(std::filesystem::current_path() / "__missing_secrets__.json");
    auto value = store.get("FOO");
    ASSERT_TRUE(is_error(value));
    EXPECT_EQ(get_error(value).code, "secret_store_unavailable");
}

TEST(SecretStoreTest, ChainFallsThroughOnlyOnNotFound) {
    auto overrides = std::make_shared<OverrideSecretStore>(
        std::map<std::string, std::string>{{"FOO", "override"}});
    auto broken = std::make_shared<JsonFileSecretStore>(
        std::filesystem::current_path() / "__missing_secrets__.json");
    ChainedSecretStore chain({overrides, broken});

    auto hit = chain.get("FOO");
    ASSERT_FALSE(is_error(hit));
    EXPECT_EQ(get_value(hit), "override");

    auto miss = chain.get("OTHER");
    ASSERT_TRUE(is_error(miss));
    EXPECT_EQ(get_error(miss).code, "secret_store_unavailable");
}

TEST(SecretStoreTest, EmptyChainReportsNotFound) {
    ChainedSecretStore chain(std::vector<std::shared_ptr<const SecretStore>>{});
    auto value = chain.get("FOO");
    ASSERT_TRUE(is_error(value));
    EXPECT_EQ(get_error(value).code, "secret_not_found");
}

}  // namespace
