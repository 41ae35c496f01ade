/**
 * @file test_profile_store.cpp
 * @brief Unit tests for profile_store persistence and default handling
 */

#include <gtest/gtest.h>

#include <kcenon/batch_transfer/profile/profile_store.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace kcenon::batch_transfer::test {

class ProfileStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("batch_transfer_test_profiles_" +
                     std::to_string(std::chrono::steady_clock::now()
                                        .time_since_epoch()
                                        .count()));
        std::filesystem::create_directories(test_dir_);
        profile_file_ = test_dir_ / "profiles.json";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    void write_file(const std::string& content) {
        std::ofstream file(profile_file_, std::ios::binary);
        file << content;
    }

    auto read_file() -> std::string {
        std::ifstream file(profile_file_, std::ios::binary);
        std::ostringstream content;
        content << file.rdbuf();
        return content.str();
    }

    static auto make_options(const std::string& host) -> session_options {
        session_options options;
        options.host = host;
        options.port = 2222;
        options.username = "deploy";
        options.password = "p\"ss";
        options.remote_dir = "/incoming";
        return options;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path profile_file_;
};

// ============================================================================
// Loading and saving
// ============================================================================

TEST_F(ProfileStoreTest, Load_MissingFileStartsEmpty) {
    profile_store store(profile_file_);

    auto loaded = store.load();

    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(store.size(), 0u);
    EXPECT_TRUE(store.default_name().empty());
    EXPECT_FALSE(store.default_profile().has_value());
}

TEST_F(ProfileStoreTest, SaveThenLoad_RoundTrips) {
    {
        profile_store store(profile_file_);
        ASSERT_TRUE(store.upsert("staging", make_options("staging.example.com")).has_value());

        auto prod = make_options("prod.example.com");
        prod.auth = auth_method::private_key;
        prod.key_path = "/home/deploy/.ssh/id_ed25519";
        prod.key_passphrase = "phrase";
        ASSERT_TRUE(store.upsert("prod", prod).has_value());
        ASSERT_TRUE(store.set_default("prod").has_value());
        ASSERT_TRUE(store.save().has_value());
    }

    profile_store reloaded(profile_file_);
    ASSERT_TRUE(reloaded.load().has_value());

    EXPECT_EQ(reloaded.names(), (std::vector<std::string>{"staging", "prod"}));
    EXPECT_EQ(reloaded.default_name(), "prod");

    auto staging = reloaded.find("staging");
    ASSERT_TRUE(staging.has_value());
    EXPECT_EQ(staging->host, "staging.example.com");
    EXPECT_EQ(staging->port, 2222);
    EXPECT_EQ(staging->username, "deploy");
    EXPECT_EQ(staging->password, "p\"ss");
    EXPECT_EQ(staging->remote_dir, "/incoming");
    EXPECT_EQ(staging->auth, auth_method::password);

    auto prod = reloaded.default_profile();
    ASSERT_TRUE(prod.has_value());
    EXPECT_EQ(prod->auth, auth_method::private_key);
    EXPECT_EQ(prod->key_path.string(), "/home/deploy/.ssh/id_ed25519");
    EXPECT_EQ(prod->key_passphrase, "phrase");
}

TEST_F(ProfileStoreTest, Save_WritesNumericPortAndProfilesKey) {
    profile_store store(profile_file_);
    ASSERT_TRUE(store.upsert("one", make_options("a.example.com")).has_value());
    ASSERT_TRUE(store.save().has_value());

    auto content = read_file();
    EXPECT_NE(content.find("\"profiles\""), std::string::npos);
    EXPECT_NE(content.find("\"port\": 2222"), std::string::npos);
    EXPECT_NE(content.find("\"auth\": \"password\""), std::string::npos);
}

TEST_F(ProfileStoreTest, Save_CreatesParentDirectories) {
    profile_store store(test_dir_ / "nested" / "deeper" / "profiles.json");
    ASSERT_TRUE(store.upsert("one", make_options("a.example.com")).has_value());

    ASSERT_TRUE(store.save().has_value());
    EXPECT_TRUE(std::filesystem::exists(store.path()));
}

TEST_F(ProfileStoreTest, Load_LegacyPresetsWithStringPort) {
    write_file(R"({
  "default": "office",
  "presets": {
    "office": {
      "host": "10.0.0.5",
      "port": "2200",
      "username": "clerk",
      "auth": "key",
      "password": "",
      "key_path": "C:\\keys\\office.pem",
      "remote_dir": "/drop"
    }
  }
})");

    profile_store store(profile_file_);
    ASSERT_TRUE(store.load().has_value());

    auto office = store.default_profile();
    ASSERT_TRUE(office.has_value());
    EXPECT_EQ(office->port, 2200);
    EXPECT_EQ(office->auth, auth_method::private_key);
    EXPECT_EQ(office->key_path.string(), "C:\\keys\\office.pem");
}

TEST_F(ProfileStoreTest, Load_UnparsableFileIsError) {
    write_file("{ \"profiles\": { \"broken\": ");

    profile_store store(profile_file_);
    auto loaded = store.load();

    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, error_code::profile_parse_error);
}

TEST_F(ProfileStoreTest, Load_InvalidPortIsError) {
    write_file(R"({"profiles": {"bad": {"host": "h", "port": 70000, "username": "u"}}})");

    profile_store store(profile_file_);
    auto loaded = store.load();

    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, error_code::profile_parse_error);
}

TEST_F(ProfileStoreTest, Load_UnknownAuthIsError) {
    write_file(R"({"profiles": {"bad": {"host": "h", "username": "u", "auth": "kerberos"}}})");

    profile_store store(profile_file_);
    EXPECT_FALSE(store.load().has_value());
}

TEST_F(ProfileStoreTest, Load_UnicodeEscapesDecodeToUtf8) {
    write_file(R"({"profiles": {"u": {"host": "h", "username": "caf\u00e9", )"
               R"("remote_dir": "/drop/\ud83d\ude00"}}})");

    profile_store store(profile_file_);
    ASSERT_TRUE(store.load().has_value());

    auto entry = store.find("u");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->username, "caf\xC3\xA9");
    EXPECT_EQ(entry->remote_dir, "/drop/\xF0\x9F\x98\x80");
}

TEST_F(ProfileStoreTest, Load_InvalidHexEscapeIsError) {
    write_file(R"({"profiles": {"u": {"host": "h\uzzzz", "username": "u"}}})");

    profile_store store(profile_file_);
    auto loaded = store.load();

    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, error_code::profile_parse_error);
}

TEST_F(ProfileStoreTest, Load_UnpairedSurrogateIsError) {
    write_file(R"({"profiles": {"u": {"host": "h\ud83dx", "username": "u"}}})");

    profile_store store(profile_file_);
    auto loaded = store.load();

    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, error_code::profile_parse_error);
}

TEST_F(ProfileStoreTest, SaveThenLoad_ControlAndNonAsciiCharacters) {
    auto options = make_options("h.example.com");
    options.password = "tab\there\x01\\end";
    options.remote_dir = "/d\xC3\xA9p\xC3\xB4t";

    {
        profile_store store(profile_file_);
        ASSERT_TRUE(store.upsert("odd", options).has_value());
        ASSERT_TRUE(store.save().has_value());
    }
    EXPECT_NE(read_file().find("tab\\there\\u0001\\\\end"), std::string::npos);

    profile_store reloaded(profile_file_);
    ASSERT_TRUE(reloaded.load().has_value());
    auto entry = reloaded.find("odd");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->password, options.password);
    EXPECT_EQ(entry->remote_dir, options.remote_dir);
}

TEST_F(ProfileStoreTest, Load_ReplacesInMemoryState) {
    profile_store store(profile_file_);
    ASSERT_TRUE(store.upsert("unsaved", make_options("x.example.com")).has_value());

    ASSERT_TRUE(store.load().has_value());

    EXPECT_FALSE(store.contains("unsaved"));
    EXPECT_EQ(store.size(), 0u);
}

// ============================================================================
// Editing
// ============================================================================

TEST_F(ProfileStoreTest, Upsert_FirstProfileBecomesDefault) {
    profile_store store(profile_file_);

    ASSERT_TRUE(store.upsert("first", make_options("a.example.com")).has_value());
    ASSERT_TRUE(store.upsert("second", make_options("b.example.com")).has_value());

    EXPECT_EQ(store.default_name(), "first");
    EXPECT_EQ(store.size(), 2u);
}

TEST_F(ProfileStoreTest, Upsert_ReplacesExistingInPlace) {
    profile_store store(profile_file_);
    ASSERT_TRUE(store.upsert("a", make_options("old.example.com")).has_value());
    ASSERT_TRUE(store.upsert("b", make_options("b.example.com")).has_value());

    ASSERT_TRUE(store.upsert("a", make_options("new.example.com")).has_value());

    EXPECT_EQ(store.names(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(store.find("a")->host, "new.example.com");
}

TEST_F(ProfileStoreTest, Upsert_EmptyNameIsRejected) {
    profile_store store(profile_file_);
    auto added = store.upsert("", make_options("a.example.com"));

    ASSERT_FALSE(added.has_value());
    EXPECT_EQ(added.error().code, error_code::invalid_request);
}

TEST_F(ProfileStoreTest, Remove_DefaultMovesToFirstRemaining) {
    profile_store store(profile_file_);
    ASSERT_TRUE(store.upsert("a", make_options("a.example.com")).has_value());
    ASSERT_TRUE(store.upsert("b", make_options("b.example.com")).has_value());
    ASSERT_TRUE(store.upsert("c", make_options("c.example.com")).has_value());
    ASSERT_TRUE(store.set_default("b").has_value());

    ASSERT_TRUE(store.remove("b").has_value());
    EXPECT_EQ(store.default_name(), "a");

    ASSERT_TRUE(store.remove("c").has_value());
    EXPECT_EQ(store.default_name(), "a");

    ASSERT_TRUE(store.remove("a").has_value());
    EXPECT_TRUE(store.default_name().empty());
}

TEST_F(ProfileStoreTest, Remove_MissingProfileIsError) {
    profile_store store(profile_file_);
    auto removed = store.remove("ghost");

    ASSERT_FALSE(removed.has_value());
    EXPECT_EQ(removed.error().code, error_code::profile_not_found);
}

TEST_F(ProfileStoreTest, SetDefault_RequiresExistingProfile) {
    profile_store store(profile_file_);
    ASSERT_TRUE(store.upsert("a", make_options("a.example.com")).has_value());

    auto changed = store.set_default("ghost");

    ASSERT_FALSE(changed.has_value());
    EXPECT_EQ(changed.error().code, error_code::profile_not_found);
    EXPECT_EQ(store.default_name(), "a");
}

TEST_F(ProfileStoreTest, DefaultPath_UnderHomeDirectory) {
    auto path = profile_store::default_path();
    EXPECT_EQ(path.filename().string(), "profiles.json");
    EXPECT_EQ(path.parent_path().filename().string(), ".batch_transfer");
}

}  // namespace kcenon::batch_transfer::test
