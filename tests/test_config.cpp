#include "test_support.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <algorithm>
#include <map>

class ConfigTest : public ScratchDirTest {
protected:
    std::map<std::string, std::string> env;

    EnvLookup lookup() {
        return [this](const std::string& key) -> std::optional<std::string> {
            auto it = env.find(key);
            if (it == env.end()) return std::nullopt;
            return it->second;
        };
    }
};

TEST_F(ConfigTest, DefaultsWhenFileMissing) {
    auto r = Config::load(test_dir / "missing.yaml", lookup());
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;

    EXPECT_EQ(c.device().address, DEFAULT_DEVICE_ADDRESS);
    EXPECT_EQ(c.device().sequence, "watcher");
    EXPECT_EQ(c.device().share_name, "");
    EXPECT_EQ(c.watch().min_file_age, 60);
    EXPECT_EQ(c.watch().check_interval, 300);
    EXPECT_EQ(c.mail().smtp_port, 25);
    EXPECT_FALSE(c.mail().enabled());
    EXPECT_EQ(c.paths().lock_file, DEFAULT_LOCK_FILE);
    EXPECT_NE(std::find(c.watch().extensions.begin(), c.watch().extensions.end(), ".mkv"),
              c.watch().extensions.end());
}

TEST_F(ConfigTest, YamlOverridesDefaults) {
    auto file = write_file("tivowatch.yaml", R"(
device:
  address: 10.0.0.5
  sequence: import
watch:
  directory: /srv/media
  extensions: [MKV, ts]
  min_file_age: 5
  remove_transferred: true
mail:
  smtp_server: relay.example.com
  smtp_port: 587
  to: ops@example.com
paths:
  lock_file: /run/tivowatch.lock
)");
    auto r = Config::load(file, lookup());
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;

    EXPECT_EQ(c.device().address, "10.0.0.5");
    EXPECT_EQ(c.device().sequence, "import");
    EXPECT_EQ(c.watch().directory, "/srv/media");
    ASSERT_EQ(c.watch().extensions.size(), 2u);
    EXPECT_EQ(c.watch().extensions[0], ".mkv");
    EXPECT_EQ(c.watch().extensions[1], ".ts");
    EXPECT_EQ(c.watch().min_file_age, 5);
    EXPECT_TRUE(c.watch().remove_transferred);
    EXPECT_EQ(c.mail().smtp_server, "relay.example.com");
    EXPECT_EQ(c.mail().smtp_port, 587);
    EXPECT_TRUE(c.mail().enabled());
    EXPECT_EQ(c.paths().lock_file, "/run/tivowatch.lock");
    EXPECT_EQ(c.source_file(), file);
}

TEST_F(ConfigTest, EnvironmentOverridesYaml) {
    auto file = write_file("tivowatch.yaml", "device:\n  address: 10.0.0.5\n");
    env["TIVO_IP"] = "10.0.0.9";
    env["WATCH_DIR"] = "/data/incoming";
    env["MIN_FILE_AGE"] = "120";
    env["VIDEO_EXTENSIONS"] = "mp4,M4V";
    env["TO_EMAIL"] = "me@example.com";
    env["SHARE_NAME"] = "Movies";

    auto r = Config::load(file, lookup());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.device().address, "10.0.0.9");
    EXPECT_EQ(r.value.device().share_name, "Movies");
    EXPECT_EQ(r.value.watch().directory, "/data/incoming");
    EXPECT_EQ(r.value.watch().min_file_age, 120);
    EXPECT_EQ(r.value.watch().extensions, (std::vector<std::string>{".mp4", ".m4v"}));
    EXPECT_EQ(r.value.mail().to, "me@example.com");
}

TEST_F(ConfigTest, NonNumericEnvironmentValueIsAnError) {
    env["SMTP_PORT"] = "twenty-five";
    auto r = Config::load(test_dir / "missing.yaml", lookup());
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("SMTP_PORT"), std::string::npos);
}

TEST_F(ConfigTest, MalformedYamlIsAnError) {
    auto file = write_file("bad.yaml", "device: [unclosed\n");
    auto r = Config::load(file, lookup());
    EXPECT_TRUE(r.is_err());
}

TEST_F(ConfigTest, NonNumericYamlValueIsAnError) {
    auto file = write_file("bad.yaml", "watch:\n  min_file_age: soon\n");
    auto r = Config::load(file, lookup());
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("min_file_age"), std::string::npos);
}

TEST_F(ConfigTest, RejectsNonPositiveInterval) {
    env["CHECK_INTERVAL"] = "0";
    auto r = Config::load(test_dir / "missing.yaml", lookup());
    EXPECT_TRUE(r.is_err());
}

TEST_F(ConfigTest, RejectsOversizedInterval) {
    env["CHECK_INTERVAL"] = "3000000";
    auto r = Config::load(test_dir / "missing.yaml", lookup());
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("check_interval"), std::string::npos);
}

TEST_F(ConfigTest, AcceptsMaximumInterval) {
    env["CHECK_INTERVAL"] = std::to_string(MAX_CHECK_INTERVAL_SECS);
    auto r = Config::load(test_dir / "missing.yaml", lookup());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.watch().check_interval, MAX_CHECK_INTERVAL_SECS);
}

TEST(NormalizeExtensions, LowerCasesAddsDotAndDedupes) {
    auto exts = normalize_extensions({"MKV", ".mkv", " mp4 ", ""});
    EXPECT_EQ(exts, (std::vector<std::string>{".mkv", ".mp4"}));
}
