#include <gtest/gtest.h>
#include <core/config.hpp>
#include <cstdlib>
#include <fstream>

// Restores HOME for tests that point it somewhere else
class ConfigHomeTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* home = std::getenv("HOME");
        saved_home_ = home ? home : "";
    }
    void TearDown() override { setenv("HOME", saved_home_.c_str(), 1); }

private:
    std::string saved_home_;
};

TEST(Config, Defaults) {
    auto config = Config::defaults();
    EXPECT_EQ(config.shell().program, "/bin/bash");
    EXPECT_EQ(config.shell().args, (std::vector<std::string>{"-l", "-m"}));
    EXPECT_EQ(config.shell().timeout_secs, 120);
    EXPECT_EQ(config.shell().activation_banner, "(.dev)");
    EXPECT_EQ(config.shell().interactive_commands.size(), 9u);
    EXPECT_EQ(config.shell().fast_commands, (std::vector<std::string>{"cd", "ls", "pwd"}));
    EXPECT_TRUE(config.environment().empty());
    EXPECT_EQ(config.remote().port, 22);
    EXPECT_TRUE(config.logging().enabled);
}

TEST(Config, ParseOverridesOnlyGivenKeys) {
    auto result = Config::parse(
        "shell:\n"
        "  program: /bin/sh\n"
        "  timeout: 30\n"
        "  fast_commands: [cd, echo]\n"
        "environment:\n"
        "  PROJECT: demo\n"
        "  DEBUG: 1\n"
        "remote:\n"
        "  host: build.example.org\n"
        "  port: 2222\n"
        "  user: ci\n"
        "logging:\n"
        "  enabled: false\n");
    ASSERT_TRUE(result.is_ok()) << result.error;
    const auto& config = result.value;
    EXPECT_EQ(config.shell().program, "/bin/sh");
    EXPECT_EQ(config.shell().timeout_secs, 30);
    EXPECT_EQ(config.shell().fast_commands, (std::vector<std::string>{"cd", "echo"}));
    EXPECT_EQ(config.shell().args, (std::vector<std::string>{"-l", "-m"}));
    EXPECT_EQ(config.environment().at("PROJECT"), "demo");
    EXPECT_EQ(config.environment().at("DEBUG"), "1");
    EXPECT_EQ(config.remote().host, "build.example.org");
    EXPECT_EQ(config.remote().port, 2222);
    EXPECT_EQ(config.remote().user, "ci");
    EXPECT_FALSE(config.remote().ssh_key_path.has_value());
    EXPECT_FALSE(config.logging().enabled);
}

TEST_F(ConfigHomeTest, HomeIsExpandedInPaths) {
    setenv("HOME", "/home/tester", 1);
    auto result = Config::parse("remote:\n  ssh_key: ~/.ssh/id_ed25519\n");
    ASSERT_TRUE(result.is_ok()) << result.error;
    ASSERT_TRUE(result.value.remote().ssh_key_path.has_value());
    EXPECT_EQ(*result.value.remote().ssh_key_path, "/home/tester/.ssh/id_ed25519");
}

TEST(Config, EmptyDocumentIsDefaults) {
    auto result = Config::parse("");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.shell().program, "/bin/bash");
}

TEST(Config, InvalidYamlIsAnError) {
    auto result = Config::parse("shell: [unclosed\n");
    EXPECT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("Failed to parse config"), std::string::npos);
}

TEST(Config, NonMappingDocumentIsAnError) {
    EXPECT_TRUE(Config::parse("- a\n- b\n").is_err());
}

TEST(Config, MissingFileIsAnError) {
    auto result = Config::load_file("/nonexistent/hostshell.yaml");
    EXPECT_TRUE(result.is_err());
}

TEST_F(ConfigHomeTest, ProjectOverridesGlobal) {
    auto root = fs::temp_directory_path() / "hostshell_config_test";
    fs::remove_all(root);
    fs::create_directories(root / "home" / ".hostshell");
    fs::create_directories(root / "project");
    setenv("HOME", (root / "home").c_str(), 1);

    std::ofstream(get_global_config_path()) << "shell:\n  timeout: 60\n  program: /bin/zsh\n";
    std::ofstream(get_project_config_path(root / "project")) << "shell:\n  timeout: 15\n";

    auto result = Config::load(root / "project");
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.shell().timeout_secs, 15);
    EXPECT_EQ(result.value.shell().program, "/bin/zsh");

    fs::remove_all(root);
}
