//! # Driver Tests
//!
//! Runs `errlens_main` against in-memory streams with a temporary config file.

#include "cli/driver.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class DriverTest : public ::testing::Test {
protected:
    fs::path temp_dir;
    fs::path config_path;

    std::istringstream in;
    std::ostringstream out;
    std::ostringstream diag;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "errlens_driver_test";
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);

        config_path = temp_dir / "errlens.toml";
        write_config("[errlens]\ncolors = false\n");
    }

    void TearDown() override {
        fs::remove_all(temp_dir);
    }

    void write_config(const std::string& content) {
        std::ofstream file(config_path);
        file << content;
    }

    int run(std::vector<std::string> args) {
        args.insert(args.begin(), "--config=" + config_path.string());
        args.insert(args.begin(), "errlens");

        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        return errlens::cli::errlens_main(static_cast<int>(args.size()), argv.data(), in, out,
                                          diag);
    }
};

TEST_F(DriverTest, Version) {
    EXPECT_EQ(run({"--version"}), 0);
    EXPECT_EQ(out.str(), "errlens 0.3.0\n");
}

TEST_F(DriverTest, Help) {
    EXPECT_EQ(run({"--help"}), 0);
    EXPECT_NE(out.str().find("Usage: errlens"), std::string::npos);
}

TEST_F(DriverTest, ClassifiesArguments) {
    EXPECT_EQ(run({"Resource group 'demo' could not be found.", "Connection reset by peer"}), 0);

    EXPECT_EQ(out.str(), "Resource not found: demo does not exist\n"
                         "Connection reset by peer\n");
    EXPECT_NE(diag.str().find("error[ResourceNotFound]"), std::string::npos);
    EXPECT_EQ(diag.str().find("Connection reset"), std::string::npos);
}

TEST_F(DriverTest, ClassifiesStdinLines) {
    in.str("Connection reset by peer\r\nargument --name: expected one argument\n");

    EXPECT_EQ(run({}), 0);
    EXPECT_EQ(out.str(), "Connection reset by peer\n"
                         "Value Required: name\n");
}

TEST_F(DriverTest, JsonFlag) {
    EXPECT_EQ(run({"--json", "argument --name: expected one argument"}), 0);
    EXPECT_NE(diag.str().find("{\"kind\":\"ValueRequired\""), std::string::npos);
}

TEST_F(DriverTest, PolicyFromConfig) {
    write_config("[errlens]\ncolors = false\npolicy = \"fall-through\"\n");
    std::string message = "Parameter 'name' must conform to the following pattern: '^[a-z]+$'. "
                          "argument --name: expected one argument";

    EXPECT_EQ(run({message}), 0);
    EXPECT_EQ(out.str(), "Value Required: name\n");
}

TEST_F(DriverTest, LogOptionsAreNotMessages) {
    EXPECT_EQ(run({"--log-level=error", "-q", "Connection reset by peer"}), 0);
    EXPECT_EQ(out.str(), "Connection reset by peer\n");
}

TEST_F(DriverTest, BadConfigFails) {
    write_config("[errlens]\nformat = \"xml\"\n");

    EXPECT_EQ(run({"Connection reset by peer"}), 1);
    EXPECT_NE(diag.str().find("error: "), std::string::npos);
    EXPECT_NE(diag.str().find("invalid value 'xml' for 'format'"), std::string::npos);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(DriverTest, InvalidValueLocatesBadCharacters) {
    std::string message = "Parameter 'resource_group_name' must conform to the following pattern: "
                          "'^[-\\w\\._\\(\\)]+$'.";

    EXPECT_EQ(run({"--invalid-value=sampleUX!!group", message}), 0);
    EXPECT_EQ(out.str(), "Character not allowed: !\n");
    EXPECT_NE(diag.str().find("error[CharacterNotAllowed]"), std::string::npos);
    EXPECT_NE(diag.str().find("= help: try `--resource-group sampleUXgroup`"), std::string::npos);
}

TEST_F(DriverTest, WithoutInvalidValueCharacterErrorIsUnchanged) {
    std::string message = "Parameter 'name' must conform to the following pattern: '^[a-z]+$'.";

    EXPECT_EQ(run({message}), 0);
    EXPECT_EQ(out.str(), message + "\n");
}
