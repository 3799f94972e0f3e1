#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "fslite/cli/cli.hpp"
#include "test_utils.hpp"

using namespace fslite;

class CLITest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<service::FileService> file_service;
  std::istringstream input;
  std::ostringstream output;
  std::unique_ptr<cli::CLI> shell;

  void SetUp() override {
    init_test_logging();
    test_dir = make_temp_dir("cli_test");

    config::Config config;
    config.storage_root = (test_dir / "nodes").string();
    config.restore_dir = (test_dir / "restored").string();
    config.sizing = engine::SizingPolicy::fixed_size(4);
    file_service = std::make_unique<service::FileService>(config);
    shell = std::make_unique<cli::CLI>(*file_service, input, output);
  }

  void TearDown() override {
    shell.reset();
    file_service.reset();
    std::filesystem::remove_all(test_dir);
  }

  std::string run(const std::string& line) {
    output.str("");
    shell->execute(line);
    return output.str();
  }

  std::filesystem::path write_local_file(const std::string& name, const std::string& text) {
    auto path = test_dir / name;
    std::ofstream(path, std::ios::binary) << text;
    return path;
  }

  std::string only_file_id() {
    auto files = file_service->list();
    return files.empty() ? std::string() : files.front().id;
  }
};

TEST_F(CLITest, StoreListReadRoundTrip) {
  auto path = write_local_file("hello.txt", "hello mesh");

  EXPECT_NE(run("store " + path.string()).find("Stored hello.txt as "), std::string::npos);
  const std::string id = only_file_id();
  ASSERT_FALSE(id.empty());

  std::string listing = run("ls");
  EXPECT_NE(listing.find("* " + id), std::string::npos);
  EXPECT_NE(listing.find("10 bytes"), std::string::npos);
  EXPECT_NE(listing.find("3 fragments"), std::string::npos);

  EXPECT_EQ(run("read " + id), "hello mesh\n");
}

TEST_F(CLITest, GetWritesIntoDirectory) {
  auto path = write_local_file("doc.txt", "contents");
  run("store " + path.string());

  std::string result = run("get " + only_file_id() + " " + (test_dir / "out").string());
  EXPECT_NE(result.find("Reconstructed to"), std::string::npos);
  EXPECT_TRUE(std::filesystem::exists(test_dir / "out" / "doc.txt"));
}

TEST_F(CLITest, EmptyListing) {
  EXPECT_EQ(run("ls"), "No files stored\n");
}

TEST_F(CLITest, StatusAndToggle) {
  EXPECT_EQ(run("toggle node_2"), "Node node_2 is now offline\n");

  std::string status = run("status");
  EXPECT_NE(status.find("Mesh health: 80%"), std::string::npos);
  EXPECT_NE(status.find("offline"), std::string::npos);

  EXPECT_EQ(run("toggle node_2"), "Node node_2 is now online\n");
  EXPECT_NE(run("toggle node_9").find("Error toggling node"), std::string::npos);
}

TEST_F(CLITest, CheckReportsOfflineFragment) {
  auto path = write_local_file("check.txt", "abcdefgh");
  run("store " + path.string());
  run("toggle node_2");

  std::string report = run("check " + only_file_id());
  EXPECT_NE(report.find("ok"), std::string::npos);
  EXPECT_NE(report.find("unavailable (node offline)"), std::string::npos);
}

TEST_F(CLITest, DeleteRemovesFile) {
  auto path = write_local_file("delete.txt", "bye");
  run("store " + path.string());

  EXPECT_EQ(run("delete " + only_file_id()), "File deleted successfully\n");
  EXPECT_EQ(run("ls"), "No files stored\n");
}

TEST_F(CLITest, ErrorsAreReported) {
  EXPECT_NE(run("read unknown").find("Error reading file: File not found"), std::string::npos);
  EXPECT_NE(run("store " + (test_dir / "missing").string()).find("Error storing file"), std::string::npos);
  EXPECT_EQ(run("read"), "Invalid input. Usage: <command> <argument> (type 'help')\n");
  EXPECT_EQ(run("frobnicate x"), "Unknown command or invalid arguments\n");
}

TEST_F(CLITest, HelpListsCommands) {
  std::string help = run("help");
  for (const char* command : {"store", "read", "get", "check", "delete", "ls", "status", "toggle", "quit"}) {
    EXPECT_NE(help.find(command), std::string::npos) << command;
  }
}

TEST_F(CLITest, RunStopsOnQuit) {
  input.str("ls\nquit\nls\n");
  shell->run();

  const std::string transcript = output.str();
  EXPECT_EQ(transcript.find("FSLite> "), 0u);
  // The second ls is never executed
  EXPECT_EQ(transcript.find("No files stored"), transcript.rfind("No files stored"));
  EXPECT_FALSE(shell->execute("exit"));
  EXPECT_TRUE(shell->execute(""));
}
