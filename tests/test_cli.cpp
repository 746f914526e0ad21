// tests/test_cli.cpp

#include "app/cli.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

const char *kUrl = "https://example.com/song.mid";

app::Cli parse(std::vector<std::string> args) {
  args.insert(args.begin(), "midiconvert");
  std::vector<char *> argv;
  for (auto &a : args) {
    argv.push_back(a.data());
  }
  argv.push_back(nullptr);
  return app::parse_cli(static_cast<int>(args.size()), argv.data());
}

} // namespace

TEST(Cli, UrlInputWithDefaults) {
  const app::Cli cli = parse({kUrl});
  EXPECT_EQ(cli.input, kUrl);
  EXPECT_FALSE(cli.jsonOut.has_value());
  EXPECT_FALSE(cli.midiOut.has_value());
  EXPECT_FALSE(cli.bpm.has_value());
  EXPECT_FALSE(cli.slice.has_value());
  EXPECT_EQ(cli.options.pitchBendRange, midi::kDefaultPitchBendRange);
  EXPECT_FALSE(cli.options.programController.has_value());
  EXPECT_FALSE(cli.verbose);
  EXPECT_FALSE(cli.quiet);
}

TEST(Cli, ParsesEveryOption) {
  const app::Cli cli =
      parse({kUrl, "--json", "-", "--out", "copy.mid", "--bpm", "90.5",
             "--slice", "1", "2.5", "--bend-range", "12", "--program-cc",
             "0", "-v", "--quiet"});
  EXPECT_EQ(*cli.jsonOut, std::filesystem::path("-"));
  EXPECT_EQ(*cli.midiOut, std::filesystem::path("copy.mid"));
  EXPECT_DOUBLE_EQ(*cli.bpm, 90.5);
  EXPECT_DOUBLE_EQ(cli.slice->first, 1.0);
  EXPECT_DOUBLE_EQ(cli.slice->second, 2.5);
  EXPECT_EQ(cli.options.pitchBendRange, 12);
  EXPECT_EQ(cli.options.programController, 0);
  EXPECT_TRUE(cli.verbose);
  EXPECT_TRUE(cli.quiet);
}

TEST(Cli, LocalFileMustExist) {
  EXPECT_THROW(parse({"/nonexistent/dir/song.mid"}), app::UsageError);

  const auto path =
      std::filesystem::temp_directory_path() / "midiconvert_cli_test.mid";
  {
    std::ofstream f(path, std::ios::binary);
    f << "MThd";
  }
  EXPECT_EQ(parse({path.string()}).input, path.string());
  std::filesystem::remove(path);
}

TEST(Cli, RejectsBadInvocations) {
  EXPECT_THROW(parse({}), app::UsageError);
  EXPECT_THROW(parse({"--help"}), app::UsageError);
  EXPECT_THROW(parse({"--json"}), app::UsageError);
  EXPECT_THROW(parse({kUrl, "--frobnicate"}), app::UsageError);
  EXPECT_THROW(parse({kUrl, "--json"}), app::UsageError);
  EXPECT_THROW(parse({kUrl, "--bpm", "fast"}), app::UsageError);
  EXPECT_THROW(parse({kUrl, "--bpm", "120x"}), app::UsageError);
  EXPECT_THROW(parse({kUrl, "--bpm", "0"}), app::UsageError);
  EXPECT_THROW(parse({kUrl, "--slice", "3", "1"}), app::UsageError);
  EXPECT_THROW(parse({kUrl, "--slice", "3"}), app::UsageError);
  EXPECT_THROW(parse({kUrl, "--bend-range", "1.5"}), app::UsageError);
  EXPECT_THROW(parse({kUrl, "--program-cc", "128"}), app::UsageError);
}

TEST(Cli, FlagLikeArguments) {
  EXPECT_TRUE(app::is_flag_like("--out"));
  EXPECT_TRUE(app::is_flag_like("-q"));
  EXPECT_FALSE(app::is_flag_like("-"));
  EXPECT_FALSE(app::is_flag_like("song.mid"));
  EXPECT_FALSE(app::is_flag_like(""));
}
