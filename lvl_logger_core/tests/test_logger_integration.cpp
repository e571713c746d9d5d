#include <fcntl.h>
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>

#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "lvl_logger/logger.hpp"
#include "test_helpers.hpp"

using lvl_logger::FormatOptions;
using lvl_logger::LoggerConfig;
using lvl_logger::PrefixMode;
using lvl_logger::SeverityLevel;
using lvl_logger_test::read_file_contents;
using lvl_logger_test::remove_directory_recursive;
using lvl_logger_test::path_exists;

class LoggerIntegrationTest : public ::testing::Test
{
 protected:
  std::string test_dir_;

  void SetUp() override
  {
    char tmpl[] = "/tmp/lvl_logger_integration_XXXXXX";
    char* dir = ::mkdtemp(tmpl);
    ASSERT_NE(dir, nullptr);
    test_dir_ = dir;
  }

  void TearDown() override { remove_directory_recursive(test_dir_); }

  static LoggerConfig make_config(bool echo_stdout,
                                  FormatOptions include = FormatOptions::Loglevel)
  {
    LoggerConfig config;
    config.directory = "logs";
    config.filename = "app.log";
    config.echo_stdout = echo_stdout;
    config.include = include;
    return config;
  }
};

TEST_F(LoggerIntegrationTest, DefaultLoggerWritesToConsoleOnly)
{
  auto logger = lvl_logger::NewLogger();
  EXPECT_EQ(logger.Sink()->SinkCount(), 1u);

  testing::internal::CaptureStdout();
  logger.Info().Println("hello", "console");
  const uint32_t expected_line = __LINE__ - 1;
  std::string out = testing::internal::GetCapturedStdout();

  std::regex pattern(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} INFO test_logger_integration\.cpp:)" +
                     std::to_string(expected_line) + R"( hello console\n)");
  EXPECT_TRUE(std::regex_match(out, pattern)) << "Actual: " << out;
}

TEST_F(LoggerIntegrationTest, DefaultLoggerPlainCallsReportCallSite)
{
  auto logger = lvl_logger::NewLogger();

  testing::internal::CaptureStdout();
  logger.Warn().Printf("retry %d", 3);
  const uint32_t line_printf = __LINE__ - 1;
  logger.Trace().Print("n=", 7);
  const uint32_t line_print = __LINE__ - 1;
  std::string out = testing::internal::GetCapturedStdout();

  std::string first = " WARN test_logger_integration.cpp:" + std::to_string(line_printf) +
                      " retry 3\n";
  std::string second = " TRACE test_logger_integration.cpp:" + std::to_string(line_print) +
                       " n=7\n";
  auto split = out.find('\n');
  ASSERT_NE(split, std::string::npos);
  std::string line_one = out.substr(0, split + 1);
  std::string line_two = out.substr(split + 1);
  ASSERT_GE(line_one.size(), first.size());
  ASSERT_GE(line_two.size(), second.size());
  EXPECT_EQ(line_one.substr(line_one.size() - first.size()), first);
  EXPECT_EQ(line_two.substr(line_two.size() - second.size()), second);
}

TEST_F(LoggerIntegrationTest, DefaultLoggerReportsCallSite)
{
  auto logger = lvl_logger::NewLogger(std::nullopt);

  testing::internal::CaptureStdout();
  LVL_LOGF(logger.Error(), "code=%d", 404);
  const uint32_t expected_line = __LINE__ - 1;
  std::string out = testing::internal::GetCapturedStdout();

  std::string tail = " ERROR test_logger_integration.cpp:" + std::to_string(expected_line) +
                     " code=404\n";
  ASSERT_GE(out.size(), tail.size());
  EXPECT_EQ(out.substr(out.size() - tail.size()), tail);
  EXPECT_EQ(logger.Error().Mode(), PrefixMode::PerLine);
}

TEST_F(LoggerIntegrationTest, EmptyFilenameThrowsConfigError)
{
  LoggerConfig config;
  config.directory = "logs";
  EXPECT_THROW(lvl_logger::NewLoggerAt(test_dir_, config), lvl_logger::ConfigError);
  EXPECT_THROW(lvl_logger::NewLogger(config), lvl_logger::ConfigError);
  EXPECT_FALSE(path_exists(test_dir_ + "/logs"));
}

TEST_F(LoggerIntegrationTest, InfoStartedGoesToConsoleAndFile)
{
  auto logger = lvl_logger::NewLoggerAt(test_dir_, make_config(true));

  testing::internal::CaptureStdout();
  logger.Info().Println("started");
  std::string out = testing::internal::GetCapturedStdout();

  EXPECT_EQ(out, "INFO started\n");
  EXPECT_EQ(read_file_contents(test_dir_ + "/logs/app.log"), "INFO started\n");
}

TEST_F(LoggerIntegrationTest, ConsoleAndFileLinesAreIdentical)
{
  auto include = FormatOptions::DateTime | FormatOptions::Loglevel |
                 FormatOptions::LongFileName;
  auto logger = LVL_NEW_LOGGER_AT(test_dir_, make_config(true, include));

  testing::internal::CaptureStdout();
  logger.Warn().Printf("disk usage at %d%%", 91);
  std::string out = testing::internal::GetCapturedStdout();

  EXPECT_FALSE(out.empty());
  EXPECT_EQ(out, read_file_contents(test_dir_ + "/logs/app.log"));
}

TEST_F(LoggerIntegrationTest, FileOnlyKeepsConsoleQuiet)
{
  auto logger = lvl_logger::NewLoggerAt(test_dir_, make_config(false));
  EXPECT_EQ(logger.Sink()->SinkCount(), 1u);

  testing::internal::CaptureStdout();
  logger.Debug().Println("quiet");
  std::string out = testing::internal::GetCapturedStdout();

  EXPECT_EQ(out, "");
  EXPECT_EQ(read_file_contents(test_dir_ + "/logs/app.log"), "DEBUG quiet\n");
}

TEST_F(LoggerIntegrationTest, AllFiveWritersUseTheirLabels)
{
  auto logger = lvl_logger::NewLoggerAt(test_dir_, make_config(false));
  logger.Debug().Println("d");
  logger.Info().Println("i");
  logger.Warn().Println("w");
  logger.Error().Println("e");
  logger.Trace().Println("t");
  logger.At(SeverityLevel::Info).Println("at");

  EXPECT_EQ(read_file_contents(test_dir_ + "/logs/app.log"),
            "DEBUG d\nINFO i\nWARN w\nERROR e\nTRACE t\nINFO at\n");
}

TEST_F(LoggerIntegrationTest, CreatesNestedDirectoriesAndAppends)
{
  LoggerConfig config;
  config.directory = "var/log/nested";
  config.filename = "svc.log";
  config.include = FormatOptions::None;

  std::string path = test_dir_ + "/var/log/nested/svc.log";
  {
    auto logger = lvl_logger::NewLoggerAt(test_dir_, config);
    logger.Info().Println("first run");
  }
  ASSERT_TRUE(path_exists(path));
  {
    auto logger = lvl_logger::NewLoggerAt(test_dir_, config);
    logger.Info().Println("second run");
  }
  EXPECT_EQ(read_file_contents(path), "first run\nsecond run\n");
}

TEST_F(LoggerIntegrationTest, EmptyDirectoryUsesWorkingDirectory)
{
  LoggerConfig config;
  config.filename = "root.log";
  config.include = FormatOptions::Loglevel;

  auto logger = lvl_logger::NewLoggerAt(test_dir_, config);
  logger.Trace().Println("here");
  EXPECT_EQ(read_file_contents(test_dir_ + "/root.log"), "TRACE here\n");
}

TEST_F(LoggerIntegrationTest, NewLoggerResolvesAgainstCurrentDirectory)
{
  char previous[4096];
  ASSERT_NE(::getcwd(previous, sizeof(previous)), nullptr);
  ASSERT_EQ(::chdir(test_dir_.c_str()), 0);

  {
    auto logger = lvl_logger::NewLogger(make_config(false));
    logger.Info().Println("relative");
  }

  ASSERT_EQ(::chdir(previous), 0);
  EXPECT_EQ(read_file_contents(test_dir_ + "/logs/app.log"), "INFO relative\n");
}

TEST_F(LoggerIntegrationTest, BlockedDirectoryThrowsFilesystemError)
{
  int fd = ::open((test_dir_ + "/logs").c_str(), O_WRONLY | O_CREAT, 0644);
  ASSERT_GE(fd, 0);
  ::close(fd);

  EXPECT_THROW(lvl_logger::NewLoggerAt(test_dir_, make_config(true)),
               lvl_logger::FilesystemError);
}

TEST_F(LoggerIntegrationTest, UnopenableFileThrowsFilesystemError)
{
  ASSERT_EQ(::mkdir((test_dir_ + "/logs").c_str(), 0755), 0);
  ASSERT_EQ(::mkdir((test_dir_ + "/logs/app.log").c_str(), 0755), 0);

  EXPECT_THROW(lvl_logger::NewLoggerAt(test_dir_, make_config(false)),
               lvl_logger::FilesystemError);
}

TEST_F(LoggerIntegrationTest, FrozenPrefixRecordsConstructionSite)
{
  auto include = FormatOptions::Loglevel | FormatOptions::ShortFileName;
  auto logger = LVL_NEW_LOGGER_AT(test_dir_, make_config(false, include));
  const uint32_t construction_line = __LINE__ - 1;

  logger.Info().Println("one");
  LVL_LOGLN(logger.Info(), "two");

  std::string prefix =
      "INFO test_logger_integration.cpp:" + std::to_string(construction_line) + " ";
  EXPECT_EQ(logger.Info().Prefix(), prefix);
  EXPECT_EQ(read_file_contents(test_dir_ + "/logs/app.log"),
            prefix + "one\n" + prefix + "two\n");
}

TEST_F(LoggerIntegrationTest, PlainNewLoggerAtRecordsCaller)
{
  auto include = FormatOptions::Loglevel | FormatOptions::ShortFileName;
  auto logger = lvl_logger::NewLoggerAt(test_dir_, make_config(false, include));
  const uint32_t construction_line = __LINE__ - 1;

  logger.Error().Println("boom");

  std::string prefix =
      "ERROR test_logger_integration.cpp:" + std::to_string(construction_line) + " ";
  EXPECT_EQ(logger.Error().Prefix(), prefix);
  EXPECT_EQ(read_file_contents(test_dir_ + "/logs/app.log"), prefix + "boom\n");
}

TEST_F(LoggerIntegrationTest, PlainNewLoggerRecordsCaller)
{
  char previous[4096];
  ASSERT_NE(::getcwd(previous, sizeof(previous)), nullptr);
  ASSERT_EQ(::chdir(test_dir_.c_str()), 0);

  auto config = make_config(false, FormatOptions::Loglevel | FormatOptions::ShortFileName);
  uint32_t construction_line = 0;
  {
    auto logger = lvl_logger::NewLogger(config);
    construction_line = __LINE__ - 1;
    logger.Info().Println("relative");
  }

  ASSERT_EQ(::chdir(previous), 0);
  EXPECT_EQ(read_file_contents(test_dir_ + "/logs/app.log"),
            "INFO test_logger_integration.cpp:" + std::to_string(construction_line) +
                " relative\n");
}

TEST_F(LoggerIntegrationTest, PerLineModeRefreshesCallSite)
{
  auto config = make_config(false, FormatOptions::Loglevel | FormatOptions::ShortFileName);
  config.prefix_mode = PrefixMode::PerLine;
  auto logger = lvl_logger::NewLoggerAt(test_dir_, config);

  LVL_LOGLN(logger.Warn(), "a");
  const uint32_t line_a = __LINE__ - 1;
  LVL_LOGLN(logger.Warn(), "b");
  const uint32_t line_b = __LINE__ - 1;
  logger.Warn().Println("c");
  const uint32_t line_c = __LINE__ - 1;

  EXPECT_EQ(read_file_contents(test_dir_ + "/logs/app.log"),
            "WARN test_logger_integration.cpp:" + std::to_string(line_a) + " a\n" +
                "WARN test_logger_integration.cpp:" + std::to_string(line_b) + " b\n" +
                "WARN test_logger_integration.cpp:" + std::to_string(line_c) + " c\n");
}

TEST_F(LoggerIntegrationTest, WriterOutlivesLogger)
{
  std::optional<lvl_logger::LevelWriter> writer;
  {
    auto logger = lvl_logger::NewLoggerAt(test_dir_, make_config(false));
    writer.emplace(logger.Error().Writer());
  }
  writer->Println("still open");
  EXPECT_EQ(read_file_contents(test_dir_ + "/logs/app.log"), "ERROR still open\n");
}

TEST_F(LoggerIntegrationTest, ConcurrentWritersNeverInterleave)
{
  auto logger = lvl_logger::NewLoggerAt(test_dir_, make_config(false));

  constexpr int kThreads = 4;
  constexpr int kLinesPerThread = 250;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t)
  {
    threads.emplace_back(
        [&logger, t]()
        {
          for (int i = 0; i < kLinesPerThread; ++i)
          {
            logger.At(lvl_logger::kAllLevels[t % 5]).Printf("thread=%d seq=%04d", t, i);
          }
        });
  }
  for (auto& th : threads)
  {
    th.join();
  }

  std::istringstream in(read_file_contents(test_dir_ + "/logs/app.log"));
  std::regex pattern(R"((DEBUG|INFO|WARN|ERROR) thread=\d seq=\d{4})");
  std::string line;
  int count = 0;
  while (std::getline(in, line))
  {
    EXPECT_TRUE(std::regex_match(line, pattern)) << "Corrupted line: " << line;
    ++count;
  }
  EXPECT_EQ(count, kThreads * kLinesPerThread);
}
