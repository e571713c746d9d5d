#include <lvl_logger/logger.hpp>

#include <cstdio>
#include <thread>

int main()
{
  // --- Console-only logger (no config) ---

  auto console = lvl_logger::NewLogger();
  console.Info().Println("console logger ready");
  LVL_LOGF(console.Debug(), "debug value: %d", 42);

  // --- File logger, echoed to stdout ---

  lvl_logger::LoggerConfig config;
  config.directory = "logs";
  config.filename = "basic_example.log";
  config.echo_stdout = true;
  config.include = lvl_logger::FormatOptions::DateTime | lvl_logger::FormatOptions::Loglevel |
                   lvl_logger::FormatOptions::ShortFileName;

  try
  {
    auto logger = LVL_NEW_LOGGER(config);

    logger.Trace().Println("application started");
    logger.Info().Printf("hello %s, version %s", "world", "1.0");
    logger.Warn().Printf("disk usage at %d%%", 85);
    logger.Error().Print("connection failed: ", "timeout");

    // --- Per-line prefixes ---

    config.filename = "basic_example_per_line.log";
    config.prefix_mode = lvl_logger::PrefixMode::PerLine;
    auto live = LVL_NEW_LOGGER(config);
    LVL_LOGF(live.Info(), "this line carries its own call site");

    // --- Multi-thread demo ---

    auto worker = [&logger](int id)
    {
      for (int i = 0; i < 5; ++i)
      {
        logger.Info().Printf("task %d processing step %d", id, i);
      }
    };

    std::thread t1(worker, 1);
    std::thread t2(worker, 2);
    t1.join();
    t2.join();

    logger.Info().Println("shutting down");
    logger.Flush();
  }
  catch (const lvl_logger::LoggerError& e)
  {
    console.Error().Printf("logger setup failed: %s", e.what());
    return 1;
  }

  std::printf("Example finished. Check ./logs/basic_example.log\n");
  return 0;
}
