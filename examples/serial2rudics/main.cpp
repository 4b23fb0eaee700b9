// Copyright (c) 2024 liudegui. MIT License.
//
// serial2rudics: bridge a glider's serial line to a dockserver's RUDICS
// port, connecting only while the glider is on the surface.
//
// Usage: serial2rudics <config.ini|.json|.yaml> [--verbose]

#include "rudics/bridge.hpp"
#include "rudics/bridge_config.hpp"
#include "rudics/config.hpp"
#include "rudics/log.hpp"
#include "rudics/serial_endpoint.hpp"
#include "rudics/session.hpp"
#include "rudics/shutdown.hpp"
#include "rudics/transcript.hpp"
#include "rudics/trigger.hpp"

#include <cstdio>
#include <cstring>
#include <utility>

static bool HasFlag(int argc, char* argv[], const char* flag) {
  for (int i = 2; i < argc; ++i) {
    if (std::strcmp(argv[i], flag) == 0) {
      return true;
    }
  }
  return false;
}

static void Usage(const char* prog) {
  std::fprintf(stderr, "usage: %s <config-file> [--verbose]\n", prog);
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    Usage(argv[0]);
    return 1;
  }

  rudics::log::Logger logger(rudics::log::Level::kInfo);

  rudics::MultiConfig store;
  auto load = store.LoadFile(argv[1]);
  if (!load) {
    RUDICS_LOG_ERROR(logger, "main", "cannot load config %s: %s", argv[1],
                     rudics::ConfigErrorName(load.get_error()));
    return 1;
  }

  auto parsed = rudics::LoadBridgeConfig(store, &logger);
  if (!parsed) {
    return 1;
  }
  rudics::BridgeConfig cfg = std::move(parsed.value());

  // -- Logging --
  logger.SetLevel(HasFlag(argc, argv, "--verbose") ? rudics::log::Level::kDebug
                                                   : cfg.log.level);
  if (!cfg.log.file.empty()) {
    auto r = logger.OpenFile(cfg.log.file.c_str(), cfg.log.max_bytes,
                             cfg.log.backup_count);
    if (!r) {
      RUDICS_LOG_ERROR(logger, "main", "cannot open log file %s", cfg.log.file.c_str());
      return 1;
    }
  }
  RUDICS_LOG_INFO(logger, "main", "serial2rudics starting, config %s", argv[1]);
  rudics::LogBridgeConfig(cfg, logger);

  // -- Triggers --
  auto triggers = rudics::TriggerSet::Compile(cfg.on_patterns, cfg.off_patterns);
  if (!triggers) {
    RUDICS_LOG_ERROR(logger, "main", "trigger pattern does not compile");
    return 1;
  }

  // -- Stop signal --
  rudics::StopSignal stop;
  if (!stop.IsValid() || !stop.InstallSignalHandlers()) {
    RUDICS_LOG_ERROR(logger, "main", "cannot install signal handlers");
    return 1;
  }

  // -- Transcript --
  rudics::Transcript transcript;
  if (!cfg.transcript_file.empty()) {
    if (!transcript.Open(cfg.transcript_file.c_str())) {
      RUDICS_LOG_ERROR(logger, "main", "cannot open transcript %s",
                       cfg.transcript_file.c_str());
      return 1;
    }
  }

  // -- Endpoints --
  rudics::SerialEndpoint serial(cfg.serial, logger);
  if (!serial.Open()) {
    return 1;
  }
  rudics::SessionController session(cfg.session, cfg.client,
                                    std::move(triggers.value()), logger);

  rudics::BridgeLoop loop(serial, session, logger,
                          transcript.IsOpen() ? &transcript : nullptr);
  if (!loop.SetStopFd(stop.ReadFd())) {
    return 1;
  }

  auto result = loop.Run();
  if (!result) {
    RUDICS_LOG_ERROR(logger, "main", "bridge loop failed");
    return 1;
  }
  if (result.value() == rudics::LoopExit::kStopped) {
    RUDICS_LOG_INFO(logger, "main", "stopped by signal %d", stop.Signal());
  } else {
    RUDICS_LOG_INFO(logger, "main", "serial line closed, exiting");
  }
  return 0;
}
