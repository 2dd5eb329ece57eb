#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "config/config.pb.h"
#include "internal/db/retry_policy.hpp"

namespace pgshadow::config {

struct DatabaseSettings {
  std::string connection_uri;
  std::size_t max_connections  = 4;
  std::string application_name = "pgshadow";
};

struct MigrationSettings {
  std::string work_schema    = "pgshadow";
  std::string archive_schema = "pgshadow_archive";
  bool        resume         = true;
};

struct BackfillSettings {
  uint32_t                  chunk_size = 1000;
  std::chrono::milliseconds pause{0};
};

struct ReplaySettings {
  uint32_t                  batch_size = 500;
  std::chrono::milliseconds poll_interval{200};
};

struct QuiescenceSettings {
  std::chrono::milliseconds window{2000};
  std::chrono::milliseconds poll_interval{250};
  // zero waits forever
  std::chrono::milliseconds max_wait{0};
};

struct CutoverSettings {
  std::chrono::milliseconds lock_timeout{2000};
  uint32_t                  max_attempts = 5;
  std::chrono::milliseconds retry_delay{1000};
};

/*
  Typed, defaulted view of RuntimeConfig.

  Zero / empty protobuf fields mean "use the default"; explicit booleans use
  proto3 `optional` so an explicit false is distinguishable from unset.
*/
struct Settings {
  DatabaseSettings   database;
  MigrationSettings  migration;
  BackfillSettings   backfill;
  ReplaySettings     replay;
  QuiescenceSettings quiescence;
  CutoverSettings    cutover;
  db::RetryOptions   retry;
};

// Applies defaults and validates ranges; throws util::ConfigError.
Settings ResolveSettings(const pgshadow::runtime::config::RuntimeConfig& config);

} // namespace pgshadow::config
