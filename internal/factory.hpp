#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/gc/orphan_collector.hpp"

namespace catalog::factory {

/*
  Application

  Owns the long-lived objects of one catalog-gc process.
*/
struct Application {
  std::shared_ptr<db::Repository>     repository;
  std::shared_ptr<gc::OrphanCollector> collector;
};

/*
  BuildRepository

  NOTE:
  This is the ONLY place allowed to know concrete DB types. The schema is
  bootstrapped (idempotently) before the repository is returned.
*/
std::shared_ptr<db::Repository> BuildRepository(const catalog::runtime::config::RuntimeConfig& config);

Application Build(const catalog::runtime::config::RuntimeConfig& config);

} // namespace catalog::factory
