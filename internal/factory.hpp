#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/http/dispatcher.hpp"
#include "internal/ids/id_translator.hpp"
#include "internal/service/service_context.hpp"

namespace cirrus::factory {

/*
  Application

  Owns all long-lived objects of one gateway process.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  service::ServiceContext context;

  std::shared_ptr<service::ReadService>  read_service;
  std::shared_ptr<service::WriteService> write_service;
  std::shared_ptr<http::Gateway>         gateway;
};

/*
  Build

  Constructs the gateway of one service role from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and storage types.
*/
Application Build(const cirrus::runtime::config::RuntimeConfig& config, http::ServiceRole role);

std::shared_ptr<db::Repository> BuildRepository(const cirrus::runtime::config::RuntimeConfig& config);

// Inserts configured collections that do not exist yet.
void BootstrapCollections(db::Repository& repository, const cirrus::runtime::config::RuntimeConfig& config);

// Decodes the hex keys; throws std::runtime_error on malformed input.
ids::TranslatorKeys TranslatorKeysFromConfig(const cirrus::runtime::config::IdentifierConfig& config);

} // namespace cirrus::factory
