#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "api/ApiServer.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "core/TemplateBinder.hpp"
#include "core/TemplateParser.hpp"

// Startup sequence for template-binder-server

int main() {
  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = tpl::common::Config::load();

    // Initialize logger with configured level
    tpl::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = tpl::common::Logger::get();
    spLog->info("Step 1: Configuration loaded successfully");

    // ── Step 2: Template parser and binder ───────────────────────────────
    auto tpParser =
        std::make_unique<tpl::core::TemplateParser>(static_cast<size_t>(cfgApp.iMaxTemplateBytes));
    auto tbBinder = std::make_unique<tpl::core::TemplateBinder>(
        tpl::core::BindOptions::fromConfig(cfgApp));
    spLog->info("Step 2: TemplateBinder ready (resource group={}, location={}, mode={})",
                cfgApp.sResourceGroup, cfgApp.sLocation, cfgApp.sDeploymentMode);

    // ── Step 3: API routes ───────────────────────────────────────────────
    auto apiServer = std::make_unique<tpl::api::ApiServer>(*tpParser, *tbBinder);
    apiServer->registerRoutes();
    spLog->info("Step 3: API routes registered");

    // ── Step 4: HTTP server ──────────────────────────────────────────────
    spLog->info("Step 4: template-binder-server listening on port {} ({} threads)",
                cfgApp.iHttpPort, cfgApp.iHttpThreads);
    apiServer->start(cfgApp.iHttpPort, cfgApp.iHttpThreads);

    spLog->info("HTTP server stopped");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] startup failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
