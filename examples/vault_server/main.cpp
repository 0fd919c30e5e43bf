//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Vault MCP server over HTTP/HTTPS
//==========================================================================================================

#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "logging/Logger.h"
#include "vaultmcp/Config.h"
#include "vaultmcp/VaultServer.h"
#include "vaultmcp/version.h"

using namespace vaultmcp;

int main(int argc, char** argv) {
    FUNC_SCOPE();
    ServerConfig cfg;
    try {
        cfg = LoadConfigFromEnv();
        std::vector<std::string> args(argv + 1, argv + argc);
        if (!ApplyCommandLine(cfg, args)) {
            std::cout << UsageText();
            return 0;
        }
        cfg.Validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Configuration error: " << e.what() << "\n" << UsageText();
        return 2;
    }

    Logger::setLogLevel(Logger::toLogLevel(Logger::levelFromString(cfg.logLevel)));
    if (!cfg.logFile.empty()) {
        Logger::setLogFile(cfg.logFile);
    }
    LOG_INFO("Starting {} {}", SERVER_NAME, getVersionString());

    try {
        VaultServer server(cfg);
        server.Start();

        // Block until SIGINT/SIGTERM, then stop in order
        boost::asio::io_context signals;
        boost::asio::signal_set set(signals, SIGINT, SIGTERM);
        set.async_wait([](const boost::system::error_code& ec, int sig) {
            if (!ec) {
                LOG_INFO("Received signal {}; shutting down", sig);
            }
        });
        signals.run();
        server.Stop();
    } catch (const std::exception& e) {
        LOG_ERROR("Vault server failed: {}", e.what());
        return 1;
    }
    return 0;
}
