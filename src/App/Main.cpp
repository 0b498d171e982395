/*
 * PhishGuard - Offline Phishing URL Classification Engine
 * Copyright (C) 2026 PhishGuard Contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
/**
 * @file Main.cpp
 * @brief phishguard command-line front end.
 *
 * Decides each URL given on the command line (or one per line on stdin)
 * and prints one JSON decision per line on stdout. Logs go to stderr.
 */

#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "../Config/EngineConfig.hpp"
#include "../Decision/DecisionEngine.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"
#include "../Utils/StringUtils.hpp"

using namespace PhishGuard;

namespace {

struct CommandLine {
    std::optional<std::string> configPath;
    std::optional<std::string> modelPath;
    std::optional<std::string> metadataPath;
    std::optional<std::string> storePath;
    std::optional<std::string> profile;
    std::optional<std::string> logLevel;
    std::vector<std::string> whitelistAdd;
    std::vector<std::string> whitelistRemove;
    std::vector<std::string> urls;
    bool stats = false;
    bool help = false;
};

void PrintUsage(const char* argv0) {
    std::cerr
        << "Usage: " << argv0 << " [options] [url...]\n"
        << "\n"
        << "Options:\n"
        << "  --config <file>            Engine configuration (JSON)\n"
        << "  --model <file>             Model artifact (overrides config)\n"
        << "  --metadata <file>          Model metadata (overrides config)\n"
        << "  --store <file>             State store (overrides config)\n"
        << "  --whitelist-add <domain>   Trust a domain (repeatable)\n"
        << "  --whitelist-remove <domain>\n"
        << "  --profile <name>           conservative | balanced | aggressive\n"
        << "  --log-level <level>        trace | debug | info | warn | error | fatal\n"
        << "  --stats                    Print engine statistics after processing\n"
        << "  -h, --help\n"
        << "\n"
        << "Without URL arguments, URLs are read from stdin, one per line.\n";
}

bool ParseCommandLine(int argc, char** argv, CommandLine& out) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto value = [&](std::optional<std::string>& target) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            target = argv[++i];
            return true;
        };
        auto append = [&](std::vector<std::string>& target) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            target.emplace_back(argv[++i]);
            return true;
        };

        bool ok = true;
        if (arg == "--config") ok = value(out.configPath);
        else if (arg == "--model") ok = value(out.modelPath);
        else if (arg == "--metadata") ok = value(out.metadataPath);
        else if (arg == "--store") ok = value(out.storePath);
        else if (arg == "--profile") ok = value(out.profile);
        else if (arg == "--log-level") ok = value(out.logLevel);
        else if (arg == "--whitelist-add") ok = append(out.whitelistAdd);
        else if (arg == "--whitelist-remove") ok = append(out.whitelistRemove);
        else if (arg == "--stats") out.stats = true;
        else if (arg == "-h" || arg == "--help") out.help = true;
        else if (Utils::StringUtils::StartsWith(arg, "--")) {
            std::cerr << "Unknown option " << arg << "\n";
            ok = false;
        }
        else out.urls.push_back(arg);

        if (!ok) return false;
    }
    return true;
}

int Run(const CommandLine& cmd) {
    Config::EngineConfig config;
    if (cmd.configPath) {
        Core::Error err;
        auto loaded = Config::EngineConfig::LoadFromFile(*cmd.configPath, &err);
        if (!loaded) {
            std::cerr << "Invalid configuration: " << err.ToString() << "\n";
            return 2;
        }
        config = std::move(*loaded);
    }
    if (cmd.modelPath) config.modelPath = *cmd.modelPath;
    if (cmd.metadataPath) config.metadataPath = *cmd.metadataPath;
    if (cmd.storePath) config.storagePath = *cmd.storePath;
    if (cmd.logLevel) config.logging.minimalLevel = Utils::ParseLogLevel(*cmd.logLevel);

    if (config.modelPath.empty() || config.metadataPath.empty()) {
        std::cerr << "A model and its metadata are required (--config or --model/--metadata)\n";
        return 2;
    }

    config.logging.toConsole = true;
    Utils::Logger::Instance().Initialize(config.logging);

    Decision::DecisionEngine engine(config);
    Core::Error err;
    if (!engine.Initialize(&err)) {
        std::cerr << "Initialization failed: " << err.ToString() << "\n";
        return 3;
    }

    int status = 0;

    if (cmd.profile && !engine.GetThresholdManager().SetProfile(*cmd.profile, &err)) {
        std::cerr << err.ToString() << "\n";
        return 2;
    }
    for (const auto& domain : cmd.whitelistAdd) {
        if (!engine.GetWhitelist().Add(domain, &err)) {
            std::cerr << "Cannot whitelist '" << domain << "': " << err.ToString() << "\n";
            status = 1;
            err.clear();
        }
    }
    for (const auto& domain : cmd.whitelistRemove) {
        if (!engine.GetWhitelist().Remove(domain, &err) && err.hasError()) {
            std::cerr << "Cannot remove '" << domain << "': " << err.ToString() << "\n";
            status = 1;
            err.clear();
        }
    }

    auto decide = [&engine](const std::string& url) {
        std::cout << engine.Decide(url).ToJsonLine() << "\n";
    };

    if (!cmd.urls.empty()) {
        for (const auto& url : cmd.urls) {
            decide(url);
        }
    } else if (cmd.whitelistAdd.empty() && cmd.whitelistRemove.empty() && !cmd.profile && !cmd.stats) {
        std::string line;
        while (std::getline(std::cin, line)) {
            const auto trimmed = Utils::StringUtils::TrimAscii(line);
            if (trimmed.empty()) continue;
            decide(std::string(trimmed));
        }
    }

    if (cmd.stats) {
        Utils::JSON::StringifyOptions opt;
        opt.pretty = true;
        std::string text;
        if (Utils::JSON::Stringify(engine.GetStatistics().ToJson(), text, opt)) {
            std::cout << text << "\n";
        }
    }

    if (!engine.Save(&err)) {
        std::cerr << "Failed to persist state: " << err.ToString() << "\n";
        status = 1;
    }
    return status;
}

}  // namespace

int main(int argc, char** argv) {
    CommandLine cmd;
    if (!ParseCommandLine(argc, argv, cmd)) {
        PrintUsage(argv[0]);
        return 2;
    }
    if (cmd.help) {
        PrintUsage(argv[0]);
        return 0;
    }

    int result = 0;
    try {
        result = Run(cmd);
    }
    catch (const std::exception& ex) {
        std::cerr << "[FATAL] " << ex.what() << "\n";
        result = 1;
    }

    Utils::Logger::Instance().ShutDown();
    return result;
}
