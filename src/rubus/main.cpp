// boost
#include <boost/asio/post.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/error_code.hpp>

// Abseil
#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/ascii.h>

// nlohmann_json
#include <nlohmann/json.hpp>

// standard
#include <iostream>
#include <optional>
#include <csignal>
#include <memory>
#include <string>
#include <thread>

// plog
#include <plog/Log.h>
#include <plog/Severity.h>
#include <plog/Initializers/RollingFileInitializer.h>

// rubus
#include <rubus/util/config-loader.hpp>
#include <rubus/util/settings.hpp>
#include <rubus/network/server.hpp>
#include <rubus/media/filesystem-media-service.hpp>

ABSL_FLAG(std::optional<std::string>, runtime_dir, std::nullopt,
    "runtime directory for logs and configs");

int main(int argc, char** argv) {
    absl::ParseCommandLine(argc, argv);

    std::string runtimeDirectory;
    if (std::optional<std::string> flag = absl::GetFlag(FLAGS_runtime_dir); flag.has_value()) {
        runtimeDirectory = flag.value();
    } else {
        std::cerr << "no runtime directory provided!\n";
        return 1;
    }

    auto logDirectory = absl::StrCat(runtimeDirectory, "/server.log");
    plog::init(plog::Severity::debug, logDirectory.c_str(), 1024 * 1024, 2);
    PLOG(plog::info) << "using runtime directory: " << runtimeDirectory;

    auto context = std::make_shared<boost::asio::io_context>();

    auto configHandler = rubus::ConfigHandler::configure(runtimeDirectory, context);
    PLOG(plog::debug) << "module created: " << "ConfigHandler; instance: " << configHandler.get();

    if (auto result = configHandler->init(); !result.ok()) {
        PLOG(plog::error) << "error: " << result.message();
        return 1;
    }

    auto serverSettings = rubus::ServerSettings::fromJson(configHandler->defaultSection("server"));
    if (!serverSettings.ok()) {
        PLOG(plog::error) << "invalid server section: " << serverSettings.status().message();
        return 1;
    }
    auto mediaSettings = rubus::MediaSettings::fromJson(configHandler->defaultSection("media"));
    if (!mediaSettings.ok()) {
        PLOG(plog::error) << "invalid media section: " << mediaSettings.status().message();
        return 1;
    }

    auto media = rubus::FilesystemMediaService::configure({.rootDirectory = mediaSettings->rootDirectory});
    if (auto result = media->init(); !result.ok()) {
        PLOG(plog::error) << "error: " << result.message();
        return 1;
    }
    PLOG(plog::debug) << "module created: " << "FilesystemMediaService; instance: " << media.get();

    auto server = rubus::Server::create(*serverSettings, media);
    if (!server.ok()) {
        PLOG(plog::error) << "error: " << server.status().message();
        return 1;
    }
    PLOG(plog::debug) << "module created: " << "Server; instance: " << server->get();

    configHandler->subscribeOnDynamicConfig("logging", [](const nlohmann::json& section) {
        if (!section.is_object() || !section.contains("severity") || !section["severity"].is_string()) {
            return;
        }
        std::string severity = absl::AsciiStrToUpper(section["severity"].get<std::string>());
        plog::Severity parsed = plog::severityFromString(severity.c_str());
        if (parsed == plog::Severity::none && severity != "NONE") {
            PLOG(plog::warning) << "unknown logging severity: " << severity;
            return;
        }
        plog::get()->setMaxSeverity(parsed);
        PLOG(plog::info) << "logging severity set to " << severity;
    }, *server);

    boost::asio::signal_set signals (*context, SIGINT, SIGTERM);
    signals.async_wait([server = *server](const boost::system::error_code& error, int signal) {
        if (error) {
            return;
        }
        PLOG(plog::info) << "received signal " << signal << ", shutting down";
        server->terminate();
    });

    std::thread contextThread ([context]() {
        context->run();
    });

    (*server)->run();

    boost::asio::post(*context, [&signals]() {
        signals.cancel();
    });
    configHandler->terminate();
    contextThread.join();

    return 0;
}
