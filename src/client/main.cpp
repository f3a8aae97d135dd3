// Abseil
#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/status/statusor.h>

// standard
#include <iostream>
#include <optional>
#include <cstdint>
#include <string>

// plog
#include <plog/Log.h>
#include <plog/Severity.h>
#include <plog/Init.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Appenders/ConsoleAppender.h>

// rubus
#include <common/exceptions.hpp>
#include <rubus/macros.hpp>
#include <rubus/client/client.hpp>

ABSL_FLAG(std::string, host, "127.0.0.1", "server host");
ABSL_FLAG(std::uint16_t, port, static_cast<std::uint16_t>(rubus::DefaultPort), "server port");
ABSL_FLAG(bool, handshake, false, "server runs secure listener");
ABSL_FLAG(bool, encryption, true, "declare encryption support during handshake");
ABSL_FLAG(bool, verbose, false, "log client internals");
ABSL_FLAG(std::optional<std::string>, list, std::nullopt, "list media with title matching pattern");
ABSL_FLAG(std::optional<std::string>, info, std::nullopt, "describe media with given id");
ABSL_FLAG(std::optional<std::string>, fetch, std::nullopt, "fetch pieces of media with given id");
ABSL_FLAG(std::uint32_t, first, 0, "first piece to fetch");
ABSL_FLAG(std::uint32_t, count, 1, "number of pieces to fetch");

namespace {

    template<typename TMessage>
    int report(const absl::StatusOr<TMessage>& result) {
        if (!result.ok()) {
            std::cerr << "request failed: " << result.status().ToString() << "\n";
            return 1;
        }
        std::cout << result->DebugString();
        return 0;
    }

}

int main(int argc, char** argv) {
    absl::ParseCommandLine(argc, argv);

    static plog::ConsoleAppender<plog::TxtFormatter> appender;
    plog::init((absl::GetFlag(FLAGS_verbose)) ? plog::Severity::debug : plog::Severity::warning, &appender);

    auto client = rubus::Client::configure({
        .host = absl::GetFlag(FLAGS_host),
        .port = absl::GetFlag(FLAGS_port),
        .handshake = absl::GetFlag(FLAGS_handshake),
        .encryption = absl::GetFlag(FLAGS_encryption)
    });

    try {
        client->connect();
        int code = 0;
        if (auto pattern = absl::GetFlag(FLAGS_list); pattern.has_value()) {
            code |= report(client->list(*pattern));
        }
        if (auto id = absl::GetFlag(FLAGS_info); id.has_value()) {
            code |= report(client->info(*id));
        }
        if (auto id = absl::GetFlag(FLAGS_fetch); id.has_value()) {
            auto pieces = client->fetch(*id, absl::GetFlag(FLAGS_first), absl::GetFlag(FLAGS_count));
            if (!pieces.ok()) {
                std::cerr << "request failed: " << pieces.status().ToString() << "\n";
                code |= 1;
            } else {
                std::cout << "media " << pieces->id() << " from piece " << pieces->starting_piece_index() 
                    << ": " << pieces->video_size() << " video and " << pieces->audio_size() << " audio clips\n";
            }
        }
        client->close();
        return code;
    } catch (const rubus::RubusException& error) {
        std::cerr << "connection failed: " << error.what() << "\n";
        return 1;
    }
}
