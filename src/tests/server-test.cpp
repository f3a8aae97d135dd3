// GTest
#include <gtest/gtest.h>

// Abseil
#include <absl/status/status.h>

// standard
#include <filesystem>
#include <iostream>
#include <optional>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

// rubus
#include <common/exceptions.hpp>
#include <rubus/util/settings.hpp>
#include <rubus/network/server.hpp>
#include <rubus/client/client.hpp>
#include <rubus/client/request-builder.hpp>
#include <rubus/media/filesystem-media-service.hpp>
#include <tests/media-directory.hpp>
#include <tests/test-credentials.hpp>

// proto
#include <protos/media/media.pb.h>

using namespace rubus;
using namespace std::chrono;

#define GTEST_COUT(chain) \
    std::cerr << "[INFO      ] " << chain << '\n';

namespace {

    const std::string MetropolisId = "123e4567-e89b-12d3-a456-426614174000";
    const std::string NosferatuId = "9b2f3c1e-5a7d-4e8f-9c0b-1d2e3f4a5b6c";

}

class ServerTest : public ::testing::Test {
protected:

    void SetUp() override {
        root = writeMediaDirectory("rubus-server-test", {
            {.id = MetropolisId, .title = "Metropolis", .duration = 4},
            {.id = NosferatuId, .title = "Nosferatu", .duration = 2}
        });
        media = FilesystemMediaService::configure({.rootDirectory = root});
        ASSERT_TRUE(media->init().ok());
    }

    void TearDown() override {
        if (server) {
            server->terminate();
        }
        if (runner.joinable()) {
            runner.join();
        }
        std::filesystem::remove_all(root);
    }

    void start(ServerSettings settings) {
        settings.bindAddress = "127.0.0.1";
        settings.listeningPort = 0;
        settings.requestTimeout = 50ms;

        auto created = Server::create(settings, media);
        ASSERT_TRUE(created.ok()) << created.status().ToString();
        server = *std::move(created);
        ASSERT_TRUE(server->port().has_value());
        GTEST_COUT("server listening on port " << *server->port());

        runner = std::thread(&Server::run, server.get());
    }

    void startSecure(bool required) {
        auto [certificate, key] = TestCredentials::get().writeTo(root.string());
        ServerSettings settings;
        settings.encryptionEnabled = true;
        settings.secureConnectionRequired = required;
        settings.certificateLocation = certificate;
        settings.privateKeyLocation = key;
        start(settings);
    }

    std::shared_ptr<Client> connect(bool handshake, bool encryption = true, bool fallback = true) {
        return Client::configure({
            .port = *server->port(),
            .handshake = handshake,
            .encryption = encryption,
            .allowPlaintextFallback = fallback
        });
    }

    void expectCatalogueServed(Client& client) {
        auto list = client.list();
        ASSERT_TRUE(list.ok()) << list.status().ToString();
        ASSERT_EQ(list->entries_size(), 2);

        auto filtered = client.list("^nos");
        ASSERT_TRUE(filtered.ok());
        ASSERT_EQ(filtered->entries_size(), 1);
        EXPECT_EQ(filtered->entries(0).id(), NosferatuId);

        auto info = client.info(MetropolisId);
        ASSERT_TRUE(info.ok()) << info.status().ToString();
        EXPECT_EQ(info->title(), "Metropolis");
        EXPECT_EQ(info->duration(), 4u);

        auto pieces = client.fetch(MetropolisId, 0, 2);
        ASSERT_TRUE(pieces.ok()) << pieces.status().ToString();
        EXPECT_EQ(pieces->id(), MetropolisId);
        EXPECT_EQ(pieces->starting_piece_index(), 0u);
        ASSERT_EQ(pieces->video_size(), 2);
        ASSERT_EQ(pieces->audio_size(), 2);
        EXPECT_EQ(pieces->video(1), videoClip(MetropolisId, 1));
        EXPECT_EQ(pieces->audio(0), audioClip(MetropolisId, 0));
    }

protected:
    std::filesystem::path root;
    std::shared_ptr<FilesystemMediaService> media;
    std::shared_ptr<Server> server;
    std::thread runner;
};

TEST_F(ServerTest, PlaintextClientIsServed) {
    start({});
    auto client = connect(false);

    expectCatalogueServed(*client);
    EXPECT_FALSE(client->secure());
    EXPECT_EQ(server->accepted(), 1u);
}

TEST_F(ServerTest, FetchScenarioOverRawRequest) {
    start({});
    auto client = connect(false);

    auto response = client->send(
        "request-type FETCH\n"
        "media-id 123e4567-e89b-12d3-a456-426614174000\n"
        "first-playback-piece 0\n"
        "number-playback-pieces 2\n"
        "body-length 0\n"
        "\n");
    EXPECT_EQ(response.type(), EResponseType::OK);

    auto pieces = response.decode<NRubus::TFetchedPieces>();
    ASSERT_TRUE(pieces.ok());
    EXPECT_EQ(pieces->id(), MetropolisId);
    EXPECT_EQ(pieces->video_size(), 2);
    EXPECT_EQ(pieces->audio_size(), 2);
}

TEST_F(ServerTest, ClientFaultsKeepConnectionOpen) {
    start({});
    auto client = connect(false);

    EXPECT_EQ(client->send(RequestBuilder::fetch(MetropolisId, 3, 2)).type(), EResponseType::BAD_REQUEST);
    EXPECT_EQ(client->send(RequestBuilder::info("not-an-id")).type(), EResponseType::BAD_REQUEST);
    EXPECT_EQ(client->send("request-type PLAY\nbody-length 0\n\n").type(), EResponseType::BAD_REQUEST);

    EXPECT_EQ(client->info(NosferatuId).status().code(), absl::StatusCode::kOk);
    EXPECT_EQ(server->accepted(), 1u);
}

TEST_F(ServerTest, SecureClientIsServed) {
    startSecure(false);
    auto client = connect(true);

    expectCatalogueServed(*client);
    EXPECT_TRUE(client->secure());
}

TEST_F(ServerTest, UnencryptedClientFallsBackToPlaintext) {
    startSecure(false);
    auto client = connect(true, false);

    expectCatalogueServed(*client);
    EXPECT_FALSE(client->secure());
}

TEST_F(ServerTest, RequiredEncryptionRejectsPlaintextPeer) {
    startSecure(true);

    auto strict = connect(true, false, false);
    EXPECT_THROW(strict->connect(), RubusHandshakeUnsupported);
    EXPECT_FALSE(strict->connected());

    // refused peer is closed by server, plaintext request does not get answer
    auto lenient = connect(true, false, true);
    EXPECT_THROW(lenient->list(), RubusException);

    auto secure = connect(true);
    EXPECT_TRUE(secure->list().ok());
    EXPECT_TRUE(secure->secure());
}

TEST_F(ServerTest, TerminateClosesClients) {
    start({});
    auto client = connect(false);
    ASSERT_TRUE(client->list().ok());

    server->terminate();
    runner.join();

    EXPECT_THROW(client->send(RequestBuilder::list()), RubusException);
}

TEST_F(ServerTest, LargeConnectionLimitIsServed) {
    ServerSettings settings;
    settings.openConnectionsLimit = 4096;
    start(settings);

    auto client = connect(false);
    EXPECT_TRUE(client->list().ok());
    EXPECT_EQ(server->manager()->openConnections(), 1u);
}
