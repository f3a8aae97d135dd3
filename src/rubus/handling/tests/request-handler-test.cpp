// GTest
#include <gtest/gtest.h>
#include <gmock/gmock.h>

// Abseil
#include <absl/status/status.h>
#include <absl/strings/str_cat.h>

// standard
#include <string_view>
#include <iostream>
#include <optional>
#include <future>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <mutex>

// rubus
#include <common/exceptions.hpp>
#include <rubus/macros.hpp>
#include <rubus/protocol/request.hpp>
#include <rubus/protocol/eager-request-parser.hpp>
#include <rubus/protocol/lazy-request-parser.hpp>
#include <rubus/protocol/header-scanner.hpp>
#include <rubus/auth/default-authenticator.hpp>
#include <rubus/handling/request-handler.hpp>
#include <rubus/handling/request-processor.hpp>
#include <rubus/secure/secure-session.hpp>
#include <rubus/secure/crypto.hpp>
#include <tests/memory-socket.hpp>
#include <tests/mocked-media-service.hpp>
#include <tests/test-credentials.hpp>

// proto
#include <protos/media/media.pb.h>

using namespace rubus;
using namespace std::chrono;
using ::testing::_;
using ::testing::Return;

#define GTEST_COUT(chain) \
    std::cerr << "[INFO      ] " << chain << '\n';

namespace {

    const std::string MediaId = "123e4567-e89b-12d3-a456-426614174000";

    constexpr std::string_view FetchRequest = 
        "request-type FETCH\n"
        "media-id 123e4567-e89b-12d3-a456-426614174000\n"
        "first-playback-piece 0\n"
        "number-playback-pieces 2\n"
        "body-length 0\n"
        "\n";

    struct ReceivedResponse {
        std::string header;
        std::string body;

        std::optional<std::string> field(std::string_view key) const {
            HeaderScanner scanner (header);
            while (auto line = scanner.next()) {
                if (line->wellFormed && line->key == key) {
                    return std::string(line->value);
                }
            }
            return std::nullopt;
        }
    };

    ReceivedResponse readResponse(ISocket& socket) {
        std::string raw;
        char chunk[512];
        while (!completeMessageSize(raw)) {
            std::size_t received = socket.read(chunk, sizeof chunk, 1000ms);
            raw.append(chunk, received);
        }

        std::size_t total = *completeMessageSize(raw);
        std::size_t header = raw.find(HeaderTerminator) + HeaderTerminator.size();
        EXPECT_EQ(total, raw.size()) << "unexpected trailing bytes";
        return ReceivedResponse{.header = raw.substr(0, header), .body = raw.substr(header, total - header)};
    }

    bool pipeIsEmpty(const std::shared_ptr<MemoryPipe>& pipe) {
        std::unique_lock<std::mutex> locked(pipe->lock);
        return pipe->data.empty();
    }

    void send(MemorySocket& socket, std::string_view data) {
        socket.write(data.data(), data.size());
    }

    // peer keeps reading but writes nothing more
    void shutdownWrite(const std::shared_ptr<MemoryPipe>& pipe) {
        {
            std::unique_lock<std::mutex> locked(pipe->lock);
            pipe->writerClosed = true;
        }
        pipe->cv.notify_all();
    }

    class RecordingMaster : public IHandlerMaster {
    public:
        void onHandlerDone(std::shared_ptr<RequestHandler> handler) override {
            last = handler;
            outcomes.push_back(handler->outcome());
        }

        std::shared_ptr<RequestHandler> last;
        std::vector<RequestHandler::EOutcome> outcomes;
    };

}

class RequestHandlerTest : public ::testing::Test {
protected:

    void SetUp() override {
        media = std::make_shared<MockedMediaService>();
        processor = RequestProcessor::configure(
            media, 
            std::make_shared<DefaultAuthenticator>(), 
            std::make_shared<BasicViewerAuthorizer>());
        master = std::make_shared<RecordingMaster>();
        handler = RequestHandler::configure(
            processor, 
            std::make_unique<EagerRequestParser>(), 
            master, 
            {.requestTimeout = 50ms, .maxRequestSize = 1024});

        sockets = makeMemorySocketPair();
        handler->assign(sockets.server);
    }

    RequestHandler::EOutcome runOnce() {
        handler->run();
        EXPECT_EQ(master->last, handler);
        return master->outcomes.back();
    }

    std::shared_ptr<MockedMediaService> media;
    std::shared_ptr<RequestProcessor> processor;
    std::shared_ptr<RecordingMaster> master;
    std::shared_ptr<RequestHandler> handler;
    MemorySocketPair sockets;
};

TEST_F(RequestHandlerTest, FetchReturnsRequestedPieces) {
    EXPECT_CALL(*media, fetch(MediaId, 0u, 2u))
        .WillOnce(Return(MediaClips{.video = {"v0", "v1"}, .audio = {"a0", "a1"}}));

    send(*sockets.client, FetchRequest);
    EXPECT_EQ(runOnce(), RequestHandler::EOutcome::SUCCESS);

    auto response = readResponse(*sockets.client);
    GTEST_COUT("response header: " << response.header);
    EXPECT_EQ(response.field("response-type"), "OK");
    EXPECT_EQ(response.field("serialized-object"), "NRubus.TFetchedPieces");
    EXPECT_EQ(response.field("body-length"), std::to_string(response.body.size()));

    NRubus::TFetchedPieces pieces;
    ASSERT_TRUE(pieces.ParseFromString(response.body));
    EXPECT_EQ(pieces.id(), MediaId);
    EXPECT_EQ(pieces.starting_piece_index(), 0u);
    ASSERT_EQ(pieces.video_size(), 2);
    ASSERT_EQ(pieces.audio_size(), 2);
    EXPECT_EQ(pieces.video(1), "v1");
    EXPECT_EQ(pieces.audio(0), "a0");
    EXPECT_EQ(handler->served(), 1u);
}

TEST_F(RequestHandlerTest, ListDefaultsToAnyTitle) {
    EXPECT_CALL(*media, list(".*"))
        .WillOnce(Return(std::vector<MediaEntry>{{.id = MediaId, .title = "Nosferatu"}}));

    send(*sockets.client, "request-type LIST\nbody-length 0\n\n");
    EXPECT_EQ(runOnce(), RequestHandler::EOutcome::SUCCESS);

    auto response = readResponse(*sockets.client);
    NRubus::TMediaList list;
    ASSERT_TRUE(list.ParseFromString(response.body));
    ASSERT_EQ(list.entries_size(), 1);
    EXPECT_EQ(list.entries(0).title(), "Nosferatu");
}

TEST_F(RequestHandlerTest, ListPassesPattern) {
    EXPECT_CALL(*media, list("star wars"))
        .WillOnce(Return(std::vector<MediaEntry>{}));

    send(*sockets.client, "request-type LIST\ntitle-contains star wars\nbody-length 0\n\n");
    EXPECT_EQ(runOnce(), RequestHandler::EOutcome::SUCCESS);
    EXPECT_EQ(readResponse(*sockets.client).field("response-type"), "OK");
}

TEST_F(RequestHandlerTest, InfoNormalizesMediaId) {
    EXPECT_CALL(*media, info(MediaId))
        .WillOnce(Return(MediaDescription{.id = MediaId, .title = "Nosferatu", .duration = 94}));

    send(*sockets.client, "request-type INFO\nmedia-id 123E4567-E89B-12D3-A456-426614174000\nbody-length 0\n\n");
    EXPECT_EQ(runOnce(), RequestHandler::EOutcome::SUCCESS);

    NRubus::TMediaInfo info;
    ASSERT_TRUE(info.ParseFromString(readResponse(*sockets.client).body));
    EXPECT_EQ(info.duration(), 94u);
}

TEST_F(RequestHandlerTest, ClientFaultsAreBadRequests) {
    EXPECT_CALL(*media, info(_)).WillOnce(Return(absl::NotFoundError("no such media")));
    EXPECT_CALL(*media, fetch(_, _, _)).WillOnce(Return(absl::OutOfRangeError("too far")));

    for (std::string_view request : {
        std::string_view("request-type STREAM\nbody-length 0\n\n"),
        std::string_view("request-type INFO\nbody-length 0\n\n"),
        std::string_view("request-type INFO\nmedia-id not-a-uuid\nbody-length 0\n\n"),
        std::string_view("request-type INFO\nmedia-id 123e4567-e89b-12d3-a456-426614174000\nbody-length 0\n\n"),
        std::string_view("request-type FETCH\nmedia-id 123e4567-e89b-12d3-a456-426614174000\nfirst-playback-piece -1\nnumber-playback-pieces 2\nbody-length 0\n\n"),
        std::string_view("request-type FETCH\nmedia-id 123e4567-e89b-12d3-a456-426614174000\nfirst-playback-piece 0\nnumber-playback-pieces 0\nbody-length 0\n\n"),
        std::string_view("request-type FETCH\nmedia-id 123e4567-e89b-12d3-a456-426614174000\nfirst-playback-piece 2147483647\nnumber-playback-pieces 1\nbody-length 0\n\n"),
        std::string_view("request-type FETCH\nmedia-id 123e4567-e89b-12d3-a456-426614174000\nfirst-playback-piece x\nnumber-playback-pieces 1\nbody-length 0\n\n"),
        std::string_view("request-type FETCH\nmedia-id 123e4567-e89b-12d3-a456-426614174000\nfirst-playback-piece 5\nnumber-playback-pieces 1\nbody-length 0\n\n"),
    }) {
        send(*sockets.client, request);
        // connection stays usable after each failure
        ASSERT_EQ(runOnce(), RequestHandler::EOutcome::SUCCESS) << request;

        auto response = readResponse(*sockets.client);
        EXPECT_EQ(response.header, "response-type BAD_REQUEST\nbody-length 0\n\n") << request;
        EXPECT_TRUE(response.body.empty());
    }
}

TEST_F(RequestHandlerTest, ServerFaultsAreServerErrors) {
    EXPECT_CALL(*media, fetch(MediaId, 0u, 2u)).WillOnce(Return(absl::InternalError("disk is gone")));

    send(*sockets.client, FetchRequest);
    EXPECT_EQ(runOnce(), RequestHandler::EOutcome::SUCCESS);
    EXPECT_EQ(readResponse(*sockets.client).header, "response-type SERVER_ERROR\nbody-length 0\n\n");
}

TEST_F(RequestHandlerTest, IdleConnectionTimesOutWithoutResponse) {
    auto started = steady_clock::now();
    EXPECT_EQ(runOnce(), RequestHandler::EOutcome::TIMED_OUT);
    EXPECT_GE(steady_clock::now() - started, 40ms);
    EXPECT_TRUE(pipeIsEmpty(sockets.downstream));
}

TEST_F(RequestHandlerTest, PeerCloseIsReported) {
    sockets.client->close();
    EXPECT_EQ(runOnce(), RequestHandler::EOutcome::CLOSED);
}

TEST_F(RequestHandlerTest, IncompleteRequestIsKeptAcrossTimeout) {
    EXPECT_CALL(*media, fetch(MediaId, 0u, 2u))
        .WillOnce(Return(MediaClips{.video = {"v0", "v1"}, .audio = {"a0", "a1"}}));

    send(*sockets.client, FetchRequest.substr(0, 30));
    EXPECT_EQ(runOnce(), RequestHandler::EOutcome::TIMED_OUT);
    EXPECT_TRUE(pipeIsEmpty(sockets.downstream));

    send(*sockets.client, FetchRequest.substr(30));
    EXPECT_EQ(runOnce(), RequestHandler::EOutcome::SUCCESS);
    EXPECT_EQ(readResponse(*sockets.client).field("response-type"), "OK");
}

TEST_F(RequestHandlerTest, PipelinedRequestsAreServedInOrder) {
    EXPECT_CALL(*media, list(".*")).WillOnce(Return(std::vector<MediaEntry>{}));
    EXPECT_CALL(*media, info(_)).WillOnce(Return(absl::NotFoundError("no such media")));

    send(*sockets.client, absl::StrCat(
        "request-type LIST\nbody-length 0\n\n",
        "request-type INFO\nmedia-id 123e4567-e89b-12d3-a456-426614174000\nbody-length 0\n\n"));

    EXPECT_EQ(runOnce(), RequestHandler::EOutcome::SUCCESS);
    EXPECT_EQ(readResponse(*sockets.client).field("response-type"), "OK");
    EXPECT_EQ(runOnce(), RequestHandler::EOutcome::SUCCESS);
    EXPECT_EQ(readResponse(*sockets.client).field("response-type"), "BAD_REQUEST");
    EXPECT_EQ(handler->served(), 2u);
}

TEST_F(RequestHandlerTest, RequestCutByEndOfStreamIsAnswered) {
    send(*sockets.client, "request-type INFO\nmedia-id 123e4567");
    shutdownWrite(sockets.upstream);

    EXPECT_EQ(runOnce(), RequestHandler::EOutcome::CLOSED);
    EXPECT_EQ(readResponse(*sockets.client).header, "response-type BAD_REQUEST\nbody-length 0\n\n");
}

TEST_F(RequestHandlerTest, OversizedRequestDropsConnection) {
    send(*sockets.client, "request-type LIST\ntitle-contains ");
    send(*sockets.client, std::string(2048, 'x'));

    EXPECT_EQ(runOnce(), RequestHandler::EOutcome::EXCEPTION);
    EXPECT_EQ(readResponse(*sockets.client).header, "response-type BAD_REQUEST\nbody-length 0\n\n");
}

TEST_F(RequestHandlerTest, BrokenTransportIsException) {
    sockets.server->close();
    EXPECT_EQ(runOnce(), RequestHandler::EOutcome::EXCEPTION);
}

TEST_F(RequestHandlerTest, DetachResetsConnectionState) {
    EXPECT_THROW(handler->assign(makeMemorySocketPair().server), RubusBadInit);

    send(*sockets.client, FetchRequest.substr(0, 30));
    EXPECT_EQ(runOnce(), RequestHandler::EOutcome::TIMED_OUT);

    EXPECT_EQ(handler->detach(), sockets.server);
    EXPECT_EQ(handler->socket(), nullptr);

    // leftover bytes of previous connection must not leak into new one
    auto next = makeMemorySocketPair();
    handler->assign(next.server);
    EXPECT_CALL(*media, list(".*")).WillOnce(Return(std::vector<MediaEntry>{}));
    send(*next.client, "request-type LIST\nbody-length 0\n\n");
    EXPECT_EQ(runOnce(), RequestHandler::EOutcome::SUCCESS);
    EXPECT_EQ(readResponse(*next.client).field("response-type"), "OK");
}

TEST(RequestHandlerParserTest, LazyParserServesSameRequests) {
    auto media = std::make_shared<MockedMediaService>();
    auto processor = RequestProcessor::configure(
        media, std::make_shared<DefaultAuthenticator>(), std::make_shared<BasicViewerAuthorizer>());
    auto handler = RequestHandler::configure(
        processor, std::make_unique<LazyRequestParser>(), std::weak_ptr<IHandlerMaster>(), {.requestTimeout = 50ms});

    EXPECT_CALL(*media, fetch(MediaId, 0u, 2u))
        .WillOnce(Return(MediaClips{.video = {"v0", "v1"}, .audio = {"a0", "a1"}}));

    auto sockets = makeMemorySocketPair(3);
    handler->assign(sockets.server);
    send(*sockets.client, FetchRequest);
    handler->run();

    EXPECT_EQ(handler->outcome(), RequestHandler::EOutcome::SUCCESS);
    auto response = readResponse(*sockets.client);
    NRubus::TFetchedPieces pieces;
    ASSERT_TRUE(pieces.ParseFromString(response.body));
    EXPECT_EQ(pieces.video_size(), 2);
}

TEST(RequestHandlerLimitTest, OversizedResponseIsBadRequest) {
    auto media = std::make_shared<MockedMediaService>();
    auto processor = RequestProcessor::configure(
        media, std::make_shared<DefaultAuthenticator>(), std::make_shared<BasicViewerAuthorizer>());
    auto master = std::make_shared<RecordingMaster>();
    auto handler = RequestHandler::configure(
        processor, std::make_unique<EagerRequestParser>(), master, 
        {.requestTimeout = 50ms, .maxRequestSize = 1024, .maxResponseSize = 256});

    EXPECT_CALL(*media, fetch(MediaId, 0u, 2u))
        .WillOnce(Return(MediaClips{
            .video = {std::string(1024, 'v'), std::string(1024, 'v')}, 
            .audio = {std::string(1024, 'a'), std::string(1024, 'a')}}))
        .WillOnce(Return(MediaClips{.video = {"v0", "v1"}, .audio = {"a0", "a1"}}));

    auto sockets = makeMemorySocketPair();
    handler->assign(sockets.server);

    send(*sockets.client, FetchRequest);
    handler->run();
    EXPECT_EQ(master->outcomes.back(), RequestHandler::EOutcome::SUCCESS);
    auto rejected = readResponse(*sockets.client);
    EXPECT_EQ(rejected.field("response-type"), "BAD_REQUEST");
    EXPECT_TRUE(rejected.body.empty());

    // connection stays usable for requests that fit
    send(*sockets.client, FetchRequest);
    handler->run();
    EXPECT_EQ(master->outcomes.back(), RequestHandler::EOutcome::SUCCESS);
    auto served = readResponse(*sockets.client);
    EXPECT_EQ(served.field("response-type"), "OK");
    EXPECT_EQ(handler->served(), 2u);
}

TEST(RequestHandlerLimitTest, DefaultResponseLimitFitsSealedFrame) {
    RequestHandler::Settings settings;
    std::size_t padded = (settings.maxResponseSize + MacLength) / 16 * 16 + 16;
    EXPECT_LE(LengthFieldSize + IvLength + padded, MaxFrameSize);
}

TEST(RequestHandlerLimitTest, DetachReleasesGrownBuffer) {
    auto media = std::make_shared<MockedMediaService>();
    auto processor = RequestProcessor::configure(
        media, std::make_shared<DefaultAuthenticator>(), std::make_shared<BasicViewerAuthorizer>());
    auto handler = RequestHandler::configure(
        processor, std::make_unique<EagerRequestParser>(), std::weak_ptr<IHandlerMaster>(), {.requestTimeout = 50ms});

    EXPECT_CALL(*media, list(_))
        .WillOnce(Return(std::vector<MediaEntry>{}));

    auto sockets = makeMemorySocketPair();
    handler->assign(sockets.server);
    send(*sockets.client, absl::StrCat(
        "request-type LIST\ntitle-contains ", std::string(3 * NetworkBufferSize, 'a'), "\nbody-length 0\n\n"));
    handler->run();

    EXPECT_EQ(handler->outcome(), RequestHandler::EOutcome::SUCCESS);
    EXPECT_EQ(readResponse(*sockets.client).field("response-type"), "OK");
    EXPECT_GT(handler->bufferCapacity(), NetworkBufferSize);

    handler->detach();
    EXPECT_EQ(handler->bufferCapacity(), NetworkBufferSize);
}

TEST(RequestHandlerLimitTest, OversizedResponseOverSecureSessionIsAnswered) {
    const auto& credentials = TestCredentials::get();
    auto responderCrypto = OpenSslCryptoProvider::configure({.privateKey = credentials.privateKeyPem});
    ASSERT_TRUE(responderCrypto->init().ok());
    auto initiatorCrypto = OpenSslCryptoProvider::configure({});
    ASSERT_TRUE(initiatorCrypto->init().ok());

    auto sockets = makeMemorySocketPair();
    auto initiator = SecureSession::configure(sockets.client, initiatorCrypto, {
        .role = SecureSession::ERole::INITIATOR,
        .encryptionSupported = true,
        .handshakeTimeout = 2s,
        .certificate = {}
    });
    auto responder = SecureSession::configure(sockets.server, responderCrypto, {
        .role = SecureSession::ERole::RESPONDER,
        .encryptionSupported = true,
        .handshakeTimeout = 2s,
        .certificate = credentials.certificatePem
    });
    auto responded = std::async(std::launch::async, [responder]() {
        responder->handshake();
    });
    initiator->handshake();
    responded.get();

    auto media = std::make_shared<MockedMediaService>();
    auto processor = RequestProcessor::configure(
        media, std::make_shared<DefaultAuthenticator>(), std::make_shared<BasicViewerAuthorizer>());
    auto handler = RequestHandler::configure(
        processor, std::make_unique<EagerRequestParser>(), std::weak_ptr<IHandlerMaster>(), 
        {.requestTimeout = 50ms, .maxResponseSize = 512});

    EXPECT_CALL(*media, fetch(MediaId, 0u, 2u))
        .WillOnce(Return(MediaClips{
            .video = {std::string(4096, 'v'), std::string(4096, 'v')}, 
            .audio = {std::string(4096, 'a'), std::string(4096, 'a')}}));

    handler->assign(responder);
    initiator->write(FetchRequest.data(), FetchRequest.size());
    handler->run();

    EXPECT_EQ(handler->outcome(), RequestHandler::EOutcome::SUCCESS);
    EXPECT_EQ(readResponse(*initiator).field("response-type"), "BAD_REQUEST");
}
