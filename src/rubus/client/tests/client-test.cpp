// GTest
#include <gtest/gtest.h>

// Abseil
#include <absl/status/status.h>

// standard
#include <string>

// rubus
#include <rubus/client/request-builder.hpp>
#include <rubus/client/response.hpp>
#include <rubus/protocol/eager-request-parser.hpp>
#include <rubus/protocol/response.hpp>

// proto
#include <protos/media/media.pb.h>

using namespace rubus;


TEST(RequestBuilderTest, BuildsWireRequests) {
    EXPECT_EQ(RequestBuilder::list(), "request-type LIST\ntitle-contains .*\nbody-length 0\n\n");
    EXPECT_EQ(RequestBuilder::info("123e4567-e89b-12d3-a456-426614174000"), 
        "request-type INFO\nmedia-id 123e4567-e89b-12d3-a456-426614174000\nbody-length 0\n\n");
    EXPECT_EQ(RequestBuilder::fetch("123e4567-e89b-12d3-a456-426614174000", 0, 2),
        "request-type FETCH\n"
        "media-id 123e4567-e89b-12d3-a456-426614174000\n"
        "first-playback-piece 0\n"
        "number-playback-pieces 2\n"
        "body-length 0\n"
        "\n");
}

TEST(RequestBuilderTest, ServerParserUnderstandsBuiltRequests) {
    EagerRequestParser parser;
    parser.feed(RequestBuilder::fetch("id", 7, 3));
    EXPECT_EQ(parser.type(), ERequestType::FETCH);
    EXPECT_EQ(parser.value(FirstPieceKey), "7");
    EXPECT_EQ(parser.value(PieceCountKey), "3");

    parser.feed(RequestBuilder::list("star wars"));
    EXPECT_EQ(parser.value(TitleContainsKey), "star wars");
}

TEST(ResponseTest, DecodesOkBody) {
    NRubus::TMediaInfo info;
    info.set_id("id");
    info.set_title("Metropolis");
    info.set_duration(153);

    auto response = Response::parse(makeResponse(info));
    ASSERT_TRUE(response.ok()) << response.status();
    EXPECT_EQ(response->type(), EResponseType::OK);
    EXPECT_EQ(response->field(SerializedObjectKey), "NRubus.TMediaInfo");

    auto decoded = response->decode<NRubus::TMediaInfo>();
    ASSERT_TRUE(decoded.ok()) << decoded.status();
    EXPECT_EQ(decoded->title(), "Metropolis");
    EXPECT_EQ(decoded->duration(), 153u);

    EXPECT_EQ(response->decode<NRubus::TMediaList>().status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(ResponseTest, ErrorResponseHasNoBody) {
    auto response = Response::parse(makeErrorResponse(EResponseType::SERVER_ERROR));
    ASSERT_TRUE(response.ok());
    EXPECT_EQ(response->type(), EResponseType::SERVER_ERROR);
    EXPECT_TRUE(response->body().empty());
    EXPECT_EQ(response->decode<NRubus::TMediaInfo>().status().code(), absl::StatusCode::kFailedPrecondition);
}

TEST(ResponseTest, RejectsMalformedResponses) {
    EXPECT_FALSE(Response::parse("response-type OK\nbody-length 0\n").ok());
    EXPECT_FALSE(Response::parse("response-type MAYBE\nbody-length 0\n\n").ok());
    EXPECT_FALSE(Response::parse("body-length 0\nresponse-type OK\n\n").ok());
    EXPECT_FALSE(Response::parse("response-type OK\nbody-length 10\n\nshort").ok());
    EXPECT_FALSE(Response::parse("response-type OK\nbody-length ten\n\n").ok());
}
