#include <gtest/gtest.h>

#include "base64.hpp"
#include "json_codec.hpp"
#include "protocol.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <string>

using apiproxy::codec::decode_request;
using apiproxy::codec::encode_response;
using apiproxy::rpc::ErrorKind;
using apiproxy::rpc::RpcError;
using apiproxy::rpc::RpcResponse;

TEST(JsonCodec, DecodesWellFormedCall) {
    auto result = decode_request(R"({"jsonrpc":"2.0","method":"on_request","params":["{}"],"id":7})");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.request->method, "on_request");
    ASSERT_TRUE(result.request->params.is_array());
    EXPECT_EQ(result.request->params.size(), 1u);
    EXPECT_EQ(result.request->id.raw, "7");
    EXPECT_FALSE(result.request->is_notification());
}

TEST(JsonCodec, MissingVersionFieldIsAccepted) {
    auto result = decode_request(R"({"method":"get_info","id":1})");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.request->method, "get_info");
}

TEST(JsonCodec, MissingOrNullParamsDecodeAsEmptyArray) {
    auto missing = decode_request(R"({"jsonrpc":"2.0","method":"get_info","id":1})");
    auto null_params = decode_request(R"({"jsonrpc":"2.0","method":"get_info","params":null,"id":1})");

    ASSERT_TRUE(missing.ok());
    ASSERT_TRUE(null_params.ok());
    EXPECT_TRUE(missing.request->params.is_array());
    EXPECT_TRUE(missing.request->params.empty());
    EXPECT_TRUE(null_params.request->params.empty());
}

TEST(JsonCodec, AbsentIdMarksNotification) {
    auto result = decode_request(R"({"jsonrpc":"2.0","method":"get_info","params":[]})");
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.request->is_notification());
    EXPECT_EQ(result.request->id.wire(), "null");
}

TEST(JsonCodec, WrongVersionIsVersionErrorAndKeepsId) {
    auto result = decode_request(R"({"jsonrpc":"1.0","method":"get_info","id":"abc"})");

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, ErrorKind::VersionError);
    EXPECT_EQ(result.id.raw, "\"abc\"");
}

TEST(JsonCodec, InvalidJsonIsParseErrorWithNullId) {
    auto result = decode_request("this is not json");

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, ErrorKind::ParseError);
    EXPECT_EQ(result.error->code, apiproxy::rpc::kPluginErrorCode);
    EXPECT_EQ(result.id.wire(), "null");
}

TEST(JsonCodec, TruncatedLineStillRecoversId) {
    auto result = decode_request(R"({"jsonrpc":"2.0","id":42,"method":"get_info","params":[)");

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, ErrorKind::ParseError);
    EXPECT_EQ(result.id.raw, "42");
}

TEST(JsonCodec, NestedIdIsNotMistakenForCallId) {
    auto raw = apiproxy::codec::extract_raw_id(R"({"params":[{"id":5}],"method":"x",)");
    EXPECT_FALSE(raw.has_value());

    auto inner_string = apiproxy::codec::extract_raw_id(R"({"method":"\"id\":9","id":3})");
    ASSERT_TRUE(inner_string.has_value());
    EXPECT_EQ(*inner_string, "3");
}

TEST(JsonCodec, StructuredIdIsRejected) {
    auto result = decode_request(R"({"jsonrpc":"2.0","method":"get_info","id":{"n":1}})");

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, ErrorKind::ParseError);
    EXPECT_EQ(result.id.wire(), "null");
}

TEST(JsonCodec, NonArrayParamsAreInvalidParams) {
    auto result = decode_request(R"({"jsonrpc":"2.0","method":"init","params":{"a":1},"id":2})");

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, ErrorKind::InvalidParams);
    EXPECT_EQ(result.id.raw, "2");
}

TEST(JsonCodec, NonObjectMessageIsParseError) {
    auto result = decode_request("[1,2,3]");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, ErrorKind::ParseError);
}

TEST(JsonCodec, ReplyEchoesIdTokenByteForByte) {
    auto result = decode_request(R"({"jsonrpc":"2.0","method":"get_info","id":1.50})");
    ASSERT_TRUE(result.ok());

    std::string line = encode_response(RpcResponse::success(result.request->id, {{"ok", true}}));
    EXPECT_NE(line.find("\"id\":1.50}"), std::string::npos) << line;

    auto escaped = decode_request(R"({"jsonrpc":"2.0","method":"get_info","id":"aéb"})");
    ASSERT_TRUE(escaped.ok());
    line = encode_response(RpcResponse::success(escaped.request->id, nullptr));
    EXPECT_NE(line.find(R"("id":"aéb")"), std::string::npos) << line;
}

TEST(JsonCodec, EncodedReplyIsExactlyOneLine) {
    std::string line = encode_response(
        RpcResponse::success(apiproxy::rpc::RpcId{"1"}, {{"text", "multi\nline\nvalue"}}));

    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(std::count(line.begin(), line.end(), '\n'), 1);
}

TEST(JsonCodec, ErrorReplyCarriesReservedCodeAndNullId) {
    std::string line = encode_response(
        RpcResponse::failure(apiproxy::rpc::RpcId{}, RpcError::make(ErrorKind::ParseError, "bad line")));
    auto reply = nlohmann::json::parse(line);

    EXPECT_EQ(reply["jsonrpc"], "2.0");
    EXPECT_TRUE(reply["id"].is_null());
    EXPECT_EQ(reply["error"]["code"], -32000);
    EXPECT_EQ(reply["error"]["message"], "bad line");
    EXPECT_FALSE(reply.contains("result"));
}

TEST(JsonCodec, RoundTripKeepsMethodParamsAndId) {
    const std::string line =
        R"({"jsonrpc":"2.0","method":"on_response","params":["{\"endpoint\":\"/x\"}",{"k":[1,2]}],"id":"req-9"})";
    auto first = decode_request(line);
    ASSERT_TRUE(first.ok());

    auto second = decode_request(apiproxy::codec::encode_request(*first.request));
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.request->method, first.request->method);
    EXPECT_EQ(second.request->params, first.request->params);
    EXPECT_EQ(second.request->id, first.request->id);
}

TEST(JsonCodec, DecodeResponseParsesResultAndError) {
    auto ok = apiproxy::codec::decode_response(R"({"jsonrpc":"2.0","result":{"status":"ok"},"id":3})");
    EXPECT_TRUE(ok.ok());
    EXPECT_EQ(ok.id().raw, "3");
    EXPECT_EQ(ok.result()["status"], "ok");

    auto failed =
        apiproxy::codec::decode_response(R"({"jsonrpc":"2.0","error":{"code":-32000,"message":"boom"},"id":4})");
    ASSERT_FALSE(failed.ok());
    EXPECT_EQ(failed.error()->code, -32000);
    EXPECT_EQ(failed.error()->message, "boom");
}

TEST(JsonCodec, DecodeResponseRejectsResultWithError) {
    EXPECT_THROW(apiproxy::codec::decode_response(
                     R"({"jsonrpc":"2.0","result":1,"error":{"code":-32000,"message":"x"},"id":1})"),
                 apiproxy::codec::CodecError);
    EXPECT_THROW(apiproxy::codec::decode_response("garbage"), apiproxy::codec::CodecError);
}

TEST(Base64, MatchesRfc4648Vectors) {
    EXPECT_EQ(apiproxy::codec::base64_encode(""), "");
    EXPECT_EQ(apiproxy::codec::base64_encode("f"), "Zg==");
    EXPECT_EQ(apiproxy::codec::base64_encode("fo"), "Zm8=");
    EXPECT_EQ(apiproxy::codec::base64_encode("foobar"), "Zm9vYmFy");

    std::string decoded;
    ASSERT_TRUE(apiproxy::codec::base64_decode("Zm9vYg==", decoded));
    EXPECT_EQ(decoded, "foob");
}

TEST(Base64, RejectsMalformedInput) {
    std::string decoded;
    EXPECT_FALSE(apiproxy::codec::base64_decode("Zm9", decoded));
    EXPECT_FALSE(apiproxy::codec::base64_decode("Zm=v", decoded));
    EXPECT_FALSE(apiproxy::codec::base64_decode("Zm9v!!==", decoded));
}

namespace {

std::string nested_arrays(std::size_t depth) {
    return std::string(depth, '[') + std::string(depth, ']');
}

} // namespace

TEST(JsonCodec, DeeplyNestedParamsAreRejectedNotFatal) {
    const std::string line =
        R"({"jsonrpc":"2.0","method":"get_info","params":[)" + nested_arrays(200000) + R"(],"id":7})";

    auto result = decode_request(line);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, ErrorKind::ParseError);
    EXPECT_NE(result.error->message.find("nesting"), std::string::npos);
    EXPECT_EQ(result.id.raw, "7");
}

TEST(JsonCodec, NestingWithinLimitIsAccepted) {
    const std::string line =
        R"({"jsonrpc":"2.0","method":"init","params":[)" + nested_arrays(400) + R"(],"id":1})";

    auto result = decode_request(line);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.request->params.size(), 1u);
}

TEST(JsonCodec, BoundedParseReportsDepthSeparately) {
    bool too_deep = true;
    auto shallow = apiproxy::codec::parse_bounded<nlohmann::json>("{\"a\":[1,2]}", &too_deep);
    EXPECT_FALSE(too_deep);
    EXPECT_TRUE(shallow.is_object());

    auto broken = apiproxy::codec::parse_bounded<nlohmann::json>("{\"a\":", &too_deep);
    EXPECT_FALSE(too_deep);
    EXPECT_TRUE(broken.is_discarded());

    auto deep = apiproxy::codec::parse_bounded<nlohmann::ordered_json>(
        nested_arrays(apiproxy::codec::kMaxJsonDepth + 1), &too_deep);
    EXPECT_TRUE(too_deep);
    EXPECT_TRUE(deep.is_discarded());
}

TEST(JsonCodec, DeeplyNestedReplyIsCodecError) {
    EXPECT_THROW(apiproxy::codec::decode_response(R"({"jsonrpc":"2.0","result":)" + nested_arrays(200000) +
                                                  R"(,"id":1})"),
                 apiproxy::codec::CodecError);
}
