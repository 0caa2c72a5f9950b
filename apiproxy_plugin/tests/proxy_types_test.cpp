#include <gtest/gtest.h>

#include "proxy_types.hpp"
#include "test_helpers.hpp"

#include <string>

using apiproxy::BodyEncoding;
using apiproxy::ProxyRequest;
using apiproxy::ProxyResponse;

TEST(ProxyTypes, ParsesEncodedRequest) {
    nlohmann::json param = R"({"method":"POST","endpoint":"/v1/x","headers":{"A":"1"},"body":"{\"k\":1}","metadata":{"m":"v"}})";

    ProxyRequest request;
    std::string error;
    ASSERT_TRUE(apiproxy::decode_proxy_request(param, request, error)) << error;
    EXPECT_EQ(request.method, "POST");
    EXPECT_EQ(request.endpoint, "/v1/x");
    EXPECT_EQ(request.headers.at("A"), "1");
    EXPECT_EQ(request.body.data, "{\"k\":1}");
    EXPECT_EQ(request.body.encoding, BodyEncoding::Text);
    EXPECT_EQ(request.metadata.at("m"), "v");
}

TEST(ProxyTypes, AcceptsInlineObjectParam) {
    nlohmann::json param = {{"endpoint", "/health"}};

    ProxyRequest request;
    std::string error;
    ASSERT_TRUE(apiproxy::decode_proxy_request(param, request, error)) << error;
    EXPECT_EQ(request.endpoint, "/health");
    EXPECT_TRUE(request.headers.empty());
    EXPECT_TRUE(request.body.empty());
}

TEST(ProxyTypes, NullMapsAndBodyDecodeAsEmpty) {
    nlohmann::json param = R"({"endpoint":"/x","headers":null,"metadata":null,"body":null})";

    ProxyRequest request;
    std::string error;
    ASSERT_TRUE(apiproxy::decode_proxy_request(param, request, error)) << error;
    EXPECT_TRUE(request.headers.empty());
    EXPECT_TRUE(request.metadata.empty());
    EXPECT_TRUE(request.body.empty());
}

TEST(ProxyTypes, RejectsMalformedRequests) {
    ProxyRequest request;
    std::string error;

    EXPECT_FALSE(apiproxy::decode_proxy_request(nlohmann::json("{not json"), request, error));
    EXPECT_FALSE(apiproxy::decode_proxy_request(nlohmann::json("[1]"), request, error));
    EXPECT_FALSE(apiproxy::decode_proxy_request(nlohmann::json(5), request, error));
    EXPECT_FALSE(apiproxy::decode_proxy_request(nlohmann::json(R"({"method":"GET"})"), request, error));
    EXPECT_NE(error.find("endpoint"), std::string::npos);
    EXPECT_FALSE(apiproxy::decode_proxy_request(nlohmann::json(R"({"endpoint":"/x","headers":{"A":1}})"), request,
                                                error));
    EXPECT_NE(error.find("headers.A"), std::string::npos);
}

TEST(ProxyTypes, ResponseRequiresIntegerStatus) {
    ProxyResponse response;
    std::string error;

    EXPECT_FALSE(apiproxy::decode_proxy_response(nlohmann::json(R"({"body":"x"})"), response, error));
    EXPECT_FALSE(apiproxy::decode_proxy_response(nlohmann::json(R"({"status_code":"200"})"), response, error));
    ASSERT_TRUE(apiproxy::decode_proxy_response(nlohmann::json(R"({"status_code":204})"), response, error)) << error;
    EXPECT_EQ(response.status_code, 204);
    EXPECT_FALSE(response.cached);
}

TEST(ProxyTypes, Base64BodyIsDecodedAndReencoded) {
    nlohmann::json param = R"({"status_code":200,"body":"AAEC/w==","body_encoding":"base64","cached":true})";

    ProxyResponse response;
    std::string error;
    ASSERT_TRUE(apiproxy::decode_proxy_response(param, response, error)) << error;
    EXPECT_EQ(response.body.data, std::string("\x00\x01\x02\xff", 4));
    EXPECT_EQ(response.body.encoding, BodyEncoding::Base64);
    EXPECT_TRUE(response.cached);

    nlohmann::json out = apiproxy::to_json(response);
    EXPECT_EQ(out["body"], "AAEC/w==");
    EXPECT_EQ(out["body_encoding"], "base64");
}

TEST(ProxyTypes, RejectsBadBodyEncoding) {
    ProxyResponse response;
    std::string error;
    EXPECT_FALSE(apiproxy::decode_proxy_response(
        nlohmann::json(R"({"status_code":200,"body":"abc","body_encoding":"base64"})"), response, error));
    EXPECT_FALSE(apiproxy::decode_proxy_response(
        nlohmann::json(R"({"status_code":200,"body":"abc","body_encoding":"gzip"})"), response, error));
}

TEST(ProxyTypes, TextBodyOmitsEncodingUnlessHostSentIt) {
    ProxyRequest plain = test::make_request("GET", "/x", "hello");
    nlohmann::json out = apiproxy::to_json(plain);
    EXPECT_EQ(out["body"], "hello");
    EXPECT_FALSE(out.contains("body_encoding"));

    ProxyRequest explicit_text;
    std::string error;
    ASSERT_TRUE(apiproxy::decode_proxy_request(
        nlohmann::json(R"({"endpoint":"/x","body":"hi","body_encoding":"text"})"), explicit_text, error));
    EXPECT_EQ(apiproxy::to_json(explicit_text)["body_encoding"], "text");
}

TEST(ProxyTypes, UnknownFieldsPassThrough) {
    nlohmann::json param = R"({"endpoint":"/x","trace_id":"t-1","priority":3})";

    ProxyRequest request;
    std::string error;
    ASSERT_TRUE(apiproxy::decode_proxy_request(param, request, error)) << error;
    EXPECT_EQ(request.extensions["trace_id"], "t-1");

    nlohmann::json out = nlohmann::json::parse(apiproxy::encode_proxy_request(request));
    EXPECT_EQ(out["trace_id"], "t-1");
    EXPECT_EQ(out["priority"], 3);
    EXPECT_EQ(out["endpoint"], "/x");
}

TEST(ProxyTypes, EncodedResponseAlwaysCarriesAllFields) {
    nlohmann::json out = apiproxy::to_json(test::make_response(404));

    EXPECT_EQ(out["status_code"], 404);
    EXPECT_TRUE(out["headers"].is_object());
    EXPECT_EQ(out["body"], "");
    EXPECT_EQ(out["cached"], false);
    EXPECT_TRUE(out["metadata"].is_object());
}

TEST(ProxyTypes, MergeMetadataLetsOverlayWin) {
    apiproxy::MetadataMap base{{"a", "1"}, {"b", "2"}};
    apiproxy::merge_metadata(base, {{"b", "x"}, {"c", "3"}});

    EXPECT_EQ(base.size(), 3u);
    EXPECT_EQ(base["a"], "1");
    EXPECT_EQ(base["b"], "x");
    EXPECT_EQ(base["c"], "3");
}

TEST(ProxyTypes, RewriteEndpointKeepsFirstOriginal) {
    ProxyRequest request = test::make_request("GET", "/v1/openai/models");

    apiproxy::rewrite_endpoint(request, "/v1/models");
    apiproxy::rewrite_endpoint(request, "/v2/models");

    EXPECT_EQ(request.endpoint, "/v2/models");
    EXPECT_EQ(request.metadata[apiproxy::kOriginalEndpointKey], "/v1/openai/models");
}

TEST(ProxyTypes, DeeplyNestedEncodedParamIsRejected) {
    std::string deep = std::string(100000, '[') + std::string(100000, ']');
    nlohmann::json param = R"({"endpoint":"/x","extra":)" + deep + "}";

    ProxyRequest request;
    std::string error;
    EXPECT_FALSE(apiproxy::decode_proxy_request(param, request, error));
    EXPECT_NE(error.find("nested deeper"), std::string::npos) << error;
}

TEST(ProxyTypes, StatusCodeMustBeHttpStatus) {
    ProxyResponse response;
    std::string error;

    EXPECT_FALSE(apiproxy::decode_proxy_response(nlohmann::json(R"({"status_code":4294967496})"), response, error));
    EXPECT_NE(error.find("not an HTTP status"), std::string::npos) << error;
    EXPECT_FALSE(apiproxy::decode_proxy_response(nlohmann::json(R"({"status_code":-200})"), response, error));
    EXPECT_FALSE(apiproxy::decode_proxy_response(nlohmann::json(R"({"status_code":99})"), response, error));
    EXPECT_FALSE(apiproxy::decode_proxy_response(nlohmann::json(R"({"status_code":600})"), response, error));

    ASSERT_TRUE(apiproxy::decode_proxy_response(nlohmann::json(R"({"status_code":599})"), response, error)) << error;
    EXPECT_EQ(response.status_code, 599);
    ASSERT_TRUE(apiproxy::decode_proxy_response(nlohmann::json(R"({"status_code":100})"), response, error)) << error;
    EXPECT_EQ(response.status_code, 100);
}
