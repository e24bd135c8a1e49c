#include <gtest/gtest.h>
#include "aws_sigv4.h"

using namespace aws;

// AWS SigV4 test suite "get-vanilla"
static const char* EXAMPLE_KEY_ID = "AKIDEXAMPLE";
static const char* EXAMPLE_SECRET = "wJalrXUtnFEMI/K7MDENG+bPxRfiCYEXAMPLEKEY";
static const std::time_t EXAMPLE_TIME = 1440938160;   // 2015-08-30T12:36:00Z

// =============================================================================
// Primitives
// =============================================================================

TEST(AwsSigV4Test, Sha256Hex) {
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(AwsSigV4Test, HmacSha256Rfc4231Case2) {
    std::string mac = hmac_sha256("Jefe", "what do ya want for nothing?");
    ASSERT_EQ(mac.size(), 32u);

    static const char digits[] = "0123456789abcdef";
    std::string hex;
    for (unsigned char c : mac) {
        hex += digits[c >> 4];
        hex += digits[c & 0x0f];
    }
    EXPECT_EQ(hex, "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(AwsSigV4Test, AmzDate) {
    EXPECT_EQ(amz_date(EXAMPLE_TIME), "20150830T123600Z");
    EXPECT_EQ(amz_date(0), "19700101T000000Z");
}

TEST(AwsSigV4Test, UriEncode) {
    EXPECT_EQ(uri_encode("abc-_.~XYZ019"), "abc-_.~XYZ019");
    EXPECT_EQ(uri_encode("a b"), "a%20b");
    EXPECT_EQ(uri_encode("model:0"), "model%3A0");
    EXPECT_EQ(uri_encode("/a/b"), "%2Fa%2Fb");
    EXPECT_EQ(uri_encode("/a/b", false), "/a/b");
    EXPECT_EQ(uri_encode("%3A", false), "%253A");
}

TEST(AwsSigV4Test, ParseUrl) {
    ParsedUrl url = parse_url("https://bedrock-runtime.us-east-1.amazonaws.com/model/x%3A0/invoke?b=2&a=1");
    EXPECT_EQ(url.scheme, "https");
    EXPECT_EQ(url.host, "bedrock-runtime.us-east-1.amazonaws.com");
    EXPECT_EQ(url.path, "/model/x%3A0/invoke");
    EXPECT_EQ(url.query, "b=2&a=1");
}

TEST(AwsSigV4Test, ParseUrlRootAndPorts) {
    EXPECT_EQ(parse_url("https://example.amazonaws.com").path, "/");
    EXPECT_EQ(parse_url("https://example.amazonaws.com:443/").host, "example.amazonaws.com");
    EXPECT_EQ(parse_url("http://localhost:80/x").host, "localhost");
    EXPECT_EQ(parse_url("http://localhost:8080/x").host, "localhost:8080");
}

// =============================================================================
// Signing
// =============================================================================

TEST(AwsSigV4Test, GetVanillaCanonicalRequest) {
    SigV4Signer signer(Credentials{EXAMPLE_KEY_ID, EXAMPLE_SECRET, ""}, "us-east-1", "service");

    std::string request = signer.canonical_request(
        "GET", parse_url("https://example.amazonaws.com/"),
        {{"host", "example.amazonaws.com"}, {"x-amz-date", "20150830T123600Z"}},
        sha256_hex(""));

    EXPECT_EQ(request,
              "GET\n"
              "/\n"
              "\n"
              "host:example.amazonaws.com\n"
              "x-amz-date:20150830T123600Z\n"
              "\n"
              "host;x-amz-date\n"
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(AwsSigV4Test, GetVanillaSignature) {
    SigV4Signer signer(Credentials{EXAMPLE_KEY_ID, EXAMPLE_SECRET, ""}, "us-east-1", "service");

    auto headers = signer.sign("GET", "https://example.amazonaws.com/", {}, "", EXAMPLE_TIME);

    EXPECT_EQ(headers.at("host"), "example.amazonaws.com");
    EXPECT_EQ(headers.at("x-amz-date"), "20150830T123600Z");
    EXPECT_EQ(headers.count("x-amz-security-token"), 0u);
    EXPECT_EQ(headers.at("Authorization"),
              "AWS4-HMAC-SHA256 Credential=AKIDEXAMPLE/20150830/us-east-1/service/aws4_request, "
              "SignedHeaders=host;x-amz-date, "
              "Signature=5fa00fa31553b73ebf1942676e86291e8372ff2a2260956d9b8aae1d763fbf31");
}

TEST(AwsSigV4Test, StringToSignLayout) {
    SigV4Signer signer(Credentials{EXAMPLE_KEY_ID, EXAMPLE_SECRET, ""}, "us-east-1", "service");
    EXPECT_EQ(signer.string_to_sign("20150830T123600Z", "abc"),
              "AWS4-HMAC-SHA256\n20150830T123600Z\n20150830/us-east-1/service/aws4_request\nabc");
}

TEST(AwsSigV4Test, CallerHeadersAreSignedLowercase) {
    SigV4Signer signer(Credentials{EXAMPLE_KEY_ID, EXAMPLE_SECRET, ""}, "us-west-2", "bedrock");

    auto headers = signer.sign("POST", "https://bedrock-runtime.us-west-2.amazonaws.com/model/m/invoke",
                               {{"Content-Type", "application/json"}}, "{}", EXAMPLE_TIME);

    const std::string& auth = headers.at("Authorization");
    EXPECT_NE(auth.find("SignedHeaders=content-type;host;x-amz-date,"), std::string::npos);
    EXPECT_NE(auth.find("/20150830/us-west-2/bedrock/aws4_request"), std::string::npos);
}

TEST(AwsSigV4Test, SessionTokenIsSentAndSigned) {
    SigV4Signer signer(Credentials{EXAMPLE_KEY_ID, EXAMPLE_SECRET, "session-token"}, "us-east-1", "service");

    auto headers = signer.sign("GET", "https://example.amazonaws.com/", {}, "", EXAMPLE_TIME);

    EXPECT_EQ(headers.at("x-amz-security-token"), "session-token");
    EXPECT_NE(headers.at("Authorization").find("SignedHeaders=host;x-amz-date;x-amz-security-token,"),
              std::string::npos);
}

TEST(AwsSigV4Test, SignatureDependsOnPayload) {
    SigV4Signer signer(Credentials{EXAMPLE_KEY_ID, EXAMPLE_SECRET, ""}, "us-east-1", "service");
    auto a = signer.sign("POST", "https://example.amazonaws.com/", {}, "one", EXAMPLE_TIME);
    auto b = signer.sign("POST", "https://example.amazonaws.com/", {}, "two", EXAMPLE_TIME);
    EXPECT_NE(a.at("Authorization"), b.at("Authorization"));
}

TEST(AwsSigV4Test, CredentialsValidity) {
    EXPECT_TRUE((Credentials{"id", "secret", ""}).is_valid());
    EXPECT_FALSE((Credentials{"", "secret", ""}).is_valid());
    EXPECT_FALSE((Credentials{"id", "", ""}).is_valid());
}
