#include <gtest/gtest.h>

#include <string>

#include "docvec_core/llm/gemini_client.hpp"

namespace docvec_core {

TEST(GeminiClientTest, BuildsRequestWithTaskTypePerIntent) {
  auto document = GeminiClient::build_request("models/embedding-001", "Some text.",
                                              EmbeddingIntent::Document);
  EXPECT_EQ(document["model"], "models/embedding-001");
  EXPECT_EQ(document["taskType"], "RETRIEVAL_DOCUMENT");
  EXPECT_EQ(document["content"]["parts"][0]["text"], "Some text.");

  auto query = GeminiClient::build_request("embedding-001", "what?", EmbeddingIntent::Query);
  EXPECT_EQ(query["model"], "models/embedding-001");
  EXPECT_EQ(query["taskType"], "RETRIEVAL_QUERY");
}

TEST(GeminiClientTest, ParsesEmbeddingValues) {
  auto values = GeminiClient::parse_response(200, R"({"embedding": {"values": [0.5, -0.25, 1]}})");
  ASSERT_EQ(values.size(), 3u);
  EXPECT_FLOAT_EQ(values[0], 0.5f);
  EXPECT_FLOAT_EQ(values[1], -0.25f);
  EXPECT_FLOAT_EQ(values[2], 1.0f);
}

TEST(GeminiClientTest, SurfacesProviderErrorDetail) {
  const std::string body =
      R"({"error": {"code": 400, "message": "API key not valid.", "status": "INVALID_ARGUMENT"}})";
  try {
    GeminiClient::parse_response(400, body);
    FAIL() << "Expected EmbeddingError";
  } catch (const EmbeddingError& e) {
    std::string message = e.what();
    EXPECT_NE(message.find("400"), std::string::npos);
    EXPECT_NE(message.find("API key not valid."), std::string::npos);
    EXPECT_NE(message.find("INVALID_ARGUMENT"), std::string::npos);
  }
}

TEST(GeminiClientTest, RejectsMalformedBodies) {
  EXPECT_THROW(GeminiClient::parse_response(200, "<html>"), EmbeddingError);
  EXPECT_THROW(GeminiClient::parse_response(200, R"({"embedding": {}})"), EmbeddingError);
  EXPECT_THROW(GeminiClient::parse_response(200, R"({"embedding": {"values": []}})"),
               EmbeddingError);
  EXPECT_THROW(GeminiClient::parse_response(200, R"({"embedding": {"values": ["a"]}})"),
               EmbeddingError);
  EXPECT_THROW(GeminiClient::parse_response(503, "Service Unavailable"), EmbeddingError);
}

TEST(GeminiClientTest, ErrorFieldThatIsNotAnObjectStillMapsToEmbeddingError) {
  try {
    GeminiClient::parse_response(429, R"({"error": "RESOURCE_EXHAUSTED"})");
    FAIL() << "Expected EmbeddingError";
  } catch (const EmbeddingError& e) {
    std::string message = e.what();
    EXPECT_NE(message.find("429"), std::string::npos);
    EXPECT_NE(message.find("RESOURCE_EXHAUSTED"), std::string::npos);
  }
  EXPECT_THROW(GeminiClient::parse_response(500, R"({"error": {"status": 7, "message": null}})"),
               EmbeddingError);
  EXPECT_THROW(GeminiClient::parse_response(502, R"({"error": [1, 2]})"), EmbeddingError);
}

TEST(GeminiClientTest, SerializesInvalidUtf8WithReplacementCharacter) {
  std::string payload =
      GeminiClient::serialize_request("embedding-001", "caf\xE9 menu", EmbeddingIntent::Query);
  auto parsed = nlohmann::json::parse(payload);
  EXPECT_EQ(parsed["content"]["parts"][0]["text"], "caf\xEF\xBF\xBD menu");
  EXPECT_EQ(parsed["taskType"], "RETRIEVAL_QUERY");
}

TEST(GeminiClientTest, EmbedWithInvalidUtf8ReportsOnlyEmbeddingErrors) {
  GeminiClient::Options options;
  options.api_key = "key";
  options.base_url = "http://127.0.0.1:1/v1beta";
  options.timeout_seconds = 2;
  GeminiClient client(options);
  EXPECT_THROW(client.embed("caf\xE9 menu", EmbeddingIntent::Query), EmbeddingError);
}

TEST(GeminiClientTest, BuildsEndpointUrl) {
  GeminiClient::Options options;
  options.api_key = "key";
  options.base_url = "https://example.test/v1beta/";
  options.model = "text-embedding-004";
  GeminiClient client(options);
  EXPECT_EQ(client.endpoint_url(), "https://example.test/v1beta/models/text-embedding-004:embedContent");
  EXPECT_EQ(client.dimension(), 768u);
}

TEST(GeminiClientTest, RequiresApiKey) {
  GeminiClient::Options options;
  EXPECT_THROW(GeminiClient client(options), EmbeddingError);
}

}  // namespace docvec_core
