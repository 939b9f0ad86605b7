#pragma once

#include <curl/curl.h>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "docvec_core/llm/embedding_provider.hpp"

namespace docvec_core {

/**
 * @class GeminiClient
 * @brief Embedding provider backed by the Generative Language REST API.
 *
 * Each embed() call is one POST to {base_url}/{model}:embedContent. The
 * intent is sent as the request's taskType so documents and queries are
 * embedded with the matching retrieval task.
 */
class GeminiClient : public EmbeddingProvider {
 public:
  struct Options {
    std::string api_key;
    std::string base_url = "https://generativelanguage.googleapis.com/v1beta";
    std::string model = "models/embedding-001";
    size_t dimension = 768;
    int timeout_seconds = 30;
  };

  explicit GeminiClient(Options options);
  ~GeminiClient() override;

  // Disable copy constructor and assignment
  GeminiClient(const GeminiClient &) = delete;
  GeminiClient &operator=(const GeminiClient &) = delete;

  std::vector<float> embed(const std::string &text, EmbeddingIntent intent) override;

  size_t dimension() const override { return options_.dimension; }
  std::string name() const override { return "gemini:" + options_.model; }

  std::string endpoint_url() const;

  static std::string task_type_for(EmbeddingIntent intent);
  static nlohmann::json build_request(const std::string &model,
                                      const std::string &text,
                                      EmbeddingIntent intent);
  static std::string serialize_request(const std::string &model,
                                       const std::string &text,
                                       EmbeddingIntent intent);
  // Returns the vector from a 2xx body, throws EmbeddingError with the provider detail otherwise
  static std::vector<float> parse_response(long http_code, const std::string &body);

 private:
  Options options_;
  CURL *curl_handle_;

  static std::string error_detail(const nlohmann::json &error);
  void setup_curl_handle();
  std::string post_json(const std::string &url, const std::string &payload, long &http_code);
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
};

}  // namespace docvec_core
