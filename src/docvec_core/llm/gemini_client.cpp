#include "docvec_core/llm/gemini_client.hpp"

#include <utility>

namespace docvec_core {

GeminiClient::GeminiClient(Options options)
    : options_(std::move(options)), curl_handle_(nullptr) {
  if (options_.api_key.empty()) {
    throw EmbeddingError("Gemini API key is not configured");
  }
  setup_curl_handle();
}

GeminiClient::~GeminiClient() {
  if (curl_handle_) {
    curl_easy_cleanup(curl_handle_);
  }
}

void GeminiClient::setup_curl_handle() {
  curl_handle_ = curl_easy_init();
  if (!curl_handle_) {
    throw EmbeddingError("Failed to initialize CURL");
  }
}

size_t GeminiClient::write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

std::string GeminiClient::endpoint_url() const {
  std::string base = options_.base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  std::string model = options_.model;
  if (model.rfind("models/", 0) != 0) {
    model = "models/" + model;
  }
  return base + "/" + model + ":embedContent";
}

std::string GeminiClient::task_type_for(EmbeddingIntent intent) {
  return intent == EmbeddingIntent::Query ? "RETRIEVAL_QUERY" : "RETRIEVAL_DOCUMENT";
}

nlohmann::json GeminiClient::build_request(const std::string &model,
                                           const std::string &text,
                                           EmbeddingIntent intent) {
  std::string qualified_model = model.rfind("models/", 0) == 0 ? model : "models/" + model;
  return {{"model", qualified_model},
          {"content", {{"parts", nlohmann::json::array({{{"text", text}}})}}},
          {"taskType", task_type_for(intent)}};
}

std::string GeminiClient::serialize_request(const std::string &model,
                                            const std::string &text,
                                            EmbeddingIntent intent) {
  // Query text comes straight from the command line; invalid bytes become U+FFFD
  try {
    return build_request(model, text, intent)
        .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingError("Failed to encode embedding request: " + std::string(e.what()));
  }
}

std::string GeminiClient::error_detail(const nlohmann::json &error) {
  if (!error.is_object()) {
    return error.is_string() ? error.get<std::string>() : error.dump();
  }
  std::string status = error.contains("status") && error["status"].is_string()
                           ? error["status"].get<std::string>()
                           : std::string("ERROR");
  std::string message = error.contains("message") && error["message"].is_string()
                            ? error["message"].get<std::string>()
                            : std::string("no message");
  return status + ": " + message;
}

std::vector<float> GeminiClient::parse_response(long http_code, const std::string &body) {
  nlohmann::json json_response = nlohmann::json::parse(body, nullptr, /*allow_exceptions*/ false);

  if (http_code < 200 || http_code >= 300) {
    std::string detail = body;
    if (!json_response.is_discarded() && json_response.contains("error")) {
      detail = error_detail(json_response["error"]);
    }
    throw EmbeddingError("Gemini API returned HTTP " + std::to_string(http_code) + " (" +
                         detail + ")");
  }

  if (json_response.is_discarded()) {
    throw EmbeddingError("Gemini API returned a non-JSON body");
  }
  if (!json_response.contains("embedding") || !json_response["embedding"].contains("values")) {
    throw EmbeddingError("Response does not contain embedding.values");
  }

  const auto &values = json_response["embedding"]["values"];
  if (!values.is_array() || values.empty()) {
    throw EmbeddingError("embedding.values is not a non-empty array");
  }
  try {
    return values.get<std::vector<float>>();
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingError("embedding.values is malformed: " + std::string(e.what()));
  }
}

std::string GeminiClient::post_json(const std::string &url,
                                    const std::string &payload,
                                    long &http_code) {
  std::string response_buffer;
  std::string key_header = "x-goog-api-key: " + options_.api_key;

  curl_slist *headers = nullptr;
  headers = curl_slist_append(headers, "Content-Type: application/json");
  headers = curl_slist_append(headers, key_header.c_str());

  curl_easy_reset(curl_handle_);
  curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, payload.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
  curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);
  curl_easy_setopt(curl_handle_, CURLOPT_TIMEOUT, static_cast<long>(options_.timeout_seconds));
  curl_easy_setopt(curl_handle_, CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl_handle_);
  curl_slist_free_all(headers);
  if (res != CURLE_OK) {
    throw EmbeddingError("CURL request failed: " + std::string(curl_easy_strerror(res)));
  }

  http_code = 0;
  curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
  return response_buffer;
}

std::vector<float> GeminiClient::embed(const std::string &text, EmbeddingIntent intent) {
  const std::string payload = serialize_request(options_.model, text, intent);

  long http_code = 0;
  std::string body = post_json(endpoint_url(), payload, http_code);
  std::vector<float> embedding = parse_response(http_code, body);

  if (embedding.size() != options_.dimension) {
    throw EmbeddingError("Gemini model " + options_.model + " returned " +
                         std::to_string(embedding.size()) + " dimensions, expected " +
                         std::to_string(options_.dimension));
  }
  return embedding;
}

}  // namespace docvec_core
