/*
 * test_server.cpp: request parsing, routing and the clustering endpoints
 */

#include "http/MultipartParser.hpp"
#include "http/Request.hpp"
#include "nlp/LanguageModel.hpp"
#include "nlp/TextNormalizer.hpp"
#include "server/ClusterHandler.hpp"
#include "server/endpoint.hpp"
#include "server/wserver.hpp"
#include "test_common.hpp"

#include <stdexcept>
#include <string>

using namespace intentcluster;

static const char* kBoundary = "----intentcluster42";

static std::string multipart_body() {
  std::string b = kBoundary;
  return "--" + b + "\r\n"
         "Content-Disposition: form-data; name=\"eps\"\r\n\r\n"
         "0.5\r\n"
         "--" + b + "\r\n"
         "Content-Disposition: form-data; name=\"file\"; filename=\"support.txt\"\r\n"
         "Content-Type: text/plain\r\n\r\n"
         "How do I reset my password?\n"
         "What is the process to change my password?\n"
         "Can you help me with password recovery?\n"
         "What is the refund policy?\n"
         "How can I get a refund?\n"
         "Tell me about your return policy.\n"
         "\r\n--" + b + "--\r\n";
}

struct MultipartFile {
  std::string filename;
  std::string content;
};

static std::string multipart_file_body(const MultipartFile& file) {
  std::string b = kBoundary;
  return "--" + b + "\r\n"
         "Content-Disposition: form-data; name=\"file\"; filename=\"" + file.filename + "\"\r\n"
         "Content-Type: text/plain\r\n\r\n" +
         file.content + "\r\n--" + b + "--\r\n";
}

static void test_parse_head() {
  printf("\n--- request head ---\n");
  size_t length = 0;
  bool has_length = false;
  std::string boundary;

  http::Request req = wServer::parse_head(
      "POST /api/cluster/upload?min_pts=3&note=a%20b+c HTTP/1.1\r\n"
      "Host: localhost\r\n"
      "content-type: Multipart/Form-Data; boundary=\"XyZ\"\r\n"
      "Content-Length: 42\r\n",
      length, has_length, boundary);

  ASSERT_TRUE(req.method == http::HttpRequest::POST, "method parsed");
  ASSERT_EQ(req.path, "/api/cluster/upload", "query stripped from path");
  ASSERT_EQ(req.getQuery("min_pts"), "3", "query parameter");
  ASSERT_EQ(req.getQuery("note"), "a b c", "query parameter decoded");
  ASSERT_FALSE(req.hasQuery("eps"), "absent query parameter");
  ASSERT_EQ(req.mediaType, "multipart/form-data", "media type lower-cased");
  ASSERT_EQ(boundary, "XyZ", "boundary unquoted");
  ASSERT_TRUE(has_length && length == 42, "content length");

  ASSERT_THROWS(wServer::parse_head("BREW /pot HTTP/1.1\r\n", length, has_length, boundary),
                std::invalid_argument, "unknown method rejected");
  ASSERT_THROWS(wServer::parse_head("GARBAGE\r\n", length, has_length, boundary),
                std::invalid_argument, "malformed request line rejected");
}

static void test_multipart() {
  printf("\n--- multipart ---\n");
  auto parts = http::MultipartParser::parse(multipart_body(), kBoundary);
  ASSERT_EQ(parts.size(), 2u, "two parts");
  ASSERT_EQ(parts[0].name, "eps", "field name");
  ASSERT_EQ(parts[0].data, "0.5", "field value");
  ASSERT_FALSE(parts[0].isFile(), "plain field");
  ASSERT_EQ(parts[1].filename, "support.txt", "file name");
  ASSERT_EQ(parts[1].content_type, "text/plain", "part content type");
  ASSERT_TRUE(parts[1].data.find("refund policy") != std::string::npos, "file content");

  ASSERT_TRUE(http::MultipartParser::parse(multipart_body(), "other").empty(), "wrong boundary");
  ASSERT_TRUE(http::MultipartParser::parse(multipart_body(), "").empty(), "no boundary");

  std::string boundary;
  std::string media = http::MultipartParser::parseContentType("application/json; charset=utf-8", boundary);
  ASSERT_EQ(media, "application/json", "parameters stripped");
  ASSERT_TRUE(boundary.empty(), "no boundary parameter");
}

static void test_dispatch() {
  printf("\n--- dispatch ---\n");
  wServer server;
  server.add_endpoint(endpoint(
      [](const http::Request&) { return http::Response::ok({{"pong", true}}); },
      http::HttpRequest::GET, "/ping"));
  server.add_endpoint(endpoint(
      [](const http::Request& req) -> http::Response {
        if (req.rawBody.empty()) throw std::runtime_error("empty body");
        return http::Response::ok({{"echo", req.rawBody}});
      },
      http::HttpRequest::POST, "/echo", "application/json"));

  http::Request req;
  req.method = http::HttpRequest::GET;
  req.path = "/ping";
  ASSERT_EQ(server.dispatch(req).status, 200, "routed");

  req.path = "/missing";
  ASSERT_EQ(server.dispatch(req).status, 404, "unknown path");

  req.path = "/ping";
  req.method = http::HttpRequest::POST;
  ASSERT_EQ(server.dispatch(req).status, 405, "wrong method");

  req.path = "/echo";
  req.mediaType = "text/plain";
  req.rawBody = "{}";
  ASSERT_EQ(server.dispatch(req).status, 415, "wrong media type");

  req.mediaType = "application/json";
  ASSERT_EQ(server.dispatch(req).status, 200, "media type accepted");

  req.rawBody.clear();
  http::Response failed = server.dispatch(req);
  ASSERT_EQ(failed.status, 400, "handler exception becomes 400");
  ASSERT_EQ(nlohmann::json::parse(failed.body)["status"], "error", "error body");
}

static void test_cluster_handler() {
  printf("\n--- cluster handler ---\n");
  nlp::LanguageModel model = nlp::LanguageModel::english();
  nlp::EnglishNormalizer normalizer(model);
  IntentPipeline pipeline(normalizer);
  ClusteringParams defaults;
  ClusterHandler handler(pipeline, defaults);

  http::Request req;
  req.method = http::HttpRequest::POST;
  req.path = "/api/cluster";
  req.mediaType = "application/json";
  req.rawBody = R"({"utterances": ["How do I reset my password?",
                                   "What is the process to change my password?",
                                   "Can you help me with password recovery?",
                                   "What is the refund policy?",
                                   "How can I get a refund?",
                                   "Tell me about your return policy."],
                   "eps": 0.5, "min_pts": 2})";

  http::Response res = handler.handleJson(req);
  ASSERT_EQ(res.status, 200, "clustered");
  nlohmann::json body = nlohmann::json::parse(res.body);
  ASSERT_EQ(body["status"], "success", "success status");
  ASSERT_EQ(body["stats"]["clusters"].get<int>(), 2, "two clusters");
  ASSERT_EQ(body["stats"]["noise"].get<int>(), 0, "no noise");

  req.rawBody = R"({"utterances": []})";
  res = handler.handleJson(req);
  ASSERT_EQ(res.status, 200, "empty batch accepted");
  ASSERT_EQ(nlohmann::json::parse(res.body)["clusters"].size(), 0u, "no clusters for empty batch");

  req.rawBody = "{not json";
  ASSERT_EQ(handler.handleJson(req).status, 400, "invalid json");

  req.rawBody = R"({"texts": ["a"]})";
  ASSERT_EQ(handler.handleJson(req).status, 400, "missing utterances");

  req.rawBody = R"({"utterances": ["a", 7]})";
  ASSERT_EQ(handler.handleJson(req).status, 400, "non-string utterance");

  req.rawBody = R"({"utterances": ["a"], "eps": -1})";
  res = handler.handleJson(req);
  ASSERT_EQ(res.status, 400, "negative eps");
  ASSERT_TRUE(res.body.find("eps") != std::string::npos, "error names the parameter");

  req.rawBody = R"({"utterances": ["a"], "min_pts": 1.5})";
  ASSERT_EQ(handler.handleJson(req).status, 400, "fractional min_pts");

  req.rawBody = R"({"utterances": ["a", "b"], "min_pts": 4294967298})";
  res = handler.handleJson(req);
  ASSERT_EQ(res.status, 400, "min_pts beyond int range rejected");
  ASSERT_TRUE(res.body.find("min_pts") != std::string::npos, "range error names min_pts");

  req.rawBody = R"({"utterances": ["a", "b"], "min_pts": 18446744073709551615})";
  ASSERT_EQ(handler.handleJson(req).status, 400, "min_pts at uint64 max rejected");

  req.rawBody = R"({"utterances": ["a", "b"], "min_pts": -4294967295})";
  ASSERT_EQ(handler.handleJson(req).status, 400, "large negative min_pts rejected");

  req.rawBody = R"({"utterances": ["a"], "cluster_space": "graph"})";
  ASSERT_EQ(handler.handleJson(req).status, 400, "unknown cluster space");

  http::Request upload;
  upload.method = http::HttpRequest::POST;
  upload.path = "/api/cluster/upload";
  upload.mediaType = "multipart/form-data";
  wServer::attach_body(upload, multipart_body(), kBoundary);
  res = handler.handleUpload(upload);
  ASSERT_EQ(res.status, 200, "upload clustered");
  ASSERT_EQ(nlohmann::json::parse(res.body)["stats"]["utterances"].get<int>(), 6, "six uploaded lines");

  upload.query["min_pts"] = "many";
  upload.parts.erase(upload.parts.begin());
  ASSERT_EQ(handler.handleUpload(upload).status, 400, "bad min_pts in query");

  http::Request latin1;
  latin1.method = http::HttpRequest::POST;
  latin1.mediaType = "multipart/form-data";
  MultipartFile bad_text{"u.txt", "caf\xE9 refund\nrefund policy\n"};
  wServer::attach_body(latin1, multipart_file_body(bad_text), kBoundary);
  res = handler.handleUpload(latin1);
  ASSERT_EQ(res.status, 400, "non-UTF-8 upload rejected");
  ASSERT_EQ(nlohmann::json::parse(res.body)["status"], "error", "rejection has an error body");

  http::Request no_file;
  no_file.method = http::HttpRequest::POST;
  ASSERT_EQ(handler.handleUpload(no_file).status, 400, "upload without a file");

  http::Response health = handler.handleHealth(http::Request());
  ASSERT_EQ(health.status, 200, "health");
  ASSERT_EQ(nlohmann::json::parse(health.body)["cluster_space"], "rows", "health reports defaults");
}

int main() {
  printf("=== Server Tests ===\n");
  test_parse_head();
  test_multipart();
  test_dispatch();
  test_cluster_handler();
  return report("server");
}
