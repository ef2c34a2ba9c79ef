// Repository: Whipcast
// Component: Daydream REST Client Contract Tests
// Purpose: Verify request bodies, response parsing and HTTP status mapping of
//          the stream API client against a loopback server.
// Copyright (c) 2025 Whipcast

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <httplib.h>

#include "whipcast/api/DaydreamApiClient.hpp"
#include "whipcast/runtime/EventLoop.hpp"
#include "whipcast/runtime/IoWorker.hpp"

namespace whipcast::api::testing {
namespace {

using runtime::CallResult;
using runtime::ErrorKind;

Json::Value ParseJson(const std::string& text) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  EXPECT_TRUE(reader->parse(text.data(), text.data() + text.size(), &root, &errors)) << errors;
  return root;
}

// Test the create body carries the pipeline and defaulted params
TEST(DaydreamApiContract, CreateBodyDefaultsParams) {
  CreateSessionRequest request;
  request.pipeline_id = "pip_abc";
  params::DiffusionParams initial;
  initial.prompt = "ocean";
  request.initial_params = initial;

  const Json::Value body = BuildCreateSessionBody(request);
  EXPECT_EQ(body["pipeline_id"].asString(), "pip_abc");
  const Json::Value& p = body["pipeline_params"];
  EXPECT_EQ(p["prompt"].asString(), "ocean");
  EXPECT_EQ(p["model_id"].asString(), params::kDefaultModelId);
  EXPECT_EQ(p["seed"].asInt64(), params::kDefaultSeed);
  EXPECT_EQ(p["controlnets"].size(), 3u);
}

// Test a create body without initial params still sends defaults
TEST(DaydreamApiContract, CreateBodyWithoutInitialParams) {
  CreateSessionRequest request;
  request.pipeline_id = "pip_abc";
  const Json::Value body = BuildCreateSessionBody(request);
  EXPECT_EQ(body["pipeline_params"]["prompt"].asString(), "");
  EXPECT_EQ(body["pipeline_params"]["num_inference_steps"].asInt(),
            params::kDefaultInferenceSteps);
}

// Test the update body wraps the full parameter set
TEST(DaydreamApiContract, UpdateBodyWrapsParams) {
  params::DiffusionParams p;
  p.prompt = "desert";
  p.seed = 5;
  const Json::Value body = BuildUpdateParamsBody(p);
  ASSERT_TRUE(body.isMember("params"));
  EXPECT_EQ(body["params"]["prompt"].asString(), "desert");
  EXPECT_EQ(body["params"]["seed"].asInt64(), 5);
  EXPECT_TRUE(body["params"].isMember("t_index_list"));
}

// Test a complete response yields the session descriptor
TEST(DaydreamApiContract, ParsesCreateResponse) {
  const CreateSessionResult out = ParseCreateSessionResponse(
      R"({"id":"str_1","output_playback_id":"pb_1","whip_url":"https://w.test/str_1","x":1})");
  EXPECT_TRUE(out.result.success);
  EXPECT_EQ(out.session.stream_id, "str_1");
  EXPECT_EQ(out.session.output_playback_id, "pb_1");
  EXPECT_EQ(out.session.whip_url, "https://w.test/str_1");
}

// Test incomplete or malformed responses are transient failures
TEST(DaydreamApiContract, RejectsIncompleteResponse) {
  EXPECT_EQ(ParseCreateSessionResponse("not json").result.kind, ErrorKind::kTransientNetwork);
  EXPECT_EQ(ParseCreateSessionResponse("[]").result.kind, ErrorKind::kTransientNetwork);

  const CreateSessionResult missing =
      ParseCreateSessionResponse(R"({"id":"str_1","output_playback_id":"pb_1"})");
  EXPECT_FALSE(missing.result.success);
  EXPECT_NE(missing.result.message.find("whip_url"), std::string::npos);

  const CreateSessionResult empty = ParseCreateSessionResponse(
      R"({"id":"","output_playback_id":"pb_1","whip_url":"https://w.test"})");
  EXPECT_FALSE(empty.result.success);
}

// Loopback stream API with scripted statuses.
class DaydreamApiClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    server_.Post("/v1/streams", [this](const httplib::Request& req, httplib::Response& res) {
      std::lock_guard<std::mutex> lock(mutex_);
      last_body_ = req.body;
      last_auth_ = req.get_header_value("Authorization");
      res.status = create_status_;
      res.set_content(
          R"({"id":"str_42","output_playback_id":"pb_42","whip_url":"https://w.test/str_42"})",
          "application/json");
    });
    server_.Patch(R"(/v1/streams/([^/]+))",
                  [this](const httplib::Request& req, httplib::Response& res) {
      std::lock_guard<std::mutex> lock(mutex_);
      last_path_ = req.path;
      last_body_ = req.body;
      res.status = update_status_;
      res.set_content("{}", "application/json");
    });

    port_ = server_.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port_, 0);
    server_thread_ = std::thread([this] { server_.listen_after_bind(); });
    server_.wait_until_ready();

    loop_.Start();
    worker_.Start();

    ApiConfig config;
    config.base_url = "http://127.0.0.1:" + std::to_string(port_);
    config.api_key = "sk_test";
    client_ = std::make_unique<DaydreamApiClient>(worker_, loop_, config);
  }

  void TearDown() override {
    worker_.Stop();
    loop_.Stop();
    server_.stop();
    if (server_thread_.joinable()) server_thread_.join();
  }

  CreateSessionResult Create() {
    std::promise<CreateSessionResult> promise;
    auto future = promise.get_future();
    CreateSessionRequest request;
    request.pipeline_id = "pip_1";
    client_->CreateSession(request, [&promise](CreateSessionResult r) {
      promise.set_value(std::move(r));
    });
    EXPECT_EQ(future.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    return future.get();
  }

  CallResult Update(const std::string& stream_id) {
    std::promise<CallResult> promise;
    auto future = promise.get_future();
    params::DiffusionParams p;
    p.prompt = "forest";
    client_->UpdateParams(stream_id, p, [&promise](CallResult r) { promise.set_value(r); });
    EXPECT_EQ(future.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    return future.get();
  }

  httplib::Server server_;
  std::thread server_thread_;
  int port_ = 0;
  runtime::EventLoop loop_;
  runtime::IoWorker worker_{"api-test"};
  std::unique_ptr<DaydreamApiClient> client_;

  std::mutex mutex_;
  int create_status_ = 201;
  int update_status_ = 200;
  std::string last_body_;
  std::string last_auth_;
  std::string last_path_;
};

// Test stream creation posts the body with bearer auth and parses the answer
TEST_F(DaydreamApiClientTest, CreatesStream) {
  const CreateSessionResult out = Create();
  ASSERT_TRUE(out.result.success) << runtime::Describe(out.result);
  EXPECT_EQ(out.session.stream_id, "str_42");
  EXPECT_EQ(out.session.whip_url, "https://w.test/str_42");

  std::lock_guard<std::mutex> lock(mutex_);
  EXPECT_EQ(last_auth_, "Bearer sk_test");
  EXPECT_EQ(ParseJson(last_body_)["pipeline_id"].asString(), "pip_1");
}

// Test a 4xx on creation is a client error
TEST_F(DaydreamApiClientTest, CreateClientErrorIsNotTransient) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    create_status_ = 401;
  }
  const CreateSessionResult out = Create();
  EXPECT_EQ(out.result.kind, ErrorKind::kClientError);
  EXPECT_EQ(out.result.http_status, 401);
}

// Test a 5xx on creation is transient
TEST_F(DaydreamApiClientTest, CreateServerErrorIsTransient) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    create_status_ = 503;
  }
  const CreateSessionResult out = Create();
  EXPECT_EQ(out.result.kind, ErrorKind::kTransientNetwork);
  EXPECT_EQ(out.result.http_status, 503);
}

// Test a parameter update patches the stream resource
TEST_F(DaydreamApiClientTest, PatchesParams) {
  const CallResult result = Update("str_42");
  EXPECT_TRUE(result.success) << runtime::Describe(result);

  std::lock_guard<std::mutex> lock(mutex_);
  EXPECT_EQ(last_path_, "/v1/streams/str_42");
  EXPECT_EQ(ParseJson(last_body_)["params"]["prompt"].asString(), "forest");
}

// Test update statuses map onto the error taxonomy
TEST_F(DaydreamApiClientTest, UpdateStatusMapping) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    update_status_ = 422;
  }
  EXPECT_EQ(Update("str_42").kind, ErrorKind::kClientError);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    update_status_ = 500;
  }
  EXPECT_EQ(Update("str_42").kind, ErrorKind::kTransientNetwork);
}

// Test an unusable base URL fails without a request
TEST(DaydreamApiClientConfig, InvalidBaseUrlIsClientError) {
  runtime::EventLoop loop;
  runtime::IoWorker worker("api-test");
  loop.Start();
  worker.Start();

  ApiConfig config;
  config.base_url = "ftp://nowhere";
  DaydreamApiClient client(worker, loop, config);

  std::promise<CallResult> promise;
  auto future = promise.get_future();
  client.UpdateParams("str_1", params::DiffusionParams{},
                      [&promise](CallResult r) { promise.set_value(r); });
  ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(future.get().kind, ErrorKind::kClientError);

  worker.Stop();
  loop.Stop();
}

}  // namespace
}  // namespace whipcast::api::testing
