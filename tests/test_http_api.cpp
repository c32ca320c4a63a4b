#include <gtest/gtest.h>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

#include "FakeRemote.hpp"
#include "TestSupport.hpp"
#include "core/Librarian.hpp"
#include "services/api/HttpServer.hpp"

using namespace alib;
using namespace std::chrono_literals;
using alib::test::FakeRemote;
using alib::test::TempDir;
using nlohmann::json;

namespace fs = std::filesystem;

namespace {

class HttpApiTest : public ::testing::Test {
protected:
  void SetUp() override {
    root = dir.str("library");
    source = dir.str("source");
    fs::create_directories(source);
    config.retry.backoff_base = 1ms;
    config.retry.backoff_max = 1ms;
    Librarian::initRepository(root, ALIB_SCHEMA_PATH);
    lib = std::make_unique<Librarian>(root, ALIB_SCHEMA_PATH, config, remote);
  }

  void serve(const std::string& apiKey = {}) {
    install_routes(svr, *lib, apiKey);
    port = svr.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    worker = std::thread([this] { svr.listen_after_bind(); });
    while (!svr.is_running()) std::this_thread::sleep_for(1ms);
  }

  void TearDown() override {
    if (worker.joinable()) {
      svr.stop();
      worker.join();
    }
  }

  httplib::Client client() const { return httplib::Client("127.0.0.1", port); }

  std::string meta() const {
    return json{{"source_path", source},
                {"description", "scans"},
                {"files", {{{"path", "scan-001.tif"}, {"size", 64}}}}}.dump();
  }

  // Creates an archive through the API and returns its id.
  std::string createOne(httplib::Client& cli) {
    auto res = cli.Post("/archives", {{"X-ALIB-Meta", meta()}}, alib::test::make_bytes(64, 3),
                        "application/octet-stream");
    EXPECT_TRUE(res);
    if (!res) return {};
    EXPECT_EQ(res->status, 201);
    return json::parse(res->body)["id"].get<std::string>();
  }

  TempDir dir;
  std::string root;
  std::string source;
  EngineConfig config;
  FakeRemote remote;
  std::unique_ptr<Librarian> lib;
  httplib::Server svr;
  std::thread worker;
  int port = 0;
};

} // namespace

TEST_F(HttpApiTest, Health) {
  serve();
  auto cli = client();
  auto res = cli.Get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(res->body, "ok");
}

TEST_F(HttpApiTest, CreateListAndResolve) {
  serve();
  auto cli = client();
  const std::string id = createOne(cli);
  ASSERT_EQ(id.size(), 16u);

  auto list = cli.Get("/archives?limit=10");
  ASSERT_TRUE(list);
  EXPECT_EQ(list->status, 200);
  const json arr = json::parse(list->body);
  ASSERT_EQ(arr.size(), 1u);
  EXPECT_EQ(arr[0]["id"].get<std::string>(), id);
  EXPECT_EQ(arr[0]["upload_status"].get<std::string>(), "NONE");
  EXPECT_TRUE(arr[0]["remote_archive_id"].is_null());

  auto one = cli.Get("/archives/" + id.substr(0, 6));
  ASSERT_TRUE(one);
  EXPECT_EQ(one->status, 200);
  EXPECT_EQ(json::parse(one->body)["description"].get<std::string>(), "scans");
}

TEST_F(HttpApiTest, ErrorsComeBackAsJson) {
  serve();
  auto cli = client();

  auto missing = cli.Get("/archives/ffffffff");
  ASSERT_TRUE(missing);
  EXPECT_EQ(missing->status, 404);
  EXPECT_EQ(json::parse(missing->body)["error"].get<std::string>(), "NotFoundError");

  auto bad = cli.Post("/archives", {{"X-ALIB-Meta", "{not json"}}, "x", "application/octet-stream");
  ASSERT_TRUE(bad);
  EXPECT_EQ(bad->status, 422);
  EXPECT_EQ(json::parse(bad->body)["error"].get<std::string>(), "ValidationError");

  auto badRange = cli.Post("/archives/abc/retrieve?first=x&last=2", std::string(), "text/plain");
  ASSERT_TRUE(badRange);
  EXPECT_EQ(badRange->status, 422);

  auto unknown = cli.Get("/nowhere");
  ASSERT_TRUE(unknown);
  EXPECT_EQ(unknown->status, 404);
}

TEST_F(HttpApiTest, PayloadPathMustStayUnderSource) {
  serve();
  auto cli = client();
  const std::string outside = dir.str("secret.bin");
  const std::string inside = source + "/scan-001.tif";
  alib::test::write_file(outside, alib::test::make_bytes(64, 4));
  alib::test::write_file(inside, alib::test::make_bytes(64, 5));

  json m = json::parse(meta());
  m["payload_path"] = outside;
  auto refused = cli.Post("/archives", {{"X-ALIB-Meta", m.dump()}}, std::string(), "application/octet-stream");
  ASSERT_TRUE(refused);
  EXPECT_EQ(refused->status, 422);
  m["payload_path"] = source + "/../secret.bin";
  auto sneaky = cli.Post("/archives", {{"X-ALIB-Meta", m.dump()}}, std::string(), "application/octet-stream");
  ASSERT_TRUE(sneaky);
  EXPECT_EQ(sneaky->status, 422);
  EXPECT_TRUE(lib->listArchives().empty());

  m["payload_path"] = inside;
  auto accepted = cli.Post("/archives", {{"X-ALIB-Meta", m.dump()}}, std::string(), "application/octet-stream");
  ASSERT_TRUE(accepted);
  EXPECT_EQ(accepted->status, 201);
}

TEST_F(HttpApiTest, UploadRetrieveAndCheck) {
  serve();
  auto cli = client();
  const std::string id = createOne(cli);

  auto up = cli.Post("/archives/" + id + "/upload", std::string(), "text/plain");
  ASSERT_TRUE(up);
  EXPECT_EQ(up->status, 200);
  const json outcome = json::parse(up->body);
  EXPECT_EQ(outcome["state"].get<std::string>(), "COMPLETED");
  EXPECT_EQ(outcome["strategy"].get<std::string>(), "SINGLE_PART");

  auto again = cli.Post("/archives/" + id + "/upload", std::string(), "text/plain");
  ASSERT_TRUE(again);
  EXPECT_EQ(again->status, 422);

  auto rt = cli.Post("/archives/" + id + "/retrieve?first=0&last=9", std::string(), "text/plain");
  ASSERT_TRUE(rt);
  EXPECT_EQ(rt->status, 202);
  const json job = json::parse(rt->body);
  EXPECT_EQ(job["range"]["last"].get<uint64_t>(), 9u);

  remote.setJobState(job["remote_job_id"].get<std::string>(), RemoteJobState::Succeeded);
  auto check = cli.Post("/jobs/check", std::string(), "text/plain");
  ASSERT_TRUE(check);
  EXPECT_EQ(check->status, 200);
  bool advanced = false;
  for (const auto& r : json::parse(check->body))
    if (r["job_id"] == job["id"]) advanced = r["advanced"].get<bool>();
  EXPECT_TRUE(advanced);

  auto jobs = cli.Get("/jobs");
  ASSERT_TRUE(jobs);
  const json all = json::parse(jobs->body);
  EXPECT_EQ(all["uploads"].size(), 1u);
  EXPECT_EQ(all["retrievals"].size(), 1u);
  EXPECT_EQ(all["retrievals"][0]["state"].get<std::string>(), "READY");
}

TEST_F(HttpApiTest, ApiKeyIsEnforced) {
  serve("s3cret");
  auto cli = client();

  auto denied = cli.Get("/archives");
  ASSERT_TRUE(denied);
  EXPECT_EQ(denied->status, 401);

  auto allowed = cli.Get("/archives", {{"X-API-Key", "s3cret"}});
  ASSERT_TRUE(allowed);
  EXPECT_EQ(allowed->status, 200);

  auto health = cli.Get("/health");
  ASSERT_TRUE(health);
  EXPECT_EQ(health->status, 200);
}
