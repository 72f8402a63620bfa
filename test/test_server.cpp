#include <gtest/gtest.h>

#include "arsenal_catalog.h"
#include "arsenal_server.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

using namespace arsenal;
using namespace std::chrono_literals;

namespace {

    // Reads an event stream on its own thread and splits it into events
    class stream_reader {
        public:
            stream_reader(int port, const std::string& path)
                : client_("127.0.0.1", port) {
                client_.set_read_timeout(5, 0);
                thread_ = std::thread([this, path]() {
                    client_.Get(path, [this](const char* data, size_t length) {
                        std::lock_guard<std::mutex> lock(mutex_);
                        buffer_.append(data, length);
                        size_t end;
                        while ((end = buffer_.find("\n\n")) != std::string::npos) {
                            std::string event = buffer_.substr(0, end);
                            buffer_.erase(0, end + 2);
                            if (event.rfind("data: ", 0) == 0) {
                                events_.push_back(json::parse(event.substr(6)));
                            }
                        }
                        cv_.notify_all();
                        return !stop_;
                    });
                });
            }

            ~stream_reader() {
                close();
            }

            void close() {
                stop_ = true;
                if (thread_.joinable()) {
                    thread_.join();
                }
            }

            // First event matching pred, or null after the timeout
            json wait_for(const std::function<bool(const json&)>& pred, std::chrono::milliseconds timeout = 3s) {
                std::unique_lock<std::mutex> lock(mutex_);
                json found;
                cv_.wait_for(lock, timeout, [&]() {
                    for (const auto& event : events_) {
                        if (pred(event)) {
                            found = event;
                            return true;
                        }
                    }
                    return false;
                });
                return found;
            }

        private:
            httplib::Client client_;
            std::mutex mutex_;
            std::condition_variable cv_;
            std::string buffer_;
            std::vector<json> events_;
            std::atomic<bool> stop_{false};
            // Last, so everything the reader touches is constructed first
            std::thread thread_;
    };

    bool has_method(const json& event, const std::string& method) {
        return event.contains("method") && event["method"] == method;
    }

    class ServerTest : public ::testing::Test {
        protected:
            void SetUp() override {
                restart(test_config());
            }

            static server::configuration test_config() {
                server::configuration conf;
                conf.host = "127.0.0.1";
                conf.port = 0;
                conf.heartbeat_interval = 50ms;
                conf.stream_poll_interval = 20ms;
                conf.maintenance_interval = 50ms;
                conf.threadpool_size = 2;
                conf.tool_threads = 2;
                conf.http_threads = 8;
                conf.max_streams = 4;
                conf.arsenal_tools = 711;
                conf.bleeding_edge = true;
                return conf;
            }

            // Replaces the running server with one built from conf
            void restart(const server::configuration& conf) {
                if (server_) {
                    server_->stop();
                }

                auto registry = std::make_shared<tool_registry>();
                register_catalog_tools(*registry, std::make_shared<const arsenal_catalog>("Test Platform"));

                server_ = std::make_unique<server>(conf, registry, default_capabilities());
                ASSERT_TRUE(server_->start(false));
                ASSERT_GT(server_->port(), 0);

                client_ = std::make_unique<httplib::Client>("127.0.0.1", server_->port());
                client_->set_read_timeout(5, 0);
            }

            std::string open_session(stream_reader& stream) {
                json init = stream.wait_for([](const json& e) { return has_method(e, "initialize"); });
                EXPECT_FALSE(init.is_null());
                return init.is_null() ? std::string() : init["params"]["sessionId"].get<std::string>();
            }

            bool wait_for_sessions(size_t expected, std::chrono::milliseconds timeout = 3s) {
                auto until = std::chrono::steady_clock::now() + timeout;
                while (server_->session_count() != expected && std::chrono::steady_clock::now() < until) {
                    std::this_thread::sleep_for(20ms);
                }
                return server_->session_count() == expected;
            }

            void TearDown() override {
                server_->stop();
            }

            json post(const std::string& body, int expected_status) {
                auto res = client_->Post("/mcp/sse", body, "application/json");
                EXPECT_TRUE(res);
                if (!res) {
                    return json();
                }
                EXPECT_EQ(res->status, expected_status) << res->body;
                return json::parse(res->body);
            }

            std::unique_ptr<server> server_;
            std::unique_ptr<httplib::Client> client_;
    };

} // namespace

TEST_F(ServerTest, PostListsTools) {
    json body = post(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})", 200);
    ASSERT_TRUE(body["result"]["tools"].is_array());
    EXPECT_EQ(body["result"]["tools"].size(), 5u);
    EXPECT_EQ(body["result"]["tools"][0]["name"], "get_complete_kali_arsenal_info");
}

TEST_F(ServerTest, PostCallsTool) {
    json body = post(R"({"jsonrpc":"2.0","id":"c1","method":"tools/call","params":{"name":"get_kali_tool_category","arguments":{"category_name":"Forensics"}}})", 200);
    EXPECT_EQ(body["id"], "c1");
    EXPECT_EQ(body["result"]["isError"], false);
    EXPECT_EQ(body["result"]["content"][0]["type"], "text");
}

TEST_F(ServerTest, PostUnknownMethodIsRpcError) {
    json body = post(R"({"jsonrpc":"2.0","id":"abc","method":"foo/bar"})", 200);
    EXPECT_EQ(body["id"], "abc");
    EXPECT_EQ(body["error"]["code"], -32601);
}

TEST_F(ServerTest, PostMalformedBodyIs500) {
    json body = post("{broken", 500);
    EXPECT_EQ(body["error"]["code"], -32603);
}

TEST_F(ServerTest, HealthReportsRegistry) {
    auto res = client_->Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    json body = json::parse(res->body);
    EXPECT_EQ(body["status"], "healthy");
    EXPECT_EQ(body["total_tools"], 5);
    EXPECT_EQ(body["arsenal_tools"], 711);
    EXPECT_EQ(body["bleeding_edge"], true);
    EXPECT_EQ(body["capability_flags"]["bleeding_edge"], true);
}

TEST_F(ServerTest, OptionsAnswersPreflight) {
    auto res = client_->Options("/mcp/sse");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 204);
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
}

TEST_F(ServerTest, StreamStartsWithInitializeThenHeartbeats) {
    stream_reader stream(server_->port(), "/mcp/sse");

    json init = stream.wait_for([](const json& e) { return has_method(e, "initialize"); });
    ASSERT_FALSE(init.is_null());
    EXPECT_EQ(init["params"]["protocolVersion"], ARSENAL_PROTOCOL_VERSION);
    EXPECT_EQ(init["params"]["serverInfo"]["name"], "arsenal-mcp-server");
    EXPECT_TRUE(init["params"]["sessionId"].is_string());

    json heartbeat = stream.wait_for([](const json& e) { return has_method(e, "heartbeat"); });
    ASSERT_FALSE(heartbeat.is_null());
    EXPECT_GE(heartbeat["params"]["sequence"].get<int64_t>(), 1);

    EXPECT_EQ(server_->session_count(), 1u);
}

TEST_F(ServerTest, SessionPostIsAnsweredOnStream) {
    stream_reader stream(server_->port(), "/mcp/sse");

    json init = stream.wait_for([](const json& e) { return has_method(e, "initialize"); });
    ASSERT_FALSE(init.is_null());
    std::string session_id = init["params"]["sessionId"].get<std::string>();

    auto res = client_->Post("/mcp/sse?session_id=" + session_id,
        R"({"jsonrpc":"2.0","id":"routed","method":"tools/list"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);

    json reply = stream.wait_for([](const json& e) { return e.contains("id") && e["id"] == "routed"; });
    ASSERT_FALSE(reply.is_null());
    EXPECT_EQ(reply["result"]["tools"].size(), 5u);
}

TEST_F(ServerTest, SessionPostToUnknownSessionIs404) {
    auto res = client_->Post("/mcp/sse?session_id=does-not-exist",
        R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
}

TEST_F(ServerTest, DisconnectedStreamReleasesSession) {
    {
        stream_reader stream(server_->port(), "/mcp/sse");
        ASSERT_FALSE(stream.wait_for([](const json& e) { return has_method(e, "initialize"); }).is_null());
        EXPECT_EQ(server_->session_count(), 1u);
    }

    auto until = std::chrono::steady_clock::now() + 3s;
    while (server_->session_count() > 0 && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(20ms);
    }
    EXPECT_EQ(server_->session_count(), 0u);
}

TEST_F(ServerTest, StopClosesOpenStreams) {
    stream_reader stream(server_->port(), "/mcp/sse");
    ASSERT_FALSE(stream.wait_for([](const json& e) { return has_method(e, "initialize"); }).is_null());

    server_->stop();
    EXPECT_FALSE(server_->is_running());
    EXPECT_EQ(server_->session_count(), 0u);
}

TEST_F(ServerTest, NotificationIsAcceptedWithoutBody) {
    auto res = client_->Post("/mcp/sse", R"({"jsonrpc":"2.0","method":"notifications/initialized"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);
    EXPECT_TRUE(res->body.empty());
}

TEST_F(ServerTest, SessionPostWithMalformedBodyIs500) {
    stream_reader stream(server_->port(), "/mcp/sse");
    std::string session_id = open_session(stream);
    ASSERT_FALSE(session_id.empty());

    auto res = client_->Post("/mcp/sse?session_id=" + session_id, "{broken", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 500);
    json body = json::parse(res->body);
    EXPECT_EQ(body["error"]["code"], -32603);

    EXPECT_EQ(server_->session_count(), 1u);
}

TEST_F(ServerTest, IdleSessionIsClosedByMaintenance) {
    server::configuration conf = test_config();
    conf.heartbeat_interval = 1h;
    conf.session_timeout = 200ms;
    restart(conf);

    stream_reader stream(server_->port(), "/mcp/sse");
    ASSERT_FALSE(open_session(stream).empty());

    EXPECT_TRUE(wait_for_sessions(0));
}

TEST_F(ServerTest, ActiveSessionOutlivesTimeout) {
    server::configuration conf = test_config();
    conf.heartbeat_interval = 50ms;
    conf.session_timeout = 500ms;
    restart(conf);

    stream_reader stream(server_->port(), "/mcp/sse");
    ASSERT_FALSE(open_session(stream).empty());

    std::this_thread::sleep_for(1s);
    EXPECT_EQ(server_->session_count(), 1u);
}

TEST_F(ServerTest, StreamsBeyondLimitAreRefused) {
    server::configuration conf = test_config();
    conf.max_streams = 1;
    restart(conf);

    stream_reader first(server_->port(), "/mcp/sse");
    ASSERT_FALSE(open_session(first).empty());

    auto res = client_->Get("/mcp/sse");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 503);

    auto health = client_->Get("/health");
    ASSERT_TRUE(health);
    EXPECT_EQ(health->status, 200);
}

TEST(ServerConfigTest, RejectsStreamLimitThatStarvesWorkers) {
    server::configuration conf;
    conf.http_threads = 8;
    conf.max_streams = 8;

    EXPECT_THROW(std::make_unique<server>(conf, std::make_shared<tool_registry>(), json::object()), std::invalid_argument);
}
