#include <core/model/server_state.h>
#include <core/network/client/http_client.h>
#include <core/network/server/http_server.h>
#include <core/network/server/receive_inbox.h>
#include <core/util/config.h>
#include <core/util/multipart.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <test_helpers.h>
#include <utility>
#include <vector>

namespace sendplus::core {
namespace {

class HttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings.alias = "Server Under Test";
        server_.SetSaveDirectory(save_dir_.path() / "inbox");
        ASSERT_TRUE(server_.Start(0));
        port_ = server_.port();
        ASSERT_NE(port_, 0);
    }

    void TearDown() override {
        server_.Stop();
        test::RunFor(ioc_, std::chrono::milliseconds(20));
    }

    HttpResponse Send(http::verb method,
                      std::string target,
                      std::string body = {},
                      std::string content_type = {}) {
        return test::RunUntilComplete(ioc_,
                                      request(ioc_,
                                              port_,
                                              method,
                                              std::move(target),
                                              std::move(body),
                                              std::move(content_type)));
    }

    HttpResponse Upload(const std::string& file_name, const std::string& content) {
        multipart::FormBuilder form;
        form.AddField("fileName", file_name);
        form.AddField("fileSize", std::to_string(content.size()));
        form.SetFile("file", file_name);
        return Send(http::verb::post,
                    "/receive",
                    form.preamble() + content + form.epilogue(),
                    form.ContentType());
    }

    // A hand-written form whose file parts are (filename, content) pairs.
    HttpResponse UploadParts(const std::vector<std::pair<std::string, std::string>>& files) {
        std::string body;
        for (const auto& [file_name, content] : files) {
            body += "--parts\r\n";
            body += "Content-Disposition: form-data; name=\"file\"; filename=\"" + file_name + "\"\r\n";
            body += "Content-Type: application/octet-stream\r\n\r\n";
            body += content + "\r\n";
        }
        body += "--parts--\r\n";
        return Send(http::verb::post, "/receive", body, "multipart/form-data; boundary=parts");
    }

    static net::awaitable<HttpResponse> request(net::io_context& ioc,
                                                std::uint16_t port,
                                                http::verb method,
                                                std::string target,
                                                std::string body,
                                                std::string content_type) {
        HttpClient client(ioc);
        co_await client.Connect("127.0.0.1", port);
        auto req = client.CreateRequest<http::string_body>(method, target);
        if (!content_type.empty()) {
            req.set(http::field::content_type, content_type);
        }
        req.body() = std::move(body);
        req.prepare_payload();
        co_return co_await client.SendRequest(req);
    }

    net::io_context ioc_;
    test::TempDir save_dir_;
    ReceiveInbox inbox_;
    SingleSlot<ServerState> state_;
    HttpServer server_{ioc_, inbox_, state_};
    std::uint16_t port_{0};
};

TEST_F(HttpServerTest, PublishesRunningState) {
    auto state = state_.Get();
    ASSERT_TRUE(state.has_value());
    EXPECT_TRUE(state->running);
    EXPECT_EQ(state->port, port_);
    EXPECT_FALSE(state->error.has_value());
}

TEST_F(HttpServerTest, Greeting) {
    auto res = Send(http::verb::get, "/");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "Hello from SendPlus server!");
}

TEST_F(HttpServerTest, DeviceInfo) {
    auto res = Send(http::verb::get, "/info");
    ASSERT_EQ(res.result(), http::status::ok);

    auto info = nlohmann::json::parse(res.body());
    EXPECT_EQ(info["alias"], "Server Under Test");
    EXPECT_EQ(info["version"], "1.0.0");
    EXPECT_TRUE(info["deviceModel"].is_string());
    EXPECT_EQ(info["https"], false);
}

TEST_F(HttpServerTest, QueryStringIsIgnoredForRouting) {
    EXPECT_EQ(Send(http::verb::get, "/info?verbose=1").result(), http::status::ok);
}

TEST_F(HttpServerTest, UnknownRouteIsNotFound) {
    EXPECT_EQ(Send(http::verb::get, "/nope").result(), http::status::not_found);
}

TEST_F(HttpServerTest, WrongMethodIsRejected) {
    EXPECT_EQ(Send(http::verb::post, "/info").result(), http::status::method_not_allowed);
    EXPECT_EQ(Send(http::verb::get, "/receive-text").result(), http::status::method_not_allowed);
}

TEST_F(HttpServerTest, ReceivesText) {
    auto res = Send(http::verb::post, "/receive-text", "héllo there", "text/plain; charset=utf-8");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "Text received successfully.");
    EXPECT_EQ(inbox_.text.Get(), "héllo there");
}

TEST_F(HttpServerTest, TextWithOtherContentTypeIsAccepted) {
    auto res = Send(http::verb::post, "/receive-text", "{\"a\":1}", "application/json");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(inbox_.text.Get(), "{\"a\":1}");
}

TEST_F(HttpServerTest, EmptyTextIsRejected) {
    auto res = Send(http::verb::post, "/receive-text", "", "text/plain");
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(res.body(), "Received empty text.");
    EXPECT_FALSE(inbox_.text.HasValue());
}

TEST_F(HttpServerTest, ReceivesFile) {
    auto res = Upload("notes.txt", "line one\nline two\n");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "File \"notes.txt\" received successfully.");

    auto target = save_dir_.path() / "inbox" / "notes.txt";
    EXPECT_EQ(test::ReadFile(target), "line one\nline two\n");

    auto received = inbox_.file.Get();
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->filename, "notes.txt");
    EXPECT_EQ(received->path, target);
}

TEST_F(HttpServerTest, UploadedNameIsSanitized) {
    auto res = Upload("../outside.txt", "x");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_TRUE(std::filesystem::exists(save_dir_.path() / "inbox" / ".._outside.txt"));
    EXPECT_FALSE(std::filesystem::exists(save_dir_.path() / "outside.txt"));
}

TEST_F(HttpServerTest, ReservedCharactersInUploadNameAreReplaced) {
    auto res = Upload("con:fig/<1>.txt", "cfg");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(test::ReadFile(save_dir_.path() / "inbox" / "con_fig__1_.txt"), "cfg");
    ASSERT_TRUE(inbox_.file.HasValue());
    EXPECT_EQ(inbox_.file.Get()->filename, "con_fig__1_.txt");
}

TEST_F(HttpServerTest, OnlyFirstFilePartIsStored) {
    auto res = UploadParts({{"one.txt", "first"}, {"two.txt", "second"}});
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "File \"one.txt\" received successfully.");
    EXPECT_EQ(test::ReadFile(save_dir_.path() / "inbox" / "one.txt"), "first");
    EXPECT_FALSE(std::filesystem::exists(save_dir_.path() / "inbox" / "two.txt"));
    EXPECT_EQ(inbox_.file.Get()->filename, "one.txt");
}

TEST_F(HttpServerTest, UnusableFilePartIsSkipped) {
    auto res = UploadParts({{"  ", "ignored"}, {"kept.txt", "payload"}});
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(test::ReadFile(save_dir_.path() / "inbox" / "kept.txt"), "payload");
    ASSERT_TRUE(inbox_.file.HasValue());
    EXPECT_EQ(inbox_.file.Get()->filename, "kept.txt");
}

TEST_F(HttpServerTest, ReceivedPathIsAbsolute) {
    auto relative_dir = std::filesystem::relative(save_dir_.path() / "relative-inbox");
    ASSERT_TRUE(relative_dir.is_relative());
    server_.SetSaveDirectory(relative_dir);

    EXPECT_EQ(Upload("rel.txt", "r").result(), http::status::ok);

    auto received = inbox_.file.Get();
    ASSERT_TRUE(received.has_value());
    EXPECT_TRUE(received->path.is_absolute());
    EXPECT_TRUE(std::filesystem::equivalent(received->path,
                                            save_dir_.path() / "relative-inbox" / "rel.txt"));
}

TEST_F(HttpServerTest, LargeUploadIsStreamedToDisk) {
    std::string content(3 * 1024 * 1024 + 17, '\0');
    for (std::size_t i = 0; i < content.size(); ++i) {
        content[i] = static_cast<char>((i * 7 + i / 4096) % 256);
    }
    auto res = Upload("large.bin", content);
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(test::ReadFile(save_dir_.path() / "inbox" / "large.bin"), content);
}

TEST_F(HttpServerTest, UploadReplacesPendingFile) {
    Upload("first.txt", "1");
    Upload("second.txt", "2");
    ASSERT_TRUE(inbox_.file.HasValue());
    EXPECT_EQ(inbox_.file.Get()->filename, "second.txt");
}

TEST_F(HttpServerTest, NonMultipartUploadIsRejected) {
    auto res = Send(http::verb::post, "/receive", "raw bytes", "application/octet-stream");
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(res.body(), "Expected a multipart/form-data request.");
}

TEST_F(HttpServerTest, MalformedMultipartIsRejected) {
    auto res = Send(http::verb::post,
                    "/receive",
                    "--b\r\nContent-Disposition: form-data; name=\"file\"; filename=\"a\"\r\n\r\nno end",
                    "multipart/form-data; boundary=b");
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_FALSE(inbox_.file.HasValue());
    // the started file is not left behind
    EXPECT_FALSE(std::filesystem::exists(save_dir_.path() / "inbox" / "a"));
}

TEST_F(HttpServerTest, ConnectionIsReusableAfterEarlyRejection) {
    auto rejected_then_greeted = [](net::io_context& ioc,
                                    std::uint16_t port) -> net::awaitable<std::pair<int, int>> {
        HttpClient client(ioc);
        co_await client.Connect("127.0.0.1", port);

        auto upload = client.CreateRequest<http::string_body>(http::verb::post, "/receive", true);
        upload.set(http::field::content_type, "application/octet-stream");
        upload.body() = std::string(10000, 'z');
        upload.prepare_payload();
        auto first = co_await client.SendRequest(upload);

        auto greeting = client.CreateRequest<http::string_body>(http::verb::get, "/", true);
        auto second = co_await client.SendRequest(greeting);
        co_return std::make_pair(first.result_int(), second.result_int());
    };

    auto [first, second] = test::RunUntilComplete(ioc_, rejected_then_greeted(ioc_, port_));
    EXPECT_EQ(first, 400);
    EXPECT_EQ(second, 200);
}

TEST_F(HttpServerTest, UploadWithoutFilePartIsRejected) {
    multipart::FormBuilder form;
    form.AddField("fileName", "ghost.txt");
    auto res = Send(http::verb::post, "/receive", form.preamble() + form.epilogue(), form.ContentType());
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(res.body(), "No valid file part found in the request.");
    EXPECT_FALSE(std::filesystem::exists(save_dir_.path() / "inbox" / "ghost.txt"));
}

TEST_F(HttpServerTest, BlankFileNameIsNotUsable) {
    auto res = Upload("   ", "data");
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_FALSE(inbox_.file.HasValue());
}

TEST_F(HttpServerTest, UnwritableDirectoryIsServerError) {
    // A regular file where the directory should be.
    auto blocker = save_dir_.path() / "blocked";
    test::WriteFile(blocker, "not a directory");
    server_.SetSaveDirectory(blocker);

    auto res = Upload("notes.txt", "data");
    EXPECT_EQ(res.result(), http::status::internal_server_error);
    EXPECT_EQ(res.body(), "Could not create target directory.");
    EXPECT_FALSE(inbox_.file.HasValue());
}

TEST_F(HttpServerTest, StartIsIdempotent) {
    EXPECT_TRUE(server_.Start(0));
    EXPECT_EQ(server_.port(), port_);
}

TEST_F(HttpServerTest, BusyPortReportsError) {
    SingleSlot<ServerState> other_state;
    ReceiveInbox other_inbox;
    HttpServer other(ioc_, other_inbox, other_state);

    EXPECT_FALSE(other.Start(port_));
    EXPECT_FALSE(other.running());
    auto state = other_state.Get();
    ASSERT_TRUE(state.has_value());
    EXPECT_FALSE(state->running);
    EXPECT_TRUE(state->error.has_value());
}

TEST_F(HttpServerTest, StopClosesListener) {
    server_.Stop();
    EXPECT_FALSE(server_.running());
    EXPECT_EQ(state_.Get(), ServerState::Stopped());

    EXPECT_THROW(Send(http::verb::get, "/"), boost::system::system_error);
}

} // namespace
} // namespace sendplus::core
