#include <core/constant/route.h>
#include <core/model/received_file_info.h>
#include <core/network/server/controller/receive_controller.h>
#include <core/network/server/http_server.h>
#include <core/util/config.h>
#include <core/util/file_name.h>
#include <core/util/multipart.h>
#include <fstream>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace fs = std::filesystem;

namespace sendplus::core {

namespace {

// Failure to store an upload. what() is the message returned to the sender.
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Writes the first usable file part of an upload to disk while it arrives.
// A file that was started but never committed is removed on destruction.
class UploadWriter {
public:
    explicit UploadWriter(const fs::path& save_dir) {
        std::error_code ec;
        save_dir_ = fs::absolute(save_dir, ec);
        if (ec) {
            spdlog::warn("Cannot resolve {}: {}", save_dir.string(), ec.message());
            save_dir_ = save_dir;
        }
    }

    ~UploadWriter() {
        if (!committed_) {
            discard();
        }
    }

    UploadWriter(const UploadWriter&) = delete;
    UploadWriter& operator=(const UploadWriter&) = delete;

    void OnPartBegin(const multipart::Part& part) {
        writing_ = false;
        if (started_ || !part.filename) {
            return;
        }
        std::string file_name = SanitizeFileName(*part.filename);
        if (file_name.empty() || file_name == "." || file_name == "..") {
            spdlog::debug("Skipping file part with unusable name \"{}\"", *part.filename);
            return;
        }

        std::error_code ec;
        fs::create_directories(save_dir_, ec);
        if (ec) {
            spdlog::error("Failed to create directory {}: {}", save_dir_.string(), ec.message());
            throw StorageError("Could not create target directory.");
        }

        started_ = true;
        file_name_ = std::move(file_name);
        file_path_ = save_dir_ / file_name_;
        out_.open(file_path_, std::ios::binary | std::ios::trunc);
        if (!out_.is_open()) {
            spdlog::error("Failed to open {} for writing", file_path_.string());
            throw StorageError("Error writing file.");
        }
        writing_ = true;
    }

    void OnPartData(std::string_view data) {
        if (!writing_) {
            return;
        }
        out_.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!out_) {
            spdlog::error("Failed to write received file to {}", file_path_.string());
            throw StorageError("Error writing file.");
        }
        bytes_written_ += data.size();
    }

    void OnPartEnd() {
        if (!writing_) {
            return;
        }
        writing_ = false;
        out_.close();
        if (!out_) {
            spdlog::error("Failed to finish received file {}", file_path_.string());
            throw StorageError("Error writing file.");
        }
        complete_ = true;
    }

    void Commit() { committed_ = true; }

    bool complete() const { return complete_; }
    const std::string& file_name() const { return file_name_; }
    const fs::path& file_path() const { return file_path_; }
    std::uint64_t bytes_written() const { return bytes_written_; }

private:
    void discard() {
        if (out_.is_open()) {
            out_.close();
        }
        if (!started_) {
            return;
        }
        std::error_code ec;
        fs::remove(file_path_, ec);
        if (ec) {
            spdlog::warn("Could not remove partial file {}: {}", file_path_.string(), ec.message());
        } else {
            spdlog::debug("Removed partial file {}", file_path_.string());
        }
    }

    fs::path save_dir_;
    std::ofstream out_;
    std::string file_name_;
    fs::path file_path_;
    std::uint64_t bytes_written_{0};
    bool started_{false};
    bool writing_{false};
    bool complete_{false};
    bool committed_{false};
};

} // namespace

ReceiveController::ReceiveController(HttpServer& server,
                                     ReceiveInbox& inbox,
                                     const std::filesystem::path& save_dir)
    : server_(server)
    , inbox_(inbox)
    , save_dir_(save_dir) {
    installRoutes();
}

void ReceiveController::SetSaveDirectory(const std::filesystem::path& save_dir) {
    save_dir_ = save_dir;
}

std::filesystem::path ReceiveController::save_directory() const {
    return save_dir_.empty() ? settings.save_dir : save_dir_;
}

net::awaitable<HttpResponse> ReceiveController::onReceive(RequestBodyReader& body) {
    std::string content_type(body.header()[http::field::content_type]);
    auto boundary = multipart::BoundaryFromContentType(content_type);
    if (!boundary) {
        spdlog::warn("Rejected upload with content type \"{}\"", content_type);
        co_return HttpServer::BadRequest(body.version(),
                                         body.keep_alive(),
                                         "Expected a multipart/form-data request.");
    }

    UploadWriter writer(save_directory());
    try {
        multipart::StreamParser parser(
            *boundary,
            [&writer](const multipart::Part& part) { writer.OnPartBegin(part); },
            [&writer](std::string_view data) { writer.OnPartData(data); },
            [&writer] { writer.OnPartEnd(); });
        while (true) {
            auto piece = co_await body.ReadSome();
            if (piece.empty()) {
                break;
            }
            parser.Feed(piece);
        }
        parser.Finish();
    } catch (const multipart::ParseError& e) {
        spdlog::warn("Malformed multipart body: {}", e.what());
        co_return HttpServer::BadRequest(body.version(),
                                         body.keep_alive(),
                                         fmt::format("Malformed multipart body: {}", e.what()));
    } catch (const StorageError& e) {
        co_return HttpServer::InternalServerError(body.version(), body.keep_alive(), e.what());
    }

    if (!writer.complete()) {
        spdlog::warn("Upload contained no usable file part");
        co_return HttpServer::BadRequest(body.version(),
                                         body.keep_alive(),
                                         "No valid file part found in the request.");
    }

    writer.Commit();
    spdlog::info("Received file \"{}\" ({} bytes) into {}",
                 writer.file_name(),
                 writer.bytes_written(),
                 writer.file_path().parent_path().string());
    inbox_.file.Set(ReceivedFileInfo{writer.file_name(), writer.file_path()});

    co_return HttpServer::Ok(body.version(),
                             body.keep_alive(),
                             fmt::format("File \"{}\" received successfully.", writer.file_name()));
}

net::awaitable<HttpResponse> ReceiveController::onReceiveText(const HttpRequest& req) {
    std::string content_type(req[http::field::content_type]);
    if (content_type.rfind("text/plain", 0) != 0) {
        spdlog::warn("Text received with content type \"{}\", reading it as UTF-8 anyway",
                     content_type);
    }

    if (req.body().empty()) {
        co_return HttpServer::BadRequest(req.version(), req.keep_alive(), "Received empty text.");
    }

    spdlog::info("Received text ({} bytes)", req.body().size());
    inbox_.text.Set(req.body());

    co_return HttpServer::Ok(req.version(), req.keep_alive(), "Text received successfully.");
}

void ReceiveController::installRoutes() {
    server_.AddStreamRoute(ApiRoute::kReceive.data(),
                           http::verb::post,
                           std::bind(&ReceiveController::onReceive, this, std::placeholders::_1));
    server_.AddRoute(ApiRoute::kReceiveText.data(),
                     http::verb::post,
                     std::bind(&ReceiveController::onReceiveText, this, std::placeholders::_1));
}

} // namespace sendplus::core
