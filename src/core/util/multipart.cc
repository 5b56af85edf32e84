#include <algorithm>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cctype>
#include <core/util/multipart.h>
#include <regex>

namespace sendplus::core {

namespace multipart {

namespace {

constexpr std::string_view kCrlf = "\r\n";

constexpr std::size_t kMaxHeaderBlockSize = 16 * 1024;

std::string toLower(std::string_view value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

std::string_view trim(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    return value;
}

std::string unquote(std::string_view value) {
    value = trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    return std::string(value);
}

// Parameter `key` of a header value such as `form-data; name="x"`.
std::optional<std::string> headerParameter(std::string_view value, std::string_view key) {
    std::size_t pos = 0;
    while (pos < value.size()) {
        auto end = value.find(';', pos);
        if (end == std::string_view::npos) {
            end = value.size();
        }
        auto item = trim(value.substr(pos, end - pos));
        if (auto eq = item.find('='); eq != std::string_view::npos) {
            if (toLower(trim(item.substr(0, eq))) == key) {
                return unquote(item.substr(eq + 1));
            }
        }
        pos = end + 1;
    }
    return std::nullopt;
}

std::string escapeQuoted(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        if (c == '"') {
            escaped += "%22";
        } else if (c == '\r' || c == '\n') {
            escaped += ' ';
        } else {
            escaped += c;
        }
    }
    return escaped;
}

} // namespace

std::optional<std::string> BoundaryFromContentType(std::string_view content_type) {
    auto semicolon = content_type.find(';');
    auto media_type = toLower(trim(content_type.substr(0, semicolon)));
    if (media_type != "multipart/form-data" || semicolon == std::string_view::npos) {
        return std::nullopt;
    }
    auto boundary = headerParameter(content_type.substr(semicolon + 1), "boundary");
    if (!boundary || boundary->empty() || boundary->size() > 70) {
        return std::nullopt;
    }
    return boundary;
}

std::optional<std::string> FilenameFromDisposition(std::string_view disposition) {
    static const std::regex kFilenameQuoted(R"re((?:^|;)\s*filename="([^"]*)")re",
                                            std::regex::icase);
    static const std::regex kFilenameToken(R"re((?:^|;)\s*filename=([^";\s]+))re",
                                           std::regex::icase);
    std::string value(disposition);
    std::smatch match;
    if (std::regex_search(value, match, kFilenameQuoted)) {
        return match[1].str();
    }
    if (std::regex_search(value, match, kFilenameToken)) {
        return match[1].str();
    }
    return std::nullopt;
}

StreamParser::StreamParser(std::string_view boundary,
                           PartBeginHandler on_part_begin,
                           PartDataHandler on_part_data,
                           PartEndHandler on_part_end)
    : delimiter_("--" + std::string(boundary))
    , body_end_(std::string(kCrlf) + delimiter_)
    , on_part_begin_(std::move(on_part_begin))
    , on_part_data_(std::move(on_part_data))
    , on_part_end_(std::move(on_part_end)) {
    if (boundary.empty()) {
        throw ParseError("empty boundary");
    }
}

void StreamParser::Feed(std::string_view data) {
    if (state_ == State::kDone) {
        return; // epilogue
    }
    pending_.append(data);
    while (state_ != State::kDone && step()) {
    }
}

void StreamParser::Finish() {
    switch (state_) {
    case State::kDone:
        return;
    case State::kPreamble:
        throw ParseError("opening boundary not found");
    case State::kHeaders:
        throw ParseError("unterminated part headers");
    default:
        throw ParseError("closing boundary not found");
    }
}

// Consumes what it can from pending_. Returns false when more input is needed.
bool StreamParser::step() {
    switch (state_) {
    case State::kPreamble: {
        auto pos = pending_.find(delimiter_);
        if (pos == std::string::npos) {
            // keep a tail that may be the start of the delimiter
            if (pending_.size() >= delimiter_.size()) {
                pending_.erase(0, pending_.size() - delimiter_.size() + 1);
            }
            return false;
        }
        pending_.erase(0, pos + delimiter_.size());
        state_ = State::kDelimiter;
        return true;
    }
    case State::kDelimiter: {
        if (pending_.size() < 2) {
            return false;
        }
        if (pending_.compare(0, 2, "--") == 0) {
            state_ = State::kDone;
            pending_.clear();
            return false;
        }
        // transport padding, then CRLF
        std::size_t pos = 0;
        while (pos < pending_.size() && (pending_[pos] == ' ' || pending_[pos] == '\t')) {
            ++pos;
        }
        if (pending_.size() - pos < 2) {
            return false;
        }
        if (pending_.compare(pos, 2, kCrlf) != 0) {
            throw ParseError("malformed boundary line");
        }
        pending_.erase(0, pos + 2);
        state_ = State::kHeaders;
        return true;
    }
    case State::kHeaders: {
        if (pending_.size() < 2) {
            return false;
        }
        // A part may also have no headers at all.
        if (pending_.compare(0, 2, kCrlf) == 0) {
            pending_.erase(0, 2);
            beginPart({});
            return true;
        }
        auto headers_end = pending_.find("\r\n\r\n");
        if (headers_end == std::string::npos) {
            if (pending_.size() > kMaxHeaderBlockSize) {
                throw ParseError("part headers too large");
            }
            return false;
        }
        std::string header_block = pending_.substr(0, headers_end);
        pending_.erase(0, headers_end + 4);
        beginPart(header_block);
        return true;
    }
    case State::kBody: {
        auto next = pending_.find(body_end_);
        if (next == std::string::npos) {
            // Everything but a possible partial delimiter at the tail is data.
            if (pending_.size() < body_end_.size()) {
                return false;
            }
            auto ready = pending_.size() - body_end_.size() + 1;
            if (on_part_data_) {
                on_part_data_(std::string_view(pending_).substr(0, ready));
            }
            pending_.erase(0, ready);
            return false;
        }
        if (next > 0 && on_part_data_) {
            on_part_data_(std::string_view(pending_).substr(0, next));
        }
        pending_.erase(0, next + body_end_.size());
        state_ = State::kDelimiter;
        if (on_part_end_) {
            on_part_end_();
        }
        return true;
    }
    case State::kDone:
        break;
    }
    return false;
}

void StreamParser::beginPart(std::string_view header_block) {
    Part part;
    std::size_t line_start = 0;
    while (line_start < header_block.size()) {
        auto line_end = header_block.find(kCrlf, line_start);
        if (line_end == std::string_view::npos) {
            line_end = header_block.size();
        }
        auto line = header_block.substr(line_start, line_end - line_start);
        if (!line.empty()) {
            auto colon = line.find(':');
            if (colon == std::string_view::npos) {
                throw ParseError("malformed part header");
            }
            part.headers[toLower(trim(line.substr(0, colon)))] = std::string(
                trim(line.substr(colon + 1)));
        }
        line_start = line_end + 2;
    }

    if (const auto* disposition = part.header("content-disposition")) {
        part.name = headerParameter(*disposition, "name").value_or("");
        part.filename = FilenameFromDisposition(*disposition);
    }

    state_ = State::kBody;
    if (on_part_begin_) {
        on_part_begin_(part);
    }
}

std::vector<Part> Parse(std::string_view body, std::string_view boundary) {
    std::vector<Part> parts;
    StreamParser parser(
        boundary,
        [&parts](const Part& part) { parts.push_back(part); },
        [&parts](std::string_view data) { parts.back().body.append(data); },
        nullptr);
    parser.Feed(body);
    parser.Finish();
    return parts;
}

FormBuilder::FormBuilder()
    : boundary_("----SendPlusBoundary" + boost::uuids::to_string(boost::uuids::random_generator()())) {}

FormBuilder::FormBuilder(std::string boundary)
    : boundary_(std::move(boundary)) {}

FormBuilder& FormBuilder::AddField(std::string_view name, std::string_view value) {
    fields_ += "--" + boundary_ + "\r\n";
    fields_ += "Content-Disposition: form-data; name=\"" + escapeQuoted(name) + "\"\r\n\r\n";
    fields_ += value;
    fields_ += "\r\n";
    return *this;
}

FormBuilder& FormBuilder::SetFile(std::string_view name,
                                  std::string_view filename,
                                  std::string_view content_type) {
    file_header_ = "--" + boundary_ + "\r\n";
    file_header_ += "Content-Disposition: form-data; name=\"" + escapeQuoted(name)
                    + "\"; filename=\"" + escapeQuoted(filename) + "\"\r\n";
    file_header_ += "Content-Type: " + std::string(content_type) + "\r\n\r\n";
    return *this;
}

std::string FormBuilder::ContentType() const {
    return "multipart/form-data; boundary=" + boundary_;
}

std::string FormBuilder::preamble() const {
    return fields_ + file_header_;
}

std::string FormBuilder::epilogue() const {
    if (file_header_.empty()) {
        return "--" + boundary_ + "--\r\n";
    }
    return "\r\n--" + boundary_ + "--\r\n";
}

std::size_t FormBuilder::ContentLength(std::size_t file_size) const {
    return preamble().size() + (file_header_.empty() ? 0 : file_size) + epilogue().size();
}

} // namespace multipart

} // namespace sendplus::core
