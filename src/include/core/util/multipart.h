#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sendplus::core {

namespace multipart {

class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One part of a multipart/form-data body. `body` is only filled in by
// Parse(); StreamParser hands the bytes out as they arrive instead.
struct Part {
    std::map<std::string, std::string> headers; // lower-case names
    std::string name;
    std::optional<std::string> filename;
    std::string body;

    const std::string* header(const std::string& lower_name) const {
        auto it = headers.find(lower_name);
        return it == headers.end() ? nullptr : &it->second;
    }
};

// Boundary parameter of a "multipart/form-data; boundary=..." header value.
std::optional<std::string> BoundaryFromContentType(std::string_view content_type);

// `filename="..."` of a content-disposition header value, unquoted.
std::optional<std::string> FilenameFromDisposition(std::string_view disposition);

// Incremental parser for bodies that do not fit in memory. Feed() takes the
// body in pieces of any size; at most one delimiter length of part data is
// held back between calls. Callbacks run from inside Feed() and may throw
// to abort parsing.
class StreamParser {
public:
    using PartBeginHandler = std::function<void(const Part& part)>;
    using PartDataHandler = std::function<void(std::string_view data)>;
    using PartEndHandler = std::function<void()>;

    StreamParser(std::string_view boundary,
                 PartBeginHandler on_part_begin,
                 PartDataHandler on_part_data,
                 PartEndHandler on_part_end);

    // Throws ParseError when the delimiters or part headers are malformed.
    void Feed(std::string_view data);

    // Throws ParseError unless the closing delimiter has been seen.
    void Finish();

    bool done() const { return state_ == State::kDone; }

private:
    enum class State { kPreamble, kDelimiter, kHeaders, kBody, kDone };

    bool step();
    void beginPart(std::string_view header_block);

    std::string delimiter_;
    std::string body_end_; // CRLF + delimiter
    PartBeginHandler on_part_begin_;
    PartDataHandler on_part_data_;
    PartEndHandler on_part_end_;
    State state_ = State::kPreamble;
    std::string pending_;
};

// Parses a complete body held in memory.
// Throws ParseError when the delimiters or part headers are malformed.
std::vector<Part> Parse(std::string_view body, std::string_view boundary);

// Builds a form whose last part is a single file. The file bytes themselves
// are not held here: a request body is preamble() + file bytes + epilogue().
class FormBuilder {
public:
    FormBuilder();
    explicit FormBuilder(std::string boundary);

    FormBuilder& AddField(std::string_view name, std::string_view value);
    FormBuilder& SetFile(std::string_view name,
                         std::string_view filename,
                         std::string_view content_type = "application/octet-stream");

    const std::string& boundary() const { return boundary_; }
    std::string ContentType() const;

    std::string preamble() const;
    std::string epilogue() const;
    std::size_t ContentLength(std::size_t file_size) const;

private:
    std::string boundary_;
    std::string fields_;
    std::string file_header_;
};

} // namespace multipart

} // namespace sendplus::core
