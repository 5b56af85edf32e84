#include <core/util/multipart.h>
#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <vector>

namespace sendplus::core {
namespace {

TEST(MultipartTest, BoundaryFromContentType) {
    EXPECT_EQ(multipart::BoundaryFromContentType("multipart/form-data; boundary=abc123"), "abc123");
    EXPECT_EQ(multipart::BoundaryFromContentType("Multipart/Form-Data; charset=utf-8; boundary=\"q r\""),
              "q r");
    EXPECT_FALSE(multipart::BoundaryFromContentType("text/plain").has_value());
    EXPECT_FALSE(multipart::BoundaryFromContentType("multipart/form-data").has_value());
    EXPECT_FALSE(multipart::BoundaryFromContentType("multipart/form-data; boundary=").has_value());
    EXPECT_FALSE(multipart::BoundaryFromContentType("").has_value());
}

TEST(MultipartTest, FilenameFromDisposition) {
    EXPECT_EQ(multipart::FilenameFromDisposition(R"(form-data; name="file"; filename="a b.txt")"),
              "a b.txt");
    EXPECT_EQ(multipart::FilenameFromDisposition("form-data; name=file; filename=plain.bin"),
              "plain.bin");
    EXPECT_FALSE(multipart::FilenameFromDisposition(R"(form-data; name="fileName")").has_value());
}

TEST(MultipartTest, ParsesFieldsAndFile) {
    std::string body = "--XyZ\r\n"
                       "Content-Disposition: form-data; name=\"fileName\"\r\n"
                       "\r\n"
                       "report.csv\r\n"
                       "--XyZ\r\n"
                       "Content-Disposition: form-data; name=\"file\"; filename=\"report.csv\"\r\n"
                       "Content-Type: text/csv\r\n"
                       "\r\n"
                       "a,b\r\n1,2\r\n"
                       "--XyZ--\r\n";

    auto parts = multipart::Parse(body, "XyZ");
    ASSERT_EQ(parts.size(), 2u);

    EXPECT_EQ(parts[0].name, "fileName");
    EXPECT_FALSE(parts[0].filename.has_value());
    EXPECT_EQ(parts[0].body, "report.csv");

    EXPECT_EQ(parts[1].name, "file");
    EXPECT_EQ(parts[1].filename, "report.csv");
    ASSERT_NE(parts[1].header("content-type"), nullptr);
    EXPECT_EQ(*parts[1].header("content-type"), "text/csv");
    EXPECT_EQ(parts[1].body, "a,b\r\n1,2");
}

TEST(MultipartTest, BinaryBodyIsKeptIntact) {
    std::string payload("\0\r\n--\xff", 6);
    multipart::FormBuilder form("bound");
    form.SetFile("file", "blob.bin");
    std::string body = form.preamble() + payload + form.epilogue();
    EXPECT_EQ(body.size(), form.ContentLength(payload.size()));

    auto parts = multipart::Parse(body, form.boundary());
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].filename, "blob.bin");
    EXPECT_EQ(parts[0].body, payload);
}

TEST(MultipartTest, BuilderEscapesQuotesInNames) {
    multipart::FormBuilder form("b");
    form.SetFile("file", "say \"hi\".txt");
    auto parts = multipart::Parse(form.preamble() + "x" + form.epilogue(), "b");
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].filename, "say %22hi%22.txt");
}

TEST(MultipartTest, GeneratedBoundariesDiffer) {
    multipart::FormBuilder a;
    multipart::FormBuilder b;
    EXPECT_NE(a.boundary(), b.boundary());
    EXPECT_EQ(multipart::BoundaryFromContentType(a.ContentType()), a.boundary());
}

TEST(MultipartTest, RejectsMalformedBodies) {
    EXPECT_THROW(multipart::Parse("no delimiter here", "XyZ"), multipart::ParseError);
    EXPECT_THROW(multipart::Parse("--XyZ\r\nContent-Disposition: form-data; name=\"a\"\r\n\r\nvalue",
                                  "XyZ"),
                 multipart::ParseError);
    EXPECT_THROW(multipart::Parse("--XyZ\r\nbroken header line\r\n\r\nv\r\n--XyZ--", "XyZ"),
                 multipart::ParseError);
    EXPECT_THROW(multipart::Parse("--XyZ\r\n", ""), multipart::ParseError);
}

TEST(MultipartTest, StreamParserAcceptsAnyChunking) {
    // Near misses of the delimiter inside the file data.
    const std::string payload = "a\r\n--Xy\r\n-\r\n--X";
    multipart::FormBuilder form("XyZ");
    form.AddField("fileName", "near.bin");
    form.SetFile("file", "near.bin");
    const std::string body = form.preamble() + payload + form.epilogue();

    for (std::size_t chunk_size : {1u, 2u, 3u, 7u, 64u, 4096u}) {
        std::vector<std::string> names;
        std::string file_data;
        int ended = 0;
        multipart::StreamParser parser(
            "XyZ",
            [&](const multipart::Part& part) { names.push_back(part.name); },
            [&](std::string_view data) {
                if (names.back() == "file") {
                    file_data.append(data);
                }
            },
            [&] { ++ended; });

        for (std::size_t pos = 0; pos < body.size(); pos += chunk_size) {
            parser.Feed(std::string_view(body).substr(pos, chunk_size));
        }
        parser.Finish();

        EXPECT_TRUE(parser.done()) << "chunk size " << chunk_size;
        EXPECT_EQ(names, (std::vector<std::string>{"fileName", "file"})) << "chunk size " << chunk_size;
        EXPECT_EQ(ended, 2) << "chunk size " << chunk_size;
        EXPECT_EQ(file_data, payload) << "chunk size " << chunk_size;
    }
}

TEST(MultipartTest, StreamParserIgnoresEpilogue) {
    multipart::StreamParser parser("b", nullptr, nullptr, nullptr);
    parser.Feed("--b\r\n\r\nx\r\n--b--\r\ntrailing junk without delimiters");
    EXPECT_TRUE(parser.done());
    EXPECT_NO_THROW(parser.Finish());
}

TEST(MultipartTest, StreamParserBoundsHeaderBlock) {
    multipart::StreamParser parser("b", nullptr, nullptr, nullptr);
    parser.Feed("--b\r\nX-Long: ");
    EXPECT_THROW(parser.Feed(std::string(64 * 1024, 'a')), multipart::ParseError);
}

TEST(MultipartTest, StreamParserNeedsClosingDelimiter) {
    multipart::StreamParser parser("b", nullptr, nullptr, nullptr);
    parser.Feed("--b\r\nContent-Disposition: form-data; name=\"file\"\r\n\r\nhalf a fi");
    EXPECT_FALSE(parser.done());
    EXPECT_THROW(parser.Finish(), multipart::ParseError);
}

TEST(MultipartTest, EmptyFormHasNoParts) {
    EXPECT_TRUE(multipart::Parse("--XyZ--\r\n", "XyZ").empty());
}

} // namespace
} // namespace sendplus::core
