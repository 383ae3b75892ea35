#include <msgdec/io/byte_reader.h>
#include <msgdec/io/byte_source.h>
#include <msgdec/io/fd_source.h>
#include <msgdec/io/zlib_source.h>
#include <gtest/gtest.h>

#include <zlib.h>
#include <unistd.h>

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

using msgdec::io::ByteReader;
using msgdec::io::FdSource;
using msgdec::io::MemorySource;
using msgdec::io::ReadResult;
using msgdec::io::StreamSource;
using msgdec::io::ZlibSource;

namespace {

std::vector<uint8_t> sample_payload(std::size_t size) {
    std::vector<uint8_t> out(size);
    for (std::size_t i = 0; i < size; ++i) {
        out[i] = static_cast<uint8_t>((i * 31 + 7) & 0xFF);
    }
    return out;
}

// windowBits 15 produces a zlib wrapper, 15 + 16 a gzip wrapper.
std::vector<uint8_t> deflate_payload(const std::vector<uint8_t>& input, int window_bits) {
    z_stream strm{};
    EXPECT_EQ(deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window_bits, 8,
                           Z_DEFAULT_STRATEGY), Z_OK);
    std::vector<uint8_t> out(deflateBound(&strm, static_cast<uLong>(input.size())) + 32);
    strm.next_in = const_cast<Bytef*>(input.data());
    strm.avail_in = static_cast<uInt>(input.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());
    EXPECT_EQ(deflate(&strm, Z_FINISH), Z_STREAM_END);
    out.resize(strm.total_out);
    deflateEnd(&strm);
    return out;
}

std::vector<uint8_t> drain(msgdec::io::ByteSource& source) {
    std::vector<uint8_t> out;
    uint8_t buffer[97];
    while (true) {
        ReadResult r = source.read(buffer, sizeof(buffer));
        if (!r.ok) {
            EXPECT_EQ(r.message, "end of stream");
            break;
        }
        out.insert(out.end(), buffer, buffer + r.count);
    }
    return out;
}

}  // namespace

// ------------------------------------------------------------------
// 1. MemorySource
// ------------------------------------------------------------------

TEST(MemorySourceTest, ReadsUpToRemaining) {
    const uint8_t data[] = {1, 2, 3};
    MemorySource source(data, sizeof(data));
    uint8_t buffer[8] = {};

    ReadResult r = source.read(buffer, 2);
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.count, 2u);
    EXPECT_EQ(source.remaining(), 1u);

    r = source.read(buffer, 8);
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.count, 1u);
    EXPECT_EQ(buffer[0], 3);
    EXPECT_FALSE(source.has_remaining());
}

TEST(MemorySourceTest, EndOfStreamIsFailedRead) {
    MemorySource source(std::vector<uint8_t>{});
    uint8_t b = 0;
    ReadResult r = source.read(&b, 1);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.message, "end of stream");
}

TEST(MemorySourceTest, OwningCopyOutlivesInput) {
    std::vector<uint8_t> data = {9, 8, 7};
    MemorySource source(data);
    data.clear();
    EXPECT_EQ(drain(source), (std::vector<uint8_t>{9, 8, 7}));
}

// ------------------------------------------------------------------
// 2. StreamSource
// ------------------------------------------------------------------

TEST(StreamSourceTest, ReadsWholeStream) {
    std::istringstream stream(std::string("\x01\x02\x03\x04", 4));
    StreamSource source(stream);
    EXPECT_EQ(drain(source), (std::vector<uint8_t>{1, 2, 3, 4}));
}

TEST(StreamSourceTest, ShortTailThenEndOfStream) {
    std::istringstream stream(std::string("ab"));
    StreamSource source(stream);
    uint8_t buffer[4] = {};
    ReadResult r = source.read(buffer, 4);
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.count, 2u);
    r = source.read(buffer, 4);
    EXPECT_FALSE(r.ok);
}

// ------------------------------------------------------------------
// 3. FdSource
// ------------------------------------------------------------------

TEST(FdSourceTest, ReadsFromPipe) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    const uint8_t payload[] = {0xc3, 0x05, 0x7f};
    ASSERT_EQ(write(fds[1], payload, sizeof(payload)), static_cast<ssize_t>(sizeof(payload)));
    close(fds[1]);

    FdSource source(fds[0], true);
    EXPECT_TRUE(source.is_open());
    EXPECT_EQ(drain(source), (std::vector<uint8_t>{0xc3, 0x05, 0x7f}));
}

TEST(FdSourceTest, MoveTransfersOwnership) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    close(fds[1]);

    FdSource a(fds[0], true);
    FdSource b(std::move(a));
    EXPECT_FALSE(a.is_open());
    EXPECT_TRUE(b.is_open());
    EXPECT_EQ(b.fd(), fds[0]);
    b.close();
    EXPECT_FALSE(b.is_open());
}

TEST(FdSourceTest, ClosedDescriptorReportsFailure) {
    FdSource source(-1);
    uint8_t b = 0;
    ReadResult r = source.read(&b, 1);
    EXPECT_FALSE(r.ok);
    EXPECT_FALSE(r.message.empty());
}

// ------------------------------------------------------------------
// 4. ZlibSource
// ------------------------------------------------------------------

TEST(ZlibSourceTest, InflatesZlibWrapped) {
    auto payload = sample_payload(5000);
    MemorySource upstream(deflate_payload(payload, 15));
    ZlibSource source(upstream, 64);
    EXPECT_EQ(drain(source), payload);
    EXPECT_TRUE(source.finished());
}

TEST(ZlibSourceTest, InflatesGzipWrapped) {
    auto payload = sample_payload(1234);
    MemorySource upstream(deflate_payload(payload, 15 + 16));
    ZlibSource source(upstream);
    EXPECT_EQ(drain(source), payload);
}

TEST(ZlibSourceTest, ByteReaderAssemblesAcrossShortReads) {
    auto payload = sample_payload(64);
    MemorySource upstream(deflate_payload(payload, 15));
    ZlibSource source(upstream, 4);
    ByteReader reader(source);

    std::vector<uint8_t> out(64);
    std::size_t done = 0;
    while (done < out.size()) {
        uint8_t b = 0;
        ASSERT_TRUE(reader.read_u8(b).ok);
        out[done++] = b;
    }
    EXPECT_EQ(out, payload);
}

TEST(ZlibSourceTest, CorruptInputFails) {
    std::vector<uint8_t> garbage = {0x78, 0x9c, 0xff, 0xff, 0xff, 0xff, 0x00, 0x01};
    MemorySource upstream(garbage);
    ZlibSource source(upstream);
    uint8_t buffer[16];
    ReadResult r = source.read(buffer, sizeof(buffer));
    EXPECT_FALSE(r.ok);
    // Sticky
    EXPECT_FALSE(source.read(buffer, sizeof(buffer)).ok);
}

TEST(ZlibSourceTest, TruncatedInputFails) {
    auto compressed = deflate_payload(sample_payload(2000), 15);
    compressed.resize(compressed.size() / 2);
    MemorySource upstream(compressed);
    ZlibSource source(upstream, 16);

    uint8_t buffer[4096];
    ReadResult r{0, true, {}};
    while (r.ok) {
        r = source.read(buffer, sizeof(buffer));
    }
    EXPECT_NE(r.message.find("compressed stream truncated"), std::string::npos);
}
