#include <msgdec/io/zlib_source.h>

#include <zlib.h>

#include <algorithm>
#include <limits>
#include <utility>

namespace msgdec::io {

struct ZlibSource::Inflater {
    z_stream strm{};
    bool initialized = false;

    ~Inflater() {
        if (initialized) {
            inflateEnd(&strm);
        }
    }
};

namespace {

// 15 + 32 enables automatic gzip / zlib-wrapped deflate detection
constexpr int kAutoDetectWindowBits = 15 + 32;

ReadResult read_failed(std::string message) {
    ReadResult result;
    result.ok = false;
    result.message = std::move(message);
    return result;
}

}  // namespace

ZlibSource::ZlibSource(ByteSource& upstream, std::size_t chunk_size)
    : upstream_(upstream),
      inflater_(std::make_unique<Inflater>()),
      input_(chunk_size == 0 ? 1 : chunk_size) {
    if (inflateInit2(&inflater_->strm, kAutoDetectWindowBits) != Z_OK) {
        failure_ = "inflateInit2 failed";
        return;
    }
    inflater_->initialized = true;
}

ZlibSource::~ZlibSource() = default;

ReadResult ZlibSource::read(uint8_t* buffer, std::size_t size) {
    if (!failure_.empty()) {
        return read_failed(failure_);
    }
    if (size == 0) {
        return {0, true, {}};
    }
    if (finished_) {
        return read_failed("end of stream");
    }

    z_stream& strm = inflater_->strm;
    std::size_t window = std::min<std::size_t>(size, std::numeric_limits<uInt>::max());
    while (true) {
        if (strm.avail_in == 0) {
            ReadResult refill = upstream_.read(input_.data(), input_.size());
            if (!refill.ok) {
                failure_ = "compressed stream truncated: " + refill.message;
                return read_failed(failure_);
            }
            strm.next_in = input_.data();
            strm.avail_in = static_cast<uInt>(refill.count);
        }

        strm.next_out = buffer;
        strm.avail_out = static_cast<uInt>(window);
        int ret = inflate(&strm, Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR || ret == Z_DATA_ERROR ||
            ret == Z_MEM_ERROR || ret == Z_NEED_DICT) {
            failure_ = std::string("inflate failed: ") +
                       (strm.msg != nullptr ? strm.msg : "corrupt data");
            return read_failed(failure_);
        }
        if (ret == Z_STREAM_END) {
            finished_ = true;
        }

        std::size_t produced = window - strm.avail_out;
        if (produced > 0) {
            return {produced, true, {}};
        }
        if (finished_) {
            return read_failed("end of stream");
        }
        // Z_OK or Z_BUF_ERROR with nothing produced: more input is needed.
    }
}

}  // namespace msgdec::io
