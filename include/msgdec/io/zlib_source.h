#pragma once
#include <msgdec/io/byte_source.h>

#include <memory>

namespace msgdec::io {

// Inflates a gzip or zlib-wrapped deflate stream pulled from another source.
// Each read returns what one inflate pass produced, so short reads are normal.
class ZlibSource : public ByteSource {
public:
    explicit ZlibSource(ByteSource& upstream, std::size_t chunk_size = 32768);
    ~ZlibSource() override;

    ZlibSource(const ZlibSource&) = delete;
    ZlibSource& operator=(const ZlibSource&) = delete;

    ReadResult read(uint8_t* buffer, std::size_t size) override;

    // True once the compressed stream's end marker has been inflated.
    bool finished() const { return finished_; }

private:
    struct Inflater;

    ByteSource& upstream_;
    std::unique_ptr<Inflater> inflater_;
    std::vector<uint8_t> input_;
    bool finished_ = false;
    std::string failure_;
};

}  // namespace msgdec::io
