#include "localsync/Transfer/ByteSource.h"
#include "localsync/Errors.h"
#include <algorithm>
#include <cstring>

namespace LocalSync {

namespace {

template<typename Buffer>
ByteSource makeBufferSource(Buffer data) {
    auto buffer = std::make_shared<Buffer>(std::move(data));
    auto offset = std::make_shared<size_t>(0);

    return [buffer, offset](uint8_t* buf, size_t len) -> size_t {
        size_t available = buffer->size() - *offset;
        size_t n = std::min(len, available);
        if (n > 0) {
            std::memcpy(buf, buffer->data() + *offset, n);
            *offset += n;
        }
        return n;
    };
}

} // namespace

ByteSource makeMemorySource(std::string data) {
    return makeBufferSource(std::move(data));
}

ByteSource makeMemorySource(std::vector<uint8_t> data) {
    return makeBufferSource(std::move(data));
}

ByteSource makeStreamSource(std::istream& stream) {
    return [&stream](uint8_t* buf, size_t len) -> size_t {
        if (len == 0 || stream.eof()) {
            return 0;
        }
        stream.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (stream.bad()) {
            throw TransferFailed("Failed to read upload source stream");
        }
        return static_cast<size_t>(stream.gcount());
    };
}

} // namespace LocalSync
