#include "localsync/Codec/EncodingSelector.h"
#include <spdlog/spdlog.h>
#include <utility>

namespace LocalSync {

EncodedImage selectSmallestEncoding(
    EncodedImage original,
    std::vector<EncodedImage> candidates)
{
    const size_t originalSize = original.bytes.size();
    EncodedImage best = std::move(original);

    for (auto& candidate : candidates) {
        if (candidate.bytes.size() < best.bytes.size()) {
            best = std::move(candidate);
        }
    }

    spdlog::debug("EncodingSelector: {} -> {} bytes ({})",
                  originalSize, best.bytes.size(), best.mimeType);
    return best;
}

} // namespace LocalSync
