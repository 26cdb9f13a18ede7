// Fuzz target for manifest decoding (chunk 0)
// Chunk 0 is the first untrusted input a syncing node parses

#include "manifest/manifest.hpp"
#include "manifest/manifest_hash.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace statesync::manifest;

    Manifest manifest;
    std::string error;
    if (DecodeManifest(data, size, manifest, error) != DecodeStatus::OK) {
        return 0;
    }

    // Anything that decodes must survive a round trip
    std::vector<uint8_t> encoded = EncodeManifest(manifest);
    Manifest again;
    if (DecodeManifest(encoded.data(), encoded.size(), again, error) !=
            DecodeStatus::OK ||
        !(again == manifest)) {
        __builtin_trap();
    }

    // Validation must not crash on arbitrary tables
    (void)ValidateManifest(manifest, ManifestRootHash(manifest), error);
    (void)manifest.FileChunkRanges();

    return 0;
}
