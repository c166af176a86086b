#pragma once
// include/nooku/audio/Track.hpp
//
// Decoded tracks are opaque to the rotation engine: it only moves handles
// between the prefetch buffer and the playback sink.

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace nooku::audio {

struct DecodedTrack {
    std::filesystem::path source;
    std::vector<std::uint8_t> payload;
    std::uint32_t bitrate = 128'000;
};

using TrackPtr = std::shared_ptr<const DecodedTrack>;

struct DecodeError {
    enum class Code {
        NotFound,
        ReadFailed,
        TooLarge,
        Empty,
    } code{};
    std::string message;
};

class ITrackDecoder {
public:
    virtual ~ITrackDecoder() = default;

    // Potentially slow; never called with a session swap lock held.
    virtual std::expected<TrackPtr, DecodeError> Decode(const std::filesystem::path& resource) = 0;
};

// Loads the whole resource into memory.
class FileTrackDecoder final : public ITrackDecoder {
public:
    explicit FileTrackDecoder(std::uintmax_t maxBytes = 64u * 1024u * 1024u,
                              std::uint32_t bitrate = 128'000)
        : m_maxBytes(maxBytes), m_bitrate(bitrate) {}

    std::expected<TrackPtr, DecodeError> Decode(const std::filesystem::path& resource) override;

private:
    std::uintmax_t m_maxBytes;
    std::uint32_t m_bitrate;
};

} // namespace nooku::audio
