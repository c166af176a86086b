#include "nooku/audio/Track.hpp"

#include "core/Log.h"

#include <fstream>
#include <system_error>

namespace nooku::audio {

std::expected<TrackPtr, DecodeError> FileTrackDecoder::Decode(const std::filesystem::path& resource)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(resource, ec))
        return std::unexpected(DecodeError{DecodeError::Code::NotFound, "no such file: " + resource.string()});

    const std::uintmax_t size = std::filesystem::file_size(resource, ec);
    if (ec)
        return std::unexpected(DecodeError{DecodeError::Code::ReadFailed,
                                           resource.string() + ": " + ec.message()});
    if (size == 0)
        return std::unexpected(DecodeError{DecodeError::Code::Empty, resource.string() + " is empty"});
    if (size > m_maxBytes)
        return std::unexpected(DecodeError{DecodeError::Code::TooLarge,
                                           resource.string() + " exceeds " + std::to_string(m_maxBytes) + " bytes"});

    std::ifstream in(resource, std::ios::binary);
    if (!in)
        return std::unexpected(DecodeError{DecodeError::Code::ReadFailed, "cannot open " + resource.string()});

    auto track = std::make_shared<DecodedTrack>();
    track->source = resource;
    track->bitrate = m_bitrate;
    track->payload.resize(static_cast<std::size_t>(size));
    in.read(reinterpret_cast<char*>(track->payload.data()), static_cast<std::streamsize>(size));
    if (in.gcount() != static_cast<std::streamsize>(size))
        return std::unexpected(DecodeError{DecodeError::Code::ReadFailed, "short read on " + resource.string()});

    LOG_TRACE("Decoded %s (%zu bytes)", resource.string().c_str(), track->payload.size());
    return TrackPtr(std::move(track));
}

} // namespace nooku::audio
