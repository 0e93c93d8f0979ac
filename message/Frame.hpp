/**
 * \file message/Frame.hpp
 * \brief Binary framing for bus traffic.
 * \ingroup message_module
 * \details Every frame is a fixed 12-byte header followed by `body_size` bytes. Data
 * frames carry one serialized `Envelope`; Ping/Pong/Close frames carry no body. The
 * header uses host byte order since both peers run on the same machine.
 */
#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

namespace HostBus {

/** \brief Kind of a bus frame. */
enum class FrameKind : uint8_t {
    Data = 1,   ///< Body holds one JSON envelope
    Ping = 2,   ///< Liveness probe; peer answers with Pong
    Pong = 3,   ///< Liveness answer
    Close = 4,  ///< Orderly goodbye
};

/** \brief Header preceding each frame body. */
struct FrameHeader {
    uint32_t magic;        ///< Always `kFrameMagic`
    uint8_t kind;          ///< `FrameKind` value
    uint8_t reserved[3];   ///< Zero
    uint32_t body_size;    ///< Bytes following the header
};
static_assert(sizeof(FrameHeader) == 12, "FrameHeader must stay 12 bytes on the wire");

/// "HBUS" in ASCII.
inline constexpr uint32_t kFrameMagic = 0x53554248u;
/// Default ceiling for a single frame body.
inline constexpr uint32_t kDefaultMaxFrameBody = 16u * 1024u * 1024u;

/** \brief Header for a frame of `kind` carrying `body_size` bytes. */
inline FrameHeader make_frame_header(FrameKind kind, uint32_t body_size) {
    FrameHeader h{};
    h.magic = kFrameMagic;
    h.kind = static_cast<uint8_t>(kind);
    h.body_size = body_size;
    return h;
}

/** \brief Header and body laid out contiguously, ready for a single write. */
inline std::string encode_frame(FrameKind kind, std::string_view body = {}) {
    const FrameHeader h = make_frame_header(kind, static_cast<uint32_t>(body.size()));
    std::string out(sizeof(FrameHeader) + body.size(), '\0');
    std::memcpy(out.data(), &h, sizeof(h));
    if (!body.empty()) std::memcpy(out.data() + sizeof(h), body.data(), body.size());
    return out;
}

/** \brief Check magic, kind and size limit; on failure `reason` says why. */
inline bool validate_frame_header(const FrameHeader& h, uint32_t max_body, std::string& reason) {
    if (h.magic != kFrameMagic) {
        reason = "bad frame magic";
        return false;
    }
    if (h.kind < static_cast<uint8_t>(FrameKind::Data) || h.kind > static_cast<uint8_t>(FrameKind::Close)) {
        reason = "unknown frame kind " + std::to_string(h.kind);
        return false;
    }
    if (h.body_size > max_body) {
        reason = "frame body of " + std::to_string(h.body_size) + " bytes exceeds limit of " + std::to_string(max_body);
        return false;
    }
    if (h.kind != static_cast<uint8_t>(FrameKind::Data) && h.body_size != 0) {
        reason = "control frame with a body";
        return false;
    }
    return true;
}

} // namespace HostBus
