#pragma once
#include "stream_event.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace pbrelay {

// Decode one raw stream frame. Throws MalformedFrame on invalid JSON or when a
// required field is missing. Encrypted ephemerals come back as Sealed events.
DecodedFrame decode(const std::string& raw, double received_at);

// Cheap discriminator check used by the session to absorb keepalives.
bool is_heartbeat(const std::string& raw);

// Decode a push record from the REST history (note/link/file).
// Dismissed or inactive pushes decode to FrameKind::Ignored.
DecodedFrame decode_push_object(const nlohmann::json& push, double received_at);

// Fill a Sealed event from its decrypted ephemeral JSON. The ciphertext payload
// is cleansed. Returns Event when the ephemeral is actionable, Ignored otherwise.
FrameKind open_sealed(StreamEvent& event, const std::string& plaintext);

// Stable identity shared by a mirror and the dismissal that refers to it.
std::string make_notification_key(const std::string& source_device,
                                  const std::string& package_name,
                                  const std::string& notification_tag,
                                  const std::string& notification_id);

} // namespace pbrelay
