#pragma once

#include "spirc/spirc.h"

#include <string>

namespace spirc {

/**
 * Serialize an envelope into its protobuf wire form.
 *
 * @param envelope Envelope to encode.
 * @param out Receives the serialized bytes.
 * @param error Optional output string describing the failure.
 * @return true on success.
 */
bool EncodeEnvelope(const Envelope& envelope, std::string* out,
                    std::string* error = nullptr);

/**
 * Parse a wire payload into an envelope.
 *
 * Unknown fields are ignored; a payload missing the sender ident or the
 * message type is rejected. Track references whose gid is not exactly 16
 * bytes decode without an id.
 */
bool DecodeEnvelope(const std::string& data, Envelope* out,
                    std::string* error = nullptr);

}  // namespace spirc
