#pragma once

#include "spirc/controller.h"
#include "spirc/spirc.h"
#include "spirc/udp_channel.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace spirc {

#ifdef SPIRC_TESTING
namespace test {

/// Run one scheduling pass of the session loop; true when a source made progress.
bool Tick(Session& session);

/// Encoded frames waiting for the publisher.
size_t PendingFrameCount(Session& session);

/// Read access to the session's controller state.
const Controller& GetController(Session& session);

std::vector<uint8_t> BuildDatagram(const std::string& topic,
                                   const std::string& payload);

bool ParseDatagram(const std::vector<uint8_t>& data, std::string* topic,
                   std::string* payload);

}  // namespace test
#endif

}  // namespace spirc
