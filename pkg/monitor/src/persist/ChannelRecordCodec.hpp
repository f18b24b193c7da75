// Repository: LiveWatch
// Component: Channel record codec
// Purpose: ChannelState <-> livewatch.v1.ChannelRecord. Shared by the channel
//          store and the control service.
// Copyright (c) 2026 LiveWatch

#pragma once

#include "livewatch/model/ChannelTypes.hpp"
#include "monitor.pb.h"

namespace livewatch::persist {

// Persistent fields only; runtime flags are not part of a record.
livewatch::v1::ChannelRecord ToRecord(const model::ChannelState& state);
model::ChannelState FromRecord(const livewatch::v1::ChannelRecord& record);

livewatch::v1::ChannelConfig ToProtoConfig(const model::ChannelConfig& config);
model::ChannelConfig FromProtoConfig(const livewatch::v1::ChannelConfig& config);

}  // namespace livewatch::persist
