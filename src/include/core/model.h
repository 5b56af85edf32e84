#pragma once

#include "model/device_info.h"
#include "model/discovery_packet.h"
#include "model/received_file_info.h"
#include "model/server_state.h"
