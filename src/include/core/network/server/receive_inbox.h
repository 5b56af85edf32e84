#pragma once

#include <core/model/received_file_info.h>
#include <core/util/single_slot.h>
#include <string>

namespace sendplus::core {

// What the server hands to the application: the last file and the last
// text that arrived, each kept until acknowledged or overwritten.
struct ReceiveInbox {
    SingleSlot<ReceivedFileInfo> file;
    SingleSlot<std::string> text;
};

} // namespace sendplus::core
