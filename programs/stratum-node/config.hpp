#pragma once

#include <cstdint>

namespace stratum { namespace node { namespace config {
   constexpr uint64_t version = 0x00010000;
   constexpr char     version_string[] = "v1.0.0";
   constexpr char     node_executable_name[] = "stratum-node";
}}}
