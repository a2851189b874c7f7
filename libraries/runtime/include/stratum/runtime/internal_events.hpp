#pragma once

#include <stratum/runtime/messages.hpp>
#include <stratum/runtime/bounded_queue.hpp>

namespace stratum { namespace runtime {

   enum class timeout_kind : uint8_t {
      round,
      status,
      request_peers,
      propose,
      update_api
   };

   /// Token handed back when a timeout fires; consensus ignores stale tokens
   struct node_timeout {
      timeout_kind   kind = timeout_kind::round;
      height_type    height = 0;
      round_type     round = 0;

      friend bool operator == ( const node_timeout& a, const node_timeout& b ) {
         return a.kind == b.kind && a.height == b.height && a.round == b.round;
      }
   };

   struct jump_to_round {
      height_type    height = 0;
      round_type     round = 0;
   };

   struct shutdown_signal {};
   struct restart_api_signal {};

   struct verify_message_request {
      bytes          raw;
   };

   struct timeout_request {
      time_point     deadline;
      node_timeout   token;
   };

   struct message_verified_event {
      verified_message  message;
   };

   struct timeout_event {
      node_timeout   token;
   };

   /// Produced by the consensus core and the dispatcher, consumed by internal_part
   using internal_request = std::variant<verify_message_request, timeout_request, jump_to_round,
                                         shutdown_signal, restart_api_signal>;

   /// Produced by internal_part, consumed by the consensus core
   using internal_event = std::variant<message_verified_event, timeout_event, jump_to_round,
                                       shutdown_signal, restart_api_signal>;

   using internal_request_queue = bounded_queue<internal_request>;
   using internal_event_queue   = bounded_queue<internal_event>;

} } // stratum::runtime

FC_REFLECT_ENUM( stratum::runtime::timeout_kind, (round)(status)(request_peers)(propose)(update_api) )
FC_REFLECT( stratum::runtime::node_timeout, (kind)(height)(round) )
FC_REFLECT( stratum::runtime::jump_to_round, (height)(round) )
FC_REFLECT_EMPTY( stratum::runtime::shutdown_signal )
FC_REFLECT_EMPTY( stratum::runtime::restart_api_signal )
FC_REFLECT( stratum::runtime::verify_message_request, (raw) )
FC_REFLECT( stratum::runtime::timeout_request, (deadline)(token) )
FC_REFLECT( stratum::runtime::message_verified_event, (message) )
FC_REFLECT( stratum::runtime::timeout_event, (token) )
