#pragma once

#include <stratum/runtime/api.hpp>
#include <stratum/runtime/internal_events.hpp>

namespace stratum { namespace runtime {

   /**
    * Signs service transactions with the node's service key and feeds them back
    * through the internal request queue, where they are verified like any
    * message received from a peer.
    */
   class signing_broadcaster : public transaction_broadcaster {
      public:
         signing_broadcaster( private_key_type key, internal_request_queue requests );

         /// @throws broadcast_exception if the request queue is closed
         digest_type broadcast( const call_info& call, const bytes& payload ) override;

         const public_key_type& public_key()const { return _public_key; }

      private:
         private_key_type         _key;
         public_key_type          _public_key;
         internal_request_queue   _requests;
   };

} } // stratum::runtime
