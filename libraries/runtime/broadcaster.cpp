#include <stratum/runtime/broadcaster.hpp>
#include <stratum/runtime/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace stratum { namespace runtime {

signing_broadcaster::signing_broadcaster( private_key_type key, internal_request_queue requests )
:_key( move(key) )
,_public_key( _key.get_public_key() )
,_requests( move(requests) ) {}

digest_type signing_broadcaster::broadcast( const call_info& call, const bytes& payload ) {
   auto raw = sign_and_pack( any_tx{ call, payload }, _key );
   auto hash = digest_type::hash( raw.data(), raw.size() );

   STRATUM_ASSERT( _requests.push( verify_message_request{ move(raw) } ), broadcast_exception,
                   "internal request queue is closed" );

   dlog( "broadcast transaction ${h} to ${i}:${m}", ("h", hash)("i", call.instance_id)("m", call.method_id) );
   return hash;
}

} } // stratum::runtime
