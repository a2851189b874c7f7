#include <stratum/runtime/messages.hpp>
#include <fc/io/datastream.hpp>
#include <fc/log/logger.hpp>

namespace stratum { namespace runtime {

signed_message sign_message( const consensus_message& msg, const private_key_type& key ) {
   signed_message result;
   result.payload = fc::raw::pack( msg );
   result.author = key.get_public_key();
   result.signature = key.sign( result.digest() );
   return result;
}

bytes sign_and_pack( const consensus_message& msg, const private_key_type& key ) {
   return fc::raw::pack( sign_message( msg, key ) );
}

optional<verified_message> verify_message( const bytes& raw ) {
   try {
      fc::datastream<const char*> ds( raw.data(), raw.size() );
      signed_message signed_msg;
      fc::raw::unpack( ds, signed_msg );
      if( ds.remaining() != 0 ) {
         dlog( "message carries ${n} trailing bytes", ("n", ds.remaining()) );
         return {};
      }
      public_key_type recovered( signed_msg.signature, signed_msg.digest() );
      if( recovered != signed_msg.author ) {
         dlog( "message signature does not match author ${a}", ("a", signed_msg.author) );
         return {};
      }

      verified_message result;
      result.message = fc::raw::unpack<consensus_message>( signed_msg.payload );
      result.author = std::move( signed_msg.author );
      result.hash = digest_type::hash( raw.data(), raw.size() );
      return result;
   } catch( const fc::exception& e ) {
      dlog( "dropping malformed message: ${e}", ("e", e.to_string()) );
   } catch( const std::exception& e ) {
      dlog( "dropping malformed message: ${e}", ("e", e.what()) );
   }
   return {};
}

} } // stratum::runtime
