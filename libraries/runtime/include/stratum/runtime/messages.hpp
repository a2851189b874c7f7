#pragma once

#include <stratum/runtime/types.hpp>

namespace stratum { namespace runtime {

   typedef uint64_t  height_type;
   typedef uint32_t  round_type;
   typedef uint16_t  validator_id_type;

   /// Service transaction; the author is the signer of the enclosing signed_message
   struct any_tx {
      call_info      call;
      bytes          payload;
   };

   struct status_message {
      height_type    height = 0;
      digest_type    last_hash;
      uint64_t       pool_size = 0;
   };

   struct propose_message {
      validator_id_type    validator = 0;
      height_type          height = 0;
      round_type           round = 0;
      digest_type          prev_hash;
      vector<digest_type>  transactions;
   };

   struct prevote_message {
      validator_id_type    validator = 0;
      height_type          height = 0;
      round_type           round = 0;
      digest_type          propose_hash;
      round_type           locked_round = 0;
   };

   struct precommit_message {
      validator_id_type    validator = 0;
      height_type          height = 0;
      round_type           round = 0;
      digest_type          propose_hash;
      digest_type          block_hash;
      time_point           time;
   };

   using consensus_message = std::variant<any_tx, status_message, propose_message, prevote_message, precommit_message>;

   /**
    * Wire envelope of every consensus message. The signature covers the sha256
    * digest of payload, which holds the packed consensus_message.
    */
   struct signed_message {
      bytes             payload;
      public_key_type   author;
      signature_type    signature;

      digest_type digest()const { return digest_type::hash( payload.data(), payload.size() ); }
   };

   /// Message whose signature has been checked against its author
   struct verified_message {
      consensus_message    message;
      public_key_type      author;
      digest_type          hash;    ///< digest of the complete packed signed_message
   };

   signed_message sign_message( const consensus_message& msg, const private_key_type& key );

   /// Packs and signs msg, the result is what travels over the wire
   bytes sign_and_pack( const consensus_message& msg, const private_key_type& key );

   /**
    * Decodes a packed signed_message and checks its signature.
    * @return empty if the bytes are malformed or the signature was not made by the author
    */
   optional<verified_message> verify_message( const bytes& raw );

} } // stratum::runtime

FC_REFLECT( stratum::runtime::any_tx, (call)(payload) )
FC_REFLECT( stratum::runtime::status_message, (height)(last_hash)(pool_size) )
FC_REFLECT( stratum::runtime::propose_message, (validator)(height)(round)(prev_hash)(transactions) )
FC_REFLECT( stratum::runtime::prevote_message, (validator)(height)(round)(propose_hash)(locked_round) )
FC_REFLECT( stratum::runtime::precommit_message, (validator)(height)(round)(propose_hash)(block_hash)(time) )
FC_REFLECT( stratum::runtime::signed_message, (payload)(author)(signature) )
FC_REFLECT( stratum::runtime::verified_message, (message)(author)(hash) )
