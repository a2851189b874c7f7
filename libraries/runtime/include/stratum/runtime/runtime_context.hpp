#pragma once

#include <stratum/runtime/action.hpp>
#include <chainbase/chainbase.hpp>

#include <boost/core/noncopyable.hpp>
#include <deque>

namespace stratum { namespace runtime {

   /**
    * Per call execution context.
    *
    * Wraps the fork the call is allowed to mutate together with the identity of
    * the transaction that triggered it. Exactly one context is live per applied
    * transaction; it lives on the caller's stack and must not outlive the call.
    */
   class runtime_context : private boost::noncopyable {
      public:
         runtime_context( chainbase::database& fork, const public_key_type& author, const digest_type& tx_hash )
         :fork(fork),author(author),tx_hash(tx_hash) {}

         chainbase::database&       fork;
         const public_key_type      author;
         const digest_type          tx_hash;

         void dispatch_action( dispatcher_action a ) {
            _actions.emplace_back( move(a) );
         }

         bool has_pending_actions()const { return !_actions.empty(); }
         size_t pending_actions()const { return _actions.size(); }

         /// Drops every action queued after the first `keep`
         void discard_actions( size_t keep ) {
            if( keep < _actions.size() )
               _actions.erase( _actions.begin() + keep, _actions.end() );
         }

         /// Hands over all queued actions, oldest first, leaving the queue empty
         std::deque<dispatcher_action> take_dispatcher_actions() {
            std::deque<dispatcher_action> result;
            result.swap( _actions );
            return result;
         }

      private:
         std::deque<dispatcher_action>   _actions;
   };

} } // stratum::runtime
