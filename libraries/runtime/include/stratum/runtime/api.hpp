#pragma once

#include <stratum/runtime/service_state.hpp>

#include <fc/variant.hpp>

#include <functional>

namespace stratum { namespace runtime {

   /**
    * Submits signed service transactions to the network on behalf of this node.
    * Only validator nodes have one.
    */
   class transaction_broadcaster {
      public:
         virtual ~transaction_broadcaster() = default;

         /// @return hash of the signed message that was broadcast
         virtual digest_type broadcast( const call_info& call, const bytes& payload ) = 0;
   };

   /**
    * Everything an API handler may touch: a snapshot of the committed state, the
    * identity of the service it belongs to and the node's broadcaster, which is
    * null on nodes that do not sign transactions.
    */
   struct service_api_state {
      const chainbase::database&  snapshot;
      instance_id_type            instance_id = 0;
      string                      instance_name;
      transaction_broadcaster*    broadcaster = nullptr;

      service_state_view state()const { return service_state_view( snapshot, instance_id ); }
   };

   using api_handler = std::function<fc::variant(const service_api_state&, const fc::variant&)>;

   struct api_endpoint {
      bool           mutating = false;
      api_handler    handler;
   };

   /// Named endpoints of one visibility level, ordered by name
   class service_api_scope {
      public:
         service_api_scope& endpoint( const string& name, api_handler h ) {
            _endpoints[name] = api_endpoint{ false, std::move(h) };
            return *this;
         }

         service_api_scope& endpoint_mut( const string& name, api_handler h ) {
            _endpoints[name] = api_endpoint{ true, std::move(h) };
            return *this;
         }

         /// Handler taking a typed query, the result is converted back into a variant
         template<typename Query, typename Handler>
         service_api_scope& endpoint( const string& name, Handler h ) {
            return endpoint( name, wrap<Query>( std::move(h) ) );
         }

         template<typename Query, typename Handler>
         service_api_scope& endpoint_mut( const string& name, Handler h ) {
            return endpoint_mut( name, wrap<Query>( std::move(h) ) );
         }

         const map<string, api_endpoint>& endpoints()const { return _endpoints; }

      private:
         template<typename Query, typename Handler>
         static api_handler wrap( Handler h ) {
            return [h = std::move(h)]( const service_api_state& s, const fc::variant& q ) -> fc::variant {
               Query query;
               fc::from_variant( q, query );
               return fc::variant( h( s, query ) );
            };
         }

         map<string, api_endpoint>   _endpoints;
   };

   class service_api_builder {
      public:
         service_api_scope&       private_scope()       { return _private; }
         service_api_scope&       public_scope()        { return _public; }
         const service_api_scope& private_scope()const  { return _private; }
         const service_api_scope& public_scope()const   { return _public; }

         instance_id_type         instance_id = 0;

      private:
         service_api_scope   _private;
         service_api_scope   _public;
   };

} } // stratum::runtime
