#pragma once

#include <stratum/runtime/api.hpp>
#include <stratum/runtime/runtime_context.hpp>

#include <functional>

namespace stratum { namespace runtime {

   /// Identity of an artifact built into the node binary
   struct native_artifact_id {
      string   name;
      string   version;

      artifact_spec to_spec()const;
      string        to_string()const { return name + ":" + version; }

      /// @throws unknown_artifact_exception if raw_spec does not hold a native artifact id
      static native_artifact_id from_spec( const artifact_spec& spec );

      friend bool operator == ( const native_artifact_id& a, const native_artifact_id& b ) {
         return a.name == b.name && a.version == b.version;
      }
      friend bool operator < ( const native_artifact_id& a, const native_artifact_id& b ) {
         return std::tie( a.name, a.version ) < std::tie( b.name, b.version );
      }
   };

   /**
    * View of the runtime_context handed to a native service method. State access
    * is restricted to the entries of the instance being called.
    */
   class service_context {
      public:
         service_context( runtime_context& ctx, instance_id_type instance_id, const string& instance_name )
         :_ctx(ctx),_instance_id(instance_id),_instance_name(instance_name) {}

         instance_id_type        instance_id()const   { return _instance_id; }
         const string&           instance_name()const { return _instance_name; }
         const public_key_type&  author()const        { return _ctx.author; }
         const digest_type&      tx_hash()const       { return _ctx.tx_hash; }

         service_state           state()              { return service_state( _ctx.fork, _instance_id ); }

         void dispatch_action( dispatcher_action a )  { _ctx.dispatch_action( move(a) ); }

      private:
         runtime_context&  _ctx;
         instance_id_type  _instance_id;
         const string&     _instance_name;
   };

   using method_handler = std::function<void(service_context&, const bytes&)>;

   /**
    * @brief Business logic of a native service instance
    *
    * Methods are registered by id in the constructor of the derived class. A
    * method reports failure by throwing, usually through STRATUM_SERVICE_ASSERT.
    */
   class service {
      public:
         virtual ~service() = default;

         /// Called once when the instance is created through init_service
         virtual void initialize( service_context& ctx, const bytes& params ) {}

         virtual void before_commit( service_state& state ) {}
         virtual void after_commit( const service_state_view& state ) {}

         virtual void wire_api( service_api_builder& builder ) {}

         const method_handler* find_method( method_id_type id )const {
            auto itr = _methods.find( id );
            return itr == _methods.end() ? nullptr : &itr->second;
         }

      protected:
         void register_method( method_id_type id, method_handler h ) {
            _methods[id] = move(h);
         }

         /// Registers a method whose payload is an fc-packed Payload
         template<typename Payload, typename Handler>
         void register_method( method_id_type id, Handler h ) {
            register_method( id, method_handler( [h = move(h)]( service_context& ctx, const bytes& payload ) {
               h( ctx, fc::raw::unpack<Payload>( payload ) );
            }));
         }

      private:
         map<method_id_type, method_handler>   _methods;
   };

   class service_factory {
      public:
         virtual ~service_factory() = default;

         virtual native_artifact_id   artifact()const = 0;
         virtual unique_ptr<service>  create_instance()const = 0;
   };

   /// Factory creating default constructed instances of ServiceType
   template<typename ServiceType>
   class default_service_factory : public service_factory {
      public:
         explicit default_service_factory( native_artifact_id id ) : _id( move(id) ) {}

         native_artifact_id  artifact()const override { return _id; }
         unique_ptr<service> create_instance()const override { return make_unique<ServiceType>(); }

      private:
         native_artifact_id   _id;
   };

} } // stratum::runtime

FC_REFLECT( stratum::runtime::native_artifact_id, (name)(version) )
