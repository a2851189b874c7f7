#pragma once

#include <stratum/runtime/native_runtime.hpp>
#include <stratum/runtime/internal_events.hpp>

namespace stratum { namespace runtime {

   /**
    * @brief Single entry point for artifact, service and call routing
    *
    * Owns the registered runtimes, keyed and iterated by runtime id, and the
    * instance id to runtime id routing table. Callers serialize access; the
    * dispatcher performs no locking of its own.
    */
   class dispatcher {
      public:
         explicit dispatcher( internal_request_queue requests );
         ~dispatcher();

         void add_runtime( runtime_id_type id, unique_ptr<runtime> rt );

         bool has_runtime( runtime_id_type id )const;
         optional<runtime_id_type> find_instance_runtime( instance_id_type instance_id )const;

         /// @throws deploy_wrong_runtime if no runtime is registered for artifact.runtime_id
         void start_deploy( const artifact_spec& artifact );
         deploy_status check_deploy_status( const artifact_spec& artifact, bool cancel_if_incomplete );

         /**
          * Initializes a service in the runtime owning the artifact and records the
          * instance on success. Requests an API restart once the runtime has been called,
          * whatever the outcome.
          * @throws init_wrong_runtime if no runtime is registered for artifact.runtime_id
          * @throws service_already_exists if any runtime already runs constructor.instance_id
          */
         void init_service( runtime_context& ctx, const artifact_spec& artifact, const service_constructor& constructor );

         /**
          * Routes the call to the runtime owning the instance, then applies the
          * dispatcher actions queued during the call in FIFO order. The first
          * failing action aborts the remaining ones.
          * @throws execution_wrong_runtime if the instance is unknown
          */
         void execute( runtime_context& ctx, const call_info& call, const bytes& payload );

         vector<pair<instance_id_type, digest_type>> state_hashes( const chainbase::database& snapshot )const;
         void before_commit( chainbase::database& fork );
         void after_commit( const chainbase::database& snapshot );

         vector<pair<string, service_api_builder>> services_api()const;

         /// Records that instance_id lives in artifact.runtime_id, an existing route is never replaced
         void notify_service_started( instance_id_type instance_id, const artifact_spec& artifact );

      private:
         friend class dispatcher_builder;

         void apply_action( runtime_context& ctx, dispatcher_action action );

         map<runtime_id_type, unique_ptr<runtime>>    _runtimes;
         map<instance_id_type, runtime_id_type>       _runtime_lookup;
         internal_request_queue                       _requests;
   };

   /// Genesis service created without running its initialize method
   struct builtin_service {
      unique_ptr<service_factory>   factory;
      instance_id_type              instance_id = 0;
      string                        instance_name;
   };

   /**
    * Two-phase construction of a dispatcher: collect builtin services, service
    * factories and additional runtimes, then finalize() registers the native
    * runtime under its well known id.
    */
   class dispatcher_builder {
      public:
         explicit dispatcher_builder( internal_request_queue requests );

         dispatcher_builder& with_builtin_service( builtin_service service );
         dispatcher_builder& with_service_factory( unique_ptr<service_factory> factory );
         dispatcher_builder& with_runtime( runtime_id_type id, unique_ptr<runtime> rt );

         unique_ptr<dispatcher> finalize();

      private:
         unique_ptr<native_runtime>   _native;
         unique_ptr<dispatcher>       _dispatcher;
   };

} } // stratum::runtime
