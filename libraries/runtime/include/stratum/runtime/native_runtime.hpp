#pragma once

#include <stratum/runtime/runtime.hpp>
#include <stratum/runtime/service.hpp>

#include <set>

namespace stratum { namespace runtime {

   /**
    * @brief Runtime for services compiled into the node
    *
    * Artifacts are service factories registered at startup, so deployment is
    * synchronous. Instances are kept ordered by instance id and every fan-out
    * operation visits them in that order.
    */
   class native_runtime : public runtime {
      public:
         static constexpr runtime_id_type id = static_cast<runtime_id_type>(runtime_identifier::native);

         native_runtime();
         ~native_runtime() override;

         void add_service_factory( unique_ptr<service_factory> factory );

         /**
          * Registers a started instance without invoking service::initialize.
          * Reserved for genesis services.
          * @return the artifact of the instance
          */
         artifact_spec add_builtin_service( unique_ptr<service_factory> factory, instance_id_type instance_id,
                                            const string& instance_name );

         bool has_instance( instance_id_type instance_id )const;

         void start_deploy( const artifact_spec& artifact ) override;
         deploy_status check_deploy_status( const artifact_spec& artifact, bool cancel_if_incomplete ) override;
         void init_service( runtime_context& ctx, const artifact_spec& artifact,
                            const service_constructor& constructor ) override;
         void execute( runtime_context& ctx, const call_info& call, const bytes& payload ) override;
         vector<pair<instance_id_type, digest_type>> state_hashes( const chainbase::database& snapshot )const override;
         void before_commit( chainbase::database& fork ) override;
         void after_commit( const chainbase::database& snapshot ) override;
         vector<pair<string, service_api_builder>> services_api()const override;

      private:
         struct service_instance {
            instance_id_type     id = 0;
            string               name;
            native_artifact_id   artifact;
            unique_ptr<service>  instance;
         };

         native_artifact_id parse_artifact( const artifact_spec& artifact )const;

         map<native_artifact_id, unique_ptr<service_factory>>   _factories;
         std::set<native_artifact_id>                           _deployed;
         map<instance_id_type, service_instance>                _instances;
   };

} } // stratum::runtime
