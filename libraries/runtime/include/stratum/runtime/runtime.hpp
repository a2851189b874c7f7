#pragma once

#include <stratum/runtime/api.hpp>
#include <stratum/runtime/runtime_context.hpp>

namespace stratum { namespace runtime {

   /**
    * @brief Execution backend for service artifacts
    *
    * A runtime deploys artifacts and runs the service instances created from them.
    * All failures are reported by throwing one of the exceptions declared in
    * stratum/runtime/exceptions.hpp.
    *
    * Implementations must be deterministic: identical storage state, call and
    * payload have to produce identical writes, actions and errors on every node.
    */
   class runtime {
      public:
         virtual ~runtime() = default;

         /**
          * Begins preparation of an artifact. Idempotent per artifact.
          * @throws deploy_wrong_runtime if the artifact belongs to another runtime
          */
         virtual void start_deploy( const artifact_spec& artifact ) = 0;

         /**
          * Non-blocking poll of a deployment started with start_deploy.
          * @param cancel_if_incomplete abandon an in-flight deployment instead of waiting for it
          */
         virtual deploy_status check_deploy_status( const artifact_spec& artifact, bool cancel_if_incomplete ) = 0;

         /**
          * Creates a service instance. Called once per instance id; on failure the
          * runtime must not retain any trace of the instance.
          */
         virtual void init_service( runtime_context& ctx, const artifact_spec& artifact,
                                    const service_constructor& constructor ) = 0;

         /// Invokes one method of a started instance. Storage is only reachable through ctx.fork
         virtual void execute( runtime_context& ctx, const call_info& call, const bytes& payload ) = 0;

         virtual vector<pair<instance_id_type, digest_type>> state_hashes( const chainbase::database& snapshot )const = 0;

         /// Invoked once per block while the fork may still be modified
         virtual void before_commit( chainbase::database& fork ) = 0;

         /// Invoked once per block after commit; must not throw
         virtual void after_commit( const chainbase::database& snapshot ) = 0;

         virtual vector<pair<string, service_api_builder>> services_api()const { return {}; }
   };

} } // stratum::runtime
