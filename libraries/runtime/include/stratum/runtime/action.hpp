#pragma once

#include <stratum/runtime/types.hpp>

namespace stratum { namespace runtime {

   struct start_deploy_action {
      artifact_spec        artifact;
   };

   struct init_service_action {
      artifact_spec        artifact;
      service_constructor  constructor;
   };

   /**
    * Dispatcher level side effect requested by a service during execution. Runtimes
    * only append these to the runtime_context; they are interpreted and applied by
    * the dispatcher, in the order they were queued, once the call has returned.
    */
   using dispatcher_action = std::variant<start_deploy_action, init_service_action>;

} } // stratum::runtime

FC_REFLECT( stratum::runtime::start_deploy_action, (artifact) )
FC_REFLECT( stratum::runtime::init_service_action, (artifact)(constructor) )
