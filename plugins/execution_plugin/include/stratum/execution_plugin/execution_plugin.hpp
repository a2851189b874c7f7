#pragma once

#include <appbase/application.hpp>

#include <stratum/runtime/dispatcher.hpp>

namespace stratum {

using namespace appbase;

/**
 * Owns the execution core of the node: the state database, the dispatcher with
 * the supervisor built in, and the internal request / event queues served by
 * internal_part on its own threads.
 *
 * Verified transactions are executed on the application thread, each one in its
 * own undo session followed by the commit hooks of every runtime.
 */
class execution_plugin : public appbase::plugin<execution_plugin> {
public:
   APPBASE_PLUGIN_REQUIRES()

   execution_plugin();
   virtual ~execution_plugin();

   virtual void set_program_options(options_description& cli, options_description& cfg) override;
   void plugin_initialize(const variables_map& options);
   void plugin_startup();
   void plugin_shutdown();

   runtime::dispatcher&             get_dispatcher();
   const chainbase::database&       db() const;
   runtime::internal_request_queue  requests() const;

   /// null before plugin_initialize
   runtime::transaction_broadcaster* broadcaster() const;

   /// Invokes /<service>/<endpoint> of the aggregated service API
   fc::variant call_api( const std::string& service, const std::string& endpoint,
                         const fc::variant& query, bool private_api ) const;

private:
   std::unique_ptr<class execution_plugin_impl> my;
};

}
