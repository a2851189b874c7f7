#pragma once

#include <stratum/runtime/runtime.hpp>

#include <set>

namespace stratum { namespace runtime {

   struct foreign_deploy_request {
      artifact_spec        artifact;
   };

   struct foreign_deploy_status_request {
      artifact_spec        artifact;
      bool                 cancel_if_incomplete = false;
   };

   struct foreign_init_request {
      artifact_spec        artifact;
      service_constructor  constructor;
      public_key_type      author;
      digest_type          tx_hash;
   };

   struct foreign_execute_request {
      call_info            call;
      bytes                payload;
      public_key_type      author;
      digest_type          tx_hash;
   };

   struct foreign_commit_request {
      bool                 after = false;
   };

   using foreign_request = std::variant<foreign_deploy_request, foreign_deploy_status_request, foreign_init_request,
                                        foreign_execute_request, foreign_commit_request>;

   /// A write to the entries of one instance, an empty value erases the key
   struct state_write {
      instance_id_type     instance_id = 0;
      uint64_t             key = 0;
      optional<bytes>      value;
   };

   struct foreign_response {
      int64_t                    code = 0;   ///< 0 on success, otherwise the code of the exception to raise
      optional<uint64_t>         error_code;
      string                     description;
      deploy_status              status = deploy_status::pending;
      vector<state_write>        writes;
      vector<dispatcher_action>  actions;
   };

   /**
    * Transport to an out of process execution backend. Takes a packed
    * foreign_request and returns a packed foreign_response.
    */
   class foreign_endpoint {
      public:
         virtual ~foreign_endpoint() = default;

         virtual bytes roundtrip( const bytes& request ) = 0;
   };

   /**
    * @brief Runtime forwarding every call to an out of process backend
    *
    * The backend never touches storage: it answers with the writes it wants to
    * make and the dispatcher actions it wants queued, and this runtime applies
    * them to the fork. State hashes are computed locally from the snapshot.
    */
   class foreign_runtime : public runtime {
      public:
         foreign_runtime( runtime_id_type id, unique_ptr<foreign_endpoint> endpoint );
         ~foreign_runtime() override;

         runtime_id_type id()const { return _id; }
         bool has_instance( instance_id_type instance_id )const;

         void start_deploy( const artifact_spec& artifact ) override;
         deploy_status check_deploy_status( const artifact_spec& artifact, bool cancel_if_incomplete ) override;
         void init_service( runtime_context& ctx, const artifact_spec& artifact,
                            const service_constructor& constructor ) override;
         void execute( runtime_context& ctx, const call_info& call, const bytes& payload ) override;
         vector<pair<instance_id_type, digest_type>> state_hashes( const chainbase::database& snapshot )const override;
         void before_commit( chainbase::database& fork ) override;
         void after_commit( const chainbase::database& snapshot ) override;

      private:
         foreign_response send( const foreign_request& request );
         void apply_writes( chainbase::database& fork, const vector<state_write>& writes,
                            const std::set<instance_id_type>& allowed );

         runtime_id_type                _id;
         unique_ptr<foreign_endpoint>   _endpoint;
         std::set<instance_id_type>     _instances;
   };

} } // stratum::runtime

FC_REFLECT( stratum::runtime::foreign_deploy_request, (artifact) )
FC_REFLECT( stratum::runtime::foreign_deploy_status_request, (artifact)(cancel_if_incomplete) )
FC_REFLECT( stratum::runtime::foreign_init_request, (artifact)(constructor)(author)(tx_hash) )
FC_REFLECT( stratum::runtime::foreign_execute_request, (call)(payload)(author)(tx_hash) )
FC_REFLECT( stratum::runtime::foreign_commit_request, (after) )
FC_REFLECT( stratum::runtime::state_write, (instance_id)(key)(value) )
FC_REFLECT( stratum::runtime::foreign_response, (code)(error_code)(description)(status)(writes)(actions) )
