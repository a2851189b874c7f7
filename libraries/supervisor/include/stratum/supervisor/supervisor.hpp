#pragma once

#include <stratum/runtime/dispatcher.hpp>
#include <stratum/runtime/messages.hpp>

#include <fc/static_variant.hpp> // variant conversion of config_change

namespace stratum { namespace supervisor {

   using namespace stratum::runtime;

   /// Well known instance of the supervisor
   constexpr instance_id_type supervisor_instance_id = 0;
   constexpr char             supervisor_instance_name[] = "supervisor";

   /// Instance ids handed out to services started through configuration changes begin here
   constexpr instance_id_type first_service_instance_id = 1024;

   enum method : method_id_type {
      request_artifact_deploy_method = 0,
      propose_config_change_method   = 1,
      confirm_config_change_method   = 2
   };

   /// Service error codes recorded in execution_status::error_code
   enum class supervisor_error : uint64_t {
      malformed_deploy_request = 1,
      empty_config_proposal    = 2,
      proposal_already_exists  = 3,
      no_pending_proposal      = 4,
      proposal_hash_mismatch   = 5,
      malformed_start_service  = 6
   };

   enum class supervisor_mode : uint8_t {
      simple,        ///< a proposal is applied as soon as it is accepted
      decentralized  ///< a proposal waits for a confirmation
   };

   struct supervisor_config {
      supervisor_mode   mode = supervisor_mode::simple;
   };

   struct deploy_request {
      artifact_spec     artifact;
      height_type       deadline_height = 0;
   };

   struct start_service {
      artifact_spec     artifact;
      string            name;
      bytes             config;
   };

   using config_change = std::variant<start_service>;

   struct config_propose {
      height_type             actual_from = 0;
      vector<config_change>   changes;
   };

   struct config_vote {
      digest_type       propose_hash;
   };

   struct pending_proposal {
      config_propose    propose;
      digest_type       propose_hash;
      public_key_type   author;
   };

   digest_type proposal_hash( const config_propose& propose );

   /**
    * @brief Built-in service managing artifacts and service instances
    *
    * Transactions only queue dispatcher actions; deployment and service
    * initialization are carried out by the dispatcher once the transaction
    * has executed.
    */
   class supervisor_service : public service {
      public:
         explicit supervisor_service( supervisor_config config );

         void wire_api( service_api_builder& builder )override;

         const supervisor_config& config()const { return _config; }

         static uint64_t                   configuration_number( const service_state_view& state );
         static optional<pending_proposal> pending( const service_state_view& state );

      private:
         void request_artifact_deploy( service_context& ctx, const deploy_request& request );
         void propose_config_change( service_context& ctx, const config_propose& propose );
         void confirm_config_change( service_context& ctx, const config_vote& vote );

         void apply_proposal( service_context& ctx, const config_propose& propose );

         supervisor_config    _config;
   };

   class supervisor_factory : public service_factory {
      public:
         explicit supervisor_factory( supervisor_config config ) : _config( config ) {}

         native_artifact_id   artifact()const override;
         unique_ptr<service>  create_instance()const override;

      private:
         supervisor_config    _config;
   };

   /// The supervisor as a builtin service under its well known id and name
   builtin_service make_builtin_supervisor( supervisor_config config );

} } // stratum::supervisor

FC_REFLECT_ENUM( stratum::supervisor::supervisor_mode, (simple)(decentralized) )
FC_REFLECT( stratum::supervisor::supervisor_config, (mode) )
FC_REFLECT( stratum::supervisor::deploy_request, (artifact)(deadline_height) )
FC_REFLECT( stratum::supervisor::start_service, (artifact)(name)(config) )
FC_REFLECT( stratum::supervisor::config_propose, (actual_from)(changes) )
FC_REFLECT( stratum::supervisor::config_vote, (propose_hash) )
FC_REFLECT( stratum::supervisor::pending_proposal, (propose)(propose_hash)(author) )
