#pragma once
#include <fc/crypto/sha256.hpp>
#include <fc/crypto/private_key.hpp>
#include <fc/crypto/public_key.hpp>
#include <fc/crypto/signature.hpp>
#include <fc/io/raw.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/time.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace stratum { namespace runtime {

   using std::map;
   using std::vector;
   using std::string;
   using std::pair;
   using std::optional;
   using std::shared_ptr;
   using std::unique_ptr;
   using std::make_shared;
   using std::make_unique;
   using std::move;
   using std::forward;

   using fc::time_point;
   using fc::microseconds;

   typedef vector<char>               bytes;
   typedef fc::sha256                 digest_type;
   typedef fc::crypto::public_key     public_key_type;
   typedef fc::crypto::private_key    private_key_type;
   typedef fc::crypto::signature      signature_type;

   typedef uint32_t                   runtime_id_type;
   typedef uint32_t                   instance_id_type;
   typedef uint16_t                   method_id_type;

   /**
    * Well known runtime identifiers. The dispatcher only reserves `native`,
    * any other identifier is assigned by whoever registers the runtime.
    */
   enum class runtime_identifier : runtime_id_type {
      native  = 0,
      foreign = 1
   };

   /**
    * Identifies a deployable unit of code within a specific runtime. The contents
    * of raw_spec are opaque to everything but the owning runtime.
    */
   struct artifact_spec {
      runtime_id_type   runtime_id = 0;
      bytes             raw_spec;

      friend bool operator == ( const artifact_spec& a, const artifact_spec& b ) {
         return a.runtime_id == b.runtime_id && a.raw_spec == b.raw_spec;
      }
      friend bool operator != ( const artifact_spec& a, const artifact_spec& b ) {
         return !(a == b);
      }
      friend bool operator < ( const artifact_spec& a, const artifact_spec& b ) {
         return std::tie( a.runtime_id, a.raw_spec ) < std::tie( b.runtime_id, b.raw_spec );
      }
   };

   enum class deploy_status : uint8_t {
      pending,
      deployed,
      failed
   };

   /// One-shot initialization payload, consumed exactly once per instance
   struct service_constructor {
      instance_id_type  instance_id = 0;
      bytes             data;
   };

   struct call_info {
      instance_id_type  instance_id = 0;
      method_id_type    method_id = 0;

      call_info() = default;
      call_info( instance_id_type i, method_id_type m ) : instance_id(i), method_id(m) {}

      friend bool operator == ( const call_info& a, const call_info& b ) {
         return a.instance_id == b.instance_id && a.method_id == b.method_id;
      }
   };

   /**
    * Deterministic record of a failed call, suitable for storing in the ledger.
    * Only the exception code, the optional service code and the top message
    * are kept so that every replica records identical bytes.
    */
   struct execution_status {
      int64_t                  code = 0;
      optional<uint64_t>       error_code;
      string                   description;

      static execution_status from_exception( const fc::exception& e );
   };

   template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
   template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} } // stratum::runtime

FC_REFLECT_ENUM( stratum::runtime::runtime_identifier, (native)(foreign) )
FC_REFLECT_ENUM( stratum::runtime::deploy_status, (pending)(deployed)(failed) )
FC_REFLECT( stratum::runtime::artifact_spec, (runtime_id)(raw_spec) )
FC_REFLECT( stratum::runtime::service_constructor, (instance_id)(data) )
FC_REFLECT( stratum::runtime::call_info, (instance_id)(method_id) )
FC_REFLECT( stratum::runtime::execution_status, (code)(error_code)(description) )
