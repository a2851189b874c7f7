#pragma once

#include <stratum/runtime/types.hpp>

#include <chainbase/chainbase.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/preprocessor/facilities/overload.hpp>
#include <boost/preprocessor/seq/for_each.hpp>

#define OBJECT_CTOR1(NAME) \
    NAME() = delete; \
    public: \
    template<typename Constructor, typename Allocator> \
    NAME(Constructor&& c, chainbase::allocator<Allocator>) \
    { c(*this); }
#define OBJECT_CTOR2_MACRO(x, y, field) ,field(a)
#define OBJECT_CTOR2(NAME, FIELDS) \
    NAME() = delete; \
    public: \
    template<typename Constructor, typename Allocator> \
    NAME(Constructor&& c, chainbase::allocator<Allocator> a) \
    : id(0) BOOST_PP_SEQ_FOR_EACH(OBJECT_CTOR2_MACRO, _, FIELDS) \
    { c(*this); }
#define OBJECT_CTOR(...) BOOST_PP_OVERLOAD(OBJECT_CTOR, __VA_ARGS__)(__VA_ARGS__)

namespace stratum { namespace runtime {

   using boost::multi_index::indexed_by;
   using boost::multi_index::ordered_unique;
   using boost::multi_index::tag;
   using boost::multi_index::member;
   using boost::multi_index::composite_key;
   using boost::multi_index::composite_key_compare;

   using chainbase::shared_string;

   /**
    * List all object types stored in the state database. Values are persisted,
    * only append to the end.
    */
   enum object_type {
      null_object_type = 0,
      service_entry_object_type,
      OBJECT_TYPE_COUNT ///< Sentry value which contains the number of different object types
   };

   struct by_id;
   struct by_instance_key;

   /**
    * @brief A single key/value entry owned by a service instance
    *
    * Services only ever see their own entries through service_state; the
    * instance_id column is filled in by the accessor.
    */
   class service_entry_object : public chainbase::object<service_entry_object_type, service_entry_object> {
      OBJECT_CTOR(service_entry_object, (value))

      id_type              id;
      instance_id_type     instance_id = 0; //< should not be changed within a chainbase modifier lambda
      uint64_t             key = 0;         //< should not be changed within a chainbase modifier lambda
      shared_string        value;
   };

   using service_entry_index = chainbase::shared_multi_index_container<
      service_entry_object,
      indexed_by<
         ordered_unique<tag<by_id>,
            member<service_entry_object, service_entry_object::id_type, &service_entry_object::id>
         >,
         ordered_unique<tag<by_instance_key>,
            composite_key< service_entry_object,
               member<service_entry_object, instance_id_type, &service_entry_object::instance_id>,
               member<service_entry_object, uint64_t,         &service_entry_object::key>
            >,
            composite_key_compare< std::less<instance_id_type>, std::less<uint64_t> >
         >
      >
   >;

   /// Registers every index the runtimes rely on
   void add_state_indices( chainbase::database& db );

} } // stratum::runtime

CHAINBASE_SET_INDEX_TYPE( stratum::runtime::service_entry_object, stratum::runtime::service_entry_index )
