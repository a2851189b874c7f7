#pragma once

#include <stratum/runtime/state_objects.hpp>

namespace stratum { namespace runtime {

   /**
    * Read only view over the entries of a single service instance. Used with
    * snapshots, i.e. when computing state hashes and answering API queries.
    */
   class service_state_view {
      public:
         service_state_view( const chainbase::database& db, instance_id_type instance_id );

         instance_id_type instance_id()const { return _instance_id; }

         optional<bytes> get( uint64_t key )const;
         bool            contains( uint64_t key )const;
         size_t          size()const;

         template<typename T>
         optional<T> get_as( uint64_t key )const {
            auto raw = get( key );
            if( !raw ) return {};
            return fc::raw::unpack<T>( *raw );
         }

         /// Visits entries in ascending key order: f(uint64_t key, const shared_string& value)
         template<typename Function>
         void for_each( Function&& f )const {
            const auto& idx = _db.get_index<service_entry_index, by_instance_key>();
            auto itr = idx.lower_bound( boost::make_tuple( _instance_id ) );
            auto end = idx.upper_bound( boost::make_tuple( _instance_id ) );
            for( ; itr != end; ++itr ) {
               f( itr->key, itr->value );
            }
         }

      protected:
         const service_entry_object* find( uint64_t key )const;

         const chainbase::database& _db;
         instance_id_type           _instance_id;
   };

   /**
    * Mutable accessor used while executing a call against the fork. All writes
    * become part of the undo session started by the caller.
    */
   class service_state : public service_state_view {
      public:
         service_state( chainbase::database& db, instance_id_type instance_id );

         void set( uint64_t key, const char* data, size_t size );
         void set( uint64_t key, const bytes& value ) { set( key, value.data(), value.size() ); }

         template<typename T>
         void set_as( uint64_t key, const T& value ) {
            set( key, fc::raw::pack( value ) );
         }

         /// @return true if an entry was removed
         bool erase( uint64_t key );

         /// Removes every entry of the instance
         void clear();

      private:
         chainbase::database& _mutable_db;
   };

   /**
    * SHA-256 over the instance id followed by its entries in key order. Pure
    * function of the snapshot.
    */
   digest_type service_state_hash( const chainbase::database& snapshot, instance_id_type instance_id );

} } // stratum::runtime
