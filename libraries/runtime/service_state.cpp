#include <stratum/runtime/service_state.hpp>
#include <stratum/runtime/exceptions.hpp>

namespace stratum { namespace runtime {

void add_state_indices( chainbase::database& db ) {
   db.add_index<service_entry_index>();
}

service_state_view::service_state_view( const chainbase::database& db, instance_id_type instance_id )
:_db(db),_instance_id(instance_id) {}

const service_entry_object* service_state_view::find( uint64_t key )const {
   return _db.find<service_entry_object, by_instance_key>( boost::make_tuple( _instance_id, key ) );
}

optional<bytes> service_state_view::get( uint64_t key )const {
   const auto* obj = find( key );
   if( !obj ) return {};
   return bytes( obj->value.data(), obj->value.data() + obj->value.size() );
}

bool service_state_view::contains( uint64_t key )const {
   return find( key ) != nullptr;
}

size_t service_state_view::size()const {
   size_t count = 0;
   for_each( [&]( uint64_t, const shared_string& ) { ++count; } );
   return count;
}

service_state::service_state( chainbase::database& db, instance_id_type instance_id )
:service_state_view(db, instance_id),_mutable_db(db) {}

void service_state::set( uint64_t key, const char* data, size_t size ) {
   const auto* obj = find( key );
   if( obj ) {
      _mutable_db.modify( *obj, [&]( auto& e ) {
         e.value.assign( data, size );
      });
   } else {
      _mutable_db.create<service_entry_object>( [&]( auto& e ) {
         e.instance_id = _instance_id;
         e.key = key;
         e.value.assign( data, size );
      });
   }
}

bool service_state::erase( uint64_t key ) {
   const auto* obj = find( key );
   if( !obj ) return false;
   _mutable_db.remove( *obj );
   return true;
}

void service_state::clear() {
   const auto& idx = _mutable_db.get_index<service_entry_index, by_instance_key>();
   auto itr = idx.lower_bound( boost::make_tuple( _instance_id ) );
   while( itr != idx.end() && itr->instance_id == _instance_id ) {
      const auto& obj = *itr;
      ++itr;
      _mutable_db.remove( obj );
   }
}

digest_type service_state_hash( const chainbase::database& snapshot, instance_id_type instance_id ) {
   digest_type::encoder enc;
   fc::raw::pack( enc, instance_id );
   service_state_view( snapshot, instance_id ).for_each( [&]( uint64_t key, const shared_string& value ) {
      fc::raw::pack( enc, key );
      fc::raw::pack( enc, fc::unsigned_int( value.size() ) );
      if( value.size() )
         enc.write( value.data(), value.size() );
   });
   return enc.result();
}

} } // stratum::runtime
