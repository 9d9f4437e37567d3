#include <sendme/db/resume.hpp>
#include <sendme/error.hpp>
#include <fc/reflect_impl.hpp>
#include <fc/reflect_vector.hpp>
#include <fc/raw.hpp>
#include <fc/thread.hpp>
#include <fc/filesystem.hpp>
#include <fc/exception.hpp>
#include <fc/log.hpp>
#include <db_cxx.h>

FC_REFLECT( sm::db::resume::range, (start)(count) )
FC_REFLECT( sm::db::resume::record, (part_path)(blob_size)(verified) )

namespace sm { namespace db {

  uint32_t resume::record::verified_prefix()const {
    uint32_t end = 0;
    bool     grew = true;
    // ranges may be stored in any order and may overlap
    while( grew ) {
      grew = false;
      for( size_t i = 0; i < verified.size(); ++i ) {
        if( verified[i].start <= end && verified[i].start + verified[i].count > end ) {
          end  = verified[i].start + verified[i].count;
          grew = true;
        }
      }
    }
    return end;
  }

  class resume_private {
    public:
      resume_private( const fc::path& envdir )
      :_thread("db::resume"),_envdir(envdir),_env(0),_resume_db(0){}

      fc::thread   _thread;
      fc::path     _envdir;
      DbEnv        _env;
      Db*          _resume_db;
  };

  resume::resume( const fc::path& dir )
  :my( new resume_private(dir) ) {}

  resume::~resume() {
    try {
      close();
      my->_thread.quit();
      delete my;
    } catch ( ... ) {
      elog( "%s", fc::current_exception().diagnostic_information().c_str() );
    }
  }

  void resume::init() {
    if( !my->_thread.is_current() ) {
      my->_thread.async( [this](){ init(); } ).wait();
      return;
    }
    try {
      if( !fc::exists( my->_envdir ) )
        fc::create_directories( my->_envdir );

      slog( "initializing resume database... %s", my->_envdir.string().c_str() );
      my->_env.open( my->_envdir.string().c_str(), DB_CREATE | DB_INIT_MPOOL | DB_INIT_TXN | DB_INIT_LOCK | DB_REGISTER | DB_RECOVER, 0 );

      my->_resume_db = new Db( &my->_env, 0 );
      my->_resume_db->set_flags( DB_RECNUM );
      my->_resume_db->open( NULL, "resume_data", "resume_data", DB_BTREE, DB_CREATE | DB_AUTO_COMMIT, 0 );
    } catch( const DbException& e ) {
      elog( "Error opening resume database: %s\n \t\t%s", my->_envdir.string().c_str(), e.what() );
      SENDME_THROW( io_error, "unable to open resume database %1%: %2%", %my->_envdir.string().c_str() %e.what() );
    }
  }

  void resume::close() {
    if( !my->_thread.is_current() ) {
      my->_thread.async( [this](){ close(); } ).wait();
      return;
    }
    if( !my->_resume_db ) return;
    try {
      slog( "closing resume db" );
      my->_resume_db->close(0);
      delete my->_resume_db;
      my->_resume_db = 0;
      my->_env.close(0);
    } catch ( const DbException& e ) {
      SENDME_THROW( io_error, "error closing resume database: %1%", %e.what() );
    }
  }

  uint32_t resume::count() {
    if( !my->_thread.is_current() ) {
      return my->_thread.async( [this](){ return count(); } ).wait();
    }
    db_recno_t num = 0;
    Dbc*       cur;
    Dbt key;
    Dbt val( &num, sizeof(num) );
    val.set_ulen( sizeof(num) );
    val.set_flags( DB_DBT_USERMEM );

    Dbt ignore_val;
    ignore_val.set_flags( DB_DBT_USERMEM | DB_DBT_PARTIAL );
    ignore_val.set_dlen(0);

    try {
      my->_resume_db->cursor( NULL, &cur, 0 );
      if( cur->get( &key, &ignore_val, DB_LAST ) == DB_NOTFOUND ) {
        cur->close();
        return 0;
      }
      cur->get( &key, &val, DB_GET_RECNO );
      cur->close();
    } catch ( const DbException& e ) {
      SENDME_THROW( io_error, "error counting resume records: %1%", %e.what() );
    }
    return num;
  }

  bool resume::fetch( const id& blob, record& r ) {
    if( !my->_thread.is_current() ) {
      return my->_thread.async( [&,this](){ return fetch( blob, r ); } ).wait();
    }
    fc::sha1 k = blob;
    Dbt key( k.data(), sizeof(k) );
    key.set_flags( DB_DBT_USERMEM );
    key.set_ulen( sizeof(k) );

    Dbt val;
    try {
      if( DB_NOTFOUND == my->_resume_db->get( 0, &key, &val, 0 ) )
        return false;
    } catch ( const DbException& e ) {
      SENDME_THROW( io_error, "error reading resume record: %1%", %e.what() );
    }
    try {
      r = fc::raw::unpack<record>( (char*)val.get_data(), val.get_size() );
    } catch ( ... ) {
      wlog( "discarding unreadable resume record for %s: %s", fc::string(blob).c_str(), fc::except_str().c_str() );
      return false;
    }
    return true;
  }

  void resume::store( const id& blob, const record& r ) {
    if( !my->_thread.is_current() ) {
      my->_thread.async( [&,this](){ store( blob, r ); } ).wait();
      return;
    }
    fc::sha1 k = blob;
    Dbt key( k.data(), sizeof(k) );
    key.set_flags( DB_DBT_USERMEM );

    fc::vector<char> dat = fc::raw::pack(r);
    Dbt val( dat.data(), dat.size() );

    DbTxn* txn = NULL;
    my->_env.txn_begin( NULL, &txn, 0 );
    try {
      my->_resume_db->put( txn, &key, &val, 0 );
      txn->commit( DB_TXN_WRITE_NOSYNC );
    } catch ( const DbException& e ) {
      txn->abort();
      SENDME_THROW( io_error, "error storing resume record: %1%", %e.what() );
    }
  }

  void resume::remove( const id& blob ) {
    if( !my->_thread.is_current() ) {
      my->_thread.async( [&,this](){ remove( blob ); } ).wait();
      return;
    }
    fc::sha1 k = blob;
    Dbt key( k.data(), sizeof(k) );
    key.set_flags( DB_DBT_USERMEM );

    DbTxn* txn = NULL;
    my->_env.txn_begin( NULL, &txn, 0 );
    try {
      my->_resume_db->del( txn, &key, 0 );
      txn->commit( DB_TXN_WRITE_NOSYNC );
    } catch ( const DbException& e ) {
      txn->abort();
      SENDME_THROW( io_error, "error removing resume record: %1%", %e.what() );
    }
  }

} } // sm::db
