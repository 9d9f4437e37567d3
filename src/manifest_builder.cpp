#include <sendme/manifest_builder.hpp>
#include <sendme/blob_store.hpp>
#include <sendme/events.hpp>
#include <sendme/error.hpp>
#include <fc/thread.hpp>
#include <fc/future.hpp>
#include <fc/exception.hpp>
#include <fc/log.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/thread/thread.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>

namespace sm {

  namespace {
    /// files larger than this are hashed as several ranges
    const uint32_t max_leaves_per_unit = (64*1024*1024) / chunk_size;

    struct work_unit {
      uint32_t file;
      uint32_t first;
      uint32_t count;
    };

    class worker_pool {
      public:
        worker_pool( uint32_t n ) {
          for( uint32_t i = 0; i < n; ++i ) {
            std::string name = "hash" + boost::lexical_cast<std::string>(i);
            _threads.push_back( boost::shared_ptr<fc::thread>( new fc::thread( name.c_str() ) ) );
          }
        }
        ~worker_pool() {
          for( size_t i = 0; i < _threads.size(); ++i )
            _threads[i]->quit();
        }
        fc::thread& operator[]( size_t i ) { return *_threads[ i % _threads.size() ]; }

      private:
        std::vector< boost::shared_ptr<fc::thread> > _threads;
    };

    fc::vector<fc::sha1> hash_range( const fc::path& p, uint64_t size, uint32_t first, uint32_t count ) {
      fc::vector<fc::sha1> leaves(count);
      if( size == 0 ) {
        leaves[0] = hash_tree::hash_leaf( 0, 0 );
        return leaves;
      }
      boost::filesystem::ifstream in( boost::filesystem::path( p.string().c_str() ), std::ios::in | std::ios::binary );
      if( !in )
        SENDME_THROW( io_error, "unable to open %1%", %p.string().c_str() );
      in.seekg( uint64_t(first) * chunk_size );

      char buf[chunk_size];
      for( uint32_t i = 0; i < count; ++i ) {
        uint32_t len = chunk_length( size, first + i );
        in.read( buf, len );
        if( uint32_t(in.gcount()) != len )
          SENDME_THROW( io_error, "%1% changed while it was being hashed", %p.string().c_str() );
        leaves[i] = hash_tree::hash_leaf( buf, len );
      }
      return leaves;
    }

    bool rel_less( const std::string& a, const std::string& b ) { return a < b; }
  }

  manifest_builder::manifest_builder( uint32_t workers )
  :_workers(workers) {
    if( _workers == 0 ) _workers = boost::thread::hardware_concurrency();
    if( _workers == 0 ) _workers = 1;
  }

  void manifest_builder::add( const fc::path& p ) {
    _inputs.push_back(p);
  }

  void manifest_builder::collect( const fc::path& p, const std::string& rel, bool top, fc::vector<input_file>& out ) {
    boost::filesystem::path bp( p.string().c_str() );
    if( !top && boost::filesystem::is_symlink(bp) ) {
      wlog( "skipping symbolic link %s", p.string().c_str() );
      return;
    }
    if( fc::is_directory(p) ) {
      fc::directory_iterator itr(p);
      fc::directory_iterator end;
      while( itr != end ) {
        fc::path child = *itr;
        collect( child, rel + "/" + child.filename().string().c_str(), false, out );
        ++itr;
      }
    } else if( fc::is_regular_file(p) ) {
      input_file f;
      f.path = p;
      f.rel  = rel;
      f.size = fc::file_size(p);
      out.push_back(f);
    } else {
      wlog( "skipping %s, not a regular file", p.string().c_str() );
    }
  }

  manifest manifest_builder::build( blob_store& store, event_channel* events ) {
    if( _inputs.empty() )
      SENDME_THROW( io_error, "no files to share" );

    fc::vector<input_file> files;
    for( size_t i = 0; i < _inputs.size(); ++i ) {
      const fc::path& p = _inputs[i];
      if( !fc::exists(p) )
        SENDME_THROW( io_error, "%1% does not exist", %p.string().c_str() );
      try {
        boost::filesystem::path bp = boost::filesystem::canonical( boost::filesystem::path( p.string().c_str() ) );
        collect( p, bp.filename().string(), true, files );
      } catch( const sendme_exception& ) {
        throw;
      } catch( const boost::filesystem::filesystem_error& e ) {
        SENDME_THROW( io_error, "unable to read %1%: %2%", %p.string().c_str() %e.what() );
      } catch( ... ) {
        SENDME_THROW( io_error, "unable to read %1%: %2%", %p.string().c_str() %fc::except_str().c_str() );
      }
    }
    if( files.empty() )
      SENDME_THROW( io_error, "no regular files found in the given paths" );

    std::vector<size_t> order( files.size() );
    for( size_t i = 0; i < order.size(); ++i ) order[i] = i;
    std::sort( order.begin(), order.end(), [&]( size_t a, size_t b ) { return rel_less( files[a].rel, files[b].rel ); } );
    for( size_t i = 1; i < order.size(); ++i ) {
      if( files[order[i-1]].rel == files[order[i]].rel )
        SENDME_THROW( io_error, "two inputs share the path %1%", %files[order[i]].rel );
    }

    fc::vector<work_unit> units;
    for( size_t i = 0; i < order.size(); ++i ) {
      uint32_t n = chunk_count( files[order[i]].size );
      for( uint32_t first = 0; first < n; first += max_leaves_per_unit ) {
        work_unit u;
        u.file  = order[i];
        u.first = first;
        u.count = std::min( n - first, uint32_t(max_leaves_per_unit) );
        units.push_back(u);
      }
    }

    slog( "hashing %d files in %d units on %d workers", int(files.size()), int(units.size()), int(_workers) );
    worker_pool pool( std::min( _workers, uint32_t(units.size()) ) );

    fc::vector< fc::future< fc::vector<fc::sha1> > > results;
    results.reserve( units.size() );
    for( size_t i = 0; i < units.size(); ++i ) {
      fc::path p     = files[units[i].file].path;
      uint64_t sz    = files[units[i].file].size;
      uint32_t first = units[i].first;
      uint32_t count = units[i].count;
      results.push_back( pool[i].async( [=]() { return hash_range( p, sz, first, count ); } ) );
    }

    manifest m;
    size_t u = 0;
    for( size_t i = 0; i < order.size(); ++i ) {
      const input_file& f = files[order[i]];
      fc::vector<fc::sha1> leaves;
      leaves.reserve( chunk_count(f.size) );
      while( u < units.size() && units[u].file == order[i] ) {
        try {
          fc::vector<fc::sha1> part = results[u].wait();
          leaves.insert( leaves.end(), part.begin(), part.end() );
        } catch( const sendme_exception& ) {
          throw;
        } catch( ... ) {
          SENDME_THROW( io_error, "unable to hash %1%: %2%", %f.path.string().c_str() %fc::except_str().c_str() );
        }
        if( events ) {
          event e( event::import_progress );
          e.path        = f.rel.c_str();
          e.bytes_total = f.size;
          e.bytes_done  = std::min( f.size, uint64_t(units[u].first + units[u].count) * chunk_size );
          events->post(e);
        }
        ++u;
      }
      hash_tree t( leaves, f.size );
      store.add_file( f.path, t );
      m.entries.push_back( manifest_entry( f.rel.c_str(), t.root(), f.size ) );
    }

    m.sort();
    m.validate();

    fc::vector<char> bytes = m.serialize();
    store.add_data( bytes, hash_tree::from_data( bytes.data(), bytes.size() ) );
    slog( "manifest %s with %d entries, %lld bytes",
          fc::string( m.root_hash() ).c_str(), int(m.entries.size()), (long long)m.total_size() );
    return m;
  }

} // namespace sm
