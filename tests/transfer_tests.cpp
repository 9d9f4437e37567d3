#include <gtest/gtest.h>
#include <sendme/transfer_engine.hpp>
#include <sendme/blob_provider.hpp>
#include <sendme/blob_sink.hpp>
#include <sendme/blob_store.hpp>
#include <sendme/manifest_builder.hpp>
#include <sendme/node.hpp>
#include <sendme/connection.hpp>
#include <sendme/events.hpp>
#include <sendme/error.hpp>
#include <sendme/db/resume.hpp>
#include <fc/thread.hpp>
#include <boost/thread/thread.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/locks.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <vector>
#include "test_util.hpp"

using namespace sm;
namespace bfs = boost::filesystem;

namespace {

  /**
   *  What the sender does with its responses, shared with the filter and
   *  observer running on the sender's node thread.
   */
  struct wire_control {
    wire_control():drop_from(uint32_t(-1)),corrupt_index(uint32_t(-1)),drop_all(false){}

    boost::mutex                mtx;
    uint32_t                    drop_from;     ///< drop data responses for this chunk and later
    uint32_t                    corrupt_index; ///< flip a byte of this chunk every time it is sent
    fc::sha1                    corrupt_hash;
    bool                        drop_all;
    std::vector<chunk_request>  requests;

    void reset() {
      boost::unique_lock<boost::mutex> lock(mtx);
      drop_from     = uint32_t(-1);
      corrupt_index = uint32_t(-1);
      drop_all      = false;
      requests.clear();
    }

    std::vector<chunk_request> seen() {
      boost::unique_lock<boost::mutex> lock(mtx);
      return requests;
    }
  };

  class transfer_fixture : public ::testing::Test {
    protected:
      void SetUp() {
        wire.reset( new wire_control() );

        sender.reset( new node() );
        sender->init( dir.sub("sender"), 0 );
        receiver.reset( new node() );
        receiver->init( dir.sub("receiver"), 0 );

        store.reset( new blob_store() );
        provider.reset( new blob_provider( *sender, store ) );

        boost::shared_ptr<wire_control> w = wire;
        provider->set_response_filter( [w]( chunk_response& r ) {
          boost::unique_lock<boost::mutex> lock(w->mtx);
          if( w->drop_all ) return false;
          if( !(r.flags & chunk_request::proof_only) && r.index >= w->drop_from ) return false;
          if( r.index == w->corrupt_index && r.hash == w->corrupt_hash && r.data.size() )
            r.data[0] ^= 0x5a;
          return true;
        });
        provider->set_request_observer( [w]( const chunk_request& r ) {
          boost::unique_lock<boost::mutex> lock(w->mtx);
          w->requests.push_back(r);
        });

        rdb.reset( new db::resume( dir.sub("resume") ) );
        rdb->init();

        cfg.request_window   = 32;
        cfg.chunk_timeout    = fc::milliseconds(200);
        cfg.max_loss_retries = 5;
      }

      void TearDown() {
        provider->stop();
        rdb->close();
        receiver->shutdown();
        sender->shutdown();
      }

      manifest share( const std::string& name ) {
        manifest_builder b(2);
        b.add( dir.sub(name) );
        manifest m = b.build( *store );
        provider->start();
        return m;
      }

      node::connection_ptr connect() {
        return receiver->connect_to( test::loopback( sender->local_endpoint().port() ),
                                     sender->get_id(), fc::seconds(3) );
      }

      std::vector<transfer> fetch( const manifest& m, event_channel* events = 0 ) {
        transfer_engine eng( *receiver, connect(), cfg, events, rdb.get() );
        return eng.run( m, out.fpath() );
      }

      test::temp_dir                   dir;
      test::temp_dir                   out;
      boost::shared_ptr<wire_control>  wire;
      node::ptr                        sender;
      node::ptr                        receiver;
      blob_store::ptr                  store;
      blob_provider::ptr               provider;
      db::resume::ptr                  rdb;
      transfer_config                  cfg;
  };

}

TEST_F( transfer_fixture, fetches_manifest ) {
  test::write_file( dir.path() / "share" / "a", 5000, 1 );
  test::write_file( dir.path() / "share" / "b", 0, 2 );
  manifest m = share( "share" );

  transfer_engine eng( *receiver, connect(), cfg );
  manifest r = eng.fetch_manifest( m.root_hash() );
  EXPECT_EQ( m.root_hash(), r.root_hash() );
  ASSERT_EQ( 2u, r.entries.size() );
  EXPECT_EQ( 5000u, r.entries[0].size );

  EXPECT_THROW( eng.fetch_manifest( fc::sha1::hash( "nothing", 7 ) ), hash_mismatch );
}

TEST_F( transfer_fixture, fetches_files_and_duplicates ) {
  test::write_file( dir.path() / "share" / "one", 100*1024 + 17, 1 );
  test::write_file( dir.path() / "share" / "copy", 100*1024 + 17, 1 );
  test::write_file( dir.path() / "share" / "sub" / "empty", 0, 2 );
  manifest m = share( "share" );

  event_channel events;
  std::vector<transfer> ts = fetch( m, &events );
  ASSERT_EQ( 3u, ts.size() );
  for( size_t i = 0; i < ts.size(); ++i ) {
    EXPECT_EQ( transfer::verified, ts[i].state ) << ts[i].path.c_str();
    EXPECT_EQ( ts[i].bytes_total, ts[i].bytes_verified );
  }
  EXPECT_TRUE( test::same_contents( dir.path() / "share" / "one", out.path() / "share" / "one" ) );
  EXPECT_TRUE( test::same_contents( dir.path() / "share" / "copy", out.path() / "share" / "copy" ) );
  EXPECT_TRUE( bfs::exists( out.path() / "share" / "sub" / "empty" ) );
  EXPECT_EQ( 0u, bfs::file_size( out.path() / "share" / "sub" / "empty" ) );

  std::vector<event> all = test::drain( events );
  EXPECT_EQ( 3u, test::count( all, event::blob_verified ) );
  EXPECT_EQ( 0u, test::count( all, event::blob_failed ) );
  EXPECT_LT( 0u, test::count( all, event::blob_progress ) );

  // identical contents are only fetched once
  std::vector<chunk_request> reqs = wire->seen();
  uint32_t requested = 0;
  for( size_t i = 0; i < reqs.size(); ++i ) requested += reqs[i].count;
  EXPECT_LT( requested, 2*chunk_count( 100*1024 + 17 ) );
}

TEST_F( transfer_fixture, corrupt_chunk_fails_the_blob ) {
  test::write_file( dir.path() / "share" / "bad", 40*1024, 1 );
  test::write_file( dir.path() / "share" / "good", 40*1024, 2 );
  manifest m = share( "share" );
  ASSERT_EQ( std::string("share/bad"), std::string( m.entries[0].path.c_str() ) );
  {
    boost::unique_lock<boost::mutex> lock(wire->mtx);
    wire->corrupt_hash  = m.entries[0].hash;
    wire->corrupt_index = 7;
  }

  event_channel events;
  std::vector<transfer> ts = fetch( m, &events );
  EXPECT_EQ( transfer::failed, ts[0].state );
  EXPECT_EQ( failure::hash_mismatch, ts[0].failure );
  EXPECT_EQ( transfer::verified, ts[1].state );

  EXPECT_FALSE( bfs::exists( out.path() / "share" / "bad" ) );
  EXPECT_FALSE( bfs::exists( bfs::path( file_sink::part_path( out.fpath(), m.entries[0].hash ).string().c_str() ) ) );
  EXPECT_TRUE( test::same_contents( dir.path() / "share" / "good", out.path() / "share" / "good" ) );

  db::resume::record rec;
  EXPECT_FALSE( rdb->fetch( m.entries[0].hash, rec ) );

  std::vector<event> all = test::drain( events );
  EXPECT_EQ( 1u, test::count( all, event::blob_failed ) );
  for( size_t i = 0; i < all.size(); ++i )
    if( all[i].type == event::blob_failed ) EXPECT_EQ( failure::hash_mismatch, all[i].reason );
}

TEST_F( transfer_fixture, resumes_after_the_sender_goes_quiet ) {
  const uint32_t cut = 300;
  test::write_file( dir.path() / "big", 500*chunk_size + 10, 7 );
  manifest m = share( "big" );
  {
    boost::unique_lock<boost::mutex> lock(wire->mtx);
    wire->drop_from = cut;
  }

  std::vector<transfer> first = fetch( m );
  ASSERT_EQ( 1u, first.size() );
  EXPECT_EQ( transfer::failed, first[0].state );
  EXPECT_EQ( failure::connection_lost, first[0].failure );
  EXPECT_FALSE( bfs::exists( out.path() / "big" ) );

  db::resume::record rec;
  ASSERT_TRUE( rdb->fetch( m.entries[0].hash, rec ) );
  EXPECT_EQ( cut, rec.verified_prefix() );

  wire->reset();
  std::vector<transfer> second = fetch( m );
  EXPECT_EQ( transfer::verified, second[0].state );
  EXPECT_TRUE( test::same_contents( dir.path() / "big", out.path() / "big" ) );
  EXPECT_FALSE( rdb->fetch( m.entries[0].hash, rec ) );

  std::vector<chunk_request> reqs = wire->seen();
  ASSERT_FALSE( reqs.empty() );
  EXPECT_EQ( 0u, reqs[0].index );
  EXPECT_TRUE( !!(reqs[0].flags & chunk_request::proof_only) );
  for( size_t i = 0; i < reqs.size(); ++i ) {
    if( reqs[i].flags & chunk_request::proof_only )
      EXPECT_LE( reqs[i].index + reqs[i].count, cut );
    else
      EXPECT_GE( reqs[i].index, cut );
  }
}

TEST_F( transfer_fixture, resume_refetches_from_a_damaged_chunk ) {
  const uint32_t cut = 300;
  const uint32_t bad = 100;
  test::write_file( dir.path() / "big", 400*chunk_size, 9 );
  manifest m = share( "big" );
  {
    boost::unique_lock<boost::mutex> lock(wire->mtx);
    wire->drop_from = cut;
  }
  std::vector<transfer> first = fetch( m );
  EXPECT_EQ( failure::connection_lost, first[0].failure );

  // flip one byte of the part file inside chunk 'bad'
  bfs::path part( file_sink::part_path( out.fpath(), m.entries[0].hash ).string().c_str() );
  ASSERT_TRUE( bfs::exists( part ) );
  {
    bfs::fstream f( part, std::ios::in | std::ios::out | std::ios::binary );
    f.seekg( uint64_t(bad) * chunk_size + 3 );
    char c = 0;
    f.read( &c, 1 );
    c ^= 0x01;
    f.seekp( uint64_t(bad) * chunk_size + 3 );
    f.write( &c, 1 );
  }

  wire->reset();
  std::vector<transfer> second = fetch( m );
  EXPECT_EQ( transfer::verified, second[0].state );
  EXPECT_TRUE( test::same_contents( dir.path() / "big", out.path() / "big" ) );

  uint32_t first_data = uint32_t(-1);
  std::vector<chunk_request> reqs = wire->seen();
  for( size_t i = 0; i < reqs.size(); ++i )
    if( !(reqs[i].flags & chunk_request::proof_only) )
      first_data = std::min( first_data, reqs[i].index );
  EXPECT_EQ( bad, first_data );
}

TEST_F( transfer_fixture, cancel_stops_promptly ) {
  test::write_file( dir.path() / "big", 300*chunk_size, 3 );
  manifest m = share( "big" );
  {
    boost::unique_lock<boost::mutex> lock(wire->mtx);
    wire->drop_all = true;
  }
  cfg.max_loss_retries = 1000;

  transfer_engine eng( *receiver, connect(), cfg, 0, rdb.get() );
  boost::thread canceller( [&eng]() {
    boost::this_thread::sleep( boost::posix_time::milliseconds(300) );
    eng.cancel();
  });

  fc::time_point start = fc::time_point::now();
  std::vector<transfer> ts = eng.run( m, out.fpath() );
  canceller.join();

  EXPECT_TRUE( fc::time_point::now() - start < fc::seconds(3) );
  EXPECT_TRUE( eng.is_cancelled() );
  EXPECT_EQ( transfer::failed, ts[0].state );
  EXPECT_EQ( failure::cancelled, ts[0].failure );
  EXPECT_FALSE( bfs::exists( out.path() / "big" ) );
}

TEST_F( transfer_fixture, sender_releases_finished_blobs ) {
  for( int i = 0; i < 40; ++i )
    test::write_file( dir.path() / "many" / ("f" + boost::lexical_cast<std::string>(i)), 3*chunk_size + i, i + 1 );
  manifest m = share( "many" );
  ASSERT_EQ( 40u, m.entries.size() );

  std::vector<transfer> ts = fetch( m );
  for( size_t i = 0; i < ts.size(); ++i )
    EXPECT_EQ( transfer::verified, ts[i].state ) << ts[i].path.c_str();
  EXPECT_EQ( 0u, provider->open_readers() );

  // the receiver's channel close messages reach the sender asynchronously
  fc::time_point deadline = fc::time_point::now() + fc::seconds(3);
  while( provider->connection_count() && fc::time_point::now() < deadline )
    boost::this_thread::sleep( boost::posix_time::milliseconds(20) );
  EXPECT_EQ( 0u, provider->connection_count() );
}
