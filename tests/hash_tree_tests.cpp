#include <gtest/gtest.h>
#include <sendme/hash_tree.hpp>
#include <sendme/error.hpp>
#include <vector>

using namespace sm;

namespace {
  std::vector<char> make_data( size_t n ) {
    std::vector<char> d(n);
    for( size_t i = 0; i < n; ++i ) d[i] = char( (i * 131) ^ (i >> 7) );
    return d;
  }
}

TEST( hash_tree, chunk_counts ) {
  EXPECT_EQ( 1u, chunk_count(0) );
  EXPECT_EQ( 1u, chunk_count(1) );
  EXPECT_EQ( 1u, chunk_count(chunk_size) );
  EXPECT_EQ( 2u, chunk_count(chunk_size + 1) );
  EXPECT_EQ( 10240u, chunk_count(10*1024*1024) );

  EXPECT_EQ( 0u, chunk_length( 0, 0 ) );
  EXPECT_EQ( uint32_t(chunk_size), chunk_length( 3000, 0 ) );
  EXPECT_EQ( 3000u - 2*chunk_size, chunk_length( 3000, 2 ) );
  EXPECT_EQ( 0u, chunk_length( 3000, 3 ) );
}

TEST( hash_tree, single_chunk_blob_hash ) {
  std::vector<char> d = make_data( 100 );
  hash_tree t = hash_tree::from_data( d.data(), d.size() );
  EXPECT_EQ( 1u, t.leaf_count() );
  EXPECT_EQ( hash_tree::hash_blob( hash_tree::hash_leaf( d.data(), d.size() ), d.size() ), t.root() );
}

TEST( hash_tree, empty_blob_is_one_empty_chunk ) {
  hash_tree t = hash_tree::from_data( 0, 0 );
  EXPECT_EQ( hash_tree().root(), t.root() );
  EXPECT_EQ( 0u, t.proof(0).size() );
  EXPECT_TRUE( hash_tree::verify( t.root(), 0, 0, hash_tree::hash_leaf( 0, 0 ), t.proof(0) ) );
}

TEST( hash_tree, size_is_part_of_the_hash ) {
  std::vector<char> d( chunk_size, 0 );
  hash_tree a = hash_tree::from_data( d.data(), d.size() );
  hash_tree b = hash_tree::from_data( d.data(), d.size() - 1 );
  EXPECT_NE( a.root(), b.root() );
}

TEST( hash_tree, every_leaf_of_an_odd_tree_verifies ) {
  // 5 chunks leaves the last node unpaired on two levels
  std::vector<char> d = make_data( 4*chunk_size + 17 );
  hash_tree t = hash_tree::from_data( d.data(), d.size() );
  ASSERT_EQ( 5u, t.leaf_count() );
  EXPECT_EQ( 3u, t.proof(0).size() );
  EXPECT_EQ( 1u, t.proof(4).size() );

  for( uint32_t i = 0; i < t.leaf_count(); ++i ) {
    fc::sha1 leaf = hash_tree::hash_leaf( d.data() + i*chunk_size, chunk_length( d.size(), i ) );
    EXPECT_TRUE( hash_tree::verify( t.root(), d.size(), i, leaf, t.proof(i) ) ) << "chunk " << i;
  }
}

TEST( hash_tree, tampering_is_detected ) {
  std::vector<char> d = make_data( 7*chunk_size );
  hash_tree t = hash_tree::from_data( d.data(), d.size() );

  std::vector<char> bad = d;
  bad[3*chunk_size + 5] ^= 0x01;
  fc::sha1 bad_leaf  = hash_tree::hash_leaf( bad.data() + 3*chunk_size, chunk_size );
  fc::sha1 good_leaf = hash_tree::hash_leaf( d.data() + 3*chunk_size, chunk_size );

  EXPECT_FALSE( hash_tree::verify( t.root(), d.size(), 3, bad_leaf, t.proof(3) ) );
  EXPECT_FALSE( hash_tree::verify( t.root(), d.size(), 2, good_leaf, t.proof(3) ) );
  EXPECT_FALSE( hash_tree::verify( t.root(), d.size() + 1, 3, good_leaf, t.proof(3) ) );

  fc::vector<fc::sha1> short_proof = t.proof(3);
  short_proof.pop_back();
  EXPECT_FALSE( hash_tree::verify( t.root(), d.size(), 3, good_leaf, short_proof ) );
  EXPECT_FALSE( hash_tree::verify( t.root(), d.size(), 7, good_leaf, t.proof(3) ) );
}

TEST( hash_tree, leaf_count_must_match_size ) {
  fc::vector<fc::sha1> leaves( 2 );
  EXPECT_THROW( hash_tree( leaves, chunk_size ), sendme_exception );
  EXPECT_NO_THROW( hash_tree( leaves, chunk_size + 1 ) );
}

TEST( hash_tree, proof_out_of_range_throws ) {
  std::vector<char> d = make_data( 2*chunk_size );
  hash_tree t = hash_tree::from_data( d.data(), d.size() );
  EXPECT_THROW( t.proof(2), sendme_exception );
  EXPECT_THROW( t.leaf(2), sendme_exception );
}
