#include "idforge/core/md5.h"
#include "idforge/core/sha1.h"
#include "idforge/core/sha3.h"
#include "idforge/format/encoding.h"

#include <catch2/catch.hpp>

#include <string>

using idforge::format::hex_encode;

TEST_CASE("MD5 matches RFC 1321 test suite", "[digest][md5]") {
  CHECK(hex_encode(idforge::core::md5_digest("")) == "d41d8cd98f00b204e9800998ecf8427e");
  CHECK(hex_encode(idforge::core::md5_digest("abc")) == "900150983cd24fb0d6963f7d28e17f72");
  CHECK(hex_encode(idforge::core::md5_digest("The quick brown fox jumps over the lazy dog")) ==
        "9e107d9d372bb6826bd81d3542a419d6");
}

TEST_CASE("SHA-1 matches FIPS 180-4 examples", "[digest][sha1]") {
  CHECK(hex_encode(idforge::core::sha1_digest("")) == "da39a3ee5e6b4b0d3255bfef95601890afd80709");
  CHECK(hex_encode(idforge::core::sha1_digest("abc")) ==
        "a9993e364706816aba3e25717850c26c9cd0d89d");
  CHECK(hex_encode(idforge::core::sha1_digest("The quick brown fox jumps over the lazy dog")) ==
        "2fd4e1c67a2d28fced849ee1bb76e7391b93eb12");
}

TEST_CASE("SHA3-512 matches FIPS 202 examples", "[digest][sha3]") {
  CHECK(hex_encode(idforge::core::sha3_512_digest("")) ==
        "a69f73cca23a9ac5c8b567dc185a756e97c982164fe25859e0d1dcc1475c80a6"
        "15b2123af1f5f94c11e3e9402c3ac558f500199d95b6d3e301758586281dcd26");
  CHECK(hex_encode(idforge::core::sha3_512_digest("abc")) ==
        "b751850b1a57168a5693cd924b6b096e08f621827444f70d884f5d0240d2712e"
        "10e116e9192af3c91a7ec57647e3934057340b4cf408d5a56592f8274eec53f0");
}

TEST_CASE("Digests handle inputs spanning several blocks", "[digest]") {
  const std::string input(200, 'a');

  CHECK(hex_encode(idforge::core::md5_digest(input)) == "887f30b43b2867f4a9accceee7d16e6c");
  CHECK(hex_encode(idforge::core::sha1_digest(input)) ==
        "e61cfffe0d9195a525fc6cf06ca2d77119c24a40");
  CHECK(hex_encode(idforge::core::sha3_512_digest(input)) ==
        "eae6c85c6904f11075de9f9d5e1064371d000510fa3d2d79d40cf9be34892fb0"
        "1859d0a0234e138bcb0ad5c84f6c0dca226a414b0c9a2897cb695f5185fe36ec");
}
