#include "test_framework.hpp"

#include "docsync/sha256.h"

#include <string>
#include <vector>

void register_sha256_tests(std::vector<docsync::tests::TestCase> &tests) {
  using docsync::tests::require;
  namespace crypto = docsync::crypto;

  tests.push_back({"sha256_known_answer_vectors", [] {
                     require(crypto::SHA256::hash("") ==
                                 "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
                             "empty string digest mismatch");
                     require(crypto::SHA256::hash("abc") ==
                                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "abc digest mismatch");
                     require(crypto::SHA256::hash(
                                 "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
                                 "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1",
                             "two-block digest mismatch");
                   }});

  tests.push_back({"sha256_incremental_update_matches_one_shot", [] {
                     const std::string text(1000, 'a');
                     crypto::SHA256 sha;
                     for (size_t i = 0; i < text.size(); i += 7) {
                       const std::string part = text.substr(i, 7);
                       sha.update(part.data(), part.size());
                     }
                     require(sha.final() == crypto::SHA256::hash(text),
                             "incremental digest should equal one-shot digest");
                   }});

  tests.push_back({"sha256_content_hash_is_64_lower_hex", [] {
                     const std::string h = crypto::content_hash("# Plan\nété\n");
                     require(h.size() == 64, "hash should have 64 characters");
                     for (char c : h) {
                       require((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'),
                               "hash should be lower-case hex");
                     }
                   }});
}
