// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "gtest/gtest.h"

#include <cstring>
#include <string>
#include <vector>

#include "base/logging.h"
#include "base/result_testing.h"
#include "crypto/crypto.h"
#include "encoding/hex.h"

static std::vector<uint8_t> unhex(const char* str) {
  std::vector<uint8_t> out;
  CHECK_OK(encoding::decode(encoding::HEX, &out, str));
  return out;
}

TEST(Registry, BlockCiphers) {
  std::vector<std::string> names;
  for (const auto* cipher : crypto::all_block_ciphers()) {
    names.push_back(cipher->name);
  }
  std::vector<std::string> expected = {"AES-128", "AES-192", "AES-256"};
  EXPECT_EQ(expected, names);

  const crypto::BlockCipher* cipher = nullptr;
  ASSERT_OK(crypto::find_block_cipher(&cipher, "AES-128"));
  EXPECT_STREQ("AES-128", cipher->name);
  EXPECT_EQ(16U, cipher->block_size);
  EXPECT_EQ(16U, cipher->key_size);
  EXPECT_EQ(10U, cipher->num_rounds);
  EXPECT_EQ(0U, cipher->flags & crypto::BlockCipher::FLAG_UNIMPLEMENTED);

  cipher = nullptr;
  ASSERT_OK(crypto::find_block_cipher(&cipher, "aes128"));
  EXPECT_STREQ("AES-128", cipher->name);

  ASSERT_OK(crypto::find_block_cipher(&cipher, "Aes_256"));
  EXPECT_STREQ("AES-256", cipher->name);
  EXPECT_EQ(32U, cipher->key_size);
  EXPECT_EQ(14U, cipher->num_rounds);
  EXPECT_NE(0U, cipher->flags & crypto::BlockCipher::FLAG_UNIMPLEMENTED);

  EXPECT_NOT_FOUND(crypto::find_block_cipher(&cipher, "DES"));
  EXPECT_NOT_FOUND(crypto::find_block_cipher(&cipher, ""));
}

TEST(Registry, Modes) {
  auto modes = crypto::all_modes();
  ASSERT_EQ(1U, modes.size());
  EXPECT_STREQ("ECB", modes[0]->name);
  EXPECT_EQ(0U, modes[0]->iv_size);

  const crypto::BlockCipherMode* mode = nullptr;
  ASSERT_OK(crypto::find_mode(&mode, "ecb"));
  EXPECT_EQ(modes[0], mode);
  EXPECT_NOT_FOUND(crypto::find_mode(&mode, "CBC"));
}

TEST(NewCrypter, AES128ECB) {
  std::unique_ptr<crypto::Crypter> crypter;
  ASSERT_OK(crypto::new_crypter(&crypter, "AES-128+ECB",
                                unhex("2b7e151628aed2a6abf7158809cf4f3c"),
                                base::Bytes()));
  ASSERT_NE(nullptr, crypter.get());
  EXPECT_EQ(16U, crypter->block_size());

  auto buf = unhex("3243f6a8885a308d313198a2e0370734");
  ASSERT_OK(crypter->encrypt(buf, buf));
  EXPECT_EQ("3925841d02dc09fbdc118597196a0b32",
            encoding::encode(encoding::HEX, buf));
  ASSERT_OK(crypter->decrypt(buf, buf));
  EXPECT_EQ("3243f6a8885a308d313198a2e0370734",
            encoding::encode(encoding::HEX, buf));
}

TEST(NewCrypter, NameParsing) {
  auto key = unhex("000102030405060708090a0b0c0d0e0f");
  std::unique_ptr<crypto::Crypter> crypter;
  EXPECT_OK(crypto::new_crypter(&crypter, " aes128 + ecb ", key,
                                base::Bytes()));
  EXPECT_INVALID_ARGUMENT(
      crypto::new_crypter(&crypter, "AES-128", key, base::Bytes()));
  EXPECT_INVALID_ARGUMENT(
      crypto::new_crypter(&crypter, "AES-128+ECB+ECB", key, base::Bytes()));
  EXPECT_INVALID_ARGUMENT(
      crypto::new_crypter(&crypter, "+ECB", key, base::Bytes()));
  EXPECT_NOT_FOUND(
      crypto::new_crypter(&crypter, "Twofish+ECB", key, base::Bytes()));
  EXPECT_NOT_FOUND(
      crypto::new_crypter(&crypter, "AES-128+CTR", key, base::Bytes()));
}

TEST(NewCrypter, Errors) {
  std::unique_ptr<crypto::Crypter> crypter;
  EXPECT_NOT_IMPLEMENTED(crypto::new_crypter(
      &crypter, "AES-192+ECB", std::vector<uint8_t>(24), base::Bytes()));
  EXPECT_NOT_IMPLEMENTED(crypto::new_crypter(
      &crypter, "AES-256+ECB", std::vector<uint8_t>(32), base::Bytes()));
  EXPECT_INVALID_ARGUMENT(crypto::new_crypter(
      &crypter, "AES-128+ECB", std::vector<uint8_t>(15), base::Bytes()));
  EXPECT_INVALID_ARGUMENT(crypto::new_crypter(
      &crypter, "AES-128+ECB", std::vector<uint8_t>(32), base::Bytes()));
  EXPECT_INVALID_ARGUMENT(crypto::new_crypter(&crypter, "AES-128+ECB",
                                              std::vector<uint8_t>(16),
                                              std::vector<uint8_t>(16)));
  EXPECT_EQ(nullptr, crypter.get());
}
