// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "crypto/aestool_lib.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <iostream>
#include <memory>
#include <utility>

#include "base/concat.h"
#include "base/debug.h"
#include "base/flag.h"
#include "base/logging.h"
#include "crypto/crypto.h"
#include "encoding/base64.h"
#include "encoding/hex.h"

namespace crypto {
namespace aestool {

inline namespace implementation {
struct File {
  int fd;
  std::string path;
  bool owned;

  File(int fd, std::string path, bool owned) noexcept : fd(fd),
                                                        path(std::move(path)),
                                                        owned(owned) {}
};

base::Result open_file(File* out, base::Chars path, bool for_write) {
  CHECK_NOTNULL(out);
  if (path.empty() || path == "-") {
    if (for_write)
      *out = File(1, "/dev/stdout", false);
    else
      *out = File(0, "/dev/stdin", false);
    return base::Result();
  }

  std::string p = path;
  int flags = O_CLOEXEC;
  if (for_write)
    flags |= O_WRONLY | O_CREAT | O_TRUNC;
  else
    flags |= O_RDONLY;
redo:
  int fd = ::open(p.c_str(), flags, 0666);
  if (fd < 0) {
    int err_no = errno;
    if (err_no == EINTR) goto redo;
    return base::Result::from_errno(err_no, "open(2) path=", p);
  }
  *out = File(fd, std::move(p), true);
  return base::Result();
}

base::Result close_file(File* file) {
  CHECK_NOTNULL(file);
  if (!file->owned) return base::Result();
  file->owned = false;
  if (::close(file->fd) != 0) {
    int err_no = errno;
    return base::Result::from_errno(err_no, "close(2) path=", file->path);
  }
  return base::Result();
}

base::Result read_all(std::vector<uint8_t>* out, const File& file) {
  CHECK_NOTNULL(out);
  std::vector<uint8_t> buf(4096);
  while (true) {
    ssize_t n = ::read(file.fd, buf.data(), buf.size());
    if (n < 0) {
      int err_no = errno;
      if (err_no == EINTR) continue;
      return base::Result::from_errno(err_no, "read(2) path=", file.path);
    }
    if (n == 0) break;
    out->insert(out->end(), buf.begin(), buf.begin() + n);
  }
  return base::Result();
}

base::Result write_all(const File& file, base::Bytes buf) {
  while (!buf.empty()) {
    ssize_t n = ::write(file.fd, buf.data(), buf.size());
    if (n < 0) {
      int err_no = errno;
      if (err_no == EINTR) continue;
      return base::Result::from_errno(err_no, "write(2) path=", file.path);
    }
    buf.remove_prefix(n);
  }
  return base::Result();
}

std::string fmt_size(uint16_t x) {
  return base::concat((x * 8), " bits (", x, " bytes)");
}

int cmd_list(base::FlagSet*) {
  std::cout << "BLOCK CIPHERS\n"
            << "-------------\n";
  for (const auto* block : crypto::all_block_ciphers()) {
    const char* status = "implemented";
    if (block->flags & crypto::BlockCipher::FLAG_UNIMPLEMENTED)
      status = "not implemented";
    std::cout << "\n"
              << "Name       : " << block->name << "\n"
              << "Block Size : " << fmt_size(block->block_size) << "\n"
              << "Key Size   : " << fmt_size(block->key_size) << "\n"
              << "Rounds     : " << block->num_rounds << "\n"
              << "Status     : " << status << "\n";
  }
  std::cout << "\n"
            << "BLOCK CIPHER MODES\n"
            << "------------------\n";
  for (const auto* mode : crypto::all_modes()) {
    std::cout << "\n"
              << "Name       : " << mode->name << "\n"
              << "IV Size    : " << fmt_size(mode->iv_size) << "\n";
  }
  std::cout << std::endl;
  return EXIT_OK;
}

int encrypt_or_decrypt(base::FlagSet* flags, bool do_encrypt) {
  if (!flags->get_string("key")->is_set()) {
    flags->die("--key is required for --cmd=",
               flags->get_choice("cmd")->value());
  }

  std::vector<uint8_t> key;
  auto result = decode_key(&key, flags->get_string("key")->value());
  if (!result) flags->die("--key: ", result);

  Format format;
  result = parse_format(&format, flags->get_choice("format")->value());
  if (!result) flags->die("--format: ", result);

  File in(-1, "", false), out(-1, "", false);
  result = open_file(&in, flags->get_string("input")->value(), false);
  if (!result) {
    LOG(ERROR) << result;
    return EXIT_FAILED;
  }

  std::vector<uint8_t> buf;
  result = read_all(&buf, in);
  auto closed = close_file(&in);
  if (result) result = closed;
  if (!result) {
    LOG(ERROR) << result;
    return EXIT_FAILED;
  }
  VLOG(1) << "read " << buf.size() << " bytes";

  std::string text;
  result = transform(&text, flags->get_string("cipher")->value(), key, format,
                     do_encrypt, buf);
  if (!result) {
    LOG(ERROR) << result;
    return EXIT_FAILED;
  }

  result = open_file(&out, flags->get_string("output")->value(), true);
  if (result) result = write_all(out, base::Bytes(text.data(), text.size()));
  closed = close_file(&out);
  if (result) result = closed;
  if (!result) {
    LOG(ERROR) << result;
    return EXIT_FAILED;
  }
  return EXIT_OK;
}

int cmd_encrypt(base::FlagSet* flags) {
  return encrypt_or_decrypt(flags, true);
}

int cmd_decrypt(base::FlagSet* flags) {
  return encrypt_or_decrypt(flags, false);
}
}  // inline namespace implementation

base::Result parse_format(Format* out, base::Chars name) {
  CHECK_NOTNULL(out);
  if (name == "raw") {
    *out = Format::raw;
  } else if (name == "hex") {
    *out = Format::hex;
  } else if (name == "base64") {
    *out = Format::base64;
  } else {
    return base::Result::invalid_argument("unknown format \"", name, "\"");
  }
  return base::Result();
}

base::Result decode_key(std::vector<uint8_t>* out, base::Chars text) {
  CHECK_NOTNULL(out);
  if (text.remove_prefix("hex:")) {
    return encoding::decode(encoding::HEX, out, text);
  }
  *out = text.bytes().as_vector();
  return base::Result();
}

base::Result transform(std::string* out, base::Chars cipher, base::Bytes key,
                       Format format, bool do_encrypt, base::Bytes in) {
  CHECK_NOTNULL(out);

  std::unique_ptr<crypto::Crypter> crypter;
  auto result = crypto::new_crypter(&crypter, cipher, key, base::Bytes());
  if (!result) return result;
  VLOG(1) << "using " << cipher << " with a " << key.size() << "-byte key";

  std::vector<uint8_t> buf;
  base::Chars encoded(reinterpret_cast<const char*>(in.data()), in.size());
  if (do_encrypt || format == Format::raw) {
    buf = in.as_vector();
  } else if (format == Format::hex) {
    result = encoding::decode(encoding::HEX, &buf, encoded);
  } else {
    result = encoding::decode(encoding::BASE64, &buf, encoded);
  }
  if (!result) {
    return base::Result::invalid_argument("input: ", result.message());
  }

  if (do_encrypt)
    result = crypter->encrypt(buf, buf);
  else
    result = crypter->decrypt(buf, buf);
  if (!result) return result;

  if (!do_encrypt || format == Format::raw) {
    out->assign(buf.begin(), buf.end());
  } else {
    if (format == Format::hex)
      *out = encoding::encode(encoding::HEX, buf);
    else
      *out = encoding::encode(encoding::BASE64, buf);
    out->push_back('\n');
  }
  return base::Result();
}

int run(int argc, const char* const* argv) {
  base::FlagSet flags;
  flags.set_description("Encrypts and decrypts data with AES-128 in ECB mode");
  flags.set_version("aestool 0.1.0");
  flags.set_usage("--cmd=<list|encrypt|decrypt> [--key=<key>] [flags]");
  flags.add_help();
  flags.add_version();
  flags.add_choice("cmd", {"list", "encrypt", "decrypt"}, "",
                   "Action to perform")
      .mark_required();
  flags.add_string("cipher", "AES-128+ECB", "Block cipher + mode to use");
  flags.add_string("key", "",
                   "Key to use (\"hex:\" prefix for base-16, else raw text)");
  flags.add_string("input", "", "File to read (default: standard input)");
  flags.add_string("output", "", "File to write (default: standard output)");
  flags.add_choice("format", {"raw", "hex", "base64"}, "raw",
                   "Text form of the ciphertext (encrypt output, decrypt input)");
  flags.add_uint("verbose", 0, 0, 9, "Log VLOG messages up to this level");
  flags.add_bool("debug", false, "Enables debug mode");
  flags.parse(argc, argv);
  if (!flags.args().empty()) {
    flags.show_help(std::cerr);
    flags.die("unexpected positional arguments");
  }

  base::set_debug(flags.get_bool("debug")->value());
  auto verbose = flags.get_uint("verbose")->value();
  if (verbose > 0) {
    base::log_stderr_set_level(VLOG_LEVEL(static_cast<int>(verbose)));
  }

  int (*cmd)(base::FlagSet*);
  base::Chars name = flags.get_choice("cmd")->value();
  if (name == "list") {
    cmd = cmd_list;
  } else if (name == "encrypt") {
    cmd = cmd_encrypt;
  } else if (name == "decrypt") {
    cmd = cmd_decrypt;
  } else {
    flags.die("invalid --cmd value");
  }
  int rc = cmd(&flags);
  base::log_flush();
  return rc;
}

}  // namespace aestool
}  // namespace crypto
