#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "zf/common.h"
#include "zf/compression/compressor.h"
#include "zf/crypto/aes_gcm_siv.h"
#include "zf/crypto/key_wrap.h"
#include "zf/error.h"
#include "zf/errors.h"
#include "zf/format/header_variant.h"
#include "zf/format/main_header.h"
#include "zf/hash/digest.h"
#include "zf/orchestrator/config.h"
#include "zf/orchestrator/container.h"
#include "zf/security/zeroizer.h"
#include "zf/storage/segment_io.h"

namespace {

constexpr int kUsageError = 64;
constexpr int kDataError = 65;
constexpr size_t kStreamBufferSize = 1 << 20;

void PrintUsage() {
  std::cout << "Usage:\n"
            << "  zf-inspect header [--password-file=<file>] [--offset=<n>] <segment>\n"
            << "  zf-inspect verify [--password-file=<file>] [--verify-key-file=<file>] <segment>...\n"
            << "  zf-inspect extract --out=<file> [--password-file=<file>] [--verify-key-file=<file>] <segment>...\n"
            << "  zf-inspect create --in=<file> --out=<base> [--password-file=<file>] [--split-size=<n>]\n"
            << "                    [--chunk-size=<n>] [--compression=none|zstd|lz4] [--plain-metadata]\n"
            << "                    [--signing-key-file=<file>]\n"
            << "                    [--case=<s>] [--evidence=<s>] [--examiner=<s>] [--notes=<s>]\n"
            << "  zf-inspect rewrap --password-file=<file> --new-password-file=<file> <segment1>\n";
}

void SecureZero(std::string& value) {
  zf::security::Zeroizer::Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(value.data()), value.size()));
}

std::string ReadPasswordInteractive(const std::string& prompt) {
  std::cout << prompt << std::flush;
  std::string password;
  std::getline(std::cin, password);
  return password;
}

std::string ReadPasswordFromFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    const int err = errno;
    throw zf::Error{zf::ErrorDomain::IO, zf::errors::io::kOpenFailed,
                    "Failed to open password file: " + zf::PathToUtf8String(path), err};
  }
  std::string password;
  std::getline(in, password);
  return password;
}

std::string AcquirePassword(const std::optional<std::filesystem::path>& file, const std::string& prompt) {
  if (file) {
    return ReadPasswordFromFile(*file);
  }
  return ReadPasswordInteractive(prompt);
}

// Raw 32-byte Ed25519 key file.
std::array<uint8_t, zf::crypto::kEd25519KeySize> ReadEd25519KeyFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    const int err = errno;
    throw zf::Error{zf::ErrorDomain::IO, zf::errors::io::kOpenFailed,
                    "Failed to open key file: " + zf::PathToUtf8String(path), err};
  }
  std::array<uint8_t, zf::crypto::kEd25519KeySize> key{};
  in.read(reinterpret_cast<char*>(key.data()), static_cast<std::streamsize>(key.size()));
  if (in.gcount() != static_cast<std::streamsize>(key.size()) || in.peek() != std::char_traits<char>::eof()) {
    zf::security::Zeroizer::Wipe(key);
    throw zf::Error{zf::ErrorDomain::Config, zf::errors::config::kInvalidConfiguration,
                    "Key file must hold exactly 32 bytes: " + zf::PathToUtf8String(path)};
  }
  return key;
}

bool TakeValue(std::string_view arg, std::string_view prefix, std::string& out) {
  if (arg.rfind(prefix, 0) != 0) {
    return false;
  }
  out = std::string(arg.substr(prefix.size()));
  return true;
}

const char* FlagName(zf::format::EncryptionFlag flag) {
  switch (flag) {
    case zf::format::EncryptionFlag::kNone:
      return "none";
    case zf::format::EncryptionFlag::kChunksOnly:
      return "chunks";
    case zf::format::EncryptionFlag::kFull:
      return "chunks+metadata";
  }
  return "unknown";
}

void PrintPbe(const zf::format::PbeHeader& pbe) {
  std::cout << "  PBE: " << (pbe.scheme == zf::crypto::PbeScheme::kAes128Cbc ? "aes128-cbc" : "aes256-cbc") << '\n';
  if (const auto* pbkdf2 = std::get_if<zf::crypto::Pbkdf2Parameters>(&pbe.kdf)) {
    std::cout << "  PBKDF2 iterations: " << pbkdf2->iterations << '\n';
    std::cout << "  Salt: " << zf::ToHex(pbkdf2->salt) << '\n';
  } else if (const auto* scrypt = std::get_if<zf::crypto::ScryptParameters>(&pbe.kdf)) {
    std::cout << "  scrypt log2(N)=" << static_cast<int>(scrypt->log_n) << " r=" << scrypt->r << " p=" << scrypt->p
              << '\n';
    std::cout << "  Salt: " << zf::ToHex(scrypt->salt) << '\n';
  }
}

void PrintEncryption(const zf::format::EncryptionHeader& encryption) {
  std::cout << "Encryption:\n";
  std::cout << "  AEAD: "
            << (encryption.algorithm == zf::crypto::AeadAlgorithm::kAes128GcmSiv ? "aes128-gcm-siv"
                                                                                 : "aes256-gcm-siv")
            << '\n';
  PrintPbe(encryption.pbe);
  std::cout << "  Wrapped key bytes: " << encryption.wrapped_key.size() << '\n';
}

void PrintCompression(const zf::format::CompressionHeader& compression) {
  std::cout << "Compression: " << zf::compression::CompressionAlgorithmName(compression.algorithm) << " level "
            << static_cast<int>(compression.level) << '\n';
}

void PrintDescription(const zf::format::DescriptionHeader& description) {
  if (description.case_number) std::cout << "Case number: " << *description.case_number << '\n';
  if (description.evidence_number) std::cout << "Evidence number: " << *description.evidence_number << '\n';
  if (description.examiner) std::cout << "Examiner: " << *description.examiner << '\n';
  if (description.notes) std::cout << "Notes: " << *description.notes << '\n';
  if (description.acquisition_date) std::cout << "Acquisition date: " << *description.acquisition_date << '\n';
}

void PrintHashValues(std::string_view label, const zf::format::HashHeader& hashes) {
  for (const auto& value : hashes.values) {
    std::cout << label << ' ' << zf::hash::HashAlgorithmName(value.type) << ": " << zf::ToHex(value.digest) << '\n';
  }
}

void PrintSplit(const zf::format::SplitHeader& split) {
  std::cout << "Container ID: " << std::hex << split.container_id << std::dec << '\n';
  std::cout << "Split number: " << split.split_number << '\n';
  std::cout << "Segment data length: " << split.segment_length << '\n';
}

void PrintMainHeader(const zf::format::MainHeader& header) {
  std::cout << "Main header version: " << static_cast<int>(header.version) << '\n';
  std::cout << "Container ID: " << std::hex << header.split.container_id << std::dec << '\n';
  std::cout << "Encryption flag: " << FlagName(header.encryption_flag) << '\n';
  if (header.encryption) {
    PrintEncryption(*header.encryption);
  }
  PrintCompression(header.compression);
  PrintDescription(header.description);
  std::cout << "Chunk size: " << header.chunk_size << '\n';
  std::cout << "Split size: " << header.split_size << '\n';
  std::cout << "Data length: " << header.data_length << '\n';
  std::cout << "Signed chunks: " << (header.signature_flag ? "yes" : "no") << '\n';
  PrintHashValues("Image hash", header.hashes);
}

void PrintChunkHeader(const zf::format::ChunkHeader& chunk) {
  std::cout << "Chunk header version: " << static_cast<int>(chunk.version) << '\n';
  std::cout << "Chunk number: " << chunk.chunk_number << '\n';
  std::cout << "Stored size: " << chunk.stored_size << '\n';
  if (chunk.crc32) {
    std::cout << "CRC32: " << std::hex << *chunk.crc32 << std::dec << '\n';
  }
  std::cout << "Flags:" << (chunk.HasFlag(zf::format::chunk_flags::kReadError) ? " read-error" : "")
            << (chunk.HasFlag(zf::format::chunk_flags::kCompressed) ? " compressed" : "")
            << (chunk.HasFlag(zf::format::chunk_flags::kSigned) ? " signed" : "") << '\n';
  PrintHashValues("Chunk hash", chunk.hashes);
  if (chunk.signature) {
    std::cout << "Signature: " << zf::ToHex(*chunk.signature) << '\n';
  }
}

struct HeaderPrinter {
  void operator()(const zf::format::MainHeader& header) const { PrintMainHeader(header); }
  void operator()(const zf::format::EncryptionHeader& header) const { PrintEncryption(header); }
  void operator()(const zf::format::PbeHeader& header) const {
    std::cout << "Password-based encryption:\n";
    PrintPbe(header);
  }
  void operator()(const zf::format::CompressionHeader& header) const { PrintCompression(header); }
  void operator()(const zf::format::DescriptionHeader& header) const { PrintDescription(header); }
  void operator()(const zf::format::HashHeader& header) const { PrintHashValues("Hash", header); }
  void operator()(const zf::format::HashValue& value) const {
    std::cout << "Hash " << zf::hash::HashAlgorithmName(value.type) << ": " << zf::ToHex(value.digest) << '\n';
  }
  void operator()(const zf::format::SplitHeader& header) const { PrintSplit(header); }
  void operator()(const zf::format::ChunkHeader& header) const { PrintChunkHeader(header); }
};

void PrintSegmentTable(const zf::orchestrator::ContainerReader& reader) {
  std::cout << "Segments:\n";
  const auto& chunks = reader.index().chunks();
  for (const auto& segment : reader.index().segments()) {
    const auto count = std::count_if(chunks.begin(), chunks.end(), [&](const auto& location) {
      return location.split_number == segment.split.split_number;
    });
    std::cout << "  #" << segment.split.split_number << " data offset " << segment.data_offset << " data length "
              << segment.split.segment_length << " chunks " << count << '\n';
  }
}

void PrintReport(const zf::orchestrator::VerificationReport& report) {
  if (!report.usable) {
    std::cout << "Container unusable: " << report.failure_reason << '\n';
    return;
  }
  std::cout << "Chunks read: " << report.chunks_read << '\n';
  for (const auto number : report.unreadable_chunks) {
    std::cout << "  chunk " << number << ": unreadable at acquisition, zero-filled\n";
  }
  if (report.signatures_verified) {
    std::cout << "Chunk signatures checked\n";
  }
  std::cout << "Bytes recovered: " << report.bytes_recovered << " of " << report.declared_length << '\n';
  for (const auto& issue : report.chunk_issues) {
    std::cout << "  chunk " << issue.chunk_number << " (segment " << issue.split_number << "): " << issue.message
              << '\n';
  }
  for (const auto& check : report.image_hashes) {
    std::cout << "Image hash " << zf::hash::HashAlgorithmName(check.type) << ": "
              << (!check.verified ? "not verified" : (check.matched ? "ok" : "MISMATCH")) << '\n';
  }
  std::cout << "Container usable with " << report.IntegrityWarnings() << " integrity warning(s)\n";
}

struct CommonArgs {
  std::optional<std::filesystem::path> password_file;
  std::optional<std::filesystem::path> verify_key_file;
  uint64_t offset{0};
  std::vector<std::filesystem::path> segments;
};

zf::orchestrator::ReaderOptions ReaderOptionsFor(const CommonArgs& args, bool needs_passphrase) {
  zf::orchestrator::ReaderOptions options;
  if (args.password_file || needs_passphrase) {
    options.passphrase = AcquirePassword(args.password_file, "Passphrase: ");
  }
  if (args.verify_key_file) {
    options.verify_key = ReadEd25519KeyFile(*args.verify_key_file);
  }
  return options;
}

// The complete frame starting at |offset|, as far as its declared length.
std::vector<uint8_t> ReadFrameAt(const zf::storage::SegmentSource& source, uint64_t offset) {
  const uint64_t size = source.Size();
  if (offset >= size) {
    throw zf::Error{zf::ErrorDomain::Config, zf::errors::config::kInvalidConfiguration,
                    "Offset " + std::to_string(offset) + " is past the end of the segment"};
  }
  const uint64_t available = size - offset;
  const auto prefix =
      source.Read(offset, static_cast<size_t>(std::min<uint64_t>(available, zf::format::kFramePrefixSize)));
  const auto declared = zf::format::PeekFrameLength(prefix);
  if (!declared) {
    zf::format::ThrowMalformed("header", zf::errors::msg::kHeaderTruncated);
  }
  return source.Read(offset, static_cast<size_t>(std::min<uint64_t>(available, *declared)));
}

bool FirstSegmentEncrypted(const std::filesystem::path& first) {
  zf::storage::FileSegmentSource source(first);
  const auto envelope = zf::format::ReadMainHeaderEnvelope(zf::orchestrator::ReadMainHeaderBytes(source));
  return envelope.encryption.has_value();
}

int RunHeader(const CommonArgs& args) {
  if (args.segments.size() != 1) {
    PrintUsage();
    return kUsageError;
  }
  zf::storage::FileSegmentSource source(args.segments.front());
  const auto bytes = ReadFrameAt(source, args.offset);
  const auto magic = zf::format::PeekMagic(bytes);

  std::vector<uint8_t> key;
  if (magic && *magic == zf::format::kEncryptedMainHeaderMagic) {
    const auto envelope = zf::format::ReadMainHeaderEnvelope(bytes);
    if (!args.password_file) {
      std::cout << "Header: " << zf::format::HeaderKindName(*magic) << '\n';
      std::cout << "Header length: " << envelope.length << '\n';
      std::cout << "Encryption flag: " << FlagName(envelope.encryption_flag) << '\n';
      PrintEncryption(*envelope.encryption);
      std::cout << "Remaining fields are encrypted; pass --password-file to decode them.\n";
      return 0;
    }
    auto passphrase = AcquirePassword(args.password_file, "Passphrase: ");
    const auto& encryption = *envelope.encryption;
    key = zf::crypto::UnwrapContentKey(passphrase, encryption.pbe.kdf, encryption.pbe.scheme, encryption.pbe.iv,
                                       encryption.wrapped_key, zf::crypto::AES_GCM_SIV::KeySize(encryption.algorithm));
    SecureZero(passphrase);
  }
  zf::security::Zeroizer::ScopeWiper<uint8_t> guard{std::span<uint8_t>(key)};
  const auto decoded = zf::format::DecodeAnyHeader(bytes, key);
  std::cout << "Header: " << zf::format::HeaderKindName(magic.value_or(0)) << '\n';
  std::cout << "Header length: " << decoded.consumed << '\n';
  std::visit(HeaderPrinter{}, decoded.header);
  return 0;
}

int RunVerify(const CommonArgs& args) {
  if (args.segments.empty()) {
    PrintUsage();
    return kUsageError;
  }
  auto options = ReaderOptionsFor(args, FirstSegmentEncrypted(args.segments.front()));
  auto reader = zf::orchestrator::ContainerReader::Open(zf::storage::OpenSegmentFiles(args.segments), options);
  if (options.passphrase) {
    SecureZero(*options.passphrase);
  }
  PrintMainHeader(reader.main_header());
  PrintSegmentTable(reader);
  const auto report = reader.Verify();
  PrintReport(report);
  return report.Clean() ? 0 : kDataError;
}

int RunExtract(const CommonArgs& args, const std::filesystem::path& out) {
  if (args.segments.empty()) {
    PrintUsage();
    return kUsageError;
  }
  auto options = ReaderOptionsFor(args, FirstSegmentEncrypted(args.segments.front()));
  auto reader = zf::orchestrator::ContainerReader::Open(zf::storage::OpenSegmentFiles(args.segments), options);
  if (options.passphrase) {
    SecureZero(*options.passphrase);
  }
  std::ofstream output(out, std::ios::binary | std::ios::trunc);
  if (!output) {
    throw zf::Error{zf::ErrorDomain::IO, zf::errors::io::kOpenFailed,
                    "Failed to create output: " + zf::PathToUtf8String(out)};
  }
  const auto report = reader.Extract([&](std::span<const uint8_t> bytes) {
    output.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!output) {
      throw zf::Error{zf::ErrorDomain::IO, zf::errors::io::kWriteFailed,
                      "Failed to write output: " + zf::PathToUtf8String(out)};
    }
  });
  PrintReport(report);
  return report.Clean() ? 0 : kDataError;
}

int RunCreate(int argc, char** argv) {
  zf::orchestrator::WriterOptions options = zf::orchestrator::ApplyEnvironmentOverrides({});
  std::optional<std::filesystem::path> input;
  std::optional<std::filesystem::path> base;
  std::optional<std::filesystem::path> password_file;
  std::optional<std::filesystem::path> signing_key_file;
  bool plain_metadata = false;
  for (int i = 2; i < argc; ++i) {
    const std::string_view arg = argv[i];
    std::string value;
    if (TakeValue(arg, "--in=", value)) {
      input = value;
    } else if (TakeValue(arg, "--out=", value)) {
      base = value;
    } else if (TakeValue(arg, "--password-file=", value)) {
      password_file = value;
    } else if (TakeValue(arg, "--signing-key-file=", value)) {
      signing_key_file = value;
    } else if (TakeValue(arg, "--split-size=", value)) {
      options.split_size = std::stoull(value);
    } else if (TakeValue(arg, "--chunk-size=", value)) {
      options.chunk_size = std::stoull(value);
    } else if (TakeValue(arg, "--compression=", value)) {
      const auto algorithm = zf::compression::ParseCompressionAlgorithm(value);
      if (!algorithm) {
        PrintUsage();
        return kUsageError;
      }
      options.compression = *algorithm;
    } else if (TakeValue(arg, "--case=", value)) {
      options.description.case_number = value;
    } else if (TakeValue(arg, "--evidence=", value)) {
      options.description.evidence_number = value;
    } else if (TakeValue(arg, "--examiner=", value)) {
      options.description.examiner = value;
    } else if (TakeValue(arg, "--notes=", value)) {
      options.description.notes = value;
    } else if (arg == "--plain-metadata") {
      plain_metadata = true;
    } else {
      PrintUsage();
      return kUsageError;
    }
  }
  if (!input || !base) {
    PrintUsage();
    return kUsageError;
  }
  if (password_file) {
    options.passphrase = ReadPasswordFromFile(*password_file);
    options.encrypt_header = !plain_metadata;
  }
  if (signing_key_file) {
    options.signing_key = ReadEd25519KeyFile(*signing_key_file);
  }
  options.description.acquisition_date = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count());

  std::ifstream in(*input, std::ios::binary);
  if (!in) {
    throw zf::Error{zf::ErrorDomain::IO, zf::errors::io::kOpenFailed,
                    "Failed to open input: " + zf::PathToUtf8String(*input)};
  }
  zf::orchestrator::ContainerWriter writer(options, zf::storage::FileSinkFactory(*base));
  if (options.passphrase) {
    SecureZero(*options.passphrase);
  }
  if (options.signing_key) {
    zf::security::Zeroizer::Wipe(*options.signing_key);
  }
  std::vector<uint8_t> buffer(kStreamBufferSize);
  while (in) {
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    const auto got = static_cast<size_t>(in.gcount());
    if (got > 0) {
      writer.Write(std::span<const uint8_t>(buffer.data(), got));
    }
  }
  if (in.bad()) {
    throw zf::Error{zf::ErrorDomain::IO, zf::errors::io::kReadFailed,
                    "Failed to read input: " + zf::PathToUtf8String(*input)};
  }
  const auto summary = writer.Finish();
  std::cout << "Container ID: " << std::hex << summary.container_id << std::dec << '\n';
  std::cout << "Data length: " << summary.data_length << " in " << summary.chunk_count << " chunk(s)\n";
  if (options.signing_key) {
    std::cout << "Chunks signed with Ed25519\n";
  }
  for (const auto& segment : summary.segments) {
    std::cout << "  " << zf::PathToUtf8String(zf::storage::SegmentFileName(*base, segment.split_number)) << ": "
              << segment.chunk_count << " chunk(s), " << segment.data_length << " data bytes\n";
  }
  return 0;
}

int RunRewrap(int argc, char** argv) {
  std::optional<std::filesystem::path> old_file;
  std::optional<std::filesystem::path> new_file;
  std::optional<std::filesystem::path> segment;
  for (int i = 2; i < argc; ++i) {
    const std::string_view arg = argv[i];
    std::string value;
    if (TakeValue(arg, "--password-file=", value)) {
      old_file = value;
    } else if (TakeValue(arg, "--new-password-file=", value)) {
      new_file = value;
    } else if (!segment && arg.rfind("--", 0) != 0) {
      segment = std::filesystem::path(std::string(arg));
    } else {
      PrintUsage();
      return kUsageError;
    }
  }
  if (!segment) {
    PrintUsage();
    return kUsageError;
  }
  auto old_password = AcquirePassword(old_file, "Current passphrase: ");
  auto new_password = AcquirePassword(new_file, "New passphrase: ");
  std::vector<uint8_t> replacement;
  {
    zf::storage::FileSegmentSource source(*segment);
    replacement = zf::orchestrator::RewrapKey(source, old_password, new_password);
  }
  SecureZero(old_password);
  SecureZero(new_password);

  std::fstream file(*segment, std::ios::binary | std::ios::in | std::ios::out);
  if (!file) {
    throw zf::Error{zf::ErrorDomain::IO, zf::errors::io::kOpenFailed,
                    "Failed to open segment for update: " + zf::PathToUtf8String(*segment)};
  }
  file.seekp(0);
  file.write(reinterpret_cast<const char*>(replacement.data()), static_cast<std::streamsize>(replacement.size()));
  file.flush();
  if (!file) {
    throw zf::Error{zf::ErrorDomain::IO, zf::errors::io::kWriteFailed,
                    "Failed to rewrite main header: " + zf::PathToUtf8String(*segment)};
  }
  std::cout << "Content key re-wrapped (" << replacement.size() << " header bytes rewritten)\n";
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage();
    return kUsageError;
  }
  try {
    const std::string command = argv[1];
    if (command == "create") {
      return RunCreate(argc, argv);
    }
    if (command == "rewrap") {
      return RunRewrap(argc, argv);
    }
    CommonArgs args;
    std::optional<std::filesystem::path> out;
    for (int i = 2; i < argc; ++i) {
      const std::string_view arg = argv[i];
      std::string value;
      if (TakeValue(arg, "--password-file=", value)) {
        args.password_file = value;
      } else if (TakeValue(arg, "--verify-key-file=", value)) {
        args.verify_key_file = value;
      } else if (TakeValue(arg, "--offset=", value)) {
        args.offset = std::stoull(value);
      } else if (TakeValue(arg, "--out=", value)) {
        out = value;
      } else if (arg.rfind("--", 0) == 0) {
        PrintUsage();
        return kUsageError;
      } else {
        args.segments.emplace_back(std::string(arg));
      }
    }
    if (command == "header") {
      return RunHeader(args);
    }
    if (command == "verify") {
      return RunVerify(args);
    }
    if (command == "extract" && out) {
      return RunExtract(args, *out);
    }
    PrintUsage();
    return kUsageError;
  } catch (const zf::Error& error) {
    std::cerr << "Error: " << error.Describe() << std::endl;
    return kDataError;
  } catch (const std::exception& error) {
    std::cerr << "Error: " << error.what() << std::endl;
    return kDataError;
  }
}
