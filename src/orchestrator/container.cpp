#include "zf/orchestrator/container.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <exception>
#include <string>
#include <thread>
#include <variant>

#include "zf/crypto/ct.h"
#include "zf/crypto/key_wrap.h"
#include "zf/crypto/random.h"
#include "zf/errors.h"
#include "zf/format/codec.h"
#include "zf/orchestrator/event_bus.h"
#include "zf/security/zeroizer.h"

namespace zf::orchestrator {

namespace {

constexpr size_t kChunksPerWorkerBatch = 4;

void PublishEvent(EventSeverity severity, EventCategory category, std::string event_id, std::string message,
                  std::vector<EventField> fields) {
  Event event;
  event.severity = severity;
  event.category = category;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  event.fields = std::move(fields);
  EventBus::Instance().Publish(event);
}

EventField NumericField(std::string key, uint64_t value) {
  return EventField(std::move(key), std::to_string(value), FieldPrivacy::kPublic, true);
}

std::array<uint8_t, crypto::AES_GCM_SIV::NONCE_SIZE> NewHeaderNonce() {
  std::array<uint8_t, crypto::AES_GCM_SIV::NONCE_SIZE> nonce{};
  do {
    crypto::SystemRandomBytes(nonce);
  } while (nonce[8] == 0 && nonce[9] == 0 && nonce[10] == 0 && nonce[11] == 0);
  return nonce;
}

uint64_t NewContainerId() {
  uint64_t id = 0;
  while (id == 0) {
    id = crypto::RandomU64();
  }
  return id;
}

crypto::KdfParameters NewKdfParameters(const WriterOptions& options) {
  if (options.kdf == crypto::KdfScheme::kScrypt) {
    return crypto::NewScryptParameters(options.scrypt.log_n, options.scrypt.r, options.scrypt.p);
  }
  return crypto::NewPbkdf2Parameters(options.pbkdf2_iterations);
}

// Same scheme and cost with a fresh salt.
crypto::KdfParameters RefreshKdfParameters(const crypto::KdfParameters& current) {
  if (const auto* scrypt = std::get_if<crypto::ScryptParameters>(&current)) {
    return crypto::NewScryptParameters(scrypt->log_n, scrypt->r, scrypt->p);
  }
  return crypto::NewPbkdf2Parameters(std::get<crypto::Pbkdf2Parameters>(current).iterations);
}

std::vector<uint8_t> UnwrapFromHeader(const format::EncryptionHeader& encryption, std::string_view passphrase) {
  return crypto::UnwrapContentKey(passphrase, encryption.pbe.kdf, encryption.pbe.scheme, encryption.pbe.iv,
                                  encryption.wrapped_key, crypto::AES_GCM_SIV::KeySize(encryption.algorithm));
}

ChunkIssue IssueFromError(const Error& error, uint64_t chunk_number, uint64_t split_number) {
  return ChunkIssue{chunk_number, split_number, error.domain, error.code, error.Describe()};
}

}  // namespace

ContainerWriter::ContainerWriter(WriterOptions options, storage::SegmentSinkFactory sinks)
    : options_(std::move(options)), image_hasher_(options_.image_hashes) {
  ValidateWriterOptions(options_);
  container_id_ = NewContainerId();

  storage::ChunkCodecSettings settings;
  settings.container_id = container_id_;
  settings.chunk_size = options_.chunk_size;
  settings.compression = options_.compression;
  settings.compression_level = options_.compression_level;
  settings.chunk_hashes = options_.chunk_hashes;
  settings.signing_key = options_.signing_key;

  if (options_.passphrase) {
    content_key_.resize(crypto::AES_GCM_SIV::KeySize(options_.aead));
    crypto::SystemRandomBytes(content_key_);

    format::EncryptionHeader encryption;
    encryption.pbe.kdf = NewKdfParameters(options_);
    encryption.pbe.scheme = options_.pbe_scheme;
    crypto::SystemRandomBytes(encryption.pbe.iv);
    encryption.algorithm = options_.aead;
    encryption.wrapped_key = crypto::WrapContentKey(*options_.passphrase, encryption.pbe.kdf, encryption.pbe.scheme,
                                                    encryption.pbe.iv, content_key_);
    encryption.nonce = NewHeaderNonce();
    main_header_.encryption = std::move(encryption);
    main_header_.encryption_flag =
        options_.encrypt_header ? format::EncryptionFlag::kFull : format::EncryptionFlag::kChunksOnly;
    settings.encryption = storage::ChunkEncryption{options_.aead, content_key_};
  }

  main_header_.compression.algorithm = options_.compression;
  main_header_.compression.level = static_cast<uint8_t>(options_.compression_level);
  main_header_.description = options_.description;
  main_header_.hashes = format::HashHeader::Placeholder(options_.image_hashes);
  main_header_.chunk_size = options_.chunk_size;
  main_header_.split_size = options_.split_size;
  main_header_.split = format::SplitHeader{container_id_, 1, 0};
  main_header_.data_length = 0;
  main_header_.signature_flag = options_.signing_key.has_value();
  const size_t main_header_size = main_header_.Encode(content_key_).size();

  codec_ = std::make_unique<storage::ChunkCodec>(std::move(settings));
  segments_ = std::make_unique<storage::SegmentWriter>(std::move(sinks), container_id_, options_.split_size,
                                                       main_header_size);
  batch_limit_ = options_.worker_threads > 1 ? options_.worker_threads * kChunksPerWorkerBatch : 1;

  PublishEvent(EventSeverity::kInfo, EventCategory::kLifecycle, "container_created", "Container writer started",
               {NumericField("container_id", container_id_), NumericField("chunk_size", options_.chunk_size),
                NumericField("split_size", options_.split_size),
                EventField("compression", compression::CompressionAlgorithmName(options_.compression)),
                NumericField("encryption_flag", static_cast<uint64_t>(main_header_.encryption_flag)),
                EventField("signed", main_header_.signature_flag ? "true" : "false")});
}

ContainerWriter::~ContainerWriter() {
  security::Zeroizer::WipeVector(content_key_);
  security::Zeroizer::WipeVector(partial_.plaintext);
  for (auto& pending : batch_) {
    security::Zeroizer::WipeVector(pending.plaintext);
  }
  if (options_.signing_key) {
    security::Zeroizer::Wipe(*options_.signing_key);
  }
}

void ContainerWriter::Write(std::span<const uint8_t> data) {
  Append(data, false);
}

void ContainerWriter::WriteUnreadable(uint64_t length) {
  if (finished_) {
    throw Error{ErrorDomain::Internal, errors::internal::kInvalidState, "Write after Finish"};
  }
  if (length == 0) {
    return;
  }
  PublishEvent(EventSeverity::kWarning, EventCategory::kIntegrity, "source_read_error",
               "Unreadable source range stored as zeros",
               {NumericField("offset", data_length_), NumericField("length", length)});
  const std::vector<uint8_t> zeros(static_cast<size_t>(std::min<uint64_t>(length, options_.chunk_size)), 0);
  while (length > 0) {
    const size_t take = static_cast<size_t>(std::min<uint64_t>(length, zeros.size()));
    Append(std::span<const uint8_t>(zeros).first(take), true);
    length -= take;
  }
}

void ContainerWriter::Append(std::span<const uint8_t> data, bool unreadable) {
  if (finished_) {
    throw Error{ErrorDomain::Internal, errors::internal::kInvalidState, "Write after Finish"};
  }
  image_hasher_.Update(data);
  data_length_ += data.size();
  const size_t chunk_size = static_cast<size_t>(options_.chunk_size);
  while (!data.empty()) {
    const size_t take = std::min(chunk_size - partial_.plaintext.size(), data.size());
    partial_.plaintext.insert(partial_.plaintext.end(), data.begin(),
                              data.begin() + static_cast<std::ptrdiff_t>(take));
    partial_.read_error = partial_.read_error || unreadable;
    data = data.subspan(take);
    if (partial_.plaintext.size() == chunk_size) {
      QueueChunk(std::move(partial_));
      partial_ = PendingChunk{};
      partial_.plaintext.reserve(chunk_size);
    }
  }
}

void ContainerWriter::QueueChunk(PendingChunk chunk) {
  if (chunk.read_error) {
    ++unreadable_chunks_;
  }
  batch_.push_back(std::move(chunk));
  if (batch_.size() >= batch_limit_) {
    SealPendingBatch();
  }
}

void ContainerWriter::SealPendingBatch() {
  if (batch_.empty()) {
    return;
  }
  const uint64_t first_number = next_chunk_number_;
  std::vector<storage::SealedChunk> sealed(batch_.size());
  const unsigned workers = static_cast<unsigned>(std::min<size_t>(options_.worker_threads, batch_.size()));
  if (workers <= 1) {
    for (size_t i = 0; i < batch_.size(); ++i) {
      sealed[i] = codec_->Seal(first_number + i, batch_[i].plaintext, batch_[i].read_error);
    }
  } else {
    std::atomic<size_t> next{0};
    std::vector<std::exception_ptr> failures(workers);
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (unsigned w = 0; w < workers; ++w) {
      threads.emplace_back([&, w]() {
        try {
          for (size_t i = next.fetch_add(1); i < batch_.size(); i = next.fetch_add(1)) {
            sealed[i] = codec_->Seal(first_number + i, batch_[i].plaintext, batch_[i].read_error);
          }
        } catch (...) {
          failures[w] = std::current_exception();
        }
      });
    }
    for (auto& thread : threads) {
      thread.join();
    }
    for (const auto& failure : failures) {
      if (failure) {
        std::rethrow_exception(failure);
      }
    }
  }
  for (const auto& chunk : sealed) {
    segments_->Append(chunk);
  }
  next_chunk_number_ += batch_.size();
  for (auto& pending : batch_) {
    security::Zeroizer::WipeVector(pending.plaintext);
  }
  batch_.clear();
}

ContainerSummary ContainerWriter::Finish() {
  if (finished_) {
    throw Error{ErrorDomain::Internal, errors::internal::kInvalidState, "Finish called twice"};
  }
  if (!partial_.plaintext.empty()) {
    if (partial_.read_error) {
      ++unreadable_chunks_;
    }
    batch_.push_back(std::move(partial_));
    partial_ = PendingChunk{};
  }
  SealPendingBatch();
  finished_ = true;

  main_header_.hashes = format::HashHeader::FromResults(image_hasher_.Finalize());
  main_header_.data_length = data_length_;
  auto segments = segments_->Finish([this](const format::SplitHeader& first_split) {
    main_header_.split = first_split;
    return main_header_.Encode(content_key_);
  });

  ContainerSummary summary;
  summary.container_id = container_id_;
  summary.data_length = data_length_;
  summary.chunk_count = next_chunk_number_ - 1;
  summary.unreadable_chunks = unreadable_chunks_;
  summary.encryption_flag = main_header_.encryption_flag;
  summary.segments = std::move(segments);
  summary.image_hashes = main_header_.hashes;

  PublishEvent(EventSeverity::kInfo, EventCategory::kLifecycle, "container_finished", "Container written",
               {NumericField("container_id", container_id_), NumericField("data_length", data_length_),
                NumericField("chunks", summary.chunk_count), NumericField("segments", summary.segments.size()),
                NumericField("unreadable_chunks", unreadable_chunks_)});
  return summary;
}

size_t VerificationReport::IntegrityWarnings() const noexcept {
  size_t warnings = chunk_issues.size();
  for (const auto& check : image_hashes) {
    if (check.verified && !check.matched) {
      ++warnings;
    }
  }
  return warnings;
}

std::vector<uint8_t> ReadMainHeaderBytes(const storage::SegmentSource& first_segment) {
  const uint64_t size = first_segment.Size();
  const auto prefix = first_segment.Read(0, static_cast<size_t>(std::min<uint64_t>(size, format::kFramePrefixSize)));
  const auto magic = format::PeekMagic(prefix);
  if (magic && *magic == format::kSplitHeaderMagic) {
    const auto split_bytes =
        first_segment.Read(0, static_cast<size_t>(std::min<uint64_t>(size, format::SplitHeader::kEncodedSize)));
    const auto split = format::SplitHeader::Decode(split_bytes).header;
    Error error{ErrorDomain::Segment, errors::segment::kSegmentMismatch,
                std::string(errors::msg::kSegmentMissingMainHeader) + ": first source is segment " +
                    std::to_string(split.split_number)};
    error.AddContext("segment 1");
    throw error;
  }
  const auto declared = format::PeekFrameLength(prefix);
  if (!declared) {
    format::ThrowMalformed("main header", errors::msg::kHeaderTruncated);
  }
  return first_segment.Read(0, static_cast<size_t>(std::min<uint64_t>(size, *declared)));
}

ContainerReader ContainerReader::Open(std::vector<std::unique_ptr<storage::SegmentSource>> sources,
                                      ReaderOptions options) {
  if (sources.empty()) {
    throw Error{ErrorDomain::Segment, errors::segment::kSegmentMismatch, std::string(errors::msg::kNoSegments)};
  }
  ContainerReader reader;
  reader.options_ = std::move(options);
  reader.sources_ = std::move(sources);

  const auto header_bytes = ReadMainHeaderBytes(*reader.sources_.front());
  auto envelope = format::ReadMainHeaderEnvelope(header_bytes);

  std::vector<uint8_t> content_key;
  if (envelope.encryption) {
    if (!reader.options_.passphrase) {
      throw Error{ErrorDomain::Crypto, errors::crypto::kPassphraseRequired,
                  std::string(errors::msg::kPassphraseRequired)};
    }
    content_key = UnwrapFromHeader(*envelope.encryption, *reader.options_.passphrase);
  }
  security::Zeroizer::ScopeWiper<uint8_t> content_key_guard{std::span<uint8_t>(content_key)};

  auto decoded = format::MainHeader::Decode(header_bytes, content_key);
  reader.main_header_ = std::move(decoded.header);
  reader.main_header_length_ = decoded.consumed;
  const auto& header = reader.main_header_;
  if (header.chunk_size > kMaxChunkSize) {
    format::ThrowMalformed("main header", "chunk size exceeds supported maximum");
  }

  reader.index_ = storage::ChunkIndex::Build(reader.sources_, header.split, reader.main_header_length_,
                                             reader.options_.fail_fast);

  storage::ChunkCodecSettings settings;
  settings.container_id = header.split.container_id;
  settings.chunk_size = header.chunk_size;
  settings.compression = header.compression.algorithm;
  settings.compression_level = header.compression.level;
  if (header.encryption) {
    settings.encryption = storage::ChunkEncryption{header.encryption->algorithm, content_key};
  }
  settings.verify_key = reader.options_.verify_key;
  reader.codec_ = std::make_unique<storage::ChunkCodec>(std::move(settings));

  PublishEvent(EventSeverity::kInfo, EventCategory::kLifecycle, "container_opened", "Container opened",
               {NumericField("container_id", header.split.container_id),
                NumericField("segments", reader.index_.segments().size()),
                NumericField("chunks", reader.index_.chunks().size()),
                NumericField("encryption_flag", static_cast<uint64_t>(header.encryption_flag))});
  return reader;
}

uint64_t ContainerReader::ExpectedChunkCount() const noexcept {
  const uint64_t chunk_size = main_header_.chunk_size;
  return main_header_.data_length / chunk_size + (main_header_.data_length % chunk_size != 0 ? 1 : 0);
}

std::vector<uint8_t> ContainerReader::ReadChunk(uint64_t chunk_number) const {
  const auto* location = index_.Find(chunk_number);
  if (location == nullptr) {
    throw Error{ErrorDomain::Segment, errors::segment::kSegmentMismatch,
                "Chunk " + std::to_string(chunk_number) + " is not present in any segment"};
  }
  const auto payload = sources_[location->segment_index]->Read(location->payload_offset,
                                                              static_cast<size_t>(location->header.stored_size));
  try {
    return codec_->Open(location->header, payload);
  } catch (Error& error) {
    error.AddContext("segment " + std::to_string(location->split_number));
    throw;
  }
}

VerificationReport ContainerReader::Extract(const PlaintextSink& sink) const {
  VerificationReport report;
  report.usable = true;
  report.declared_length = main_header_.data_length;
  report.signatures_verified = options_.verify_key.has_value();

  for (const auto& issue : index_.issues()) {
    report.chunk_issues.push_back(IssueFromError(issue.error, issue.chunk_number.value_or(0), issue.split_number));
  }

  std::vector<hash::HashAlgorithm> image_algorithms;
  for (const auto& value : main_header_.hashes.values) {
    if (value.IsKnown() && value.type != static_cast<uint8_t>(hash::HashAlgorithm::kNone)) {
      image_algorithms.push_back(static_cast<hash::HashAlgorithm>(value.type));
    }
  }
  hash::MultiHasher image_hasher(image_algorithms);

  const uint64_t expected_chunks = ExpectedChunkCount();
  const uint64_t chunk_size = main_header_.chunk_size;
  for (uint64_t number = 1; number <= expected_chunks; ++number) {
    const uint64_t expected_length =
        number < expected_chunks ? chunk_size : main_header_.data_length - (expected_chunks - 1) * chunk_size;
    const auto* location = index_.Find(number);
    std::vector<uint8_t> plaintext;
    try {
      if (location == nullptr) {
        Error missing{ErrorDomain::Segment, errors::segment::kSegmentMismatch,
                      "Chunk " + std::to_string(number) + " is not present in any segment"};
        throw missing;
      }
      plaintext = ReadChunk(number);
      if (plaintext.size() != expected_length) {
        Error length{ErrorDomain::Integrity, errors::integrity::kIntegrityViolation,
                     "Chunk " + std::to_string(number) + " holds " + std::to_string(plaintext.size()) +
                         " bytes, expected " + std::to_string(expected_length)};
        throw length;
      }
      ++report.chunks_read;
      report.bytes_recovered += plaintext.size();
      if (location->header.HasFlag(format::chunk_flags::kReadError)) {
        report.unreadable_chunks.push_back(number);
        PublishEvent(EventSeverity::kWarning, EventCategory::kIntegrity, "chunk_read_error",
                     std::string(errors::msg::kChunkReadError), {NumericField("chunk_number", number)});
      }
    } catch (const Error& error) {
      if (options_.fail_fast) {
        throw;
      }
      report.chunk_issues.push_back(IssueFromError(error, number, location ? location->split_number : 0));
      PublishEvent(EventSeverity::kWarning, EventCategory::kIntegrity, "chunk_unrecoverable", error.what(),
                   {NumericField("chunk_number", number), NumericField("code", static_cast<uint64_t>(error.code))});
      plaintext.assign(static_cast<size_t>(expected_length), 0);
    }
    image_hasher.Update(plaintext);
    if (sink) {
      sink(plaintext);
    }
    security::Zeroizer::WipeVector(plaintext);
  }

  for (const auto& location : index_.chunks()) {
    if (location.header.chunk_number > expected_chunks) {
      report.chunk_issues.push_back(ChunkIssue{location.header.chunk_number, location.split_number,
                                               ErrorDomain::Integrity, errors::integrity::kIntegrityViolation,
                                               std::string(errors::msg::kImageLengthMismatch)});
    }
  }

  const auto computed = image_hasher.Finalize();
  for (const auto& value : main_header_.hashes.values) {
    ImageHashCheck check;
    check.type = value.type;
    for (const auto& result : computed) {
      if (static_cast<uint8_t>(result.algorithm) == value.type) {
        check.verified = true;
        check.matched = crypto::ct::CompareEqual(result.digest, value.digest);
      }
    }
    if (check.verified && !check.matched) {
      PublishEvent(EventSeverity::kWarning, EventCategory::kIntegrity, "image_digest_mismatch",
                   std::string(errors::msg::kImageDigestMismatch),
                   {EventField("algorithm", hash::HashAlgorithmName(value.type))});
    }
    report.image_hashes.push_back(check);
  }
  return report;
}

VerificationReport ContainerReader::Verify() const { return Extract({}); }

VerificationReport VerifyContainer(std::vector<std::unique_ptr<storage::SegmentSource>> sources,
                                   const ReaderOptions& options) {
  try {
    auto reader = ContainerReader::Open(std::move(sources), options);
    return reader.Verify();
  } catch (const Error& error) {
    VerificationReport report;
    report.usable = false;
    report.failure_code = error.code;
    report.failure_reason = error.Describe();
    PublishEvent(EventSeverity::kError, EventCategory::kIntegrity, "container_unusable", error.what(),
                 {NumericField("code", static_cast<uint64_t>(error.code))});
    return report;
  }
}

std::vector<uint8_t> RewrapKey(const storage::SegmentSource& first_segment, std::string_view old_passphrase,
                               std::string_view new_passphrase) {
  if (new_passphrase.empty()) {
    throw Error{ErrorDomain::Config, errors::config::kInvalidConfiguration, "passphrase must not be empty"};
  }
  const auto header_bytes = ReadMainHeaderBytes(first_segment);
  const auto envelope = format::ReadMainHeaderEnvelope(header_bytes);
  if (!envelope.encryption) {
    throw Error{ErrorDomain::Config, errors::config::kInvalidConfiguration, "container is not encrypted"};
  }
  auto content_key = UnwrapFromHeader(*envelope.encryption, old_passphrase);
  security::Zeroizer::ScopeWiper<uint8_t> key_guard{std::span<uint8_t>(content_key)};

  auto header = format::MainHeader::Decode(header_bytes, content_key).header;
  auto& encryption = *header.encryption;
  encryption.pbe.kdf = RefreshKdfParameters(encryption.pbe.kdf);
  crypto::SystemRandomBytes(encryption.pbe.iv);
  encryption.wrapped_key = crypto::WrapContentKey(new_passphrase, encryption.pbe.kdf, encryption.pbe.scheme,
                                                  encryption.pbe.iv, content_key);
  auto encoded = header.Encode(content_key);
  if (encoded.size() != header_bytes.size()) {
    throw Error{ErrorDomain::Internal, errors::internal::kInvalidState, "Re-wrapped main header changed size"};
  }
  PublishEvent(EventSeverity::kInfo, EventCategory::kSecurity, "key_rewrapped", "Content key re-wrapped",
               {NumericField("container_id", header.split.container_id)});
  return encoded;
}

}  // namespace zf::orchestrator
