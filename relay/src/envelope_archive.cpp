/*
 * 설명: libarchive로 봉투 ZIP 아카이브를 메모리에서 쓰고 읽는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: relay/tests/unit/envelope_archive_test.cpp
 */
#include "relay/envelope_archive.hpp"

#include <memory>
#include <optional>
#include <utility>

#include <archive.h>
#include <archive_entry.h>

namespace relay {

namespace {
struct ArchiveReadDeleter {
  void operator()(struct archive* a) const { archive_read_free(a); }
};
struct ArchiveWriteDeleter {
  void operator()(struct archive* a) const { archive_write_free(a); }
};
struct ArchiveEntryDeleter {
  void operator()(struct archive_entry* e) const { archive_entry_free(e); }
};

la_ssize_t AppendToString(struct archive*, void* client_data, const void* buffer, size_t length) {
  auto* out = static_cast<std::string*>(client_data);
  out->append(static_cast<const char*>(buffer), length);
  return static_cast<la_ssize_t>(length);
}

std::string ArchiveMessage(struct archive* a, const std::string& context) {
  const char* detail = archive_error_string(a);
  return detail ? context + ": " + detail : context;
}

void WriteMember(struct archive* a, const char* name, const Bytes& data) {
  std::unique_ptr<struct archive_entry, ArchiveEntryDeleter> entry(archive_entry_new());
  if (!entry) {
    throw EnvelopeError("아카이브 항목 생성 실패");
  }
  archive_entry_set_pathname(entry.get(), name);
  archive_entry_set_size(entry.get(), static_cast<la_int64_t>(data.size()));
  archive_entry_set_filetype(entry.get(), AE_IFREG);
  archive_entry_set_perm(entry.get(), 0644);
  if (archive_write_header(a, entry.get()) != ARCHIVE_OK) {
    throw EnvelopeError(ArchiveMessage(a, std::string("아카이브 헤더 기록 실패: ") + name));
  }
  if (!data.empty() && archive_write_data(a, data.data(), data.size()) != static_cast<la_ssize_t>(data.size())) {
    throw EnvelopeError(ArchiveMessage(a, std::string("아카이브 데이터 기록 실패: ") + name));
  }
}

Bytes ReadMember(struct archive* a) {
  Bytes data;
  unsigned char chunk[8192];
  for (;;) {
    la_ssize_t n = archive_read_data(a, chunk, sizeof(chunk));
    if (n == 0) {
      break;
    }
    if (n < 0) {
      throw EnvelopeError(ArchiveMessage(a, "아카이브 멤버 읽기 실패"));
    }
    data.insert(data.end(), chunk, chunk + n);
  }
  return data;
}
}  // namespace

std::string PackEnvelope(const EncryptedEnvelope& envelope) {
  std::unique_ptr<struct archive, ArchiveWriteDeleter> a(archive_write_new());
  if (!a) {
    throw EnvelopeError("아카이브 객체 생성 실패");
  }
  if (archive_write_set_format_zip(a.get()) != ARCHIVE_OK ||
      archive_write_set_options(a.get(), "zip:compression=store") != ARCHIVE_OK ||
      archive_write_set_bytes_per_block(a.get(), 0) != ARCHIVE_OK) {
    throw EnvelopeError(ArchiveMessage(a.get(), "ZIP 형식 설정 실패"));
  }

  std::string out;
  if (archive_write_open(a.get(), &out, nullptr, AppendToString, nullptr) != ARCHIVE_OK) {
    throw EnvelopeError(ArchiveMessage(a.get(), "아카이브 열기 실패"));
  }
  WriteMember(a.get(), kKeyMember, envelope.key);
  WriteMember(a.get(), kSessionDataMember, envelope.session_data);
  if (archive_write_close(a.get()) != ARCHIVE_OK) {
    throw EnvelopeError(ArchiveMessage(a.get(), "아카이브 닫기 실패"));
  }
  return out;
}

EncryptedEnvelope UnpackEnvelope(const std::string& archive_bytes) {
  if (archive_bytes.empty()) {
    throw EnvelopeError("응답 본문이 비어 있습니다");
  }
  std::unique_ptr<struct archive, ArchiveReadDeleter> a(archive_read_new());
  if (!a) {
    throw EnvelopeError("아카이브 객체 생성 실패");
  }
  archive_read_support_format_zip(a.get());
  if (archive_read_open_memory(a.get(), archive_bytes.data(), archive_bytes.size()) != ARCHIVE_OK) {
    throw EnvelopeError(ArchiveMessage(a.get(), "ZIP 아카이브를 열 수 없습니다"));
  }

  std::optional<Bytes> key;
  std::optional<Bytes> session_data;
  struct archive_entry* current = nullptr;
  for (;;) {
    int r = archive_read_next_header(a.get(), &current);
    if (r == ARCHIVE_EOF) {
      break;
    }
    if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
      throw EnvelopeError(ArchiveMessage(a.get(), "ZIP 헤더 읽기 실패"));
    }
    const char* raw_name = archive_entry_pathname(current);
    std::string name = raw_name ? raw_name : "";
    if (name == kKeyMember) {
      key = ReadMember(a.get());
    } else if (name == kSessionDataMember) {
      session_data = ReadMember(a.get());
    } else if (archive_read_data_skip(a.get()) != ARCHIVE_OK) {
      throw EnvelopeError(ArchiveMessage(a.get(), "아카이브 멤버 건너뛰기 실패"));
    }
  }

  if (!key) {
    throw EnvelopeError("아카이브에 key 멤버가 없습니다");
  }
  if (!session_data) {
    throw EnvelopeError("아카이브에 session_data 멤버가 없습니다");
  }
  return EncryptedEnvelope{std::move(*key), std::move(*session_data)};
}

}  // namespace relay
