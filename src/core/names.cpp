#include "cdm/core/error.hpp"
#include "cdm/core/types.hpp"

namespace cdm {

const char* error_code_name(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::InvalidArgument:
      return "invalid argument";
    case ErrorCode::IoError:
      return "io error";
    case ErrorCode::CodecError:
      return "codec error";
    case ErrorCode::DecodeError:
      return "decode error";
    case ErrorCode::ClassificationError:
      return "classification error";
    case ErrorCode::NumericFormatError:
      return "numeric format error";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::Internal:
      return "internal error";
  }
  return "unknown";
}

const char* section_name(Section section) noexcept {
  switch (section) {
    case Section::None:
      return "none";
    case Section::Read:
      return "read";
    case Section::Write:
      return "write";
    case Section::Mix:
      return "mix";
  }
  return "none";
}

const char* pattern_kind_name(PatternKind kind) noexcept {
  return kind == PatternKind::SequentialAccess ? "SEQ" : "RND";
}

std::string_view pattern_label(const Measurement& m) noexcept {
  if (m.pattern_token.empty()) {
    return pattern_kind_name(m.pattern);
  }
  return m.pattern_token;
}

const char* metadata_label(MetadataField field) noexcept {
  switch (field) {
    case MetadataField::Profile:
      return "Profile";
    case MetadataField::Test:
      return "Test";
    case MetadataField::Mode:
      return "Mode";
    case MetadataField::Time:
      return "Time";
    case MetadataField::Date:
      return "Date";
    case MetadataField::Os:
      return "OS";
    case MetadataField::Comment:
      return "Comment";
  }
  return "unknown";
}

const char* codec_name(CodecId id) noexcept {
  switch (id) {
    case CodecId::None:
      return "none";
    case CodecId::Lz4:
      return "lz4";
    case CodecId::Zstd:
      return "zstd";
  }
  return "unknown";
}

}  // namespace cdm
