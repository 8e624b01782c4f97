// Copyright 2023 Intrinsic Innovation LLC

#include "clientboot/util/proto/get_text_proto.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>

#include <string>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/io/tokenizer.h"
#include "google/protobuf/io/zero_copy_stream.h"
#include "google/protobuf/io/zero_copy_stream_impl.h"
#include "google/protobuf/io/zero_copy_stream_impl_lite.h"
#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"

namespace clientboot {
namespace {

// Collects protobuf errors and warnings into multiline strings.
class StringErrorCollector : public google::protobuf::io::ErrorCollector {
 public:
  StringErrorCollector() = default;
  ~StringErrorCollector() override = default;

  void AddError(int line, google::protobuf::io::ColumnNumber column,
                const std::string& message) override {
    absl::StrAppend(&errors_, "line ", line, " column ", column, ": ", message,
                    "\n");
  }

  void AddWarning(int line, google::protobuf::io::ColumnNumber column,
                  const std::string& message) override {
    absl::StrAppend(&warnings_, "Warning line ", line, " column ", column, ": ",
                    message, "\n");
  }

  const std::string& errors() const { return errors_; }
  const std::string& warnings() const { return warnings_; }

 private:
  std::string errors_;
  std::string warnings_;
};

absl::Status ParseFromStream(google::protobuf::io::ZeroCopyInputStream& input,
                             google::protobuf::Message& proto,
                             absl::string_view source_name) {
  StringErrorCollector error_collector;
  google::protobuf::TextFormat::Parser parser;
  parser.RecordErrorsTo(&error_collector);
  if (!parser.Parse(&input, &proto)) {
    return absl::InvalidArgumentError(
        absl::StrCat("failed to parse text proto ", source_name, "\n",
                     error_collector.errors()));
  }
  if (!error_collector.warnings().empty()) {
    LOG(WARNING) << "warnings while parsing text proto " << source_name << "\n"
                 << error_collector.warnings();
  }
  return absl::OkStatus();
}

}  // namespace

absl::Status GetTextProto(absl::string_view filename,
                          google::protobuf::Message& proto) {
  int fd = open(std::string(filename).c_str(), O_RDONLY);
  if (fd == -1) {
    return absl::NotFoundError(
        absl::StrCat("error reading file ", filename, ": ", strerror(errno)));
  }
  google::protobuf::io::FileInputStream fstream(fd);
  fstream.SetCloseOnDelete(true);
  return ParseFromStream(fstream, proto, filename);
}

absl::Status ParseTextProto(absl::string_view text,
                            google::protobuf::Message& proto,
                            absl::string_view source_name) {
  google::protobuf::io::ArrayInputStream stream(text.data(),
                                                static_cast<int>(text.size()));
  return ParseFromStream(stream, proto, source_name);
}

}  // namespace clientboot
