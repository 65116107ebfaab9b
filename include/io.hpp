#ifndef NBAYES_IO_H_
#define NBAYES_IO_H_

#include <fcntl.h>
#include <unistd.h>
#include <cstdlib>

#include "common.hpp"
#include "google/protobuf/message.h"
#include "nbayes.pb.h"

namespace nbayes {

using ::google::protobuf::Message;

inline void MakeTempFilename(string* temp_filename) {
  temp_filename->clear();
  *temp_filename = "/tmp/nbayes_test.XXXXXX";
  vector<char> temp_filename_cstr(temp_filename->begin(),
      temp_filename->end());
  temp_filename_cstr.push_back('\0');
  int fd = mkstemp(&temp_filename_cstr[0]);
  CHECK_GE(fd, 0) << "Failed to open a temporary file at: " << *temp_filename;
  close(fd);
  *temp_filename = &temp_filename_cstr[0];
}

bool CheckFileExistence(const char* filename);

inline bool CheckFileExistence(const string& filename) {
  return CheckFileExistence(filename.c_str());
}

// One entry per line, trailing '\r' removed. Dies if the file can't be read.
void ReadLines(const string& filename, vector<string>* lines);
void WriteLines(const vector<string>& lines, const string& filename);

bool ReadProtoFromTextFile(const char* filename, Message* proto);

inline bool ReadProtoFromTextFile(const string& filename, Message* proto) {
  return ReadProtoFromTextFile(filename.c_str(), proto);
}

inline void ReadProtoFromTextFileOrDie(const char* filename, Message* proto) {
  CHECK(ReadProtoFromTextFile(filename, proto))
      << "Failed to parse parameter file: " << filename;
}

inline void ReadProtoFromTextFileOrDie(const string& filename, Message* proto) {
  ReadProtoFromTextFileOrDie(filename.c_str(), proto);
}

void WriteProtoToTextFile(const Message& proto, const char* filename);
inline void WriteProtoToTextFile(const Message& proto, const string& filename) {
  WriteProtoToTextFile(proto, filename.c_str());
}

}  // namespace nbayes

#endif   // NBAYES_IO_H_
