#include <fcntl.h>
#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/text_format.h>
#include <sys/stat.h>
#include <unistd.h>

#include "common.hpp"
#include "io.hpp"

namespace nbayes {

using google::protobuf::io::FileInputStream;
using google::protobuf::io::FileOutputStream;

bool CheckFileExistence(const char* filename) {
  struct stat buffer;
  return (stat(filename, &buffer) == 0);
}

void ReadLines(const string& filename, vector<string>* lines) {
  CHECK(lines != NULL);
  fstream input(filename.c_str(), ios::in);
  CHECK(input.is_open()) << "File not found: " << filename;
  lines->clear();
  string line;
  while (getline(input, line)) {
    if (!line.empty() && line[line.size() - 1] == '\r') {
      line.erase(line.size() - 1);
    }
    lines->push_back(line);
  }
  input.close();
}

void WriteLines(const vector<string>& lines, const string& filename) {
  fstream output(filename.c_str(), ios::out | ios::trunc);
  CHECK(output.is_open()) << "Fail to create file: " << filename;
  for (const auto& line : lines) {
    output << line << "\n";
  }
  output.close();
}

bool ReadProtoFromTextFile(const char* filename, Message* proto) {
  int fd = open(filename, O_RDONLY);
  CHECK_NE(fd, -1) << "File not found: " << filename;
  bool success = false;
  {
    FileInputStream input(fd);
    success = google::protobuf::TextFormat::Parse(&input, proto);
  }
  close(fd);
  return success;
}

void WriteProtoToTextFile(const Message& proto, const char* filename) {
  int fd = open(filename, O_WRONLY | O_CREAT | O_TRUNC, 0644);
  CHECK_NE(fd, -1) << "Fail to create file: " << filename;
  {
    FileOutputStream output(fd);
    CHECK(google::protobuf::TextFormat::Print(proto, &output));
  }
  close(fd);
}

}  // namespace nbayes
